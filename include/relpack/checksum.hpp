#pragma once

#include <relpack/result.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace relpack {

// Streaming SHA-256 (FIPS 180-4)
class Sha256 {
public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest. The object must not be fed afterwards.
    Digest finish();

    static std::string hex(const Digest& digest);
    static std::string hash_hex(const std::string& input);

private:
    void compress(const uint8_t block[64]);

    std::array<uint32_t, 8> h_;
    uint64_t length_ = 0;
    uint8_t block_[64];
    size_t used_ = 0;
};

// Hex digest of a file's contents
Result<std::string> sha256_file(const std::filesystem::path& path);

struct ChecksumEntry {
    std::string digest;   // lowercase hex
    std::string name;     // file name, no directory
};

// Hash every file in `files`; entries come back sorted by name
Result<std::vector<ChecksumEntry>> compute_checksums(
    const std::vector<std::filesystem::path>& files);

// "<digest>  <name>\n" per entry, in the order given
std::string format_checksums(const std::vector<ChecksumEntry>& entries);

Result<std::vector<ChecksumEntry>> parse_checksums(const std::string& content);

// Hashes `files` and writes the listing to `dest` atomically
Result<std::vector<ChecksumEntry>> write_checksums_file(
    const std::filesystem::path& dest,
    const std::vector<std::filesystem::path>& files);

// Re-hashes every file listed in `checksums_file` (names resolve against
// `dir`). Missing files and digest mismatches are Checksum errors.
Status verify_checksums(const std::filesystem::path& checksums_file,
                        const std::filesystem::path& dir);

} // namespace relpack
