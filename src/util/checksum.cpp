#include <relpack/checksum.hpp>
#include <relpack/fs_util.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace relpack {

// ---------------------------------------------------------------------------
// SHA-256 core
// ---------------------------------------------------------------------------

namespace {

// FIPS 180-4 4.2.2
constexpr uint32_t kRound[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

// FIPS 180-4 5.3.3
constexpr std::array<uint32_t, 8> kInitial = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

Sha256::Sha256() : h_(kInitial) {}

void Sha256::compress(const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) w[i] = load_be32(block + 4 * i);
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::array<uint32_t, 8> v = h_;
    for (int i = 0; i < 64; ++i) {
        uint32_t& a = v[0]; uint32_t& b = v[1]; uint32_t& c = v[2]; uint32_t& d = v[3];
        uint32_t& e = v[4]; uint32_t& f = v[5]; uint32_t& g = v[6]; uint32_t& h = v[7];

        uint32_t s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        uint32_t choose = (e & f) ^ (~e & g);
        uint32_t t1 = h + s1 + choose + kRound[i] + w[i];
        uint32_t s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
        uint32_t t2 = s0 + majority;

        h = g; g = f; f = e; e = d + t1;
        d = c; c = b; b = a; a = t1 + t2;
    }
    for (size_t i = 0; i < 8; ++i) h_[i] += v[i];
}

void Sha256::update(const uint8_t* data, size_t len) {
    length_ += len;
    while (len > 0) {
        if (used_ == 0 && len >= 64) {
            compress(data);
            data += 64;
            len -= 64;
            continue;
        }
        size_t take = std::min(len, sizeof(block_) - used_);
        std::memcpy(block_ + used_, data, take);
        used_ += take;
        data += take;
        len -= take;
        if (used_ == sizeof(block_)) {
            compress(block_);
            used_ = 0;
        }
    }
}

void Sha256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

Sha256::Digest Sha256::finish() {
    uint64_t bits = length_ * 8;

    block_[used_++] = 0x80;
    if (used_ > 56) {
        std::memset(block_ + used_, 0, 64 - used_);
        compress(block_);
        used_ = 0;
    }
    std::memset(block_ + used_, 0, 56 - used_);
    for (int i = 0; i < 8; ++i) {
        block_[63 - i] = static_cast<uint8_t>(bits >> (8 * i));
    }
    compress(block_);
    used_ = 0;

    Digest out;
    for (size_t i = 0; i < 8; ++i) {
        out[4 * i] = static_cast<uint8_t>(h_[i] >> 24);
        out[4 * i + 1] = static_cast<uint8_t>(h_[i] >> 16);
        out[4 * i + 2] = static_cast<uint8_t>(h_[i] >> 8);
        out[4 * i + 3] = static_cast<uint8_t>(h_[i]);
    }
    return out;
}

std::string Sha256::hex(const Digest& digest) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (uint8_t b : digest) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

std::string Sha256::hash_hex(const std::string& input) {
    Sha256 ctx;
    ctx.update(input);
    return hex(ctx.finish());
}

Result<std::string> sha256_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return RelpackError{RelpackError::IO, "cannot open " + path.string()};
    }

    Sha256 ctx;
    char buf[16384];
    while (in) {
        in.read(buf, sizeof(buf));
        auto n = in.gcount();
        if (n > 0) ctx.update(reinterpret_cast<const uint8_t*>(buf), static_cast<size_t>(n));
    }
    if (in.bad()) {
        return RelpackError{RelpackError::IO, "read error on " + path.string()};
    }
    return Result<std::string>::ok(Sha256::hex(ctx.finish()));
}

// ---------------------------------------------------------------------------
// Checksums file
// ---------------------------------------------------------------------------

Result<std::vector<ChecksumEntry>> compute_checksums(const std::vector<fs::path>& files) {
    std::vector<ChecksumEntry> entries;
    entries.reserve(files.size());
    for (const auto& f : files) {
        auto digest = sha256_file(f);
        if (digest.is_err()) return std::move(digest).error();
        entries.push_back(ChecksumEntry{std::move(digest).value(), f.filename().string()});
    }
    std::sort(entries.begin(), entries.end(),
              [](const ChecksumEntry& a, const ChecksumEntry& b) { return a.name < b.name; });
    return Result<std::vector<ChecksumEntry>>::ok(std::move(entries));
}

std::string format_checksums(const std::vector<ChecksumEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        out += e.digest;
        out += "  ";
        out += e.name;
        out += '\n';
    }
    return out;
}

static bool is_hex_digest(const std::string& s) {
    if (s.size() != 64) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    });
}

Result<std::vector<ChecksumEntry>> parse_checksums(const std::string& content) {
    std::vector<ChecksumEntry> entries;
    std::istringstream stream(content);
    std::string line;
    int lineno = 0;
    while (std::getline(stream, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        // "<digest>  <name>" (text mode) or "<digest> *<name>" (binary mode)
        auto sep = line.find(' ');
        if (sep == std::string::npos || sep + 2 > line.size()) {
            return RelpackError{RelpackError::Parse,
                "malformed checksum line " + std::to_string(lineno) + ": " + line};
        }
        std::string digest = line.substr(0, sep);
        std::string name = line.substr(sep + 2);
        if (!is_hex_digest(digest) || (line[sep + 1] != ' ' && line[sep + 1] != '*') ||
            name.empty()) {
            return RelpackError{RelpackError::Parse,
                "malformed checksum line " + std::to_string(lineno) + ": " + line};
        }
        std::transform(digest.begin(), digest.end(), digest.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        entries.push_back(ChecksumEntry{std::move(digest), std::move(name)});
    }
    return Result<std::vector<ChecksumEntry>>::ok(std::move(entries));
}

Result<std::vector<ChecksumEntry>> write_checksums_file(const fs::path& dest,
                                                        const std::vector<fs::path>& files) {
    auto entries = compute_checksums(files);
    if (entries.is_err()) return std::move(entries).error();
    RELPACK_TRY(write_file_atomic(dest, format_checksums(entries.value())));
    return entries;
}

Status verify_checksums(const fs::path& checksums_file, const fs::path& dir) {
    auto content = read_file(checksums_file);
    if (content.is_err()) return std::move(content).error();

    auto entries = parse_checksums(content.value());
    if (entries.is_err()) {
        return std::move(entries).error().with_context(checksums_file.filename().string());
    }

    std::vector<std::string> problems;
    for (const auto& e : entries.value()) {
        fs::path target = dir / e.name;
        std::error_code ec;
        if (!fs::is_regular_file(target, ec)) {
            problems.push_back(e.name + ": missing");
            continue;
        }
        auto actual = sha256_file(target);
        if (actual.is_err()) {
            problems.push_back(e.name + ": " + actual.error().message);
        } else if (actual.value() != e.digest) {
            problems.push_back(e.name + ": digest mismatch");
        }
    }

    if (!problems.empty()) {
        std::string msg = "checksum verification failed for " +
                          checksums_file.filename().string() + ":";
        for (const auto& p : problems) msg += "\n  " + p;
        return RelpackError{RelpackError::Checksum, msg};
    }
    return ok_status();
}

} // namespace relpack
