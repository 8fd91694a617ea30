#pragma once

#include <relpack/platform.hpp>
#include <relpack/result.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace relpack {

struct ArchiveEntry {
    std::string path;          // relative, '/'-separated, no trailing slash
    bool is_directory = false;
    uint64_t size = 0;
    uint32_t mode = 0;         // permission bits (07777)
    int64_t mtime = 0;         // seconds since the epoch
};

// Receives the members of an archive in stored order. data() is called
// zero or more times between begin() and end() with the member's bytes,
// unless begin() returned false.
class EntryHandler {
public:
    virtual ~EntryHandler() = default;
    virtual Result<bool> begin(const ArchiveEntry& entry) = 0;
    virtual Status data(const char* bytes, size_t len) = 0;
    virtual Status end(const ArchiveEntry& entry) = 0;
};

// Handle to a compressed archive on disk
class Archive {
public:
    Archive(std::filesystem::path path, ArchiveFormat format)
        : path_(std::move(path)), format_(format) {}

    // Infers the format from the file name
    static Result<Archive> from_path(const std::filesystem::path& path);

    const std::filesystem::path& path() const { return path_; }
    ArchiveFormat format() const { return format_; }
    std::string name() const { return path_.filename().string(); }

    // File size in bytes, computed on first use
    Result<uint64_t> size() const;

private:
    std::filesystem::path path_;
    ArchiveFormat format_;
    mutable std::optional<uint64_t> size_;
};

// Normalizes a stored member name ("./a/b/" -> "a/b"). A name that only
// refers to the archive root ("./", ".") yields an empty string; readers
// skip such directory entries. Absolute paths, ".." components and empty
// names are rejected.
Result<std::string> sanitize_member_path(const std::string& raw);

// Write `members` (relative paths under `root`, as produced by list_tree)
// into a new archive at `dest`. Writes to `dest` directly; callers that
// replace an existing file write to a temp_sibling and rename.
Status write_archive(const std::filesystem::path& dest, ArchiveFormat fmt,
                     const std::filesystem::path& root,
                     const std::vector<std::string>& members);

Status walk_archive(const std::filesystem::path& archive, ArchiveFormat fmt,
                    EntryHandler& handler);

// Extract every member into `dest`, restoring permission bits and
// modification times
Status extract_archive(const std::filesystem::path& archive, ArchiveFormat fmt,
                       const std::filesystem::path& dest);

Result<std::vector<ArchiveEntry>> list_archive(const std::filesystem::path& archive,
                                               ArchiveFormat fmt);

// Contents of one regular-file member
Result<std::string> read_member(const std::filesystem::path& archive,
                                ArchiveFormat fmt, const std::string& member);

namespace tar {
Status write(const std::filesystem::path& dest, const std::filesystem::path& root,
             const std::vector<std::string>& members);
Status walk(const std::filesystem::path& archive, EntryHandler& handler);
} // namespace tar

namespace zip {
Status write(const std::filesystem::path& dest, const std::filesystem::path& root,
             const std::vector<std::string>& members);
Status walk(const std::filesystem::path& archive, EntryHandler& handler);
} // namespace zip

} // namespace relpack
