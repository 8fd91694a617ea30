#pragma once

#include <relpack/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace relpack {

// Exclusively owned scratch directory. Created with a unique name under
// `root` and removed with all its contents when the owner goes away.
class ScratchDir {
public:
    // Empty root means the system temporary directory
    static Result<ScratchDir> create(const std::filesystem::path& root,
                                     const std::string& prefix);

    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ~ScratchDir();

    const std::filesystem::path& path() const { return path_; }

    // Removes the directory now; later calls are no-ops
    Status remove();

private:
    explicit ScratchDir(std::filesystem::path p) : path_(std::move(p)) {}

    std::filesystem::path path_;
};

// Unique, not yet existing path next to `target` (same directory, so a
// rename onto `target` stays on one filesystem)
std::filesystem::path temp_sibling(const std::filesystem::path& target);

// Atomically replace `target` with `source` (rename)
Status replace_file(const std::filesystem::path& source,
                    const std::filesystem::path& target);

// Write `content` to a sibling temp file, then rename it over `path`.
// Readers see either the old file or the complete new one.
Status write_file_atomic(const std::filesystem::path& path,
                         const std::string& content);

Result<std::string> read_file(const std::filesystem::path& path);

Status ensure_directory(const std::filesystem::path& dir);

// Regular files and directories under `root`, as generic relative paths
// sorted lexicographically. Directories are listed before their contents.
Result<std::vector<std::string>> list_tree(const std::filesystem::path& root);

} // namespace relpack
