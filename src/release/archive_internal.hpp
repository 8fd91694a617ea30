#pragma once

// Helpers shared by the tar and zip codecs

#include <relpack/archive.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace relpack::detail {

constexpr size_t kIoChunk = 64 * 1024;

// lstat() of root/rel as an ArchiveEntry. Only regular files and
// directories are accepted.
Result<ArchiveEntry> stat_member(const std::filesystem::path& root,
                                 const std::string& rel);

} // namespace relpack::detail
