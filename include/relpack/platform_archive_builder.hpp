#pragma once

#include <relpack/archive.hpp>
#include <relpack/log.hpp>
#include <relpack/platform.hpp>
#include <relpack/result.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace relpack {

struct PlatformArchiveReport {
    std::vector<Archive> created;
    // Platforms without an archive this run: directory missing or empty,
    // or writing failed (those also appear in `failures`)
    std::vector<std::string> skipped;
    std::vector<ItemFailure> failures;

    size_t created_count() const { return created.size(); }
    size_t skipped_count() const { return skipped.size(); }
};

// Packs {source}/{platform}/ into {dest}/{platform}.{zip|tar.gz} for every
// known platform target
class PlatformArchiveBuilder {
public:
    explicit PlatformArchiveBuilder(log::Logger& logger, int jobs = 1)
        : logger_(logger), jobs_(jobs) {}

    // MissingInputDirectory when `source_dir` does not exist. ArchiveWrite
    // when no archive at all could be created. Per-platform problems are
    // skips recorded in the report.
    Result<PlatformArchiveReport> build(const std::filesystem::path& source_dir,
                                        const std::filesystem::path& dest_dir);

    // Archive one platform directory (which must contain something).
    // The archive is written under a temporary name and renamed into place.
    Result<Archive> build_one(const PlatformTarget& target,
                              const std::filesystem::path& platform_dir,
                              const std::filesystem::path& dest_dir);

private:
    log::Logger& logger_;
    int jobs_;
};

} // namespace relpack
