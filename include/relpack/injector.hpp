#pragma once

#include <relpack/archive.hpp>
#include <relpack/config.hpp>
#include <relpack/log.hpp>
#include <relpack/result.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace relpack {

// Directory inside every release archive that receives the platform archives
constexpr const char* kPlatformsMember = "platforms";

// Release archives in `dist_dir` named {product}_*.tar.gz or {product}_*.zip,
// sorted by name
Result<std::vector<Archive>> discover_release_archives(const std::filesystem::path& dist_dir,
                                                       const std::string& product);

// Every *.tar.gz / *.zip directly inside `platforms_dir`, sorted by name
Result<std::vector<Archive>> discover_platform_archives(const std::filesystem::path& platforms_dir);

struct InjectionReport {
    std::vector<Archive> injected;
    std::vector<ItemFailure> failures;
    // Nothing to inject (no platforms directory or no platform archives);
    // release archives were left untouched
    bool skipped = false;

    bool ok() const { return failures.empty(); }
};

// Applies the configured per-archive failure policy: Report always
// succeeds, Fail turns any failure into an ArchiveRewrite error
Status enforce_policy(const InjectionReport& report, InjectFailurePolicy policy);

// Merges platform archives into release archives under platforms/.
//
// Each release archive is extracted into its own scratch directory, the
// platform archives are copied in (replacing stale copies), and the tree is
// re-archived into a temporary sibling file. The temporary file is read back
// and only then renamed over the original, so a failure at any point leaves
// the original archive as it was.
class ReleaseArchiveInjector {
public:
    ReleaseArchiveInjector(log::Logger& logger,
                           std::filesystem::path scratch_root = {},
                           int jobs = 1)
        : logger_(logger), scratch_root_(std::move(scratch_root)), jobs_(jobs) {}

    Status inject_one(const Archive& release, const std::vector<Archive>& platform_archives);

    // Best effort across `releases`: one archive failing never stops the others
    InjectionReport inject(const std::vector<Archive>& releases,
                           const std::vector<Archive>& platform_archives);

    // Discovers both archive sets and injects. A missing or empty
    // `platforms_dir` skips the phase with a warning.
    Result<InjectionReport> inject_directory(const std::filesystem::path& dist_dir,
                                             const std::filesystem::path& platforms_dir,
                                             const std::string& product);

private:
    log::Logger& logger_;
    std::filesystem::path scratch_root_;
    int jobs_;
};

} // namespace relpack
