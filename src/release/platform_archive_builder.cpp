#include <relpack/platform_archive_builder.hpp>
#include <relpack/fs_util.hpp>
#include <relpack/workers.hpp>

#include <optional>

namespace fs = std::filesystem;

namespace relpack {

namespace {

enum class Outcome { Created, Missing, Empty, Failed };

struct PlatformResult {
    Outcome outcome = Outcome::Missing;
    std::optional<Archive> archive;
    std::optional<RelpackError> error;
};

bool directory_is_empty(const fs::path& dir, std::error_code& ec) {
    fs::directory_iterator it(dir, ec);
    return !ec && it == fs::directory_iterator();
}

} // namespace

Result<Archive> PlatformArchiveBuilder::build_one(const PlatformTarget& target,
                                                  const fs::path& platform_dir,
                                                  const fs::path& dest_dir) {
    // Both formats carry the whole tree: zip walks it recursively, tar.gz
    // adds each top-level item together with everything beneath it
    auto members = list_tree(platform_dir);
    if (members.is_err()) {
        RelpackError err = std::move(members).error();
        err.code = RelpackError::ArchiveWrite;
        return err.with_context(target.name());
    }
    if (members.value().empty()) {
        return RelpackError{RelpackError::ArchiveWrite,
            target.name() + ": nothing to archive in " + platform_dir.string()};
    }

    RELPACK_TRY(ensure_directory(dest_dir));
    fs::path dest = dest_dir / target.archive_name();
    fs::path tmp = temp_sibling(dest);

    auto st = write_archive(tmp, target.format(), platform_dir, members.value());
    if (st.is_ok()) st = replace_file(tmp, dest);
    if (st.is_err()) {
        std::error_code ec;
        fs::remove(tmp, ec);
        RelpackError err = std::move(st).error();
        err.code = RelpackError::ArchiveWrite;
        return err.with_context(target.name());
    }

    Archive archive(dest, target.format());
    return Result<Archive>::ok(std::move(archive));
}

Result<PlatformArchiveReport> PlatformArchiveBuilder::build(const fs::path& source_dir,
                                                            const fs::path& dest_dir) {
    std::error_code ec;
    if (!fs::is_directory(source_dir, ec)) {
        return RelpackError{RelpackError::MissingInputDirectory,
            "platforms directory not found: " + source_dir.string(),
            "build the platform binaries first"};
    }

    std::vector<PlatformResult> results(kPlatformTargets.size());
    run_parallel(kPlatformTargets.size(), jobs_, [&](size_t i) {
        const PlatformTarget& target = kPlatformTargets[i];
        PlatformResult& res = results[i];
        fs::path dir = source_dir / target.name();

        std::error_code dir_ec;
        if (!fs::is_directory(dir, dir_ec)) {
            res.outcome = Outcome::Missing;
            return;
        }
        if (directory_is_empty(dir, dir_ec)) {
            res.outcome = Outcome::Empty;
            return;
        }
        if (dir_ec) {
            res.outcome = Outcome::Failed;
            res.error = RelpackError{RelpackError::ArchiveWrite,
                target.name() + ": cannot read " + dir.string() + ": " + dir_ec.message()};
            return;
        }

        auto archive = build_one(target, dir, dest_dir);
        if (archive.is_err()) {
            res.outcome = Outcome::Failed;
            res.error = std::move(archive).error();
        } else {
            res.outcome = Outcome::Created;
            res.archive = std::move(archive).value();
        }
    });

    // Report in platform order regardless of completion order
    PlatformArchiveReport report;
    for (size_t i = 0; i < results.size(); ++i) {
        std::string name = kPlatformTargets[i].name();
        PlatformResult& res = results[i];
        switch (res.outcome) {
            case Outcome::Created: {
                auto size = res.archive->size();
                logger_.info("created %s (%llu bytes)", res.archive->name().c_str(),
                             static_cast<unsigned long long>(size.value_or(0)));
                report.created.push_back(std::move(*res.archive));
                break;
            }
            case Outcome::Missing:
                logger_.warn("platform directory %s not found, skipping", name.c_str());
                report.skipped.push_back(name);
                break;
            case Outcome::Empty:
                logger_.warn("platform directory %s is empty, skipping", name.c_str());
                report.skipped.push_back(name);
                break;
            case Outcome::Failed:
                logger_.report(*res.error);
                logger_.warn("skipping %s", name.c_str());
                report.skipped.push_back(name);
                report.failures.push_back(ItemFailure{name, std::move(*res.error)});
                break;
        }
    }

    if (report.created.empty()) {
        return RelpackError{RelpackError::ArchiveWrite,
            "no platform archives were created from " + source_dir.string(),
            "expected subdirectories such as " + kPlatformTargets[0].name()};
    }
    return Result<PlatformArchiveReport>::ok(std::move(report));
}

} // namespace relpack
