#include <relpack/injector.hpp>
#include <relpack/fs_util.hpp>
#include <relpack/workers.hpp>

#include <algorithm>
#include <optional>

namespace fs = std::filesystem;

namespace relpack {

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

namespace {

// Archives directly inside `dir` whose names satisfy `accept`
template<typename Pred>
Result<std::vector<Archive>> scan_archives(const fs::path& dir, Pred accept) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot list " + dir.string() + ": " + ec.message()};
    }

    std::vector<Archive> found;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        // Hidden names include our own in-flight temporary files
        if (name.empty() || name[0] == '.') continue;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        auto fmt = format_from_path(it->path());
        if (!fmt || !accept(name)) continue;
        found.emplace_back(it->path(), *fmt);
    }
    if (ec) {
        return RelpackError{RelpackError::IO,
            "failed while listing " + dir.string() + ": " + ec.message()};
    }

    std::sort(found.begin(), found.end(),
              [](const Archive& a, const Archive& b) { return a.name() < b.name(); });
    return Result<std::vector<Archive>>::ok(std::move(found));
}

RelpackError recode(RelpackError err, RelpackError::Code code) {
    err.code = code;
    return err;
}

} // namespace

Result<std::vector<Archive>> discover_release_archives(const fs::path& dist_dir,
                                                       const std::string& product) {
    std::string prefix = product + "_";
    return scan_archives(dist_dir, [&](const std::string& name) {
        return name.rfind(prefix, 0) == 0;
    });
}

Result<std::vector<Archive>> discover_platform_archives(const fs::path& platforms_dir) {
    return scan_archives(platforms_dir, [](const std::string&) { return true; });
}

Status enforce_policy(const InjectionReport& report, InjectFailurePolicy policy) {
    if (report.ok() || policy == InjectFailurePolicy::Report) return ok_status();

    std::string names;
    for (const auto& f : report.failures) {
        if (!names.empty()) names += ", ";
        names += f.item;
    }
    return RelpackError{RelpackError::ArchiveRewrite,
        "injection failed for " + std::to_string(report.failures.size()) +
        " release archive(s): " + names,
        "the failed archives were left unchanged; fix the cause and re-run"};
}

// ---------------------------------------------------------------------------
// Injection
// ---------------------------------------------------------------------------

static Status copy_platform_archive(const Archive& src, const fs::path& dest_dir) {
    fs::path target = dest_dir / src.name();
    std::error_code ec;

    // A previous run may have left a copy behind, possibly read-only
    fs::remove(target, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot replace " + target.string() + ": " + ec.message()};
    }
    fs::copy_file(src.path(), target, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot copy " + src.path().string() + ": " + ec.message()};
    }
    auto mtime = fs::last_write_time(src.path(), ec);
    if (!ec) fs::last_write_time(target, mtime, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot set modification time of " + target.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status ReleaseArchiveInjector::inject_one(const Archive& release,
                                          const std::vector<Archive>& platform_archives) {
    auto scratch = ScratchDir::create(scratch_root_, "relpack-inject");
    if (scratch.is_err()) return std::move(scratch).error();
    const fs::path& tree = scratch.value().path();

    // 1. Extract
    auto st = extract_archive(release.path(), release.format(), tree);
    if (st.is_err()) return recode(std::move(st).error(), RelpackError::ArchiveExtract);

    // 2-3. platforms/ with fresh copies
    fs::path platforms = tree / kPlatformsMember;
    std::error_code ec;
    if (fs::exists(platforms, ec) && !fs::is_directory(platforms, ec)) {
        return RelpackError{RelpackError::ArchiveRewrite,
            release.name() + " already contains a non-directory '" +
            std::string(kPlatformsMember) + "' member"};
    }
    st = ensure_directory(platforms);
    if (st.is_err()) return recode(std::move(st).error(), RelpackError::ArchiveRewrite);
    for (const auto& pa : platform_archives) {
        st = copy_platform_archive(pa, platforms);
        if (st.is_err()) return recode(std::move(st).error(), RelpackError::ArchiveRewrite);
    }

    // 4-5. Rewrite into a sibling file, read it back, then swap it in
    auto members = list_tree(tree);
    if (members.is_err()) return recode(std::move(members).error(), RelpackError::ArchiveRewrite);

    fs::path tmp = temp_sibling(release.path());
    st = write_archive(tmp, release.format(), tree, members.value());
    if (st.is_ok()) {
        auto check = list_archive(tmp, release.format());
        if (check.is_err()) {
            st = std::move(check).error();
        } else if (check.value().size() != members.value().size()) {
            st = RelpackError{RelpackError::ArchiveRewrite,
                "rewritten archive has " + std::to_string(check.value().size()) +
                " members, expected " + std::to_string(members.value().size())};
        }
    }
    if (st.is_ok()) st = replace_file(tmp, release.path());
    if (st.is_err()) {
        fs::remove(tmp, ec);
        return recode(std::move(st).error(), RelpackError::ArchiveRewrite);
    }

    auto removed = scratch.value().remove();
    if (removed.is_err()) logger_.warn("%s", removed.error().message.c_str());
    return ok_status();
}

InjectionReport ReleaseArchiveInjector::inject(const std::vector<Archive>& releases,
                                               const std::vector<Archive>& platform_archives) {
    std::vector<std::optional<RelpackError>> errors(releases.size());

    run_parallel(releases.size(), jobs_, [&](size_t i) {
        logger_.info("processing %s", releases[i].name().c_str());
        auto st = inject_one(releases[i], platform_archives);
        if (st.is_err()) errors[i] = std::move(st).error();
    });

    InjectionReport report;
    for (size_t i = 0; i < releases.size(); ++i) {
        if (errors[i]) {
            RelpackError err = errors[i]->with_context(releases[i].name());
            logger_.report(err);
            report.failures.push_back(ItemFailure{releases[i].name(), std::move(err)});
        } else {
            logger_.info("added %s/ to %s", kPlatformsMember, releases[i].name().c_str());
            report.injected.push_back(releases[i]);
        }
    }
    return report;
}

Result<InjectionReport> ReleaseArchiveInjector::inject_directory(const fs::path& dist_dir,
                                                                 const fs::path& platforms_dir,
                                                                 const std::string& product) {
    InjectionReport report;
    std::error_code ec;
    if (!fs::is_directory(platforms_dir, ec)) {
        logger_.warn("platforms directory %s not found, skipping injection",
                     platforms_dir.string().c_str());
        report.skipped = true;
        return Result<InjectionReport>::ok(std::move(report));
    }

    auto platform_archives = discover_platform_archives(platforms_dir);
    if (platform_archives.is_err()) return std::move(platform_archives).error();
    if (platform_archives.value().empty()) {
        logger_.warn("no platform archives in %s, skipping injection",
                     platforms_dir.string().c_str());
        report.skipped = true;
        return Result<InjectionReport>::ok(std::move(report));
    }

    auto releases = discover_release_archives(dist_dir, product);
    if (releases.is_err()) return std::move(releases).error();
    if (releases.value().empty()) {
        logger_.warn("no %s_* release archives in %s", product.c_str(),
                     dist_dir.string().c_str());
    }

    report = inject(releases.value(), platform_archives.value());
    return Result<InjectionReport>::ok(std::move(report));
}

} // namespace relpack
