#include <relpack/pipeline.hpp>
#include <relpack/checksum.hpp>
#include <relpack/fs_util.hpp>
#include <relpack/platform_archive_builder.hpp>
#include <relpack/release_notes.hpp>
#include <relpack/tool_lookup.hpp>

#include <algorithm>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace relpack {

const char* stage_name(Stage s) {
    switch (s) {
        case Stage::Idle:                  return "idle";
        case Stage::VersionValidated:      return "validate-version";
        case Stage::DependenciesChecked:   return "check-dependencies";
        case Stage::VersionFilesUpdated:   return "update-version-files";
        case Stage::TaggedForBuild:        return "create-tag";
        case Stage::BuildInvoked:          return "build";
        case Stage::TagRemoved:            return "remove-tag";
        case Stage::TagRemovedOnFailure:   return "remove-tag-after-failure";
        case Stage::PlatformArchivesBuilt: return "platform-archives";
        case Stage::ArchivesInjected:      return "inject";
        case Stage::OutputsVerified:       return "verify";
        case Stage::NotesGenerated:        return "release-notes";
        case Stage::Done:                  return "done";
    }
    return "unknown";
}

bool PipelineRun::reached(Stage s) const {
    return std::find(history.begin(), history.end(), s) != history.end();
}

std::string PipelineRun::describe() const {
    std::string tag = version ? version->to_tag() : requested;
    std::string out = "release " + tag;
    if (succeeded) {
        out += " succeeded";
    } else if (failed_at) {
        out += " failed at ";
        out += stage_name(*failed_at);
        if (error) out += ": " + error->message;
    } else {
        out += " did not finish";
    }

    if (!tag_created) {
        out += " (no temporary tag was created)";
    } else if (tag_removed) {
        out += " (temporary tag " + tag + " was removed)";
    } else {
        out += " (temporary tag " + tag + " was NOT removed; run: git tag -d " + tag + ")";
    }
    return out;
}

// ---------------------------------------------------------------------------
// Version files
// ---------------------------------------------------------------------------

Result<size_t> rewrite_version_file(const VersionFileRule& rule, const TemplateVars& vars) {
    auto replacement = render_template(rule.replace, vars);
    if (replacement.is_err()) {
        return std::move(replacement).error().with_context(rule.path.string());
    }

    std::regex re;
    try {
        re = std::regex(rule.pattern);
    } catch (const std::regex_error& e) {
        return RelpackError{RelpackError::Config,
            "invalid pattern for " + rule.path.string() + ": " + e.what()};
    }

    auto content = read_file(rule.path);
    if (content.is_err()) return std::move(content).error();

    std::string out;
    out.reserve(content.value().size());
    size_t changed = 0;
    std::istringstream in(content.value());
    std::string line;
    while (std::getline(in, line)) {
        if (std::regex_search(line, re)) {
            std::string updated = std::regex_replace(line, re, replacement.value());
            if (updated != line) ++changed;
            line = std::move(updated);
        }
        out += line;
        if (!in.eof()) out += '\n';
    }
    if (changed == 0) return Result<size_t>::ok(0);

    std::error_code ec;
    auto perms = fs::status(rule.path, ec).permissions();
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot stat " + rule.path.string() + ": " + ec.message()};
    }
    RELPACK_TRY(write_file_atomic(rule.path, out));
    fs::permissions(rule.path, perms, fs::perm_options::replace, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot restore permissions of " + rule.path.string() + ": " + ec.message()};
    }
    return Result<size_t>::ok(changed);
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

TemplateVars ReleasePipeline::vars(const PipelineRun& run) const {
    return release_vars(run.version ? run.version->to_tag() : run.requested,
                        cfg_.release.product);
}

void ReleasePipeline::fail(PipelineRun& run, Stage stage, RelpackError err) {
    run.failed_at = stage;
    run.error = std::move(err);
}

PipelineRun ReleasePipeline::run(const std::string& version) {
    PipelineRun run;
    run.requested = version;

    logger_.step("validating version %s", version.c_str());
    auto parsed = Version::parse(version);
    if (parsed.is_err()) {
        fail(run, Stage::VersionValidated, std::move(parsed).error());
        logger_.report(*run.error);
        logger_.error("%s", run.describe().c_str());
        return run;
    }
    run.version = std::move(parsed).value();
    run.history.push_back(Stage::VersionValidated);

    struct Step {
        Stage stage;
        const char* banner;
        Status (ReleasePipeline::*fn)(PipelineRun&);
    };
    const Step steps[] = {
        {Stage::DependenciesChecked,   "checking dependencies",       &ReleasePipeline::check_dependencies},
        {Stage::VersionFilesUpdated,   "updating version files",      &ReleasePipeline::update_version_files},
        {Stage::TaggedForBuild,        "building release artifacts",  &ReleasePipeline::tagged_build},
        {Stage::PlatformArchivesBuilt, "building platform archives",  &ReleasePipeline::build_platform_archives},
        {Stage::ArchivesInjected,      "injecting platform archives", &ReleasePipeline::inject},
        {Stage::OutputsVerified,       "verifying outputs",           &ReleasePipeline::verify_outputs},
        {Stage::NotesGenerated,        "generating release notes",    &ReleasePipeline::generate_notes},
    };

    for (const auto& step : steps) {
        logger_.step("%s", step.banner);
        auto st = (this->*step.fn)(run);
        if (st.is_err()) {
            // Stages that fail at a more specific point record it themselves
            if (!run.failed_at) fail(run, step.stage, std::move(st).error());
            logger_.report(*run.error);
            logger_.error("%s", run.describe().c_str());
            return run;
        }
    }

    run.history.push_back(Stage::Done);
    run.succeeded = true;
    logger_.success("%s", run.describe().c_str());
    return run;
}

Status ReleasePipeline::check_dependencies(PipelineRun& run) {
    for (const auto& cmd : cfg_.build.preflight) {
        auto r = run_checked(runner_, cmd, cfg_.root.string(), cfg_.git.timeout);
        if (r.is_err()) {
            RelpackError err = std::move(r).error();
            err.code = RelpackError::ExternalTool;
            err.hint = "required by the preflight check";
            return err;
        }
        logger_.debug("%s: ok", describe_command(cmd).c_str());
    }

    auto tool = find_tool(runner_, cfg_.build.tool, cfg_.git.timeout);
    if (tool.is_err()) {
        RelpackError err = std::move(tool).error();
        err.code = RelpackError::ExternalTool;
        return err.with_context("build tool not found");
    }
    run.build_tool = std::move(tool).value();
    logger_.info("build tool: %s", run.build_tool.c_str());

    auto repo = git_.is_repository();
    if (repo.is_err()) return std::move(repo).error();
    if (!repo.value()) {
        return RelpackError{RelpackError::ExternalTool,
            "not a git repository: " + cfg_.root.string()};
    }

    if (!cfg_.build.config_file.empty()) {
        std::error_code ec;
        if (!fs::exists(cfg_.build.config_file, ec)) {
            return RelpackError{RelpackError::NotFound,
                "build configuration not found: " + cfg_.build.config_file.string()};
        }
    }

    run.history.push_back(Stage::DependenciesChecked);
    return ok_status();
}

Status ReleasePipeline::update_version_files(PipelineRun& run) {
    TemplateVars tv = vars(run);

    for (const auto& rule : cfg_.version_files) {
        std::error_code ec;
        if (!fs::exists(rule.path, ec)) {
            logger_.info("%s not found, skipping", rule.path.string().c_str());
            continue;
        }
        auto changed = rewrite_version_file(rule, tv);
        if (changed.is_err()) return std::move(changed).error();
        logger_.info("updated %zu line(s) in %s", changed.value(),
                     rule.path.filename().string().c_str());
    }

    if (!cfg_.build.version_command.empty()) {
        std::vector<std::string> cmd;
        for (const auto& arg : cfg_.build.version_command) {
            auto rendered = render_template(arg, tv);
            if (rendered.is_err()) return std::move(rendered).error().with_context("version-command");
            cmd.push_back(std::move(rendered).value());
        }
        auto r = run_checked(runner_, cmd, cfg_.root.string(), cfg_.build.binaries_timeout);
        if (r.is_err()) logger_.warn("version command failed: %s", r.error().message.c_str());
    }

    run.history.push_back(Stage::VersionFilesUpdated);
    return ok_status();
}

Status ReleasePipeline::tagged_build(PipelineRun& run) {
    const std::string tag = run.version->to_tag();

    std::error_code ec;
    fs::remove_all(cfg_.release.dist_dir, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot clean " + cfg_.release.dist_dir.string() + ": " + ec.message()};
    }

    // A tag left behind by an interrupted run would make the build tool
    // pick up the wrong commit
    auto stale = git_.tag_exists(tag);
    if (stale.is_err()) return std::move(stale).error();
    if (stale.value()) {
        logger_.warn("removing existing tag %s", tag.c_str());
        RELPACK_TRY(git_.delete_tag(tag));
    }

    auto created = TemporaryTag::create(git_, tag, logger_);
    if (created.is_err()) return std::move(created).error();
    TemporaryTag temp_tag = std::move(created).value();
    run.tag_created = true;
    run.history.push_back(Stage::TaggedForBuild);

    std::vector<std::string> cmd{run.build_tool};
    cmd.insert(cmd.end(), cfg_.build.args.begin(), cfg_.build.args.end());
    logger_.info("running %s", describe_command(cmd).c_str());
    auto build = run_checked(runner_, cmd, cfg_.root.string(), cfg_.build.timeout);

    auto removed = temp_tag.release();
    run.tag_removed = removed.is_ok();

    if (build.is_err()) {
        RelpackError err = std::move(build).error();
        if (err.code != RelpackError::Timeout) err.code = RelpackError::ExternalTool;
        if (removed.is_ok()) {
            run.history.push_back(Stage::TagRemovedOnFailure);
        } else {
            logger_.report(removed.error());
            err.hint = "temporary tag " + tag + " could not be removed; run: git tag -d " + tag;
        }
        fail(run, Stage::BuildInvoked, err);
        return err;
    }
    run.history.push_back(Stage::BuildInvoked);

    if (removed.is_err()) {
        RelpackError err = std::move(removed).error();
        fail(run, Stage::TagRemoved, err);
        return err;
    }
    run.history.push_back(Stage::TagRemoved);
    return ok_status();
}

Status ReleasePipeline::build_platform_archives(PipelineRun& run) {
    if (!cfg_.build.binaries_command.empty()) {
        auto r = run_checked(runner_, cfg_.build.binaries_command, cfg_.root.string(),
                             cfg_.build.binaries_timeout);
        if (r.is_err()) {
            logger_.warn("platform binaries command failed: %s", r.error().message.c_str());
        }
    }

    PlatformArchiveBuilder builder(logger_, cfg_.inject.jobs);
    auto report = builder.build(cfg_.release.platforms_dir, cfg_.release.platforms_dir);
    if (report.is_err()) {
        if (cfg_.release.require_platform_archives) return std::move(report).error();
        logger_.warn("%s", report.error().message.c_str());
        logger_.warn("continuing without platform archives");
    } else {
        logger_.info("%zu platform archive(s) created, %zu skipped",
                     report.value().created_count(), report.value().skipped_count());
        run.platform_archives = std::move(report.value().created);
    }

    run.history.push_back(Stage::PlatformArchivesBuilt);
    return ok_status();
}

Status ReleasePipeline::inject(PipelineRun& run) {
    ReleaseArchiveInjector injector(logger_, cfg_.release.scratch_dir, cfg_.inject.jobs);
    auto report = injector.inject_directory(cfg_.release.dist_dir, cfg_.release.platforms_dir,
                                            cfg_.release.product);
    if (report.is_err()) return std::move(report).error();
    run.injection = std::move(report).value();

    if (!run.injection.skipped) {
        logger_.info("platform archives injected into %zu release archive(s), %zu failed",
                     run.injection.injected.size(), run.injection.failures.size());
    }
    RELPACK_TRY(enforce_policy(run.injection, cfg_.inject.on_failure));

    run.history.push_back(Stage::ArchivesInjected);
    return ok_status();
}

Status ReleasePipeline::verify_outputs(PipelineRun& run) {
    const fs::path& dist = cfg_.release.dist_dir;
    std::error_code ec;
    if (!fs::is_directory(dist, ec)) {
        return RelpackError{RelpackError::MissingInputDirectory,
            "dist directory not found: " + dist.string()};
    }

    auto archives = discover_release_archives(dist, cfg_.release.product);
    if (archives.is_err()) return std::move(archives).error();
    if (archives.value().empty()) {
        return RelpackError{RelpackError::NotFound,
            "no " + cfg_.release.product + "_* release archives in " + dist.string(),
            "check the build tool output and [release] product"};
    }

    std::vector<fs::path> paths;
    for (const auto& a : archives.value()) {
        auto members = list_archive(a.path(), a.format());
        if (members.is_err()) return std::move(members).error().with_context(a.name());
        auto size = a.size();
        logger_.info("%s: %zu member(s), %llu bytes", a.name().c_str(), members.value().size(),
                     static_cast<unsigned long long>(size.value_or(0)));
        paths.push_back(a.path());
    }
    run.release_archives = std::move(archives).value();

    auto name = render_template(cfg_.release.checksums_file, vars(run));
    if (name.is_err()) return std::move(name).error().with_context("checksums-file");
    fs::path checksums = dist / name.value();

    auto written = write_checksums_file(checksums, paths);
    if (written.is_err()) return std::move(written).error();
    RELPACK_TRY(verify_checksums(checksums, dist));
    logger_.info("%s: %zu entries verified", checksums.filename().string().c_str(),
                 written.value().size());

    run.history.push_back(Stage::OutputsVerified);
    return ok_status();
}

Status ReleasePipeline::generate_notes(PipelineRun& run) {
    ReleaseNotesAggregator notes(cfg_.notes.dir, logger_);
    const std::string tag = run.version ? run.version->to_tag() : run.requested;
    const std::string num = run.version ? run.version->to_numeric() : run.requested;

    // Per-release notes file published next to the archives
    std::string body;
    auto record = notes.load(num);
    if (record.is_err()) return std::move(record).error();
    if (record.value()) {
        body = render_record(*record.value());
    } else {
        logger_.warn("no release notes record for %s", num.c_str());
        body = "## " + num + "\n\nNo release notes record found for this version.\n";
    }

    auto commit = git_.short_head();
    if (commit.is_err()) logger_.warn("cannot determine commit: %s", commit.error().message.c_str());
    body += "\n## Build Information\n\n";
    body += "- Build Date: " + utc_timestamp() + "\n";
    body += "- Commit: " + commit.value_or("unknown") + "\n";

    fs::path per_release = cfg_.release.dist_dir / ("RELEASE_NOTES_" + tag + ".md");
    RELPACK_TRY(write_notes_document(per_release, body));
    logger_.info("wrote %s", per_release.filename().string().c_str());

    // Aggregated document
    AggregateOptions opts;
    opts.title = cfg_.notes.title;
    auto doc = notes.aggregate(std::nullopt, opts);
    if (doc.is_err()) return std::move(doc).error();
    fs::path aggregated = cfg_.notes.output_dir / cfg_.notes.filename;
    RELPACK_TRY(write_notes_document(aggregated, doc.value()));
    logger_.info("wrote %s", aggregated.string().c_str());

    RELPACK_TRY(notes.check_release_tags(git_, cfg_.notes.completeness));

    run.history.push_back(Stage::NotesGenerated);
    return ok_status();
}

} // namespace relpack
