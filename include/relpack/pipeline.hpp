#pragma once

#include <relpack/archive.hpp>
#include <relpack/config.hpp>
#include <relpack/git.hpp>
#include <relpack/injector.hpp>
#include <relpack/log.hpp>
#include <relpack/result.hpp>
#include <relpack/template.hpp>
#include <relpack/version.hpp>

#include <optional>
#include <string>
#include <vector>

namespace relpack {

enum class Stage {
    Idle,
    VersionValidated,
    DependenciesChecked,
    VersionFilesUpdated,
    TaggedForBuild,
    BuildInvoked,
    TagRemoved,
    TagRemovedOnFailure,
    PlatformArchivesBuilt,
    ArchivesInjected,
    OutputsVerified,
    NotesGenerated,
    Done
};

const char* stage_name(Stage s);

// State of one release invocation. Never persisted.
struct PipelineRun {
    std::string requested;                 // version as given
    std::optional<Version> version;
    std::string build_tool;                // resolved build tool path
    std::vector<Archive> platform_archives;
    std::vector<Archive> release_archives;
    InjectionReport injection;
    std::vector<Stage> history;            // stages reached, in order

    bool tag_created = false;
    bool tag_removed = false;

    bool succeeded = false;
    std::optional<Stage> failed_at;        // stage that could not be reached
    std::optional<RelpackError> error;

    Stage current() const { return history.empty() ? Stage::Idle : history.back(); }
    bool reached(Stage s) const;

    // One-line outcome, including what happened to the temporary tag
    std::string describe() const;
};

// Applies one [[version-files]] rule: every line matching `pattern` is
// rewritten with the rendered `replace` text. The file keeps its
// permissions and is replaced atomically. Returns the number of lines
// changed.
Result<size_t> rewrite_version_file(const VersionFileRule& rule, const TemplateVars& vars);

// Sequences the release stages:
//   validate -> dependencies -> version files -> tag / build / untag ->
//   platform archives -> inject -> verify + checksums -> notes
// and halts at the first fatal failure. The temporary build tag is removed
// on every path once it has been created.
class ReleasePipeline {
public:
    ReleasePipeline(Config cfg, CommandRunner& runner, log::Logger& logger)
        : cfg_(std::move(cfg)), runner_(runner), logger_(logger),
          git_(runner, cfg_.root.string(), cfg_.git.timeout) {}

    PipelineRun run(const std::string& version);

    // Individual stages, also used by the standalone subcommands
    Status build_platform_archives(PipelineRun& run);
    Status inject(PipelineRun& run);
    Status verify_outputs(PipelineRun& run);
    Status generate_notes(PipelineRun& run);

    const Config& config() const { return cfg_; }

private:
    Status check_dependencies(PipelineRun& run);
    Status update_version_files(PipelineRun& run);
    Status tagged_build(PipelineRun& run);

    TemplateVars vars(const PipelineRun& run) const;
    void fail(PipelineRun& run, Stage stage, RelpackError err);

    Config cfg_;
    CommandRunner& runner_;
    log::Logger& logger_;
    GitCli git_;
};

} // namespace relpack
