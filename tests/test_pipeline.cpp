#include <catch2/catch.hpp>
#include <relpack/archive.hpp>
#include <relpack/checksum.hpp>
#include <relpack/fs_util.hpp>
#include <relpack/pipeline.hpp>
#include "test_helpers.hpp"

#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace relpack;
using relpack::testing::CapturedLog;
using relpack::testing::FakeRunner;
using relpack::testing::TempDir;
using relpack::testing::read_text;
using relpack::testing::write_text;

namespace {

using Args = FakeRunner::Args;

CommandResult exited(int code, std::string err = "") {
    return CommandResult{code, "", std::move(err)};
}

// A project checkout with a scripted git, build tool and binaries build.
// Nothing is executed: the fake build tool writes release archives into
// dist/ and the fake binaries build fills dist/platforms/.
struct PipelineFixture {
    TempDir tmp;
    Config cfg = Config::defaults(tmp.path());
    FakeRunner runner;
    CapturedLog log{log::Debug};

    PipelineFixture() {
        cfg.build.tool = {"goreleaser"};
        cfg.build.args = {"release", "--clean"};
        write_text(cfg.build.config_file, "project_name: app\n");

        // No stale tag unless a test says otherwise
        runner.on({"git", "rev-parse", "-q", "--verify"}, 1);
        runner.on({"git", "rev-parse", "--short", "HEAD"}, 0, "abc1234\n");

        const Config& c = cfg;
        runner.on({"goreleaser", "release"}, [&c](const Args&) {
            fs::path stage = c.root / "stage";
            write_text(stage / "app", "binary");
            auto members = list_tree(stage).value();
            fs::create_directories(c.release.dist_dir);
            auto st = write_archive(c.release.dist_dir / "app_1.0.0_linux_amd64.tar.gz",
                                    ArchiveFormat::TarGz, stage, members);
            if (st.is_ok()) {
                st = write_archive(c.release.dist_dir / "app_1.0.0_windows_amd64.zip",
                                   ArchiveFormat::Zip, stage, members);
            }
            if (st.is_err()) return Result<CommandResult>::err(st.error());
            return Result<CommandResult>::ok(exited(0));
        });
        runner.on({"make", "build-all-platforms"}, [&c](const Args&) {
            write_text(c.release.platforms_dir / "linux-amd64/app", "linux");
            write_text(c.release.platforms_dir / "windows-amd64/app.exe", "windows");
            return Result<CommandResult>::ok(exited(0));
        });
    }

    PipelineRun run(const std::string& version = "v1.0.0") {
        ReleasePipeline pipeline(cfg, runner, log.logger());
        return pipeline.run(version);
    }

    fs::path dist(const std::string& name) const { return cfg.release.dist_dir / name; }
};

} // namespace

// ===== Happy path =====

TEST_CASE("full release produces verified, injected archives", "[pipeline]") {
    PipelineFixture fx;
    write_text(fx.cfg.notes.dir / "1.0.0.json",
               R"({"version": "1.0.0", "date": "2024-03-01", "tag": "v1.0.0", "summary": "First"})");

    auto run = fx.run();
    INFO(fx.log.text());
    REQUIRE(run.succeeded);
    REQUIRE_FALSE(run.failed_at.has_value());
    REQUIRE(run.tag_created);
    REQUIRE(run.tag_removed);
    REQUIRE(run.current() == Stage::Done);
    REQUIRE(run.build_tool == "goreleaser");

    // Stage order
    std::vector<Stage> expected{Stage::VersionValidated, Stage::DependenciesChecked,
                                Stage::VersionFilesUpdated, Stage::TaggedForBuild,
                                Stage::BuildInvoked, Stage::TagRemoved,
                                Stage::PlatformArchivesBuilt, Stage::ArchivesInjected,
                                Stage::OutputsVerified, Stage::NotesGenerated, Stage::Done};
    REQUIRE(run.history == expected);

    // The tag exists exactly while the build tool runs
    int tag = fx.runner.index_of({"git", "tag", "v1.0.0"});
    int build = fx.runner.index_of({"goreleaser", "release"});
    int untag = fx.runner.index_of({"git", "tag", "-d", "v1.0.0"});
    REQUIRE(tag >= 0);
    REQUIRE(tag < build);
    REQUIRE(build < untag);
    REQUIRE(fx.runner.index_of({"make", "build-all-platforms"}) > untag);

    // Platform archives built and injected
    REQUIRE(run.platform_archives.size() == 2);
    REQUIRE(run.injection.injected.size() == 2);
    REQUIRE(read_member(fx.dist("app_1.0.0_windows_amd64.zip"), ArchiveFormat::Zip,
                        "platforms/linux-amd64.tar.gz").is_ok());

    // Checksums cover the final archives
    REQUIRE(run.release_archives.size() == 2);
    REQUIRE(verify_checksums(fx.dist("checksums_1.0.0.txt"), fx.cfg.release.dist_dir).is_ok());
    auto sums = parse_checksums(read_text(fx.dist("checksums_1.0.0.txt"))).value();
    REQUIRE(sums.size() == 2);

    // Notes
    auto per_release = read_text(fx.dist("RELEASE_NOTES_v1.0.0.md"));
    REQUIRE(per_release.find("## 1.0.0") != std::string::npos);
    REQUIRE(per_release.find("- Commit: abc1234") != std::string::npos);
    auto aggregated = read_text(fx.cfg.notes.output_dir / fx.cfg.notes.filename);
    REQUIRE(aggregated.find("First") != std::string::npos);

    REQUIRE(run.describe() == "release v1.0.0 succeeded (temporary tag v1.0.0 was removed)");
}

TEST_CASE("a stale tag is removed before tagging", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"git", "rev-parse", "-q", "--verify"}, 0, "deadbeef\n");

    auto run = fx.run();
    REQUIRE(run.succeeded);
    REQUIRE(fx.runner.count({"git", "tag", "-d", "v1.0.0"}) == 2);
    REQUIRE(fx.runner.index_of({"git", "tag", "-d"}) < fx.runner.index_of({"git", "tag", "v1.0.0"}));
}

TEST_CASE("missing release notes record gets a placeholder", "[pipeline]") {
    PipelineFixture fx;
    auto run = fx.run();
    REQUIRE(run.succeeded);
    auto text = read_text(fx.dist("RELEASE_NOTES_v1.0.0.md"));
    REQUIRE(text.find("No release notes record found") != std::string::npos);
    REQUIRE(text.find("## Build Information") != std::string::npos);
}

// ===== Failures =====

TEST_CASE("invalid version stops before any command runs", "[pipeline]") {
    PipelineFixture fx;
    auto run = fx.run("1.0.0");
    REQUIRE_FALSE(run.succeeded);
    REQUIRE(run.failed_at == Stage::VersionValidated);
    REQUIRE(run.error->code == RelpackError::InvalidVersionFormat);
    REQUIRE(run.history.empty());
    REQUIRE(fx.runner.calls.empty());
    REQUIRE(run.describe().find("(no temporary tag was created)") != std::string::npos);
}

TEST_CASE("missing build tool fails the dependency check", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"goreleaser", "--version"}, 127);

    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::DependenciesChecked);
    REQUIRE(run.error->code == RelpackError::ExternalTool);
    REQUIRE_FALSE(run.tag_created);
    REQUIRE_FALSE(fx.runner.called({"git", "tag"}));
}

TEST_CASE("failing preflight command fails the dependency check", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"go", "version"}, 127);

    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::DependenciesChecked);
    REQUIRE(run.error->hint == "required by the preflight check");
}

TEST_CASE("not a git repository", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"git", "rev-parse", "--git-dir"}, 128);
    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::DependenciesChecked);
    REQUIRE(run.error->message.find("not a git repository") != std::string::npos);
}

TEST_CASE("missing build configuration file", "[pipeline]") {
    PipelineFixture fx;
    fs::remove(fx.cfg.build.config_file);
    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::DependenciesChecked);
    REQUIRE(run.error->code == RelpackError::NotFound);
}

TEST_CASE("build failure still removes the temporary tag", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"goreleaser", "release"}, 1, "", "error: dirty tree");

    auto run = fx.run();
    REQUIRE_FALSE(run.succeeded);
    REQUIRE(run.failed_at == Stage::BuildInvoked);
    REQUIRE(run.error->code == RelpackError::ExternalTool);
    REQUIRE(run.error->message.find("dirty tree") != std::string::npos);
    REQUIRE(run.tag_created);
    REQUIRE(run.tag_removed);
    REQUIRE(run.reached(Stage::TagRemovedOnFailure));
    REQUIRE_FALSE(run.reached(Stage::BuildInvoked));
    REQUIRE(fx.runner.count({"git", "tag", "-d", "v1.0.0"}) == 1);
    REQUIRE_FALSE(fx.runner.called({"make"}));
    REQUIRE(run.describe().find("temporary tag v1.0.0 was removed") != std::string::npos);
}

TEST_CASE("build timeout keeps its error code and removes the tag", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"goreleaser", "release"}, [](const Args&) {
        return Result<CommandResult>::err(RelpackError{RelpackError::Timeout, "timed out"});
    });

    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::BuildInvoked);
    REQUIRE(run.error->code == RelpackError::Timeout);
    REQUIRE(run.tag_removed);
}

TEST_CASE("build failure with a stuck tag says how to clean up", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"goreleaser", "release"}, 1);
    fx.runner.on({"git", "tag", "-d"}, 1, "", "cannot lock ref");

    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::BuildInvoked);
    REQUIRE_FALSE(run.tag_removed);
    REQUIRE(run.error->hint.find("git tag -d v1.0.0") != std::string::npos);
    REQUIRE(run.describe().find("was NOT removed; run: git tag -d v1.0.0") != std::string::npos);
    REQUIRE(fx.runner.count({"git", "tag", "-d", "v1.0.0"}) == 1);
}

TEST_CASE("tag removal failure after a good build fails the run", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"git", "tag", "-d"}, 1, "", "cannot lock ref");

    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::TagRemoved);
    REQUIRE(run.reached(Stage::BuildInvoked));
    REQUIRE_FALSE(run.tag_removed);
    REQUIRE_FALSE(fx.runner.called({"make"}));
}

TEST_CASE("no platform archives is a warning unless required", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"make", "build-all-platforms"}, 2, "", "no cross compiler");

    SECTION("optional") {
        auto run = fx.run();
        REQUIRE(run.succeeded);
        REQUIRE(run.platform_archives.empty());
        REQUIRE(run.injection.skipped);
        REQUIRE(fx.log.contains("continuing without platform archives"));
        REQUIRE(list_archive(fx.dist("app_1.0.0_linux_amd64.tar.gz"),
                             ArchiveFormat::TarGz).value().size() == 1);
    }
    SECTION("required") {
        fx.cfg.release.require_platform_archives = true;
        auto run = fx.run();
        REQUIRE(run.failed_at == Stage::PlatformArchivesBuilt);
        REQUIRE(run.error->code == RelpackError::MissingInputDirectory);
        REQUIRE(run.tag_removed);
    }
}

TEST_CASE("injection failure policy", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"goreleaser", "release"}, [&fx](const Args&) {
        write_text(fx.dist("app_1.0.0_linux_amd64.tar.gz"), "corrupt");
        return Result<CommandResult>::ok(exited(0));
    });

    SECTION("report") {
        auto run = fx.run();
        // The corrupt archive is still listed when verifying, which fails
        REQUIRE(run.reached(Stage::ArchivesInjected));
        REQUIRE(run.injection.failures.size() == 1);
        REQUIRE(run.failed_at == Stage::OutputsVerified);
    }
    SECTION("fail") {
        fx.cfg.inject.on_failure = InjectFailurePolicy::Fail;
        auto run = fx.run();
        REQUIRE(run.failed_at == Stage::ArchivesInjected);
        REQUIRE(run.error->code == RelpackError::ArchiveRewrite);
    }
}

TEST_CASE("build that produces no release archives fails verification", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"goreleaser", "release"}, 0);

    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::OutputsVerified);
    REQUIRE(run.error->code == RelpackError::NotFound);
}

TEST_CASE("strict completeness fails on missing records", "[pipeline]") {
    PipelineFixture fx;
    fx.cfg.notes.completeness = CompletenessMode::Strict;
    fx.runner.on({"git", "tag", "-l"}, 0, "v1.0.0\nv0.9.0\n");
    write_text(fx.cfg.notes.dir / "1.0.0.json",
               R"({"version": "1.0.0", "date": "2024-03-01", "tag": "v1.0.0"})");

    auto run = fx.run();
    REQUIRE(run.failed_at == Stage::NotesGenerated);
    REQUIRE(run.error->code == RelpackError::MissingRecords);
    REQUIRE(fx.log.contains("0.9.0 (tag: v0.9.0)"));
    // Outputs written before the check are kept
    REQUIRE(fs::exists(fx.dist("RELEASE_NOTES_v1.0.0.md")));
}

TEST_CASE("warn completeness only logs", "[pipeline]") {
    PipelineFixture fx;
    fx.runner.on({"git", "tag", "-l"}, 0, "v1.0.0\nv0.9.0\n");
    auto run = fx.run();
    REQUIRE(run.succeeded);
    REQUIRE(fx.log.contains("warn: missing release notes for 2 version(s):"));
}

// ===== Version files =====

TEST_CASE("rewrite_version_file replaces matching lines", "[pipeline]") {
    TempDir tmp;
    fs::path file = tmp / "version.go";
    write_text(file, "package main\n\nconst Version = \"0.0.0-dev\"\nconst Other = \"x\"\n");
    fs::permissions(file, fs::perms(0640), fs::perm_options::replace);

    VersionFileRule rule{file, R"(Version = ".*")", R"(Version = "{{ version_num }}")"};
    auto changed = rewrite_version_file(rule, release_vars("v1.2.3", "app"));
    REQUIRE(changed.is_ok());
    REQUIRE(changed.value() == 1);
    REQUIRE(read_text(file) ==
            "package main\n\nconst Version = \"1.2.3\"\nconst Other = \"x\"\n");
    REQUIRE((fs::status(file).permissions() & fs::perms::all) == fs::perms(0640));

    // Already up to date
    REQUIRE(rewrite_version_file(rule, release_vars("v1.2.3", "app")).value() == 0);
}

TEST_CASE("rewrite_version_file errors", "[pipeline]") {
    TempDir tmp;
    write_text(tmp / "v.txt", "version=1\n");
    VersionFileRule unknown{tmp / "v.txt", "version=.*", "version={{ nope }}"};
    auto r = rewrite_version_file(unknown, release_vars("v1.0.0", "app"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RelpackError::NotFound);

    VersionFileRule missing{tmp / "absent.txt", "x", "y"};
    REQUIRE(rewrite_version_file(missing, release_vars("v1.0.0", "app")).is_err());
}

TEST_CASE("pipeline updates version files and runs the version command", "[pipeline]") {
    PipelineFixture fx;
    write_text(fx.tmp / "VERSION", "0.0.0\n");
    fx.cfg.version_files.push_back(
        VersionFileRule{fx.tmp / "VERSION", R"(^\d+\.\d+\.\d+$)", "{{ version_num }}"});
    fx.cfg.version_files.push_back(
        VersionFileRule{fx.tmp / "absent.go", "x", "y"});
    fx.cfg.build.version_command = {"make", "set-version", "VERSION={{ version_num }}"};

    auto run = fx.run("v2.1.0");
    REQUIRE(run.reached(Stage::VersionFilesUpdated));
    REQUIRE(read_text(fx.tmp / "VERSION") == "2.1.0\n");
    REQUIRE(fx.runner.called({"make", "set-version", "VERSION=2.1.0"}));
    REQUIRE(fx.log.contains("absent.go not found, skipping"));
}

// ===== Stages =====

TEST_CASE("stage names", "[pipeline]") {
    REQUIRE(std::string(stage_name(Stage::BuildInvoked)) == "build");
    REQUIRE(std::string(stage_name(Stage::TagRemovedOnFailure)) == "remove-tag-after-failure");
    REQUIRE(std::string(stage_name(Stage::OutputsVerified)) == "verify");

    PipelineRun run;
    REQUIRE(run.current() == Stage::Idle);
    REQUIRE_FALSE(run.reached(Stage::Done));
}
