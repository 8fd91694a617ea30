// relpack command-line entry point.
//
//     relpack release v1.2.3
//     relpack platform-archives [platforms-dir] [output-dir]
//     relpack inject [--dist DIR] [--platforms DIR]
//     relpack checksums v1.2.3
//     relpack notes [--check] [--warn-only] [--list-missing] [--version V]
//                   [--output DIR] [--filename NAME]
//     relpack validate-version v1.2.3
//
// Global options: --config PATH, --color auto|always|never, --verbose, --quiet
// Exit status: 0 success, 1 failure, 2 usage error.

#include <relpack/config.hpp>
#include <relpack/git.hpp>
#include <relpack/injector.hpp>
#include <relpack/log.hpp>
#include <relpack/pipeline.hpp>
#include <relpack/platform_archive_builder.hpp>
#include <relpack/release_notes.hpp>
#include <relpack/result.hpp>
#include <relpack/version.hpp>

#include <cstdio>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace relpack;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

const char* kUsage =
    "usage: relpack [--config PATH] [--color MODE] [--verbose|--quiet] <command> [args]\n"
    "\n"
    "commands:\n"
    "  release <version>                        run the full release pipeline\n"
    "  platform-archives [platforms] [output]   archive each platform directory\n"
    "  inject [--dist DIR] [--platforms DIR]    add platform archives to release archives\n"
    "  checksums <version>                      regenerate and verify the checksums file\n"
    "  notes [--check] [--warn-only] [--list-missing] [--version V]\n"
    "        [--output DIR] [--filename NAME]   aggregate or check release notes\n"
    "  validate-version <version>               check a version string\n";

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }
    bool flag(const std::string& name) const { return flags.count(name) > 0; }
};

const std::set<std::string> kValueOptions = {
    "--config", "--color", "--dist", "--platforms", "--version", "--output", "--filename",
};

const std::set<std::string> kFlagOptions = {
    "--verbose", "--quiet", "--help", "--check", "--warn-only", "--list-missing",
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h") arg = "--help";
        if (arg == "-v") arg = "--verbose";
        if (arg == "-q") arg = "--quiet";

        if (arg.rfind("--", 0) == 0) {
            std::string value;
            bool has_value = false;
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_value = true;
            }
            if (kValueOptions.count(arg)) {
                if (!has_value) {
                    if (i + 1 >= argc) {
                        return RelpackError{RelpackError::InvalidArg,
                            "option " + arg + " needs a value"};
                    }
                    value = argv[++i];
                }
                args.options[arg] = value;
            } else if (kFlagOptions.count(arg) && !has_value) {
                args.flags.insert(arg);
            } else {
                return RelpackError{RelpackError::InvalidArg, "unknown option " + arg};
            }
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return Result<Args>::ok(std::move(args));
}

Result<Config> load_config(const Args& args) {
    if (auto path = args.option("--config")) {
        return Config::load(*path);
    }
    std::error_code ec;
    if (fs::exists(kDefaultConfigFile, ec)) {
        return Config::load(kDefaultConfigFile);
    }
    return Result<Config>::ok(Config::defaults("."));
}

Result<log::Options> logger_options(const Args& args, const Config& cfg) {
    log::Options opts = cfg.log;
    if (args.flag("--verbose")) opts.level = log::Debug;
    if (args.flag("--quiet")) opts.level = log::Warn;
    if (auto color = args.option("--color")) {
        auto mode = log::parse_color_mode(*color);
        if (mode.is_err()) return std::move(mode).error();
        opts.color = mode.value();
    }
    return Result<log::Options>::ok(opts);
}

int usage_error(const std::string& msg) {
    std::fprintf(stderr, "relpack: %s\n\n%s", msg.c_str(), kUsage);
    return kExitUsage;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_release(const Args& args, const Config& cfg, log::Logger& logger) {
    if (args.positional.size() != 1) return usage_error("release needs exactly one version");
    SystemCommandRunner runner;
    ReleasePipeline pipeline(cfg, runner, logger);
    PipelineRun run = pipeline.run(args.positional[0]);
    return run.succeeded ? kExitOk : kExitFailure;
}

int cmd_platform_archives(const Args& args, const Config& cfg, log::Logger& logger) {
    if (args.positional.size() > 2) return usage_error("too many arguments");
    fs::path source = args.positional.empty() ? cfg.release.platforms_dir
                                              : fs::path(args.positional[0]);
    fs::path dest = args.positional.size() > 1 ? fs::path(args.positional[1]) : source;

    PlatformArchiveBuilder builder(logger, cfg.inject.jobs);
    auto report = builder.build(source, dest);
    if (report.is_err()) {
        logger.report(report.error());
        return kExitFailure;
    }
    logger.success("%zu platform archive(s) created, %zu skipped",
                   report.value().created_count(), report.value().skipped_count());
    return kExitOk;
}

int cmd_inject(const Args& args, const Config& cfg, log::Logger& logger) {
    if (!args.positional.empty()) return usage_error("inject takes no positional arguments");
    fs::path dist = args.option("--dist").value_or(cfg.release.dist_dir.string());
    fs::path platforms = args.option("--platforms").value_or(cfg.release.platforms_dir.string());

    ReleaseArchiveInjector injector(logger, cfg.release.scratch_dir, cfg.inject.jobs);
    auto report = injector.inject_directory(dist, platforms, cfg.release.product);
    if (report.is_err()) {
        logger.report(report.error());
        return kExitFailure;
    }
    auto st = enforce_policy(report.value(), cfg.inject.on_failure);
    if (st.is_err()) {
        logger.report(st.error());
        return kExitFailure;
    }
    if (!report.value().skipped) {
        logger.success("platform archives injected into %zu release archive(s)",
                       report.value().injected.size());
    }
    return kExitOk;
}

int cmd_checksums(const Args& args, const Config& cfg, log::Logger& logger) {
    if (args.positional.size() != 1) return usage_error("checksums needs exactly one version");
    auto version = Version::parse(args.positional[0]);
    if (version.is_err()) {
        logger.report(version.error());
        return kExitFailure;
    }

    SystemCommandRunner runner;
    ReleasePipeline pipeline(cfg, runner, logger);
    PipelineRun run;
    run.requested = args.positional[0];
    run.version = std::move(version).value();
    auto st = pipeline.verify_outputs(run);
    if (st.is_err()) {
        logger.report(st.error());
        return kExitFailure;
    }
    logger.success("checksums verified for %zu release archive(s)", run.release_archives.size());
    return kExitOk;
}

int cmd_notes(const Args& args, const Config& cfg, log::Logger& logger) {
    if (!args.positional.empty()) return usage_error("notes takes no positional arguments");
    ReleaseNotesAggregator notes(cfg.notes.dir, logger);

    if (args.flag("--list-missing") || args.flag("--check")) {
        SystemCommandRunner runner;
        GitCli git(runner, cfg.root.string(), cfg.git.timeout);

        if (args.flag("--list-missing")) {
            auto tags = git.list_release_tags();
            if (tags.is_err()) {
                logger.report(tags.error());
                return kExitFailure;
            }
            auto missing = notes.check_completeness(tags.value());
            if (missing.is_err()) {
                logger.report(missing.error());
                return kExitFailure;
            }
            std::printf("Versions without release notes:\n");
            for (const auto& v : missing.value()) std::printf("  %s\n", v.to_numeric().c_str());
            if (missing.value().empty()) std::printf("  (none)\n");
            return kExitOk;
        }

        CompletenessMode mode = args.flag("--warn-only") ? CompletenessMode::Warn
                                                         : CompletenessMode::Strict;
        auto st = notes.check_release_tags(git, mode);
        if (st.is_err()) {
            logger.report(st.error());
            return kExitFailure;
        }
        return kExitOk;
    }

    std::optional<std::vector<std::string>> subset;
    if (auto v = args.option("--version")) subset = std::vector<std::string>{*v};

    AggregateOptions opts;
    opts.title = cfg.notes.title;
    auto doc = notes.aggregate(subset, opts);
    if (doc.is_err()) {
        logger.report(doc.error());
        return kExitFailure;
    }

    fs::path out_dir = args.option("--output").value_or(cfg.notes.output_dir.string());
    std::string filename = args.option("--filename").value_or(cfg.notes.filename);
    fs::path out = out_dir / filename;
    auto st = write_notes_document(out, doc.value());
    if (st.is_err()) {
        logger.report(st.error());
        return kExitFailure;
    }
    logger.success("generated %s", out.string().c_str());
    return kExitOk;
}

int cmd_validate_version(const Args& args, log::Logger& logger) {
    if (args.positional.size() != 1) return usage_error("validate-version needs exactly one version");
    auto v = Version::parse(args.positional[0]);
    if (v.is_err()) {
        logger.report(v.error());
        return kExitFailure;
    }
    std::printf("%s %s\n", v.value().to_tag().c_str(), v.value().to_numeric().c_str());
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) return usage_error(parsed.error().message);
    const Args& args = parsed.value();

    if (args.flag("--help") || args.command.empty()) {
        std::fputs(kUsage, args.command.empty() && !args.flag("--help") ? stderr : stdout);
        return args.flag("--help") ? kExitOk : kExitUsage;
    }

    auto cfg = load_config(args);
    if (cfg.is_err()) {
        log::Logger fallback;
        fallback.report(cfg.error());
        return kExitFailure;
    }

    auto opts = logger_options(args, cfg.value());
    if (opts.is_err()) return usage_error(opts.error().message);
    log::Logger logger(opts.value());

    const std::string& cmd = args.command;
    if (cmd == "release")           return cmd_release(args, cfg.value(), logger);
    if (cmd == "platform-archives") return cmd_platform_archives(args, cfg.value(), logger);
    if (cmd == "inject")            return cmd_inject(args, cfg.value(), logger);
    if (cmd == "checksums")         return cmd_checksums(args, cfg.value(), logger);
    if (cmd == "notes")             return cmd_notes(args, cfg.value(), logger);
    if (cmd == "validate-version")  return cmd_validate_version(args, logger);
    return usage_error("unknown command '" + cmd + "'");
}
