#pragma once

#include <relpack/log.hpp>
#include <relpack/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace relpack {

enum class InjectFailurePolicy { Report, Fail };

enum class CompletenessMode { Off, Warn, Strict };

const char* completeness_mode_name(CompletenessMode mode);

struct ReleaseSettings {
    std::string product = "app";
    std::filesystem::path dist_dir = "dist";
    std::filesystem::path platforms_dir = "dist/platforms";
    std::string checksums_file = "checksums_{{ version_num }}.txt";
    bool require_platform_archives = false;
    std::filesystem::path scratch_dir;   // empty: system temp directory
};

struct BuildSettings {
    std::vector<std::string> tool = {"goreleaser", "~/go/bin/goreleaser"};
    std::vector<std::string> args = {"release", "--clean", "--skip-validate", "--skip-publish"};
    std::filesystem::path config_file = ".goreleaser.yml";
    std::vector<std::vector<std::string>> preflight = {{"go", "version"}};
    std::vector<std::string> binaries_command = {"make", "build-all-platforms"};
    std::vector<std::string> version_command;
    int timeout = 1800;
    int binaries_timeout = 1800;
};

struct GitSettings {
    int timeout = 60;
};

struct InjectSettings {
    InjectFailurePolicy on_failure = InjectFailurePolicy::Report;
    int jobs = 1;
};

struct NotesSettings {
    std::filesystem::path dir = "release-notes";
    std::filesystem::path output_dir = "dist";
    std::string filename = "RELEASE-NOTES.md";
    std::string title = "Release Notes";
    CompletenessMode completeness = CompletenessMode::Warn;
};

// Line-level rewrite of a version string in a source file
struct VersionFileRule {
    std::filesystem::path path;
    std::string pattern;   // ECMAScript regex matched against each line
    std::string replace;   // template; {{ version }} etc.
};

struct Config {
    std::filesystem::path root = ".";
    ReleaseSettings release;
    BuildSettings build;
    GitSettings git;
    InjectSettings inject;
    NotesSettings notes;
    std::vector<VersionFileRule> version_files;
    log::Options log;

    // Parse TOML text. Relative paths resolve against `root`.
    static Result<Config> parse(const std::string& toml_str,
                                const std::filesystem::path& root = ".");

    static Result<Config> load(const std::filesystem::path& path);

    // Defaults with paths resolved against `root`
    static Config defaults(const std::filesystem::path& root);
};

// Config file used when none is given on the command line
constexpr const char* kDefaultConfigFile = "relpack.toml";

} // namespace relpack
