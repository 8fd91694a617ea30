#include <relpack/config.hpp>
#include <toml++/toml.hpp>

#include <fstream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace relpack {

const char* completeness_mode_name(CompletenessMode mode) {
    switch (mode) {
        case CompletenessMode::Off:    return "off";
        case CompletenessMode::Warn:   return "warn";
        case CompletenessMode::Strict: return "strict";
    }
    return "unknown";
}

namespace {

RelpackError config_error(const std::string& key, const std::string& what) {
    return RelpackError{RelpackError::Config, "config key '" + key + "': " + what};
}

fs::path resolve(const fs::path& root, const fs::path& p) {
    if (p.empty() || p.is_absolute()) return p;
    return (root / p).lexically_normal();
}

// Typed accessors. Absent keys leave `out` at its default; a value of the
// wrong type is an error naming the key.

Status get_string(const toml::table& tbl, const std::string& section,
                  const char* key, std::string& out) {
    const toml::node* node = tbl.get(key);
    if (node == nullptr) return ok_status();
    auto v = node->value<std::string>();
    if (!v) return config_error(section + "." + key, "expected a string");
    out = *v;
    return ok_status();
}

Status get_path(const toml::table& tbl, const std::string& section,
                const char* key, fs::path& out) {
    std::string s = out.string();
    RELPACK_TRY(get_string(tbl, section, key, s));
    out = s;
    return ok_status();
}

Status get_bool(const toml::table& tbl, const std::string& section,
                const char* key, bool& out) {
    const toml::node* node = tbl.get(key);
    if (node == nullptr) return ok_status();
    auto v = node->value<bool>();
    if (!v) return config_error(section + "." + key, "expected a boolean");
    out = *v;
    return ok_status();
}

Status get_positive(const toml::table& tbl, const std::string& section,
                    const char* key, int& out) {
    const toml::node* node = tbl.get(key);
    if (node == nullptr) return ok_status();
    auto v = node->value<int64_t>();
    if (!v) return config_error(section + "." + key, "expected an integer");
    if (*v <= 0 || *v > 1000000) {
        return config_error(section + "." + key, "must be a positive integer");
    }
    out = static_cast<int>(*v);
    return ok_status();
}

Result<std::vector<std::string>> string_list(const toml::node& node, const std::string& key) {
    std::vector<std::string> out;
    if (auto s = node.value<std::string>()) {
        // A plain string is split on whitespace
        std::istringstream in(*s);
        std::string word;
        while (in >> word) out.push_back(word);
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    const toml::array* arr = node.as_array();
    if (arr == nullptr) return config_error(key, "expected a string or an array of strings");
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) return config_error(key, "expected an array of strings");
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Status get_list(const toml::table& tbl, const std::string& section,
                const char* key, std::vector<std::string>& out) {
    const toml::node* node = tbl.get(key);
    if (node == nullptr) return ok_status();
    auto list = string_list(*node, section + "." + key);
    if (list.is_err()) return std::move(list).error();
    out = std::move(list).value();
    return ok_status();
}

// Section lookup; a key that exists but is not a table is an error
Result<const toml::table*> find_section(const toml::table& doc, const char* name) {
    const toml::node* node = doc.get(name);
    if (node == nullptr) return Result<const toml::table*>::ok(nullptr);
    if (!node->is_table()) return config_error(name, "expected a table");
    return Result<const toml::table*>::ok(node->as_table());
}

Status parse_release(const toml::table& t, ReleaseSettings& r) {
    RELPACK_TRY(get_string(t, "release", "product", r.product));
    RELPACK_TRY(get_path(t, "release", "dist-dir", r.dist_dir));
    RELPACK_TRY(get_path(t, "release", "platforms-dir", r.platforms_dir));
    RELPACK_TRY(get_string(t, "release", "checksums-file", r.checksums_file));
    RELPACK_TRY(get_bool(t, "release", "require-platform-archives",
                         r.require_platform_archives));
    RELPACK_TRY(get_path(t, "release", "scratch-dir", r.scratch_dir));
    if (r.product.empty()) return config_error("release.product", "must not be empty");
    return ok_status();
}

Status parse_build(const toml::table& t, BuildSettings& b) {
    RELPACK_TRY(get_list(t, "build", "tool", b.tool));
    RELPACK_TRY(get_list(t, "build", "args", b.args));
    RELPACK_TRY(get_path(t, "build", "config-file", b.config_file));
    RELPACK_TRY(get_list(t, "build", "binaries-command", b.binaries_command));
    RELPACK_TRY(get_list(t, "build", "version-command", b.version_command));
    RELPACK_TRY(get_positive(t, "build", "timeout", b.timeout));
    RELPACK_TRY(get_positive(t, "build", "binaries-timeout", b.binaries_timeout));

    if (const toml::node* node = t.get("preflight")) {
        const toml::array* arr = node->as_array();
        if (arr == nullptr) return config_error("build.preflight", "expected an array");
        b.preflight.clear();
        for (const auto& el : *arr) {
            auto cmd = string_list(el, "build.preflight");
            if (cmd.is_err()) return std::move(cmd).error();
            if (!cmd.value().empty()) b.preflight.push_back(std::move(cmd).value());
        }
    }
    if (b.tool.empty()) return config_error("build.tool", "needs at least one candidate");
    return ok_status();
}

Status parse_inject(const toml::table& t, InjectSettings& i) {
    std::string policy = i.on_failure == InjectFailurePolicy::Fail ? "fail" : "report";
    RELPACK_TRY(get_string(t, "inject", "on-failure", policy));
    if (policy == "report") {
        i.on_failure = InjectFailurePolicy::Report;
    } else if (policy == "fail") {
        i.on_failure = InjectFailurePolicy::Fail;
    } else {
        return RelpackError{RelpackError::Config,
            "config key 'inject.on-failure': unknown value '" + policy + "'",
            "expected one of: report, fail"};
    }
    return get_positive(t, "inject", "jobs", i.jobs);
}

Status parse_notes(const toml::table& t, NotesSettings& n) {
    RELPACK_TRY(get_path(t, "notes", "dir", n.dir));
    RELPACK_TRY(get_path(t, "notes", "output-dir", n.output_dir));
    RELPACK_TRY(get_string(t, "notes", "filename", n.filename));
    RELPACK_TRY(get_string(t, "notes", "title", n.title));

    std::string mode = completeness_mode_name(n.completeness);
    RELPACK_TRY(get_string(t, "notes", "completeness", mode));
    if (mode == "off") {
        n.completeness = CompletenessMode::Off;
    } else if (mode == "warn") {
        n.completeness = CompletenessMode::Warn;
    } else if (mode == "strict") {
        n.completeness = CompletenessMode::Strict;
    } else {
        return RelpackError{RelpackError::Config,
            "config key 'notes.completeness': unknown value '" + mode + "'",
            "expected one of: off, warn, strict"};
    }
    if (n.filename.empty()) return config_error("notes.filename", "must not be empty");
    return ok_status();
}

Status parse_version_files(const toml::node& node, std::vector<VersionFileRule>& rules) {
    const toml::array* arr = node.as_array();
    if (arr == nullptr) return config_error("version-files", "expected an array of tables");
    for (size_t i = 0; i < arr->size(); ++i) {
        std::string key = "version-files[" + std::to_string(i) + "]";
        const toml::table* t = (*arr)[i].as_table();
        if (t == nullptr) return config_error(key, "expected a table");

        VersionFileRule rule;
        std::string path;
        RELPACK_TRY(get_string(*t, key, "path", path));
        RELPACK_TRY(get_string(*t, key, "pattern", rule.pattern));
        RELPACK_TRY(get_string(*t, key, "replace", rule.replace));
        if (path.empty() || rule.pattern.empty()) {
            return config_error(key, "'path' and 'pattern' are required");
        }
        try {
            std::regex check(rule.pattern);
        } catch (const std::regex_error& e) {
            return config_error(key + ".pattern", std::string("invalid regex: ") + e.what());
        }
        rule.path = path;
        rules.push_back(std::move(rule));
    }
    return ok_status();
}

Status parse_log(const toml::table& t, log::Options& opts) {
    std::string level = log::level_name(opts.level);
    RELPACK_TRY(get_string(t, "log", "level", level));
    auto lvl = log::parse_level(level);
    if (lvl.is_err()) return std::move(lvl).error().with_context("config key 'log.level'");
    opts.level = lvl.value();

    const toml::node* color = t.get("color");
    if (color != nullptr) {
        auto s = color->value<std::string>();
        if (!s) return config_error("log.color", "expected a string");
        auto mode = log::parse_color_mode(*s);
        if (mode.is_err()) return std::move(mode).error().with_context("config key 'log.color'");
        opts.color = mode.value();
    }
    return ok_status();
}

void resolve_paths(Config& cfg) {
    cfg.release.dist_dir = resolve(cfg.root, cfg.release.dist_dir);
    cfg.release.platforms_dir = resolve(cfg.root, cfg.release.platforms_dir);
    cfg.release.scratch_dir = resolve(cfg.root, cfg.release.scratch_dir);
    cfg.build.config_file = resolve(cfg.root, cfg.build.config_file);
    cfg.notes.dir = resolve(cfg.root, cfg.notes.dir);
    cfg.notes.output_dir = resolve(cfg.root, cfg.notes.output_dir);
    for (auto& rule : cfg.version_files) rule.path = resolve(cfg.root, rule.path);
}

} // namespace

Config Config::defaults(const fs::path& root) {
    Config cfg;
    cfg.root = root;
    resolve_paths(cfg);
    return cfg;
}

Result<Config> Config::parse(const std::string& toml_str, const fs::path& root) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return RelpackError{RelpackError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;
    cfg.root = root;

    auto release = find_section(doc, "release");
    if (release.is_err()) return std::move(release).error();
    if (release.value()) RELPACK_TRY(parse_release(*release.value(), cfg.release));

    auto build = find_section(doc, "build");
    if (build.is_err()) return std::move(build).error();
    if (build.value()) RELPACK_TRY(parse_build(*build.value(), cfg.build));

    auto git = find_section(doc, "git");
    if (git.is_err()) return std::move(git).error();
    if (git.value()) RELPACK_TRY(get_positive(*git.value(), "git", "timeout", cfg.git.timeout));

    auto inject = find_section(doc, "inject");
    if (inject.is_err()) return std::move(inject).error();
    if (inject.value()) RELPACK_TRY(parse_inject(*inject.value(), cfg.inject));

    auto notes = find_section(doc, "notes");
    if (notes.is_err()) return std::move(notes).error();
    if (notes.value()) RELPACK_TRY(parse_notes(*notes.value(), cfg.notes));

    if (const toml::node* vf = doc.get("version-files")) {
        RELPACK_TRY(parse_version_files(*vf, cfg.version_files));
    }

    auto log_section = find_section(doc, "log");
    if (log_section.is_err()) return std::move(log_section).error();
    if (log_section.value()) RELPACK_TRY(parse_log(*log_section.value(), cfg.log));

    resolve_paths(cfg);
    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return RelpackError{RelpackError::IO,
            "cannot open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    fs::path root = path.parent_path();
    if (root.empty()) root = ".";
    auto cfg = Config::parse(ss.str(), root);
    if (cfg.is_err()) {
        RelpackError err = std::move(cfg).error();
        if (err.line > 0) err.file = path.string();
        else err = err.with_context(path.string());
        return err;
    }
    return cfg;
}

} // namespace relpack
