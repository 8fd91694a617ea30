#include <relpack/release_notes.hpp>
#include <relpack/fs_util.hpp>
#include <relpack/git.hpp>
#include <relpack/template.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace relpack {

// ---------------------------------------------------------------------------
// Categories
// ---------------------------------------------------------------------------

const char* category_key(ChangeCategory c) {
    switch (c) {
        case ChangeCategory::Breaking:     return "breaking";
        case ChangeCategory::Security:     return "security";
        case ChangeCategory::Features:     return "features";
        case ChangeCategory::Improvements: return "improvements";
        case ChangeCategory::Fixes:        return "fixes";
        case ChangeCategory::Docs:         return "docs";
    }
    return "";
}

const char* category_title(ChangeCategory c) {
    switch (c) {
        case ChangeCategory::Breaking:     return "Breaking Changes";
        case ChangeCategory::Security:     return "Security";
        case ChangeCategory::Features:     return "New Features";
        case ChangeCategory::Improvements: return "Improvements";
        case ChangeCategory::Fixes:        return "Bug Fixes";
        case ChangeCategory::Docs:         return "Documentation";
    }
    return "";
}

std::optional<ChangeCategory> parse_category(const std::string& key) {
    for (ChangeCategory c : kChangeCategories) {
        if (key == category_key(c)) return c;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Record parsing
// ---------------------------------------------------------------------------

namespace {

// Reads typed fields out of a record object. A field of the wrong type is
// left absent and noted in `errors`.
class FieldReader {
public:
    explicit FieldReader(std::vector<ValidationError>& errors) : errors_(errors) {}

    void string(const json& obj, const std::string& key, std::optional<std::string>& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return;
        if (!it->is_string()) return wrong_type(key, "a string");
        out = it->get<std::string>();
    }

    void text(const json& obj, const std::string& key, std::string& out) {
        std::optional<std::string> v;
        string(obj, key, v);
        if (v) out = std::move(*v);
    }

    void string_list(const json& obj, const std::string& key, std::vector<std::string>& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return;
        if (!it->is_array()) return wrong_type(key, "an array of strings");
        for (const auto& el : *it) {
            if (!el.is_string()) return wrong_type(key, "an array of strings");
        }
        for (const auto& el : *it) out.push_back(el.get<std::string>());
    }

    std::optional<ChangeItem> change(const json& el, const std::string& where) {
        if (!el.is_object()) {
            wrong_type(where, "an object");
            return std::nullopt;
        }
        ChangeItem item;
        auto desc = el.find("description");
        if (desc != el.end() && !desc->is_null()) {
            if (desc->is_string()) {
                item.description = desc->get<std::string>();
            } else {
                wrong_type(where + ".description", "a string");
            }
        }
        auto issue = el.find("issue");
        if (issue != el.end() && !issue->is_null()) {
            std::string value;
            if (issue->is_string()) {
                value = issue->get<std::string>();
            } else if (issue->is_number_integer()) {
                value = std::to_string(issue->get<long long>());
            } else {
                wrong_type(where + ".issue", "a string or an integer");
            }
            if (!value.empty()) item.issue = std::move(value);
        }
        return item;
    }

    void wrong_type(const std::string& field, const char* expected) {
        errors_.push_back({field, "field '" + field + "' must be " + expected});
    }

private:
    std::vector<ValidationError>& errors_;
};

} // namespace

Result<ReleaseNoteRecord> ReleaseNoteRecord::from_json(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return RelpackError{RelpackError::Parse, std::string("invalid JSON: ") + e.what()};
    }
    if (!doc.is_object()) {
        return RelpackError{RelpackError::Parse, "release notes must be a JSON object"};
    }

    ReleaseNoteRecord rec;
    FieldReader read(rec.type_errors);
    read.string(doc, "version", rec.version);
    read.string(doc, "date", rec.date);
    read.string(doc, "tag", rec.tag);
    read.text(doc, "summary", rec.summary);
    read.string_list(doc, "highlights", rec.highlights);
    read.string_list(doc, "components", rec.components);
    read.text(doc, "notes", rec.notes);

    auto changes = doc.find("changes");
    if (changes != doc.end() && !changes->is_null()) {
        if (!changes->is_object()) {
            read.wrong_type("changes", "an object");
        } else {
            for (const auto& [key, items] : changes->items()) {
                auto cat = parse_category(key);
                if (!cat) {
                    rec.unknown_categories.push_back(key);
                    continue;
                }
                if (!items.is_array()) {
                    read.wrong_type("changes." + key, "an array");
                    continue;
                }
                auto& list = rec.changes[*cat];
                for (const auto& el : items) {
                    auto item = read.change(el, "changes." + key);
                    if (item) list.push_back(std::move(*item));
                }
            }
        }
    }
    return Result<ReleaseNoteRecord>::ok(std::move(rec));
}

// ---------------------------------------------------------------------------
// Validation and rendering
// ---------------------------------------------------------------------------

std::vector<ValidationError> validate_record(const ReleaseNoteRecord& record,
                                             const std::string& expected_version) {
    std::vector<ValidationError> errors = record.type_errors;
    auto mistyped = [&](const char* field) {
        return std::any_of(record.type_errors.begin(), record.type_errors.end(),
                           [&](const ValidationError& e) { return e.field == field; });
    };
    auto require = [&](const std::optional<std::string>& value, const char* field) {
        if (!value && !mistyped(field)) {
            errors.push_back({field, std::string("missing required field: ") + field});
        }
    };
    require(record.version, "version");
    require(record.date, "date");
    require(record.tag, "tag");

    if (record.version && *record.version != expected_version) {
        errors.push_back({"version", "version mismatch: file is " + expected_version +
                                     ".json but contains version " + *record.version});
    }
    if (record.tag && (record.tag->empty() || (*record.tag)[0] != 'v')) {
        errors.push_back({"tag", "tag should start with 'v': " + *record.tag});
    }
    return errors;
}

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string render_record(const ReleaseNoteRecord& record) {
    std::vector<std::string> lines;
    lines.push_back("## " + record.version.value_or("Unknown"));
    lines.push_back("");
    lines.push_back("**Release Date:** " + record.date.value_or("Unknown"));
    lines.push_back("");

    if (!record.summary.empty()) {
        lines.push_back(record.summary);
        lines.push_back("");
    }

    if (!record.highlights.empty()) {
        lines.push_back("### Highlights");
        lines.push_back("");
        for (const auto& h : record.highlights) lines.push_back("- " + h);
        lines.push_back("");
    }

    for (ChangeCategory cat : kChangeCategories) {
        auto it = record.changes.find(cat);
        if (it == record.changes.end() || it->second.empty()) continue;
        lines.push_back(std::string("### ") + category_title(cat));
        lines.push_back("");
        for (const auto& item : it->second) {
            if (item.issue) {
                lines.push_back("- " + item.description + " (" + *item.issue + ")");
            } else {
                lines.push_back("- " + item.description);
            }
        }
        lines.push_back("");
    }

    if (!record.components.empty()) {
        std::string joined;
        for (const auto& c : record.components) {
            if (!joined.empty()) joined += ", ";
            joined += c;
        }
        lines.push_back("### Affected Components");
        lines.push_back("");
        lines.push_back(joined);
        lines.push_back("");
    }

    if (!record.notes.empty()) {
        lines.push_back("### Notes");
        lines.push_back("");
        lines.push_back(record.notes);
        lines.push_back("");
    }

    return join_lines(lines);
}

// ---------------------------------------------------------------------------
// Aggregator
// ---------------------------------------------------------------------------

static std::string strip_v(const std::string& version) {
    if (!version.empty() && version[0] == 'v') return version.substr(1);
    return version;
}

fs::path ReleaseNotesAggregator::record_path(const std::string& version) const {
    return dir_ / (version + ".json");
}

Result<std::optional<ReleaseNoteRecord>>
ReleaseNotesAggregator::load(const std::string& version) const {
    using Loaded = std::optional<ReleaseNoteRecord>;
    fs::path path = record_path(strip_v(version));
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return RelpackError{RelpackError::IO,
                "cannot access " + path.string() + ": " + ec.message()};
        }
        return Result<Loaded>::ok(std::nullopt);
    }

    auto text = read_file(path);
    if (text.is_err()) return std::move(text).error();
    auto rec = ReleaseNoteRecord::from_json(text.value());
    if (rec.is_err()) {
        RelpackError err = std::move(rec).error();
        err.file = path.string();
        return err;
    }
    for (const auto& key : rec.value().unknown_categories) {
        logger_.debug("%s: ignoring unknown change category '%s'",
                      path.filename().string().c_str(), key.c_str());
    }
    return Result<Loaded>::ok(std::move(rec).value());
}

Result<std::vector<std::string>> ReleaseNotesAggregator::existing_versions() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return Result<std::vector<std::string>>::ok(std::move(names));
    }

    fs::directory_iterator it(dir_, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        std::string file = p.filename().string();
        if (p.extension() != ".json" || file[0] == '_') continue;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        names.push_back(p.stem().string());
    }
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot list " + dir_.string() + ": " + ec.message()};
    }

    // Newest first by numeric version; anything unparseable goes last
    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        auto va = Version::parse_numeric(a);
        auto vb = Version::parse_numeric(b);
        if (va.is_ok() && vb.is_ok()) {
            int c = va.value().compare(vb.value());
            return c != 0 ? c > 0 : a < b;
        }
        if (va.is_ok() != vb.is_ok()) return va.is_ok();
        return a < b;
    });
    return Result<std::vector<std::string>>::ok(std::move(names));
}

Result<std::string>
ReleaseNotesAggregator::aggregate(const std::optional<std::vector<std::string>>& versions,
                                  const AggregateOptions& opts) const {
    auto existing = existing_versions();
    if (existing.is_err()) return std::move(existing).error();

    std::vector<std::string> selected;
    if (versions) {
        for (const auto& v : *versions) {
            std::string num = strip_v(v);
            const auto& have = existing.value();
            if (std::find(have.begin(), have.end(), num) != have.end()) {
                selected.push_back(num);
            }
        }
    } else {
        selected = existing.value();
    }

    std::string generated = opts.generated_at.empty() ? utc_timestamp() : opts.generated_at;
    std::vector<std::string> lines = {
        "# " + opts.title,
        "",
        "Generated: " + generated,
        "",
        "---",
        "",
    };

    size_t rendered = 0;
    for (const auto& version : selected) {
        auto rec = load(version);
        if (rec.is_err()) {
            logger_.report(rec.error());
            continue;
        }
        if (!rec.value()) continue;

        auto errors = validate_record(*rec.value(), version);
        if (!errors.empty()) {
            logger_.warn("validation errors in %s.json:", version.c_str());
            for (const auto& e : errors) logger_.warn("  - %s", e.message.c_str());
        }
        lines.push_back(render_record(*rec.value()));
        lines.push_back("---");
        lines.push_back("");
        ++rendered;
    }

    if (rendered == 0) {
        lines.push_back("No release notes available.");
        lines.push_back("");
    }
    return Result<std::string>::ok(join_lines(lines));
}

Result<std::vector<Version>>
ReleaseNotesAggregator::check_completeness(const std::vector<std::string>& known_tags) const {
    auto existing = existing_versions();
    if (existing.is_err()) return std::move(existing).error();
    const auto& have = existing.value();

    std::vector<Version> missing;
    for (const auto& tag : known_tags) {
        auto v = Version::parse(tag);
        if (v.is_err() || v.value().is_snapshot()) continue;
        if (std::find(have.begin(), have.end(), v.value().to_numeric()) == have.end()) {
            missing.push_back(std::move(v).value());
        }
    }
    return Result<std::vector<Version>>::ok(std::move(missing));
}

Result<NotesCheckReport>
ReleaseNotesAggregator::check(const std::vector<std::string>& known_tags) const {
    NotesCheckReport report;
    auto missing = check_completeness(known_tags);
    if (missing.is_err()) return std::move(missing).error();
    report.missing = std::move(missing).value();

    auto existing = existing_versions();
    if (existing.is_err()) return std::move(existing).error();
    for (const auto& version : existing.value()) {
        std::string item = version + ".json";
        auto rec = load(version);
        if (rec.is_err()) {
            report.invalid.push_back(ItemFailure{item, std::move(rec).error()});
            continue;
        }
        if (!rec.value()) continue;
        auto errors = validate_record(*rec.value(), version);
        if (errors.empty()) continue;

        std::string msg;
        for (const auto& e : errors) {
            if (!msg.empty()) msg += "; ";
            msg += e.message;
        }
        report.invalid.push_back(ItemFailure{item,
            RelpackError{RelpackError::RecordValidation, msg, "", record_path(version).string(), 0}});
    }
    return Result<NotesCheckReport>::ok(std::move(report));
}

Status ReleaseNotesAggregator::enforce(const NotesCheckReport& report,
                                       CompletenessMode mode) const {
    if (mode == CompletenessMode::Off) return ok_status();

    if (report.ok()) {
        logger_.info("all released versions have valid release notes");
        return ok_status();
    }

    bool strict = mode == CompletenessMode::Strict;
    auto emit = [&](const std::string& line) {
        if (strict) logger_.error("%s", line.c_str());
        else logger_.warn("%s", line.c_str());
    };

    if (!report.missing.empty()) {
        emit("missing release notes for " + std::to_string(report.missing.size()) +
             " version(s):");
        for (const auto& v : report.missing) {
            emit("  - " + v.to_numeric() + " (tag: " + v.to_tag() + ")");
        }
    }
    for (const auto& f : report.invalid) {
        emit("invalid release notes " + f.item + ": " + f.error.message);
    }

    if (!strict) return ok_status();

    if (!report.missing.empty()) {
        std::string first = report.missing.front().to_numeric();
        return RelpackError{RelpackError::MissingRecords,
            std::to_string(report.missing.size()) + " released version(s) have no release notes",
            "add " + (dir_ / (first + ".json")).string()};
    }
    return RelpackError{RelpackError::RecordValidation,
        std::to_string(report.invalid.size()) + " release notes record(s) are invalid"};
}

Status ReleaseNotesAggregator::check_release_tags(GitCli& git, CompletenessMode mode) const {
    if (mode == CompletenessMode::Off) return ok_status();

    auto tags = git.list_release_tags();
    if (tags.is_err()) {
        if (mode == CompletenessMode::Strict) return std::move(tags).error();
        logger_.warn("cannot list release tags: %s", tags.error().message.c_str());
        return ok_status();
    }
    auto report = check(tags.value());
    if (report.is_err()) return std::move(report).error();
    return enforce(report.value(), mode);
}

Status write_notes_document(const fs::path& path, const std::string& document) {
    return write_file_atomic(path, document);
}

} // namespace relpack
