#pragma once

#include <relpack/config.hpp>
#include <relpack/log.hpp>
#include <relpack/result.hpp>
#include <relpack/version.hpp>

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relpack {

class GitCli;

// Rendering order is the declaration order
enum class ChangeCategory { Breaking, Security, Features, Improvements, Fixes, Docs };

constexpr std::array<ChangeCategory, 6> kChangeCategories = {
    ChangeCategory::Breaking, ChangeCategory::Security, ChangeCategory::Features,
    ChangeCategory::Improvements, ChangeCategory::Fixes, ChangeCategory::Docs,
};

const char* category_key(ChangeCategory c);     // "breaking"
const char* category_title(ChangeCategory c);   // "Breaking Changes"
std::optional<ChangeCategory> parse_category(const std::string& key);

struct ChangeItem {
    std::string description;
    std::optional<std::string> issue;
};

struct ValidationError {
    std::string field;
    std::string message;
};

// One release-notes/<version>.json file
struct ReleaseNoteRecord {
    std::optional<std::string> version;
    std::optional<std::string> date;
    std::optional<std::string> tag;
    std::string summary;
    std::vector<std::string> highlights;
    std::map<ChangeCategory, std::vector<ChangeItem>> changes;
    std::vector<std::string> components;
    std::string notes;
    // Keys under "changes" that are not a known category
    std::vector<std::string> unknown_categories;
    // Fields of the wrong type; parsing leaves them absent
    std::vector<ValidationError> type_errors;

    // Parse error only for malformed JSON or a document that is not an
    // object
    static Result<ReleaseNoteRecord> from_json(const std::string& text);
};

// Required fields, version/file name agreement and the "v" tag prefix
std::vector<ValidationError> validate_record(const ReleaseNoteRecord& record,
                                             const std::string& expected_version);

// Markdown section for one record
std::string render_record(const ReleaseNoteRecord& record);

struct AggregateOptions {
    std::string title = "Release Notes";
    std::string generated_at;   // empty: current UTC time
};

// Findings of a completeness check
struct NotesCheckReport {
    std::vector<Version> missing;       // known releases without a record
    std::vector<ItemFailure> invalid;   // records that fail to load or validate

    bool ok() const { return missing.empty() && invalid.empty(); }
};

class ReleaseNotesAggregator {
public:
    ReleaseNotesAggregator(std::filesystem::path dir, log::Logger& logger)
        : dir_(std::move(dir)), logger_(logger) {}

    const std::filesystem::path& dir() const { return dir_; }

    // A missing file is the normal "not written yet" state, not an error
    Result<std::optional<ReleaseNoteRecord>> load(const std::string& version) const;

    // Versions with a record file, newest first. Names that are not
    // versions sort after all valid ones, lexically.
    Result<std::vector<std::string>> existing_versions() const;

    // Every record (or only `versions`, in the given order, skipping those
    // without a record) rendered into one document. Invalid records are
    // rendered with warnings; unreadable ones are reported and left out.
    Result<std::string> aggregate(const std::optional<std::vector<std::string>>& versions,
                                  const AggregateOptions& opts = {}) const;

    // Known release tags (vX.Y.Z) that have no record, in the given order
    Result<std::vector<Version>> check_completeness(const std::vector<std::string>& known_tags) const;

    // check_completeness plus validation of every existing record
    Result<NotesCheckReport> check(const std::vector<std::string>& known_tags) const;

    // Logs the findings. Strict fails with MissingRecords (or
    // RecordValidation when only invalid records were found), Warn and Off
    // always succeed.
    Status enforce(const NotesCheckReport& report, CompletenessMode mode) const;

    // Lists the release tags through `git`, then check and enforce. Off
    // does nothing. A tag listing failure fails Strict; Warn logs it and
    // succeeds.
    Status check_release_tags(GitCli& git, CompletenessMode mode) const;

private:
    std::filesystem::path record_path(const std::string& version) const;

    std::filesystem::path dir_;
    log::Logger& logger_;
};

// Writes the aggregated document to `path` atomically
Status write_notes_document(const std::filesystem::path& path, const std::string& document);

} // namespace relpack
