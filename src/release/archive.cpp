#include <relpack/archive.hpp>
#include <relpack/fs_util.hpp>
#include "archive_internal.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>

#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace relpack {

namespace detail {

Result<ArchiveEntry> stat_member(const fs::path& root, const std::string& rel) {
    fs::path full = root / rel;
    struct stat st;
    if (lstat(full.c_str(), &st) != 0) {
        return RelpackError{RelpackError::IO,
            "cannot stat " + full.string()};
    }

    ArchiveEntry entry;
    entry.path = rel;
    entry.mode = static_cast<uint32_t>(st.st_mode & 07777);
    entry.mtime = static_cast<int64_t>(st.st_mtime);
    if (S_ISDIR(st.st_mode)) {
        entry.is_directory = true;
    } else if (S_ISREG(st.st_mode)) {
        entry.size = static_cast<uint64_t>(st.st_size);
    } else {
        return RelpackError{RelpackError::ArchiveWrite,
            "unsupported file type for archiving: " + full.string()};
    }
    return Result<ArchiveEntry>::ok(std::move(entry));
}

} // namespace detail

// ---------------------------------------------------------------------------
// Archive handle
// ---------------------------------------------------------------------------

Result<Archive> Archive::from_path(const fs::path& path) {
    auto fmt = format_from_path(path);
    if (!fmt) {
        return RelpackError{RelpackError::InvalidArg,
            "not a recognized archive name: " + path.filename().string(),
            "expected a .tar.gz, .tgz or .zip file"};
    }
    return Result<Archive>::ok(Archive(path, *fmt));
}

Result<uint64_t> Archive::size() const {
    if (size_) return Result<uint64_t>::ok(*size_);
    std::error_code ec;
    auto sz = fs::file_size(path_, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot stat archive " + path_.string() + ": " + ec.message()};
    }
    size_ = static_cast<uint64_t>(sz);
    return Result<uint64_t>::ok(*size_);
}

// ---------------------------------------------------------------------------
// Member names
// ---------------------------------------------------------------------------

Result<std::string> sanitize_member_path(const std::string& raw) {
    if (raw.empty()) {
        return RelpackError{RelpackError::ArchiveExtract, "empty member path"};
    }
    std::string p = raw;
    for (char& c : p) {
        if (c == '\\') c = '/';
    }
    if (!p.empty() && p[0] == '/') {
        return RelpackError{RelpackError::ArchiveExtract,
            "absolute member path: " + raw};
    }

    std::string out;
    size_t pos = 0;
    while (pos <= p.size()) {
        size_t slash = p.find('/', pos);
        if (slash == std::string::npos) slash = p.size();
        std::string seg = p.substr(pos, slash - pos);
        pos = slash + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            return RelpackError{RelpackError::ArchiveExtract,
                "member path escapes the archive root: " + raw};
        }
        if (!out.empty()) out += '/';
        out += seg;
    }

    // "./" and "." name the archive root: an empty result
    return Result<std::string>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Format dispatch
// ---------------------------------------------------------------------------

Status write_archive(const fs::path& dest, ArchiveFormat fmt,
                     const fs::path& root, const std::vector<std::string>& members) {
    switch (fmt) {
        case ArchiveFormat::TarGz: return tar::write(dest, root, members);
        case ArchiveFormat::Zip:   return zip::write(dest, root, members);
    }
    return RelpackError{RelpackError::InvalidArg, "unknown archive format"};
}

Status walk_archive(const fs::path& archive, ArchiveFormat fmt,
                    EntryHandler& handler) {
    switch (fmt) {
        case ArchiveFormat::TarGz: return tar::walk(archive, handler);
        case ArchiveFormat::Zip:   return zip::walk(archive, handler);
    }
    return RelpackError{RelpackError::InvalidArg, "unknown archive format"};
}

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

namespace {

Status restore_mtime(const fs::path& path, int64_t mtime) {
    if (mtime <= 0) return ok_status();
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(mtime);
    times[0].tv_nsec = 0;
    times[1] = times[0];
    if (utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        return RelpackError{RelpackError::ArchiveExtract,
            "cannot set modification time on " + path.string() + ": " +
            std::strerror(errno)};
    }
    return ok_status();
}

class ExtractHandler : public EntryHandler {
public:
    explicit ExtractHandler(fs::path dest) : dest_(std::move(dest)) {}

    Result<bool> begin(const ArchiveEntry& entry) override {
        fs::path target = dest_ / entry.path;
        std::error_code ec;

        if (entry.is_directory) {
            fs::create_directories(target, ec);
            if (ec) {
                return RelpackError{RelpackError::ArchiveExtract,
                    "cannot create " + target.string() + ": " + ec.message()};
            }
            dirs_.push_back(entry);
            return Result<bool>::ok(false);
        }

        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return RelpackError{RelpackError::ArchiveExtract,
                "cannot create " + target.parent_path().string() + ": " + ec.message()};
        }
        // A repeated member replaces the earlier one
        fs::remove(target, ec);

        out_ = std::make_unique<std::ofstream>(target, std::ios::binary | std::ios::trunc);
        if (!*out_) {
            return RelpackError{RelpackError::ArchiveExtract,
                "cannot create " + target.string()};
        }
        return Result<bool>::ok(true);
    }

    Status data(const char* bytes, size_t len) override {
        out_->write(bytes, static_cast<std::streamsize>(len));
        if (!*out_) {
            return RelpackError{RelpackError::ArchiveExtract, "write failed during extraction"};
        }
        return ok_status();
    }

    Status end(const ArchiveEntry& entry) override {
        if (entry.is_directory || !out_) return ok_status();

        fs::path target = dest_ / entry.path;
        out_->close();
        bool failed = out_->fail();
        out_.reset();
        if (failed) {
            return RelpackError{RelpackError::ArchiveExtract,
                "failed writing " + target.string()};
        }

        std::error_code ec;
        fs::permissions(target, static_cast<fs::perms>(entry.mode & 07777),
                        fs::perm_options::replace, ec);
        if (ec) {
            return RelpackError{RelpackError::ArchiveExtract,
                "cannot set permissions on " + target.string() + ": " + ec.message()};
        }
        return restore_mtime(target, entry.mtime);
    }

    // Directory modes are applied last so a read-only directory does not
    // block extraction of its own contents; deepest directories first.
    Status finish() {
        for (auto it = dirs_.rbegin(); it != dirs_.rend(); ++it) {
            fs::path target = dest_ / it->path;
            std::error_code ec;
            fs::permissions(target, static_cast<fs::perms>(it->mode & 07777),
                            fs::perm_options::replace, ec);
            if (ec) {
                return RelpackError{RelpackError::ArchiveExtract,
                    "cannot set permissions on " + target.string() + ": " + ec.message()};
            }
            RELPACK_TRY(restore_mtime(target, it->mtime));
        }
        return ok_status();
    }

private:
    fs::path dest_;
    std::unique_ptr<std::ofstream> out_;
    std::vector<ArchiveEntry> dirs_;
};

class ListHandler : public EntryHandler {
public:
    Result<bool> begin(const ArchiveEntry& entry) override {
        entries.push_back(entry);
        return Result<bool>::ok(false);
    }
    Status data(const char*, size_t) override { return ok_status(); }
    Status end(const ArchiveEntry&) override { return ok_status(); }

    std::vector<ArchiveEntry> entries;
};

class MemberHandler : public EntryHandler {
public:
    explicit MemberHandler(std::string wanted) : wanted_(std::move(wanted)) {}

    Result<bool> begin(const ArchiveEntry& entry) override {
        capturing_ = !entry.is_directory && entry.path == wanted_;
        if (capturing_) {
            found = true;
            content.clear();
        }
        return Result<bool>::ok(capturing_);
    }
    Status data(const char* bytes, size_t len) override {
        content.append(bytes, len);
        return ok_status();
    }
    Status end(const ArchiveEntry&) override {
        capturing_ = false;
        return ok_status();
    }

    bool found = false;
    std::string content;

private:
    std::string wanted_;
    bool capturing_ = false;
};

} // namespace

Status extract_archive(const fs::path& archive, ArchiveFormat fmt,
                       const fs::path& dest) {
    auto st = ensure_directory(dest);
    if (st.is_err()) {
        return RelpackError{RelpackError::ArchiveExtract, st.error().message};
    }

    ExtractHandler handler(dest);
    RELPACK_TRY(walk_archive(archive, fmt, handler));
    return handler.finish();
}

Result<std::vector<ArchiveEntry>> list_archive(const fs::path& archive,
                                               ArchiveFormat fmt) {
    ListHandler handler;
    RELPACK_TRY(walk_archive(archive, fmt, handler));
    return Result<std::vector<ArchiveEntry>>::ok(std::move(handler.entries));
}

Result<std::string> read_member(const fs::path& archive, ArchiveFormat fmt,
                                const std::string& member) {
    MemberHandler handler(member);
    RELPACK_TRY(walk_archive(archive, fmt, handler));
    if (!handler.found) {
        return RelpackError{RelpackError::NotFound,
            "member '" + member + "' not found in " + archive.filename().string()};
    }
    return Result<std::string>::ok(std::move(handler.content));
}

} // namespace relpack
