#include <relpack/fs_util.hpp>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace relpack {

// ---------------------------------------------------------------------------
// ScratchDir
// ---------------------------------------------------------------------------

Result<ScratchDir> ScratchDir::create(const fs::path& root,
                                      const std::string& prefix) {
    std::error_code ec;
    fs::path base = root;
    if (base.empty()) {
        base = fs::temp_directory_path(ec);
        if (ec) {
            return RelpackError{RelpackError::IO,
                "cannot determine temporary directory: " + ec.message()};
        }
    }
    fs::create_directories(base, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot create scratch root " + base.string() + ": " + ec.message()};
    }

    std::string templ = (base / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        return RelpackError{RelpackError::IO,
            "mkdtemp failed under " + base.string() + ": " + std::strerror(errno)};
    }

    return Result<ScratchDir>::ok(ScratchDir(fs::path(buf.data())));
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDir::~ScratchDir() {
    remove();
}

Status ScratchDir::remove() {
    if (path_.empty()) return ok_status();
    std::error_code ec;
    fs::remove_all(path_, ec);
    fs::path removed = path_;
    path_.clear();
    if (ec) {
        return RelpackError{RelpackError::IO,
            "failed to remove scratch directory " + removed.string() + ": " +
            ec.message()};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Atomic replacement
// ---------------------------------------------------------------------------

fs::path temp_sibling(const fs::path& target) {
    static std::atomic<unsigned> counter{0};
    std::error_code ec;
    for (;;) {
        std::string name = "." + target.filename().string() + ".tmp-" +
                           std::to_string(getpid()) + "-" +
                           std::to_string(counter.fetch_add(1));
        fs::path candidate = target.parent_path() / name;
        if (!fs::exists(candidate, ec)) return candidate;
    }
}

Status replace_file(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    fs::rename(source, target, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot move " + source.string() + " to " + target.string() +
            ": " + ec.message()};
    }
    return ok_status();
}

Status write_file_atomic(const fs::path& path, const std::string& content) {
    if (!path.parent_path().empty()) {
        RELPACK_TRY(ensure_directory(path.parent_path()));
    }

    fs::path tmp = temp_sibling(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return RelpackError{RelpackError::IO,
                "cannot open " + tmp.string() + " for writing"};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return RelpackError{RelpackError::IO,
                "failed writing " + tmp.string()};
        }
    }

    auto st = replace_file(tmp, path);
    if (st.is_err()) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return st;
    }
    return ok_status();
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return RelpackError{RelpackError::IO,
            "cannot open file: " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Status ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot create directory " + dir.string() + ": " + ec.message()};
    }
    return ok_status();
}

Result<std::vector<std::string>> list_tree(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return RelpackError{RelpackError::NotFound,
            "not a directory: " + root.string()};
    }

    std::vector<std::string> entries;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return RelpackError{RelpackError::IO,
            "cannot walk " + root.string() + ": " + ec.message()};
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return RelpackError{RelpackError::IO,
                "failed while walking " + root.string() + ": " + ec.message()};
        }
        auto status = it->symlink_status(ec);
        if (ec) {
            return RelpackError{RelpackError::IO,
                "cannot stat " + it->path().string() + ": " + ec.message()};
        }
        if (!fs::is_regular_file(status) && !fs::is_directory(status)) {
            return RelpackError{RelpackError::InvalidArg,
                "unsupported file type (only regular files and directories): " +
                it->path().string()};
        }
        entries.push_back(it->path().lexically_relative(root).generic_string());
    }
    if (ec) {
        return RelpackError{RelpackError::IO,
            "failed while walking " + root.string() + ": " + ec.message()};
    }

    // Lexicographic order puts "a" before "a/b"; directories precede contents
    std::sort(entries.begin(), entries.end());
    return Result<std::vector<std::string>>::ok(std::move(entries));
}

} // namespace relpack
