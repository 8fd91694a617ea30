#include <relpack/archive.hpp>
#include "archive_internal.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <optional>
#include <vector>

#include <zlib.h>

namespace fs = std::filesystem;

// POSIX ustar records inside a gzip stream.
//
// Header layout (512 bytes):
//   name[100] mode[8] uid[8] gid[8] size[12] mtime[12] chksum[8] typeflag[1]
//   linkname[100] magic[6] version[2] uname[32] gname[32] devmajor[8]
//   devminor[8] prefix[155] pad[12]

namespace relpack::tar {

namespace {

constexpr size_t kBlock = 512;
constexpr size_t kNameLen = 100;
constexpr size_t kPrefixLen = 155;
constexpr uint64_t kOctal11Max = 077777777777ULL;  // largest size in 11 octal digits

constexpr size_t kOffMode = 100;
constexpr size_t kOffUid = 108;
constexpr size_t kOffGid = 116;
constexpr size_t kOffSize = 124;
constexpr size_t kOffMtime = 136;
constexpr size_t kOffChksum = 148;
constexpr size_t kOffType = 156;
constexpr size_t kOffMagic = 257;
constexpr size_t kOffVersion = 263;
constexpr size_t kOffPrefix = 345;

using Block = std::array<char, kBlock>;

// RAII owner of a gzFile
class GzFile {
public:
    GzFile(const fs::path& path, const char* mode)
        : file_(gzopen(path.c_str(), mode)) {}
    ~GzFile() {
        if (file_) gzclose(file_);
    }
    GzFile(const GzFile&) = delete;
    GzFile& operator=(const GzFile&) = delete;

    gzFile get() const { return file_; }
    explicit operator bool() const { return file_ != nullptr; }

    // Closes and reports whether the stream was flushed cleanly
    bool close() {
        if (!file_) return true;
        int rc = gzclose(file_);
        file_ = nullptr;
        return rc == Z_OK;
    }

private:
    gzFile file_;
};

// ---------------------------------------------------------------------------
// Header encoding
// ---------------------------------------------------------------------------

void put_octal(Block& h, size_t off, size_t width, uint64_t value) {
    // width-1 digits, zero padded, NUL terminated
    std::snprintf(h.data() + off, width, "%0*llo", static_cast<int>(width - 1),
                  static_cast<unsigned long long>(value));
}

void put_size(Block& h, uint64_t size) {
    if (size <= kOctal11Max) {
        put_octal(h, kOffSize, 12, size);
        return;
    }
    // GNU base-256: high bit of the first byte set, big-endian value
    h[kOffSize] = static_cast<char>(0x80);
    for (int i = 11; i >= 1; --i) {
        h[kOffSize + static_cast<size_t>(i)] = static_cast<char>(size & 0xFF);
        size >>= 8;
    }
}

void put_string(Block& h, size_t off, const std::string& s, size_t width) {
    std::memcpy(h.data() + off, s.data(), std::min(s.size(), width));
}

unsigned header_checksum(const Block& h) {
    unsigned sum = 0;
    for (size_t i = 0; i < kBlock; ++i) {
        bool in_chksum = i >= kOffChksum && i < kOffChksum + 8;
        sum += in_chksum ? static_cast<unsigned>(' ')
                         : static_cast<unsigned char>(h[i]);
    }
    return sum;
}

void seal_header(Block& h) {
    std::snprintf(h.data() + kOffChksum, 8, "%06o", header_checksum(h));
    h[kOffChksum + 7] = ' ';
}

Block make_header(const std::string& name, char type, uint64_t size,
                  uint32_t mode, int64_t mtime) {
    Block h{};
    put_string(h, 0, name, kNameLen);
    put_octal(h, kOffMode, 8, mode & 07777);
    put_octal(h, kOffUid, 8, 0);
    put_octal(h, kOffGid, 8, 0);
    put_size(h, size);
    put_octal(h, kOffMtime, 12, mtime > 0 ? static_cast<uint64_t>(mtime) : 0);
    h[kOffType] = type;
    std::memcpy(h.data() + kOffMagic, "ustar", 6);  // includes the NUL
    std::memcpy(h.data() + kOffVersion, "00", 2);
    return h;
}

// Splits a long name into ustar prefix/name at a '/'. Returns false when
// no split fits.
bool split_ustar_name(const std::string& path, std::string& prefix, std::string& name) {
    size_t pos = path.size();
    while (pos != std::string::npos && pos > 0) {
        pos = path.rfind('/', pos - 1);
        if (pos == std::string::npos) break;
        if (pos <= kPrefixLen && path.size() - pos - 1 <= kNameLen &&
            path.size() - pos - 1 > 0) {
            prefix = path.substr(0, pos);
            name = path.substr(pos + 1);
            return true;
        }
    }
    return false;
}

Status gz_write(GzFile& out, const char* data, size_t len) {
    while (len > 0) {
        unsigned chunk = static_cast<unsigned>(std::min(len, detail::kIoChunk));
        if (gzwrite(out.get(), data, chunk) != static_cast<int>(chunk)) {
            int errnum = 0;
            const char* msg = gzerror(out.get(), &errnum);
            return RelpackError{RelpackError::ArchiveWrite,
                std::string("gzip write failed: ") + (msg ? msg : "unknown error")};
        }
        data += chunk;
        len -= chunk;
    }
    return ok_status();
}

Status write_padding(GzFile& out, uint64_t size) {
    size_t rem = static_cast<size_t>(size % kBlock);
    if (rem == 0) return ok_status();
    Block zeros{};
    return gz_write(out, zeros.data(), kBlock - rem);
}

Status write_header(GzFile& out, const std::string& stored_name, char type,
                    uint64_t size, uint32_t mode, int64_t mtime) {
    std::string prefix;
    std::string name = stored_name;

    if (stored_name.size() > kNameLen && !split_ustar_name(stored_name, prefix, name)) {
        // GNU long name record carries the full path
        std::string payload = stored_name + '\0';
        Block link = make_header("././@LongLink", 'L', payload.size(), 0644, 0);
        seal_header(link);
        RELPACK_TRY(gz_write(out, link.data(), kBlock));
        RELPACK_TRY(gz_write(out, payload.data(), payload.size()));
        RELPACK_TRY(write_padding(out, payload.size()));
        prefix.clear();
        name = stored_name.substr(0, kNameLen);
    }

    Block h = make_header(name, type, size, mode, mtime);
    put_string(h, kOffPrefix, prefix, kPrefixLen);
    seal_header(h);
    return gz_write(out, h.data(), kBlock);
}

Status write_file_data(GzFile& out, const fs::path& src, uint64_t expected) {
    std::ifstream in(src, std::ios::binary);
    if (!in) {
        return RelpackError{RelpackError::ArchiveWrite,
            "cannot open " + src.string()};
    }
    std::vector<char> buf(detail::kIoChunk);
    uint64_t total = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = static_cast<size_t>(in.gcount());
        if (n == 0) break;
        // The header already carries the stat() size; never write past it
        if (total + n > expected) {
            return RelpackError{RelpackError::ArchiveWrite,
                src.string() + " grew while being archived"};
        }
        RELPACK_TRY(gz_write(out, buf.data(), n));
        total += n;
    }
    if (in.bad()) {
        return RelpackError{RelpackError::ArchiveWrite,
            "read error on " + src.string()};
    }
    if (total != expected) {
        return RelpackError{RelpackError::ArchiveWrite,
            src.string() + " shrank while being archived"};
    }
    return write_padding(out, total);
}

// ---------------------------------------------------------------------------
// Header decoding
// ---------------------------------------------------------------------------

std::string field_string(const Block& h, size_t off, size_t width) {
    const char* start = h.data() + off;
    size_t len = 0;
    while (len < width && start[len] != '\0') ++len;
    return std::string(start, len);
}

std::optional<uint64_t> parse_numeric(const Block& h, size_t off, size_t width) {
    auto first = static_cast<unsigned char>(h[off]);
    if (first & 0x80) {
        uint64_t value = first & 0x7F;
        for (size_t i = 1; i < width; ++i) {
            if (value > (UINT64_MAX >> 8)) return std::nullopt;
            value = (value << 8) | static_cast<unsigned char>(h[off + i]);
        }
        return value;
    }

    uint64_t value = 0;
    bool seen_digit = false;
    for (size_t i = 0; i < width; ++i) {
        char c = h[off + i];
        if (c == '\0' || (c == ' ' && seen_digit)) break;
        if (c == ' ') continue;
        if (c < '0' || c > '7') return std::nullopt;
        value = (value << 3) | static_cast<uint64_t>(c - '0');
        seen_digit = true;
    }
    return value;
}

bool is_zero_block(const Block& h) {
    return std::all_of(h.begin(), h.end(), [](char c) { return c == '\0'; });
}

class TarInput {
public:
    explicit TarInput(GzFile& in) : in_(in) {}

    // Reads exactly len bytes. Returns false on a clean end of stream
    // before any byte was read; a short read is an error.
    Result<bool> read_exact(char* dst, size_t len) {
        size_t got = 0;
        while (got < len) {
            unsigned chunk = static_cast<unsigned>(std::min(len - got, detail::kIoChunk));
            int n = gzread(in_.get(), dst + got, chunk);
            if (n < 0) return gz_error("read failed");
            if (n == 0) {
                int errnum = Z_OK;
                gzerror(in_.get(), &errnum);
                if (got == 0 && errnum == Z_OK) return Result<bool>::ok(false);
                return truncated();
            }
            got += static_cast<size_t>(n);
        }
        return Result<bool>::ok(true);
    }

    Status require(char* dst, size_t len) {
        auto r = read_exact(dst, len);
        if (r.is_err()) return std::move(r).error();
        if (!r.value() && len > 0) return truncated();
        return ok_status();
    }

    Status skip_padding(uint64_t size) {
        size_t rem = static_cast<size_t>(size % kBlock);
        if (rem == 0) return ok_status();
        Block pad;
        return require(pad.data(), kBlock - rem);
    }

    // Drain the rest of the gzip stream so zlib checks the trailer CRC
    Status drain() {
        std::vector<char> buf(detail::kIoChunk);
        for (;;) {
            int n = gzread(in_.get(), buf.data(), static_cast<unsigned>(buf.size()));
            if (n < 0) return gz_error("corrupt gzip stream");
            if (n == 0) break;
        }
        int errnum = Z_OK;
        gzerror(in_.get(), &errnum);
        if (errnum != Z_OK) return truncated();
        return ok_status();
    }

    RelpackError truncated() const {
        return RelpackError{RelpackError::ArchiveExtract,
            "archive is truncated or corrupt"};
    }

private:
    RelpackError gz_error(const char* what) const {
        int errnum = 0;
        const char* msg = gzerror(in_.get(), &errnum);
        return RelpackError{RelpackError::ArchiveExtract,
            std::string(what) + ": " + (msg ? msg : "unknown gzip error")};
    }

    GzFile& in_;
};

// Value of the "path" and "size" records in a pax extended header
void parse_pax(const std::string& data, std::optional<std::string>& path,
               std::optional<uint64_t>& size) {
    size_t pos = 0;
    while (pos < data.size()) {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos) return;
        size_t rec_len = 0;
        try {
            rec_len = static_cast<size_t>(std::stoull(data.substr(pos, space - pos)));
        } catch (const std::exception&) {
            return;
        }
        if (rec_len == 0 || pos + rec_len > data.size()) return;

        std::string record = data.substr(space + 1, pos + rec_len - space - 1);
        if (!record.empty() && record.back() == '\n') record.pop_back();
        size_t eq = record.find('=');
        if (eq != std::string::npos) {
            std::string key = record.substr(0, eq);
            std::string value = record.substr(eq + 1);
            if (key == "path") {
                path = value;
            } else if (key == "size") {
                try {
                    size = static_cast<uint64_t>(std::stoull(value));
                } catch (const std::exception&) {
                    // malformed size record: keep the header value
                }
            }
        }
        pos += rec_len;
    }
}

Result<std::string> read_payload(TarInput& in, uint64_t size) {
    if (size > (16u << 20)) {
        return RelpackError{RelpackError::ArchiveExtract,
            "oversized extended header record"};
    }
    std::string data(static_cast<size_t>(size), '\0');
    RELPACK_TRY(in.require(data.data(), data.size()));
    RELPACK_TRY(in.skip_padding(size));
    return Result<std::string>::ok(std::move(data));
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Status write(const fs::path& dest, const fs::path& root,
             const std::vector<std::string>& members) {
    GzFile out(dest, "wb");
    if (!out) {
        return RelpackError{RelpackError::ArchiveWrite,
            "cannot create " + dest.string()};
    }

    for (const auto& rel : members) {
        auto info = detail::stat_member(root, rel);
        if (info.is_err()) return std::move(info).error();
        const ArchiveEntry& entry = info.value();

        if (entry.is_directory) {
            RELPACK_TRY(write_header(out, rel + "/", '5', 0, entry.mode, entry.mtime));
            continue;
        }
        RELPACK_TRY(write_header(out, rel, '0', entry.size, entry.mode, entry.mtime));
        RELPACK_TRY(write_file_data(out, root / rel, entry.size));
    }

    // End of archive: two zero blocks
    Block zeros{};
    RELPACK_TRY(gz_write(out, zeros.data(), kBlock));
    RELPACK_TRY(gz_write(out, zeros.data(), kBlock));

    if (!out.close()) {
        return RelpackError{RelpackError::ArchiveWrite,
            "failed to finish gzip stream for " + dest.string()};
    }
    return ok_status();
}

Status walk(const fs::path& archive, EntryHandler& handler) {
    GzFile file(archive, "rb");
    if (!file) {
        return RelpackError{RelpackError::ArchiveExtract,
            "cannot open " + archive.string()};
    }
    TarInput in(file);

    std::optional<std::string> long_name;
    std::optional<std::string> pax_path;
    std::optional<uint64_t> pax_size;
    std::vector<char> buf(detail::kIoChunk);

    for (;;) {
        Block h;
        auto got = in.read_exact(h.data(), kBlock);
        if (got.is_err()) return std::move(got).error();
        if (!got.value()) break;  // stream ended without the zero blocks
        if (is_zero_block(h)) {
            RELPACK_TRY(in.drain());
            break;
        }

        auto stored_sum = parse_numeric(h, kOffChksum, 8);
        if (!stored_sum || *stored_sum != header_checksum(h)) {
            return RelpackError{RelpackError::ArchiveExtract,
                "bad header checksum in " + archive.filename().string()};
        }

        auto size = parse_numeric(h, kOffSize, 12);
        if (!size) {
            return RelpackError{RelpackError::ArchiveExtract,
                "bad size field in " + archive.filename().string()};
        }
        char type = h[kOffType];

        if (type == 'L') {
            auto data = read_payload(in, *size);
            if (data.is_err()) return std::move(data).error();
            std::string name = std::move(data).value();
            name.erase(std::find(name.begin(), name.end(), '\0'), name.end());
            long_name = std::move(name);
            continue;
        }
        if (type == 'x' || type == 'g') {
            auto data = read_payload(in, *size);
            if (data.is_err()) return std::move(data).error();
            if (type == 'x') parse_pax(data.value(), pax_path, pax_size);
            continue;
        }

        std::string raw_name;
        if (pax_path) {
            raw_name = *pax_path;
        } else if (long_name) {
            raw_name = *long_name;
        } else {
            std::string prefix = field_string(h, kOffPrefix, kPrefixLen);
            raw_name = field_string(h, 0, kNameLen);
            if (!prefix.empty() && field_string(h, kOffMagic, 5) == "ustar") {
                raw_name = prefix + "/" + raw_name;
            }
        }
        uint64_t data_size = pax_size ? *pax_size : *size;
        long_name.reset();
        pax_path.reset();
        pax_size.reset();

        ArchiveEntry entry;
        if (type == '5') {
            entry.is_directory = true;
        } else if (type == '0' || type == '\0' || type == '7') {
            entry.size = data_size;
        } else {
            return RelpackError{RelpackError::ArchiveExtract,
                "unsupported tar entry type '" + std::string(1, type) +
                "' for " + raw_name,
                "only regular files and directories are supported"};
        }

        auto clean = sanitize_member_path(raw_name);
        if (clean.is_err()) return std::move(clean).error();
        entry.path = std::move(clean).value();
        if (entry.path.empty()) {
            // "./" entry written by `tar -C dir -czf out.tar.gz .`
            if (!entry.is_directory) {
                return RelpackError{RelpackError::ArchiveExtract,
                    "file member names the archive root: '" + raw_name + "'"};
            }
            for (uint64_t remaining = data_size; remaining > 0;) {
                size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
                RELPACK_TRY(in.require(buf.data(), chunk));
                remaining -= chunk;
            }
            RELPACK_TRY(in.skip_padding(data_size));
            continue;
        }
        entry.mode = static_cast<uint32_t>(parse_numeric(h, kOffMode, 8).value_or(0644) & 07777);
        entry.mtime = static_cast<int64_t>(parse_numeric(h, kOffMtime, 12).value_or(0));

        auto wanted = handler.begin(entry);
        if (wanted.is_err()) return std::move(wanted).error();

        uint64_t remaining = data_size;
        while (remaining > 0) {
            size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
            RELPACK_TRY(in.require(buf.data(), chunk));
            if (wanted.value() && !entry.is_directory) {
                RELPACK_TRY(handler.data(buf.data(), chunk));
            }
            remaining -= chunk;
        }
        RELPACK_TRY(in.skip_padding(data_size));
        RELPACK_TRY(handler.end(entry));
    }

    return ok_status();
}

} // namespace relpack::tar
