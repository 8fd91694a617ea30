#include <relpack/archive.hpp>
#include "archive_internal.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <fstream>
#include <vector>

#include <zlib.h>

namespace fs = std::filesystem;

// PKZIP 2.0 subset: stored and deflated members, 32-bit sizes and offsets,
// Unix permission bits in the external attributes.

namespace relpack::zip {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50U;
constexpr uint32_t kCentralHeaderSig = 0x02014b50U;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50U;

constexpr uint16_t kVersionNeeded = 20;                 // 2.0
constexpr uint16_t kVersionMadeBy = (3U << 8) | 20U;    // Unix, 2.0
constexpr uint16_t kFlagEncrypted = 0x0001;
constexpr uint16_t kFlagUtf8 = 0x0800;
constexpr uint16_t kMethodStore = 0;
constexpr uint16_t kMethodDeflate = 8;
constexpr uint32_t kDosDirectoryAttr = 0x10;

constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndRecordSize = 22;
constexpr uint32_t kMax32 = 0xFFFFFFFFU;
constexpr uint16_t kMax16 = 0xFFFFU;

struct CentralEntry {
    std::string name;
    uint16_t made_by = 0;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint16_t dos_time = 0;
    uint16_t dos_date = 0;
    uint32_t crc = 0;
    uint32_t compressed_size = 0;
    uint32_t size = 0;
    uint32_t external_attr = 0;
    uint32_t local_offset = 0;
};

// ---------------------------------------------------------------------------
// Little-endian helpers
// ---------------------------------------------------------------------------

void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

uint16_t get_u16(const char* p) {
    return static_cast<uint16_t>(static_cast<unsigned char>(p[0]) |
                                 (static_cast<unsigned char>(p[1]) << 8));
}

uint32_t get_u32(const char* p) {
    return static_cast<uint32_t>(static_cast<unsigned char>(p[0])) |
           (static_cast<uint32_t>(static_cast<unsigned char>(p[1])) << 8) |
           (static_cast<uint32_t>(static_cast<unsigned char>(p[2])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(p[3])) << 24);
}

// ---------------------------------------------------------------------------
// DOS timestamps (local time, 2 second resolution)
// ---------------------------------------------------------------------------

void to_dos_time(int64_t mtime, uint16_t& dos_time, uint16_t& dos_date) {
    std::time_t t = static_cast<std::time_t>(mtime);
    std::tm tm{};
    if (mtime <= 0 || localtime_r(&t, &tm) == nullptr || tm.tm_year < 80) {
        dos_time = 0;
        dos_date = (1 << 5) | 1;  // 1980-01-01
        return;
    }
    dos_time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dos_date = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

int64_t from_dos_time(uint16_t dos_time, uint16_t dos_date) {
    std::tm tm{};
    tm.tm_year = ((dos_date >> 9) & 0x7F) + 80;
    tm.tm_mon = ((dos_date >> 5) & 0x0F) - 1;
    tm.tm_mday = dos_date & 0x1F;
    tm.tm_hour = (dos_time >> 11) & 0x1F;
    tm.tm_min = (dos_time >> 5) & 0x3F;
    tm.tm_sec = (dos_time & 0x1F) * 2;
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    return t < 0 ? 0 : static_cast<int64_t>(t);
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

class ZipWriter {
public:
    explicit ZipWriter(const fs::path& dest)
        : dest_(dest), out_(dest, std::ios::binary | std::ios::trunc) {}

    bool is_open() const { return static_cast<bool>(out_); }

    Status add_directory(const ArchiveEntry& entry) {
        CentralEntry ce = begin_entry(entry.path + "/", kMethodStore, entry);
        ce.external_attr = ((040000U | (entry.mode & 07777)) << 16) | kDosDirectoryAttr;
        RELPACK_TRY(check_offset(ce));
        RELPACK_TRY(emit(local_header(ce)));
        central_.push_back(std::move(ce));
        return ok_status();
    }

    Status add_file(const fs::path& src, const ArchiveEntry& entry) {
        CentralEntry ce = begin_entry(entry.path, kMethodDeflate, entry);
        ce.external_attr = (0100000U | (entry.mode & 07777)) << 16;
        RELPACK_TRY(check_offset(ce));
        RELPACK_TRY(emit(local_header(ce)));

        RELPACK_TRY(deflate_file(src, ce));

        // Patch crc and sizes into the local header, then return to the end
        std::streampos end = out_.tellp();
        std::string patch;
        put_u32(patch, ce.crc);
        put_u32(patch, ce.compressed_size);
        put_u32(patch, ce.size);
        out_.seekp(static_cast<std::streamoff>(ce.local_offset) + 14);
        RELPACK_TRY(emit(patch));
        out_.seekp(end);
        if (!out_) return write_error();

        central_.push_back(std::move(ce));
        return ok_status();
    }

    Status finish() {
        if (central_.size() > kMax16) {
            return RelpackError{RelpackError::ArchiveWrite,
                "too many members for zip32: " + std::to_string(central_.size())};
        }
        uint64_t cd_offset = static_cast<uint64_t>(out_.tellp());
        std::string cd;
        for (const auto& ce : central_) {
            put_u32(cd, kCentralHeaderSig);
            put_u16(cd, kVersionMadeBy);
            put_u16(cd, kVersionNeeded);
            put_u16(cd, ce.flags);
            put_u16(cd, ce.method);
            put_u16(cd, ce.dos_time);
            put_u16(cd, ce.dos_date);
            put_u32(cd, ce.crc);
            put_u32(cd, ce.compressed_size);
            put_u32(cd, ce.size);
            put_u16(cd, static_cast<uint16_t>(ce.name.size()));
            put_u16(cd, 0);  // extra
            put_u16(cd, 0);  // comment
            put_u16(cd, 0);  // disk number start
            put_u16(cd, 0);  // internal attributes
            put_u32(cd, ce.external_attr);
            put_u32(cd, ce.local_offset);
            cd += ce.name;
        }
        if (cd_offset + cd.size() > kMax32) {
            return RelpackError{RelpackError::ArchiveWrite,
                "archive too large for zip32: " + dest_.string()};
        }

        std::string eocd;
        put_u32(eocd, kEndOfCentralDirSig);
        put_u16(eocd, 0);
        put_u16(eocd, 0);
        put_u16(eocd, static_cast<uint16_t>(central_.size()));
        put_u16(eocd, static_cast<uint16_t>(central_.size()));
        put_u32(eocd, static_cast<uint32_t>(cd.size()));
        put_u32(eocd, static_cast<uint32_t>(cd_offset));
        put_u16(eocd, 0);

        RELPACK_TRY(emit(cd));
        RELPACK_TRY(emit(eocd));
        out_.close();
        if (out_.fail()) return write_error();
        return ok_status();
    }

private:
    CentralEntry begin_entry(const std::string& name, uint16_t method,
                             const ArchiveEntry& entry) {
        CentralEntry ce;
        ce.name = name;
        ce.flags = kFlagUtf8;
        ce.method = method;
        to_dos_time(entry.mtime, ce.dos_time, ce.dos_date);
        std::streamoff pos = out_.tellp();
        ce.local_offset = pos > 0 && static_cast<uint64_t>(pos) <= kMax32
                              ? static_cast<uint32_t>(pos) : 0;
        offset_overflow_ = pos < 0 || static_cast<uint64_t>(pos) > kMax32;
        return ce;
    }

    Status check_offset(const CentralEntry& ce) const {
        if (offset_overflow_) {
            return RelpackError{RelpackError::ArchiveWrite,
                "archive too large for zip32 at member " + ce.name};
        }
        if (ce.name.size() > kMax16) {
            return RelpackError{RelpackError::ArchiveWrite,
                "member name too long: " + ce.name};
        }
        return ok_status();
    }

    std::string local_header(const CentralEntry& ce) const {
        std::string h;
        put_u32(h, kLocalHeaderSig);
        put_u16(h, kVersionNeeded);
        put_u16(h, ce.flags);
        put_u16(h, ce.method);
        put_u16(h, ce.dos_time);
        put_u16(h, ce.dos_date);
        put_u32(h, ce.crc);
        put_u32(h, ce.compressed_size);
        put_u32(h, ce.size);
        put_u16(h, static_cast<uint16_t>(ce.name.size()));
        put_u16(h, 0);
        h += ce.name;
        return h;
    }

    Status deflate_file(const fs::path& src, CentralEntry& ce) {
        std::ifstream in(src, std::ios::binary);
        if (!in) {
            return RelpackError{RelpackError::ArchiveWrite,
                "cannot open " + src.string()};
        }

        z_stream zs{};
        if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK) {
            return RelpackError{RelpackError::ArchiveWrite, "deflateInit2 failed"};
        }

        std::vector<char> inbuf(detail::kIoChunk);
        std::vector<char> outbuf(detail::kIoChunk);
        uLong crc = crc32(0L, Z_NULL, 0);
        uint64_t total_in = 0;
        uint64_t total_out = 0;
        Status result = ok_status();

        bool done = false;
        while (!done && result.is_ok()) {
            in.read(inbuf.data(), static_cast<std::streamsize>(inbuf.size()));
            auto n = static_cast<size_t>(in.gcount());
            if (in.bad()) {
                result = RelpackError{RelpackError::ArchiveWrite,
                    "read error on " + src.string()};
                break;
            }
            int flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;
            crc = crc32(crc, reinterpret_cast<const Bytef*>(inbuf.data()),
                        static_cast<uInt>(n));
            total_in += n;

            zs.next_in = reinterpret_cast<Bytef*>(inbuf.data());
            zs.avail_in = static_cast<uInt>(n);
            do {
                zs.next_out = reinterpret_cast<Bytef*>(outbuf.data());
                zs.avail_out = static_cast<uInt>(outbuf.size());
                int rc = deflate(&zs, flush);
                if (rc == Z_STREAM_ERROR) {
                    result = RelpackError{RelpackError::ArchiveWrite,
                        "deflate failed for " + src.string()};
                    break;
                }
                size_t produced = outbuf.size() - zs.avail_out;
                total_out += produced;
                auto st = emit(outbuf.data(), produced);
                if (st.is_err()) {
                    result = std::move(st).error();
                    break;
                }
            } while (zs.avail_out == 0);
            done = flush == Z_FINISH;
        }
        deflateEnd(&zs);
        if (result.is_err()) return result;

        if (total_in > kMax32 || total_out > kMax32) {
            return RelpackError{RelpackError::ArchiveWrite,
                "file too large for zip32: " + src.string()};
        }
        ce.crc = static_cast<uint32_t>(crc);
        ce.size = static_cast<uint32_t>(total_in);
        ce.compressed_size = static_cast<uint32_t>(total_out);
        return ok_status();
    }

    Status emit(const std::string& bytes) {
        return emit(bytes.data(), bytes.size());
    }

    Status emit(const char* data, size_t len) {
        out_.write(data, static_cast<std::streamsize>(len));
        if (!out_) return write_error();
        return ok_status();
    }

    RelpackError write_error() const {
        return RelpackError{RelpackError::ArchiveWrite,
            "failed writing " + dest_.string()};
    }

    fs::path dest_;
    std::ofstream out_;
    std::vector<CentralEntry> central_;
    bool offset_overflow_ = false;
};

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

RelpackError corrupt(const fs::path& archive, const std::string& what) {
    return RelpackError{RelpackError::ArchiveExtract,
        archive.filename().string() + ": " + what};
}

Result<std::vector<CentralEntry>> read_central_directory(std::ifstream& in,
                                                         const fs::path& archive) {
    in.seekg(0, std::ios::end);
    std::streamoff file_size = in.tellg();
    if (file_size < static_cast<std::streamoff>(kEndRecordSize)) {
        return corrupt(archive, "too small to be a zip archive");
    }

    // The end record sits in the last 22 + 65535 (max comment) bytes
    std::streamoff tail_len = std::min<std::streamoff>(file_size, kEndRecordSize + kMax16);
    std::string tail(static_cast<size_t>(tail_len), '\0');
    in.seekg(file_size - tail_len);
    in.read(tail.data(), tail_len);
    if (!in) return corrupt(archive, "cannot read end of central directory");

    size_t eocd = std::string::npos;
    for (size_t i = tail.size() - kEndRecordSize + 1; i-- > 0;) {
        if (get_u32(tail.data() + i) == kEndOfCentralDirSig) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) {
        return corrupt(archive, "end of central directory not found");
    }

    const char* e = tail.data() + eocd;
    uint16_t count = get_u16(e + 10);
    uint32_t cd_size = get_u32(e + 12);
    uint32_t cd_offset = get_u32(e + 16);
    if (count == kMax16 || cd_offset == kMax32 || cd_size == kMax32) {
        return RelpackError{RelpackError::ArchiveExtract,
            "zip64 archives are not supported: " + archive.filename().string()};
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > static_cast<uint64_t>(file_size)) {
        return corrupt(archive, "central directory lies outside the file");
    }

    std::string cd(cd_size, '\0');
    in.seekg(cd_offset);
    in.read(cd.data(), cd_size);
    if (!in) return corrupt(archive, "cannot read central directory");

    std::vector<CentralEntry> entries;
    entries.reserve(count);
    size_t pos = 0;
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + kCentralHeaderSize > cd.size() ||
            get_u32(cd.data() + pos) != kCentralHeaderSig) {
            return corrupt(archive, "malformed central directory entry");
        }
        const char* h = cd.data() + pos;
        CentralEntry ce;
        ce.made_by = get_u16(h + 4);
        ce.flags = get_u16(h + 8);
        ce.method = get_u16(h + 10);
        ce.dos_time = get_u16(h + 12);
        ce.dos_date = get_u16(h + 14);
        ce.crc = get_u32(h + 16);
        ce.compressed_size = get_u32(h + 20);
        ce.size = get_u32(h + 24);
        uint16_t name_len = get_u16(h + 28);
        uint16_t extra_len = get_u16(h + 30);
        uint16_t comment_len = get_u16(h + 32);
        ce.external_attr = get_u32(h + 38);
        ce.local_offset = get_u32(h + 42);

        size_t next = pos + kCentralHeaderSize + name_len + extra_len + comment_len;
        if (next > cd.size()) return corrupt(archive, "truncated central directory");
        ce.name.assign(h + kCentralHeaderSize, name_len);
        if (ce.compressed_size == kMax32 || ce.size == kMax32 || ce.local_offset == kMax32) {
            return RelpackError{RelpackError::ArchiveExtract,
                "zip64 members are not supported: " + ce.name};
        }
        entries.push_back(std::move(ce));
        pos = next;
    }
    return Result<std::vector<CentralEntry>>::ok(std::move(entries));
}

ArchiveEntry to_entry(const CentralEntry& ce, std::string clean_path) {
    ArchiveEntry entry;
    entry.path = std::move(clean_path);
    bool unix_host = (ce.made_by >> 8) == 3;
    uint32_t unix_mode = ce.external_attr >> 16;
    entry.is_directory = (!ce.name.empty() && ce.name.back() == '/') ||
                         (ce.external_attr & kDosDirectoryAttr) != 0 ||
                         (unix_host && (unix_mode & 0170000) == 040000);
    entry.size = entry.is_directory ? 0 : ce.size;
    if (unix_host && (unix_mode & 07777) != 0) {
        entry.mode = unix_mode & 07777;
    } else {
        entry.mode = entry.is_directory ? 0755 : 0644;
    }
    entry.mtime = from_dos_time(ce.dos_time, ce.dos_date);
    return entry;
}

// Streams one member's data through `handler`, verifying size and CRC-32
Status read_member_data(std::ifstream& in, const fs::path& archive,
                        const CentralEntry& ce, bool deliver, EntryHandler& handler) {
    char lh[kLocalHeaderSize];
    in.seekg(ce.local_offset);
    in.read(lh, kLocalHeaderSize);
    if (!in || get_u32(lh) != kLocalHeaderSig) {
        return corrupt(archive, "bad local header for " + ce.name);
    }
    std::streamoff data_start = static_cast<std::streamoff>(ce.local_offset) +
                                static_cast<std::streamoff>(kLocalHeaderSize) +
                                get_u16(lh + 26) + get_u16(lh + 28);
    in.seekg(data_start);

    std::vector<char> inbuf(detail::kIoChunk);
    std::vector<char> outbuf(detail::kIoChunk);
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t produced = 0;
    uint64_t remaining = ce.compressed_size;

    auto consume = [&](const char* data, size_t len) -> Status {
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(len));
        produced += len;
        if (produced > ce.size) return corrupt(archive, "member larger than recorded: " + ce.name);
        if (deliver) return handler.data(data, len);
        return ok_status();
    };

    if (ce.method == kMethodStore) {
        while (remaining > 0) {
            size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, inbuf.size()));
            in.read(inbuf.data(), static_cast<std::streamsize>(n));
            if (!in) return corrupt(archive, "truncated data for " + ce.name);
            RELPACK_TRY(consume(inbuf.data(), n));
            remaining -= n;
        }
    } else {
        z_stream zs{};
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
            return RelpackError{RelpackError::ArchiveExtract, "inflateInit2 failed"};
        }
        Status result = ok_status();
        int rc = Z_OK;
        while (rc != Z_STREAM_END && result.is_ok()) {
            if (zs.avail_in == 0) {
                if (remaining == 0) {
                    result = corrupt(archive, "truncated deflate stream for " + ce.name);
                    break;
                }
                size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, inbuf.size()));
                in.read(inbuf.data(), static_cast<std::streamsize>(n));
                if (!in) {
                    result = corrupt(archive, "truncated data for " + ce.name);
                    break;
                }
                remaining -= n;
                zs.next_in = reinterpret_cast<Bytef*>(inbuf.data());
                zs.avail_in = static_cast<uInt>(n);
            }
            zs.next_out = reinterpret_cast<Bytef*>(outbuf.data());
            zs.avail_out = static_cast<uInt>(outbuf.size());
            rc = inflate(&zs, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END) {
                result = corrupt(archive, "invalid deflate data for " + ce.name);
                break;
            }
            size_t n = outbuf.size() - zs.avail_out;
            if (n > 0) {
                auto st = consume(outbuf.data(), n);
                if (st.is_err()) result = std::move(st).error();
            }
        }
        inflateEnd(&zs);
        if (result.is_err()) return result;
    }

    if (produced != ce.size) {
        return corrupt(archive, "size mismatch for " + ce.name);
    }
    if (static_cast<uint32_t>(crc) != ce.crc) {
        return corrupt(archive, "CRC-32 mismatch for " + ce.name);
    }
    return ok_status();
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Status write(const fs::path& dest, const fs::path& root,
             const std::vector<std::string>& members) {
    ZipWriter writer(dest);
    if (!writer.is_open()) {
        return RelpackError{RelpackError::ArchiveWrite,
            "cannot create " + dest.string()};
    }

    for (const auto& rel : members) {
        auto info = detail::stat_member(root, rel);
        if (info.is_err()) return std::move(info).error();
        if (info.value().is_directory) {
            RELPACK_TRY(writer.add_directory(info.value()));
        } else {
            RELPACK_TRY(writer.add_file(root / rel, info.value()));
        }
    }
    return writer.finish();
}

Status walk(const fs::path& archive, EntryHandler& handler) {
    std::ifstream in(archive, std::ios::binary);
    if (!in) {
        return RelpackError{RelpackError::ArchiveExtract,
            "cannot open " + archive.string()};
    }

    auto central = read_central_directory(in, archive);
    if (central.is_err()) return std::move(central).error();

    for (const auto& ce : central.value()) {
        if (ce.flags & kFlagEncrypted) {
            return RelpackError{RelpackError::ArchiveExtract,
                "encrypted members are not supported: " + ce.name};
        }
        if (ce.method != kMethodStore && ce.method != kMethodDeflate) {
            return RelpackError{RelpackError::ArchiveExtract,
                "unsupported compression method " + std::to_string(ce.method) +
                " for " + ce.name};
        }

        auto clean = sanitize_member_path(ce.name);
        if (clean.is_err()) return std::move(clean).error();
        ArchiveEntry entry = to_entry(ce, std::move(clean).value());
        if (entry.path.empty()) {
            if (!entry.is_directory) {
                return corrupt(archive, "file member names the archive root: '" + ce.name + "'");
            }
            continue;
        }

        auto wanted = handler.begin(entry);
        if (wanted.is_err()) return std::move(wanted).error();
        if (!entry.is_directory) {
            // Data is always read so the CRC of every member is checked
            RELPACK_TRY(read_member_data(in, archive, ce, wanted.value(), handler));
        }
        RELPACK_TRY(handler.end(entry));
    }
    return ok_status();
}

} // namespace relpack::zip
