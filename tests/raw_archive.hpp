#pragma once

// Byte-level archive builders for archives relpack did not write itself:
// GNU tar "./" roots, ././@LongLink and pax names, base-256 sizes, zip
// members from non-Unix hosts and zips without directory records.

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

namespace relpack::testing {

class RawTar {
public:
    static constexpr int64_t kMtime = 1700000000;

    RawTar& dir(const std::string& name, uint32_t mode = 0755) {
        header(name, '5', 0, mode, false);
        return *this;
    }

    RawTar& file(const std::string& name, const std::string& data,
                 uint32_t mode = 0644, bool base256_size = false) {
        header(name, '0', data.size(), mode, base256_size);
        payload(data);
        return *this;
    }

    // Name stored in a preceding ././@LongLink record
    RawTar& gnu_long_file(const std::string& name, const std::string& data) {
        header("././@LongLink", 'L', name.size() + 1, 0644, false);
        payload(name + '\0');
        return file(name.substr(0, 100), data);
    }

    // Name stored in a pax extended header
    RawTar& pax_file(const std::string& name, const std::string& data) {
        std::string body = "path=" + name + "\n";
        size_t len = body.size() + 2;
        while (std::to_string(len).size() + 1 + body.size() != len) ++len;
        std::string record = std::to_string(len) + " " + body;
        header("PaxHeaders.0/entry", 'x', record.size(), 0644, false);
        payload(record);
        return file("entry", data);
    }

    void write_gz(const std::filesystem::path& dest) const {
        std::filesystem::create_directories(dest.parent_path());
        std::string out = bytes_ + std::string(1024, '\0');
        gzFile gz = gzopen(dest.c_str(), "wb");
        if (gz == nullptr) throw std::runtime_error("gzopen failed: " + dest.string());
        int written = gzwrite(gz, out.data(), static_cast<unsigned>(out.size()));
        int rc = gzclose(gz);
        if (written != static_cast<int>(out.size()) || rc != Z_OK) {
            throw std::runtime_error("gzip write failed: " + dest.string());
        }
    }

private:
    void header(const std::string& name, char type, uint64_t size, uint32_t mode,
                bool base256_size) {
        std::string h(512, '\0');
        h.replace(0, std::min<size_t>(name.size(), 100), name, 0, 100);
        std::snprintf(&h[100], 8, "%07o", mode);
        std::snprintf(&h[108], 8, "%07o", 0u);
        std::snprintf(&h[116], 8, "%07o", 0u);
        if (base256_size) {
            h[124] = static_cast<char>(0x80);
            for (int i = 11; i >= 1; --i) {
                h[124 + i] = static_cast<char>(size & 0xFF);
                size >>= 8;
            }
        } else {
            std::snprintf(&h[124], 12, "%011llo", static_cast<unsigned long long>(size));
        }
        std::snprintf(&h[136], 12, "%011llo", static_cast<unsigned long long>(kMtime));
        h.replace(148, 8, 8, ' ');
        h[156] = type;
        h.replace(257, 8, std::string("ustar  \0", 8));  // GNU magic

        unsigned sum = 0;
        for (char c : h) sum += static_cast<unsigned char>(c);
        std::snprintf(&h[148], 8, "%06o", sum);
        h[155] = ' ';
        bytes_ += h;
    }

    void payload(const std::string& data) {
        bytes_ += data;
        if (data.size() % 512 != 0) bytes_.append(512 - data.size() % 512, '\0');
    }

    std::string bytes_;
};

// Zip with stored members only
class RawZip {
public:
    static constexpr uint8_t kHostDos = 0;
    static constexpr uint8_t kHostUnix = 3;
    static constexpr uint32_t kDosDirectory = 0x10;

    RawZip& stored(const std::string& name, const std::string& data,
                   uint8_t host = kHostDos, uint32_t external_attr = 0) {
        Entry e{name, data, host, external_attr,
                static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(data.data()),
                                            static_cast<uInt>(data.size()))),
                static_cast<uint32_t>(body_.size())};
        u32(body_, 0x04034b50U);
        u16(body_, 20);
        u16(body_, 0);
        u16(body_, 0);
        u16(body_, kDosTime);
        u16(body_, kDosDate);
        u32(body_, e.crc);
        u32(body_, static_cast<uint32_t>(data.size()));
        u32(body_, static_cast<uint32_t>(data.size()));
        u16(body_, static_cast<uint16_t>(name.size()));
        u16(body_, 0);
        body_ += name;
        body_ += data;
        entries_.push_back(std::move(e));
        return *this;
    }

    void write(const std::filesystem::path& dest) const {
        std::string out = body_;
        std::string cd;
        for (const auto& e : entries_) {
            u32(cd, 0x02014b50U);
            u16(cd, static_cast<uint16_t>((e.host << 8) | 20));
            u16(cd, 20);
            u16(cd, 0);
            u16(cd, 0);
            u16(cd, kDosTime);
            u16(cd, kDosDate);
            u32(cd, e.crc);
            u32(cd, static_cast<uint32_t>(e.data.size()));
            u32(cd, static_cast<uint32_t>(e.data.size()));
            u16(cd, static_cast<uint16_t>(e.name.size()));
            u16(cd, 0);
            u16(cd, 0);
            u16(cd, 0);
            u16(cd, 0);
            u32(cd, e.external_attr);
            u32(cd, e.offset);
            cd += e.name;
        }
        uint32_t cd_offset = static_cast<uint32_t>(out.size());
        out += cd;
        u32(out, 0x06054b50U);
        u16(out, 0);
        u16(out, 0);
        u16(out, static_cast<uint16_t>(entries_.size()));
        u16(out, static_cast<uint16_t>(entries_.size()));
        u32(out, static_cast<uint32_t>(cd.size()));
        u32(out, cd_offset);
        u16(out, 0);

        std::filesystem::create_directories(dest.parent_path());
        std::ofstream f(dest, std::ios::binary | std::ios::trunc);
        f.write(out.data(), static_cast<std::streamsize>(out.size()));
        if (!f) throw std::runtime_error("cannot write " + dest.string());
    }

private:
    // 2024-01-02 10:00:00 local time
    static constexpr uint16_t kDosTime = 10 << 11;
    static constexpr uint16_t kDosDate = ((2024 - 1980) << 9) | (1 << 5) | 2;

    struct Entry {
        std::string name;
        std::string data;
        uint8_t host;
        uint32_t external_attr;
        uint32_t crc;
        uint32_t offset;
    };

    static void u16(std::string& out, uint16_t v) {
        out.push_back(static_cast<char>(v & 0xFF));
        out.push_back(static_cast<char>(v >> 8));
    }
    static void u32(std::string& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }

    std::string body_;
    std::vector<Entry> entries_;
};

} // namespace relpack::testing
