#include <catch2/catch.hpp>
#include <relpack/archive.hpp>
#include <relpack/platform_archive_builder.hpp>
#include "test_helpers.hpp"

#include <algorithm>
#include <string>

namespace fs = std::filesystem;
using namespace relpack;
using relpack::testing::CapturedLog;
using relpack::testing::TempDir;
using relpack::testing::write_text;

// linux-amd64 and windows-amd64 have binaries, darwin-amd64 is empty and
// linux-arm64 is absent
static void make_platforms(const fs::path& dir) {
    write_text(dir / "linux-amd64/app", "ELF");
    write_text(dir / "windows-amd64/app.exe", "MZ");
    write_text(dir / "windows-amd64/lib/plugin.dll", "MZ plugin");
    fs::create_directories(dir / "darwin-amd64");
}

static std::vector<std::string> names(const PlatformArchiveReport& report) {
    std::vector<std::string> out;
    for (const auto& a : report.created) out.push_back(a.name());
    return out;
}

TEST_CASE("builds one archive per populated platform", "[builder]") {
    int jobs = GENERATE(1, 4);
    TempDir tmp;
    make_platforms(tmp / "platforms");
    CapturedLog log;

    PlatformArchiveBuilder builder(log.logger(), jobs);
    auto r = builder.build(tmp / "platforms", tmp / "out");
    REQUIRE(r.is_ok());
    const auto& report = r.value();

    REQUIRE(names(report) == std::vector<std::string>{"linux-amd64.tar.gz", "windows-amd64.zip"});
    REQUIRE(report.created_count() == 2);
    REQUIRE(report.skipped == std::vector<std::string>{"linux-arm64", "darwin-amd64"});
    REQUIRE(report.failures.empty());

    REQUIRE(fs::exists(tmp / "out/linux-amd64.tar.gz"));
    REQUIRE(fs::exists(tmp / "out/windows-amd64.zip"));
    REQUIRE_FALSE(fs::exists(tmp / "out/darwin-amd64.tar.gz"));

    REQUIRE(log.contains("linux-arm64 not found"));
    REQUIRE(log.contains("darwin-amd64 is empty"));
}

TEST_CASE("archives carry the platform directory contents", "[builder]") {
    TempDir tmp;
    make_platforms(tmp / "platforms");
    CapturedLog log;

    PlatformArchiveBuilder builder(log.logger());
    REQUIRE(builder.build(tmp / "platforms", tmp / "out").is_ok());

    REQUIRE(read_member(tmp / "out/windows-amd64.zip", ArchiveFormat::Zip,
                        "lib/plugin.dll").value() == "MZ plugin");
    REQUIRE(read_member(tmp / "out/linux-amd64.tar.gz", ArchiveFormat::TarGz,
                        "app").value() == "ELF");
}

TEST_CASE("archives can be written beside the platform directories", "[builder]") {
    TempDir tmp;
    make_platforms(tmp / "platforms");
    CapturedLog log;

    PlatformArchiveBuilder builder(log.logger());
    REQUIRE(builder.build(tmp / "platforms", tmp / "platforms").is_ok());
    // Running again replaces the archives instead of nesting them
    auto again = builder.build(tmp / "platforms", tmp / "platforms");
    REQUIRE(again.is_ok());
    REQUIRE(again.value().created_count() == 2);

    auto entries = list_archive(tmp / "platforms/linux-amd64.tar.gz", ArchiveFormat::TarGz);
    REQUIRE(entries.value().size() == 1);

    size_t leftovers = 0;
    for (const auto& e : fs::directory_iterator(tmp.path() / "platforms")) {
        if (e.path().filename().string().find(".tmp") != std::string::npos) ++leftovers;
    }
    REQUIRE(leftovers == 0);
}

TEST_CASE("missing source directory", "[builder]") {
    TempDir tmp;
    CapturedLog log;
    PlatformArchiveBuilder builder(log.logger());
    auto r = builder.build(tmp / "nope", tmp / "out");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RelpackError::MissingInputDirectory);
}

TEST_CASE("no populated platform is a failure", "[builder]") {
    TempDir tmp;
    fs::create_directories(tmp / "platforms/linux-amd64");
    fs::create_directories(tmp / "platforms/freebsd-amd64");
    write_text(tmp / "platforms/freebsd-amd64/app", "ignored");
    CapturedLog log;

    PlatformArchiveBuilder builder(log.logger());
    auto r = builder.build(tmp / "platforms", tmp / "out");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RelpackError::ArchiveWrite);
    REQUIRE_FALSE(fs::exists(tmp / "out/freebsd-amd64.tar.gz"));
}

TEST_CASE("build_one rejects an empty directory", "[builder]") {
    TempDir tmp;
    fs::create_directories(tmp / "empty");
    CapturedLog log;
    PlatformArchiveBuilder builder(log.logger());
    auto r = builder.build_one(kPlatformTargets[0], tmp / "empty", tmp / "out");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RelpackError::ArchiveWrite);
}
