#include <catch2/catch.hpp>
#include <relpack/platform.hpp>
#include <string>

using namespace relpack;

TEST_CASE("platform names and formats", "[platform]") {
    REQUIRE(kPlatformTargets.size() == 4);
    REQUIRE(kPlatformTargets[0].name() == "linux-amd64");
    REQUIRE(kPlatformTargets[1].name() == "linux-arm64");
    REQUIRE(kPlatformTargets[2].name() == "windows-amd64");
    REQUIRE(kPlatformTargets[3].name() == "darwin-amd64");

    for (const auto& t : kPlatformTargets) {
        INFO(t.name());
        if (t.os == Os::Windows) {
            REQUIRE(t.format() == ArchiveFormat::Zip);
        } else {
            REQUIRE(t.format() == ArchiveFormat::TarGz);
        }
    }
    REQUIRE(kPlatformTargets[2].archive_name() == "windows-amd64.zip");
    REQUIRE(kPlatformTargets[3].archive_name() == "darwin-amd64.tar.gz");
}

TEST_CASE("find_platform", "[platform]") {
    auto t = find_platform("linux-arm64");
    REQUIRE(t.has_value());
    REQUIRE(t->arch == Arch::Arm64);
    REQUIRE_FALSE(find_platform("freebsd-amd64").has_value());
    REQUIRE_FALSE(find_platform("windows-arm64").has_value());
}

TEST_CASE("format_from_path", "[platform]") {
    REQUIRE(format_from_path("dist/app_linux.tar.gz") == ArchiveFormat::TarGz);
    REQUIRE(format_from_path("app.tgz") == ArchiveFormat::TarGz);
    REQUIRE(format_from_path("app_windows.zip") == ArchiveFormat::Zip);
    REQUIRE_FALSE(format_from_path("app.tar").has_value());
    REQUIRE_FALSE(format_from_path("checksums.txt").has_value());
    REQUIRE(std::string(format_extension(ArchiveFormat::Zip)) == "zip");
}
