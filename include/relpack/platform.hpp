#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>

namespace relpack {

enum class ArchiveFormat { TarGz, Zip };

// "tar.gz" or "zip"
const char* format_extension(ArchiveFormat fmt);

// Infers the format from a file name (.tar.gz, .tgz, .zip)
std::optional<ArchiveFormat> format_from_path(const std::filesystem::path& path);

enum class Os { Linux, Windows, Darwin };
enum class Arch { Amd64, Arm64 };

const char* os_name(Os os);
const char* arch_name(Arch arch);

// One build target. Windows-family targets ship as zip, the rest as tar.gz.
struct PlatformTarget {
    Os os;
    Arch arch;

    std::string name() const;           // "linux-amd64"
    ArchiveFormat format() const;
    std::string archive_name() const;   // "linux-amd64.tar.gz"
};

// Closed set of targets every release is built for, in build order
inline constexpr std::array<PlatformTarget, 4> kPlatformTargets = {{
    {Os::Linux, Arch::Amd64},
    {Os::Linux, Arch::Arm64},
    {Os::Windows, Arch::Amd64},
    {Os::Darwin, Arch::Amd64},
}};

std::optional<PlatformTarget> find_platform(const std::string& name);

} // namespace relpack
