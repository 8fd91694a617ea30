#include <relpack/platform.hpp>

namespace relpack {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const char* format_extension(ArchiveFormat fmt) {
    switch (fmt) {
        case ArchiveFormat::TarGz: return "tar.gz";
        case ArchiveFormat::Zip:   return "zip";
    }
    return "";
}

std::optional<ArchiveFormat> format_from_path(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    if (ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) {
        return ArchiveFormat::TarGz;
    }
    if (ends_with(name, ".zip")) {
        return ArchiveFormat::Zip;
    }
    return std::nullopt;
}

const char* os_name(Os os) {
    switch (os) {
        case Os::Linux:   return "linux";
        case Os::Windows: return "windows";
        case Os::Darwin:  return "darwin";
    }
    return "unknown";
}

const char* arch_name(Arch arch) {
    switch (arch) {
        case Arch::Amd64: return "amd64";
        case Arch::Arm64: return "arm64";
    }
    return "unknown";
}

std::string PlatformTarget::name() const {
    return std::string(os_name(os)) + "-" + arch_name(arch);
}

ArchiveFormat PlatformTarget::format() const {
    return os == Os::Windows ? ArchiveFormat::Zip : ArchiveFormat::TarGz;
}

std::string PlatformTarget::archive_name() const {
    return name() + "." + format_extension(format());
}

std::optional<PlatformTarget> find_platform(const std::string& name) {
    for (const auto& target : kPlatformTargets) {
        if (target.name() == name) return target;
    }
    return std::nullopt;
}

} // namespace relpack
