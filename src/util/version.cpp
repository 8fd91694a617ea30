#include <relpack/version.hpp>

namespace relpack {

static const char* kSnapshotSuffix = "-SNAPSHOT";

static bool is_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// Compare two non-empty digit strings by numeric value
static int compare_digits(const std::string& a, const std::string& b) {
    size_t ia = a.find_first_not_of('0');
    size_t ib = b.find_first_not_of('0');
    std::string na = ia == std::string::npos ? "" : a.substr(ia);
    std::string nb = ib == std::string::npos ? "" : b.substr(ib);
    if (na.size() != nb.size()) return na.size() < nb.size() ? -1 : 1;
    int c = na.compare(nb);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

static RelpackError invalid_format(const std::string& input) {
    return RelpackError{RelpackError::InvalidVersionFormat,
        "invalid version '" + input + "'",
        "expected semantic version: v1.2.3 or v1.2.3-SNAPSHOT"};
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse_numeric(const std::string& numeric) {
    std::string body = numeric;
    bool snapshot = false;

    const std::string suffix = kSnapshotSuffix;
    size_t dash = body.find('-');
    if (dash != std::string::npos) {
        if (body.compare(dash, std::string::npos, suffix) != 0) {
            return invalid_format(numeric);
        }
        snapshot = true;
        body = body.substr(0, dash);
    }

    size_t dot1 = body.find('.');
    if (dot1 == std::string::npos) return invalid_format(numeric);
    size_t dot2 = body.find('.', dot1 + 1);
    if (dot2 == std::string::npos) return invalid_format(numeric);
    if (body.find('.', dot2 + 1) != std::string::npos) return invalid_format(numeric);

    Version v;
    v.major_ = body.substr(0, dot1);
    v.minor_ = body.substr(dot1 + 1, dot2 - dot1 - 1);
    v.patch_ = body.substr(dot2 + 1);
    v.snapshot_ = snapshot;

    if (!is_digits(v.major_) || !is_digits(v.minor_) || !is_digits(v.patch_)) {
        return invalid_format(numeric);
    }

    return Result<Version>::ok(std::move(v));
}

Result<Version> Version::parse(const std::string& tag) {
    if (tag.size() < 2 || tag[0] != 'v') {
        return invalid_format(tag);
    }
    auto v = parse_numeric(tag.substr(1));
    if (v.is_err()) return invalid_format(tag);
    return v;
}

std::string Version::to_numeric() const {
    std::string s = major_ + "." + minor_ + "." + patch_;
    if (snapshot_) s += kSnapshotSuffix;
    return s;
}

std::string Version::to_tag() const {
    return "v" + to_numeric();
}

int Version::compare(const Version& o) const {
    if (int c = compare_digits(major_, o.major_)) return c;
    if (int c = compare_digits(minor_, o.minor_)) return c;
    if (int c = compare_digits(patch_, o.patch_)) return c;
    if (snapshot_ == o.snapshot_) return 0;
    return snapshot_ ? -1 : 1;
}

bool Version::operator==(const Version& o) const { return compare(o) == 0; }
bool Version::operator!=(const Version& o) const { return compare(o) != 0; }
bool Version::operator<(const Version& o) const { return compare(o) < 0; }
bool Version::operator<=(const Version& o) const { return compare(o) <= 0; }
bool Version::operator>(const Version& o) const { return compare(o) > 0; }
bool Version::operator>=(const Version& o) const { return compare(o) >= 0; }

// ---------------------------------------------------------------------------
// String conversions
// ---------------------------------------------------------------------------

Result<std::string> to_numeric(const std::string& tag) {
    auto v = Version::parse(tag);
    if (v.is_err()) return std::move(v).error();
    return Result<std::string>::ok(v.value().to_numeric());
}

Result<std::string> to_tag(const std::string& numeric) {
    auto v = Version::parse_numeric(numeric);
    if (v.is_err()) return std::move(v).error();
    return Result<std::string>::ok(v.value().to_tag());
}

} // namespace relpack
