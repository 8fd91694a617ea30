#pragma once

#include <relpack/result.hpp>
#include <string>

namespace relpack {

// Release version: vMAJOR.MINOR.PATCH[-SNAPSHOT]
//
// Components are kept as the digit strings they were written with, so
// conversions between tag and numeric form reproduce the input exactly
// (including leading zeros) and arbitrarily long components never overflow.
class Version {
public:
    // Accepts exactly ^v\d+\.\d+\.\d+(-SNAPSHOT)?$
    static Result<Version> parse(const std::string& tag);

    // Same grammar without the leading 'v' (release-note file names)
    static Result<Version> parse_numeric(const std::string& numeric);

    std::string to_tag() const;      // "v1.2.3"
    std::string to_numeric() const;  // "1.2.3"

    const std::string& major() const { return major_; }
    const std::string& minor() const { return minor_; }
    const std::string& patch() const { return patch_; }
    bool is_snapshot() const { return snapshot_; }

    // Numeric comparison of (major, minor, patch); a snapshot sorts
    // before the release it precedes.
    int compare(const Version& o) const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;

private:
    std::string major_;
    std::string minor_;
    std::string patch_;
    bool snapshot_ = false;
};

// String-level conversions between "v1.2.3" and "1.2.3". Both validate
// their input and are inverses for every valid version.
Result<std::string> to_numeric(const std::string& tag);
Result<std::string> to_tag(const std::string& numeric);

} // namespace relpack
