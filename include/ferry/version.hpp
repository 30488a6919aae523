#pragma once

#include <ferry/result.hpp>
#include <string>
#include <vector>

namespace ferry {

// Semantic version: major.minor.patch[-prerelease][+build]
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::vector<std::string> prerelease;  // dot-separated identifiers
    std::string build;                    // ignored for precedence

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !prerelease.empty(); }

    // Precedence per semver 2.0 section 11
    int compare(const Version& o) const;

    bool operator==(const Version& o) const { return compare(o) == 0; }
    bool operator!=(const Version& o) const { return compare(o) != 0; }
    bool operator<(const Version& o) const { return compare(o) < 0; }
    bool operator<=(const Version& o) const { return compare(o) <= 0; }
    bool operator>(const Version& o) const { return compare(o) > 0; }
    bool operator>=(const Version& o) const { return compare(o) >= 0; }
};

enum class RangeKind {
    Exact,   // 1.2.3 or =1.2.3
    Caret,   // ^1.2.3 (same major; same minor while major is 0)
    Tilde,   // ~1.2.3 (same major.minor)
    Latest,  // "", "*", "latest"
};

struct VersionRange {
    RangeKind kind = RangeKind::Latest;
    Version version;  // unused for Latest

    // Accepts partial versions: "^1" -> ^1.0.0, "~1.2" -> ~1.2.0, "1" -> ^1.0.0,
    // "1.2" -> ~1.2.0
    static Result<VersionRange> parse(const std::string& s);

    static VersionRange exact(Version v) { return {RangeKind::Exact, std::move(v)}; }
    static VersionRange latest() { return {}; }

    bool matches(const Version& v) const;
    bool is_exact() const { return kind == RangeKind::Exact; }

    // "" for Latest so that "npm:foo" round-trips
    std::string to_string() const;
};

} // namespace ferry
