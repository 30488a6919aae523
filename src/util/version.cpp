#include <ferry/version.hpp>

#include <algorithm>
#include <cctype>

namespace ferry {

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool valid_identifier(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-';
    });
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

Result<int> parse_component(const std::string& part, const std::string& whole) {
    if (!all_digits(part)) {
        return FerryError{FerryError::Parse,
            "invalid version '" + whole + "'",
            "expected format: major.minor.patch[-prerelease][+build]"};
    }
    if (part.size() > 1 && part[0] == '0') {
        return FerryError{FerryError::Parse,
            "leading zero in version component of '" + whole + "'"};
    }
    if (part.size() > 9) {
        return FerryError{FerryError::Parse,
            "version component too large in '" + whole + "'"};
    }
    return Result<int>::ok(std::stoi(part));
}

int compare_identifiers(const std::string& a, const std::string& b) {
    bool a_num = all_digits(a);
    bool b_num = all_digits(b);
    if (a_num && b_num) {
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        int c = a.compare(b);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    // Numeric identifiers have lower precedence than alphanumeric ones
    if (a_num) return -1;
    if (b_num) return 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& input) {
    std::string s = input;
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) s = s.substr(1);
    if (s.empty()) {
        return FerryError{FerryError::Parse, "empty version string"};
    }

    Version v;

    size_t plus = s.find('+');
    if (plus != std::string::npos) {
        v.build = s.substr(plus + 1);
        s = s.substr(0, plus);
        if (v.build.empty()) {
            return FerryError{FerryError::Parse,
                "empty build metadata in '" + input + "'"};
        }
    }

    size_t dash = s.find('-');
    std::string core = s.substr(0, dash);
    if (dash != std::string::npos) {
        std::string pre = s.substr(dash + 1);
        if (pre.empty()) {
            return FerryError{FerryError::Parse,
                "empty pre-release after '-' in '" + input + "'"};
        }
        for (auto& ident : split(pre, '.')) {
            if (!valid_identifier(ident)) {
                return FerryError{FerryError::Parse,
                    "invalid pre-release identifier in '" + input + "'"};
            }
            v.prerelease.push_back(ident);
        }
    }

    auto parts = split(core, '.');
    if (parts.size() != 3) {
        return FerryError{FerryError::Parse,
            "invalid version '" + input + "'",
            "expected format: major.minor.patch[-prerelease][+build]"};
    }

    auto major = parse_component(parts[0], input);
    if (major.is_err()) return std::move(major).error();
    auto minor = parse_component(parts[1], input);
    if (minor.is_err()) return std::move(minor).error();
    auto patch = parse_component(parts[2], input);
    if (patch.is_err()) return std::move(patch).error();

    v.major = major.value();
    v.minor = minor.value();
    v.patch = patch.value();
    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    for (size_t i = 0; i < prerelease.size(); ++i) {
        s += (i == 0 ? "-" : ".");
        s += prerelease[i];
    }
    if (!build.empty()) {
        s += "+" + build;
    }
    return s;
}

int Version::compare(const Version& o) const {
    if (major != o.major) return major < o.major ? -1 : 1;
    if (minor != o.minor) return minor < o.minor ? -1 : 1;
    if (patch != o.patch) return patch < o.patch ? -1 : 1;

    // A release outranks any of its pre-releases
    if (prerelease.empty() && o.prerelease.empty()) return 0;
    if (prerelease.empty()) return 1;
    if (o.prerelease.empty()) return -1;

    size_t n = std::min(prerelease.size(), o.prerelease.size());
    for (size_t i = 0; i < n; ++i) {
        int c = compare_identifiers(prerelease[i], o.prerelease[i]);
        if (c != 0) return c;
    }
    if (prerelease.size() == o.prerelease.size()) return 0;
    return prerelease.size() < o.prerelease.size() ? -1 : 1;
}

// ---------------------------------------------------------------------------
// VersionRange
// ---------------------------------------------------------------------------

Result<VersionRange> VersionRange::parse(const std::string& input) {
    std::string s = input;
    while (!s.empty() && s.front() == ' ') s.erase(s.begin());
    while (!s.empty() && s.back() == ' ') s.pop_back();

    if (s.empty() || s == "*" || s == "latest") {
        return Result<VersionRange>::ok(VersionRange::latest());
    }

    VersionRange range;
    bool explicit_op = true;
    if (s[0] == '^') {
        range.kind = RangeKind::Caret;
        s = s.substr(1);
    } else if (s[0] == '~') {
        range.kind = RangeKind::Tilde;
        s = s.substr(1);
    } else if (s[0] == '=') {
        range.kind = RangeKind::Exact;
        s = s.substr(1);
    } else {
        range.kind = RangeKind::Exact;
        explicit_op = false;
    }

    // Partial forms: pad with zeros. Without an operator a partial version
    // is an x-range: "1" -> ^1.0.0, "1.2" -> ~1.2.0.
    std::string core = s.substr(0, s.find_first_of("-+"));
    size_t dots = static_cast<size_t>(std::count(core.begin(), core.end(), '.'));
    if (dots < 2 && core.size() == s.size()) {
        if (!explicit_op) {
            range.kind = dots == 0 ? RangeKind::Caret : RangeKind::Tilde;
        } else if (range.kind == RangeKind::Exact) {
            return FerryError{FerryError::Parse,
                "exact version requires major.minor.patch: '" + input + "'"};
        }
        s += (dots == 0 ? ".0.0" : ".0");
    }

    auto v = Version::parse(s);
    if (v.is_err()) {
        return FerryError{FerryError::Parse,
            "invalid version range '" + input + "'",
            "supported forms: 1.2.3, ^1.2.3, ~1.2.3, latest"};
    }
    range.version = std::move(v).value();
    return Result<VersionRange>::ok(std::move(range));
}

bool VersionRange::matches(const Version& v) const {
    switch (kind) {
    case RangeKind::Latest:
        return true;

    case RangeKind::Exact:
        return v == version;

    case RangeKind::Caret:
    case RangeKind::Tilde:
        if (v < version) return false;
        // Pre-releases only match a range that names the same release line
        if (v.is_prerelease()) {
            if (!version.is_prerelease()) return false;
            if (v.major != version.major || v.minor != version.minor ||
                v.patch != version.patch) return false;
        }
        if (v.major != version.major) return false;
        if (kind == RangeKind::Tilde || version.major == 0) {
            return v.minor == version.minor;
        }
        return true;
    }
    return false;
}

std::string VersionRange::to_string() const {
    switch (kind) {
    case RangeKind::Latest: return "";
    case RangeKind::Exact:  return version.to_string();
    case RangeKind::Caret:  return "^" + version.to_string();
    case RangeKind::Tilde:  return "~" + version.to_string();
    }
    return "";
}

} // namespace ferry
