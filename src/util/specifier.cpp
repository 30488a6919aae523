#include <ferry/specifier.hpp>
#include <ferry/import_map.hpp>
#include <ferry/url.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace ferry {

namespace fs = std::filesystem;

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_relative_ref(const std::string& s) {
    return starts_with(s, "./") || starts_with(s, "../") || starts_with(s, "/") ||
           s == "." || s == "..";
}

// "node:fs", "data:...", "git+ssh://..." and friends
bool has_foreign_scheme(const std::string& s) {
    size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    if (s.find('/') < colon) return false;
    return std::all_of(s.begin(), s.begin() + static_cast<long>(colon), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '+' || c == '-' || c == '.';
    });
}

bool valid_package_part(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.';
    });
}

Result<Specifier> resolve_in_package(const std::string& raw, const std::string& referrer) {
    auto base = Specifier::parse_registry(referrer);
    if (base.is_err()) return std::move(base).error();

    RegistrySpecifier spec = std::move(base).value();
    std::string dir = "/" + spec.subpath;
    dir = dir.substr(0, dir.rfind('/') + 1);

    std::string joined = raw[0] == '/' ? raw : dir + raw;
    std::string normal = remove_dot_segments(joined);
    if (normal.empty() || normal == "/") {
        return FerryError{FerryError::UnresolvedSpecifier,
            "'" + raw + "' imported from '" + referrer + "' does not name a file in the package"};
    }
    spec.subpath = normal.substr(1);
    if (!has_module_extension(spec.subpath)) {
        return FerryError{FerryError::UnresolvedSpecifier,
            "module not found '" + raw + "' imported from '" + referrer + "'",
            "relative imports must name a file including its extension"};
    }
    return Result<Specifier>::ok(Specifier(std::move(spec)));
}

Result<Specifier> resolve_local(const std::string& raw, const std::string& referrer) {
    fs::path target;
    if (starts_with(raw, "file://")) {
        target = path_from_file_url(raw);
    } else if (raw[0] == '/') {
        target = fs::path(raw);
    } else {
        fs::path base = starts_with(referrer, "file://")
            ? path_from_file_url(referrer)
            : fs::path(referrer);
        std::string base_str = base.generic_string();
        fs::path dir = (!base_str.empty() && base_str.back() == '/')
            ? base
            : base.parent_path();
        target = dir / raw;
    }
    target = target.lexically_normal();

    if (!has_module_extension(target.filename().string())) {
        return FerryError{FerryError::UnresolvedSpecifier,
            "module not found '" + raw + "' imported from '" + referrer + "'",
            "local imports must name a file including its extension, e.g. './" +
                target.filename().string() + ".ts'"};
    }
    return Result<Specifier>::ok(Specifier(LocalSpecifier{std::move(target)}));
}

} // namespace

const char* registry_name(RegistryKind kind) {
    switch (kind) {
        case RegistryKind::Jsr: return "jsr";
        case RegistryKind::Npm: return "npm";
    }
    return "unknown";
}

bool has_module_extension(const std::string& path) {
    static const std::array<const char*, 10> extensions = {
        ".ts", ".tsx", ".mts", ".cts", ".js", ".jsx", ".mjs", ".cjs", ".json", ".wasm"
    };
    std::string name = path.substr(path.find_last_of('/') + 1);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return false;
    std::string ext = name.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const char* e) { return ext == e; });
}

// ---------------------------------------------------------------------------
// RegistrySpecifier
// ---------------------------------------------------------------------------

std::string RegistrySpecifier::package_key() const {
    return std::string(registry_name(kind)) + ":" + package;
}

std::string RegistrySpecifier::range_key() const {
    std::string range_str = range.to_string();
    if (range_str.empty()) return package_key();
    return package_key() + "@" + range_str;
}

// ---------------------------------------------------------------------------
// Specifier
// ---------------------------------------------------------------------------

Result<RegistrySpecifier> Specifier::parse_registry(const std::string& raw) {
    RegistrySpecifier spec;
    std::string rest;
    if (starts_with(raw, "jsr:")) {
        spec.kind = RegistryKind::Jsr;
        rest = raw.substr(4);
    } else if (starts_with(raw, "npm:")) {
        spec.kind = RegistryKind::Npm;
        rest = raw.substr(4);
    } else {
        return FerryError{FerryError::UnresolvedSpecifier,
            "not a registry specifier: '" + raw + "'"};
    }
    // "jsr:/@std/path" is accepted as well
    if (starts_with(rest, "/")) rest = rest.substr(1);

    size_t name_end;
    if (starts_with(rest, "@")) {
        size_t slash = rest.find('/');
        if (slash == std::string::npos) {
            return FerryError{FerryError::UnresolvedSpecifier,
                "invalid " + std::string(registry_name(spec.kind)) +
                " specifier '" + raw + "': scoped package needs a name after the scope"};
        }
        name_end = rest.find_first_of("@/", slash + 1);
        std::string scope = rest.substr(1, slash - 1);
        std::string name = rest.substr(slash + 1, name_end == std::string::npos
                                                  ? std::string::npos : name_end - slash - 1);
        if (!valid_package_part(scope) || !valid_package_part(name)) {
            return FerryError{FerryError::UnresolvedSpecifier,
                "invalid package name in '" + raw + "'"};
        }
    } else {
        if (spec.kind == RegistryKind::Jsr) {
            return FerryError{FerryError::UnresolvedSpecifier,
                "invalid jsr specifier '" + raw + "'",
                "jsr packages are scoped: jsr:@scope/name"};
        }
        name_end = rest.find_first_of("@/");
        if (!valid_package_part(rest.substr(0, name_end))) {
            return FerryError{FerryError::UnresolvedSpecifier,
                "invalid package name in '" + raw + "'"};
        }
    }
    spec.package = rest.substr(0, name_end);

    std::string tail = name_end == std::string::npos ? "" : rest.substr(name_end);
    if (starts_with(tail, "@")) {
        size_t slash = tail.find('/');
        std::string range_str = tail.substr(1, slash == std::string::npos
                                               ? std::string::npos : slash - 1);
        auto range = VersionRange::parse(range_str);
        if (range.is_err()) {
            auto err = std::move(range).error();
            err.code = FerryError::UnresolvedSpecifier;
            err.message += " in '" + raw + "'";
            return err;
        }
        spec.range = std::move(range).value();
        tail = slash == std::string::npos ? "" : tail.substr(slash);
    }
    if (starts_with(tail, "/")) {
        spec.subpath = remove_dot_segments(tail).substr(1);
    }
    return Result<RegistrySpecifier>::ok(std::move(spec));
}

Result<Specifier> Specifier::parse(const std::string& raw,
                                   const std::string& referrer,
                                   const ImportMap* map) {
    if (raw.empty()) {
        return FerryError{FerryError::UnresolvedSpecifier,
            "empty specifier imported from '" + referrer + "'"};
    }

    if (starts_with(raw, "jsr:") || starts_with(raw, "npm:")) {
        auto reg = parse_registry(raw);
        if (reg.is_err()) return std::move(reg).error();
        return Result<Specifier>::ok(Specifier(std::move(reg).value()));
    }

    if (map && map->maps(raw, referrer)) {
        return Result<Specifier>::ok(Specifier(BareSpecifier{raw}));
    }

    if (has_http_scheme(raw)) {
        auto url = Url::parse(raw);
        if (url.is_err()) return std::move(url).error();
        return Result<Specifier>::ok(Specifier(UrlSpecifier{url.value().to_string()}));
    }

    if (starts_with(raw, "file://")) {
        return resolve_local(raw, referrer);
    }

    if (is_relative_ref(raw)) {
        if (has_http_scheme(referrer)) {
            auto base = Url::parse(referrer);
            if (base.is_err()) return std::move(base).error();
            auto joined = base.value().join(raw);
            if (joined.is_err()) return std::move(joined).error();
            return Result<Specifier>::ok(Specifier(UrlSpecifier{joined.value().to_string()}));
        }
        if (starts_with(referrer, "jsr:") || starts_with(referrer, "npm:")) {
            return resolve_in_package(raw, referrer);
        }
        return resolve_local(raw, referrer);
    }

    if (has_foreign_scheme(raw)) {
        return FerryError{FerryError::UnresolvedSpecifier,
            "unsupported scheme in '" + raw + "' imported from '" + referrer + "'"};
    }

    return FerryError{FerryError::UnmappedSpecifier,
        "bare specifier '" + raw + "' imported from '" + referrer +
            "' is not mapped by the import map",
        "add an entry for it under [imports] in ferry.toml"};
}

std::string Specifier::to_string() const {
    switch (kind()) {
    case Kind::Local:
        return file_url(local().path);
    case Kind::Bare:
        return bare().name;
    case Kind::Registry: {
        const auto& r = registry();
        std::string s = r.range_key();
        if (!r.subpath.empty()) s += "/" + r.subpath;
        return s;
    }
    case Kind::Url:
        return url().url;
    }
    return "";
}

std::string Specifier::cache_key() const {
    if (is_registry() && registry().kind == RegistryKind::Npm) {
        return registry().range_key();
    }
    return to_string();
}

Specifier Specifier::with_version(const Version& v) const {
    RegistrySpecifier copy = registry();
    copy.range = VersionRange::exact(v);
    return Specifier(std::move(copy));
}

} // namespace ferry
