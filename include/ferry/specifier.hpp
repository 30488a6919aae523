#pragma once

#include <ferry/result.hpp>
#include <ferry/version.hpp>

#include <filesystem>
#include <string>
#include <variant>

namespace ferry {

class ImportMap;

enum class RegistryKind { Jsr, Npm };

// "jsr" / "npm"
const char* registry_name(RegistryKind kind);

struct LocalSpecifier {
    std::filesystem::path path;  // absolute, lexically normal
};

struct BareSpecifier {
    std::string name;
};

struct RegistrySpecifier {
    RegistryKind kind = RegistryKind::Jsr;
    std::string package;   // "@scope/name" or "name"
    VersionRange range;
    std::string subpath;   // without leading '/', empty for the default export

    // "jsr:@x/y"
    std::string package_key() const;
    // "jsr:@x/y@^1.2.0", the form pinned in the lock file
    std::string range_key() const;
};

struct UrlSpecifier {
    std::string url;
};

// A parsed import string. Immutable once constructed.
class Specifier {
public:
    using Variant = std::variant<LocalSpecifier, BareSpecifier, RegistrySpecifier, UrlSpecifier>;
    enum class Kind { Local, Bare, Registry, Url };

    Specifier(LocalSpecifier s) : data_(std::move(s)) {}
    Specifier(BareSpecifier s) : data_(std::move(s)) {}
    Specifier(RegistrySpecifier s) : data_(std::move(s)) {}
    Specifier(UrlSpecifier s) : data_(std::move(s)) {}

    // Classify `raw` as imported from `referrer`. The referrer is the
    // canonical string of the importing module, or a directory URL ending
    // in '/' for top-level roots. When `map` is given, strings it maps are
    // returned as Bare.
    static Result<Specifier> parse(const std::string& raw,
                                   const std::string& referrer,
                                   const ImportMap* map = nullptr);

    // Parse "jsr:..." / "npm:..." only
    static Result<RegistrySpecifier> parse_registry(const std::string& raw);

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool is_local() const { return kind() == Kind::Local; }
    bool is_bare() const { return kind() == Kind::Bare; }
    bool is_registry() const { return kind() == Kind::Registry; }
    bool is_url() const { return kind() == Kind::Url; }

    // Registry and URL content is cached and locked; local files are not
    bool is_remote() const { return is_registry() || is_url(); }

    const LocalSpecifier& local() const { return std::get<LocalSpecifier>(data_); }
    const BareSpecifier& bare() const { return std::get<BareSpecifier>(data_); }
    const RegistrySpecifier& registry() const { return std::get<RegistrySpecifier>(data_); }
    const UrlSpecifier& url() const { return std::get<UrlSpecifier>(data_); }

    // file:///a/b.ts, name, jsr:@x/y@^1.2.0/sub.ts, https://host/mod.ts
    std::string to_string() const;

    // Key for the cache and the lock file: the canonical string with the
    // concrete version. npm keys name the whole package tarball, so they
    // carry no subpath.
    std::string cache_key() const;

    // Copy of a registry specifier with its range fixed to `v`
    Specifier with_version(const Version& v) const;

    bool operator==(const Specifier& o) const { return to_string() == o.to_string(); }

private:
    Variant data_;
};

// True when the last path component ends in a module extension
// (.ts .tsx .mts .cts .js .jsx .mjs .cjs .json .wasm)
bool has_module_extension(const std::string& path);

} // namespace ferry
