#pragma once

#include <ferry/result.hpp>
#include <ferry/specifier.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace ferry {

// Project-level bare-name bindings with scoped overrides. Loaded once when
// the project is loaded and read-only afterwards; import maps that appear
// inside fetched modules are never consulted.
//
// Keys ending in '/' are prefix keys: "@std/" -> "jsr:@std/" maps
// "@std/path" to "jsr:@std/path".
class ImportMap {
public:
    using Mapping = std::map<std::string, std::string>;

    ImportMap() = default;
    explicit ImportMap(std::filesystem::path base_dir);

    // {"imports": {...}, "scopes": {"prefix": {...}}}
    static Result<ImportMap> parse_json(const std::string& text,
                                        const std::filesystem::path& base_dir);
    static Result<ImportMap> load_json(const std::filesystem::path& path);

    Status add_import(const std::string& key, const std::string& target);
    Status add_scope(const std::string& prefix, const std::string& key,
                     const std::string& target);

    // Entries of `other` replace entries with the same key
    void merge(const ImportMap& other);

    // Whether `name` has a binding visible to `referrer`
    bool maps(const std::string& name, const std::string& referrer) const;

    // Target string after applying the most specific binding
    Result<std::string> resolve_target(const std::string& name,
                                       const std::string& referrer) const;

    // Mapped and parsed; targets are relative to the import map's base dir
    Result<Specifier> resolve(const std::string& name, const std::string& referrer) const;

    const Mapping& imports() const { return imports_; }
    const std::map<std::string, Mapping>& scopes() const { return scopes_; }
    const std::filesystem::path& base_dir() const { return base_dir_; }
    bool empty() const { return imports_.empty() && scopes_.empty(); }

private:
    static std::optional<std::string> lookup(const Mapping& mapping, const std::string& name);
    std::string normalize_scope(const std::string& prefix) const;
    std::string normalize_target(const std::string& target) const;

    std::filesystem::path base_dir_;
    Mapping imports_;
    std::map<std::string, Mapping> scopes_;
};

} // namespace ferry
