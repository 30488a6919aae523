#include <ferry/import_map.hpp>
#include <ferry/url.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace ferry {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_prefix_key(const std::string& key) {
    return !key.empty() && key.back() == '/';
}

Status check_entry(const std::string& key, const std::string& target) {
    if (key.empty()) {
        return FerryError{FerryError::Config, "import map key must not be empty"};
    }
    if (target.empty()) {
        return FerryError{FerryError::Config,
            "import map entry '" + key + "' has an empty target"};
    }
    if (is_prefix_key(key) && !is_prefix_key(target)) {
        return FerryError{FerryError::Config,
            "import map entry '" + key + "' ends in '/' but its target '" +
                target + "' does not"};
    }
    return ok_status();
}

} // namespace

ImportMap::ImportMap(fs::path base_dir) : base_dir_(std::move(base_dir)) {}

Result<ImportMap> ImportMap::parse_json(const std::string& text, const fs::path& base_dir) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return FerryError{FerryError::Parse,
            std::string("import map JSON parse error: ") + e.what()};
    }
    if (!doc.is_object()) {
        return FerryError{FerryError::Config, "import map must be a JSON object"};
    }

    ImportMap map(base_dir);

    if (doc.contains("imports")) {
        const auto& imports = doc["imports"];
        if (!imports.is_object()) {
            return FerryError{FerryError::Config, "import map \"imports\" must be an object"};
        }
        for (auto it = imports.begin(); it != imports.end(); ++it) {
            if (!it.value().is_string()) {
                return FerryError{FerryError::Config,
                    "import map entry '" + it.key() + "' must be a string"};
            }
            FERRY_TRY(map.add_import(it.key(), it.value().get<std::string>()));
        }
    }

    if (doc.contains("scopes")) {
        const auto& scopes = doc["scopes"];
        if (!scopes.is_object()) {
            return FerryError{FerryError::Config, "import map \"scopes\" must be an object"};
        }
        for (auto scope = scopes.begin(); scope != scopes.end(); ++scope) {
            if (!scope.value().is_object()) {
                return FerryError{FerryError::Config,
                    "import map scope '" + scope.key() + "' must be an object"};
            }
            for (auto it = scope.value().begin(); it != scope.value().end(); ++it) {
                if (!it.value().is_string()) {
                    return FerryError{FerryError::Config,
                        "import map entry '" + it.key() + "' in scope '" +
                            scope.key() + "' must be a string"};
                }
                FERRY_TRY(map.add_scope(scope.key(), it.key(), it.value().get<std::string>()));
            }
        }
    }

    return Result<ImportMap>::ok(std::move(map));
}

Result<ImportMap> ImportMap::load_json(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FerryError{FerryError::IO, "cannot open import map: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto map = parse_json(ss.str(), fs::absolute(path).parent_path());
    if (map.is_err()) {
        auto err = std::move(map).error();
        err.file = path.string();
        return err;
    }
    return map;
}

Status ImportMap::add_import(const std::string& key, const std::string& target) {
    FERRY_TRY(check_entry(key, target));
    imports_[key] = normalize_target(target);
    return ok_status();
}

Status ImportMap::add_scope(const std::string& prefix, const std::string& key,
                            const std::string& target) {
    if (prefix.empty()) {
        return FerryError{FerryError::Config, "import map scope prefix must not be empty"};
    }
    FERRY_TRY(check_entry(key, target));
    scopes_[normalize_scope(prefix)][key] = normalize_target(target);
    return ok_status();
}

void ImportMap::merge(const ImportMap& other) {
    for (const auto& [k, v] : other.imports_) {
        imports_[k] = v;
    }
    for (const auto& [scope, mapping] : other.scopes_) {
        for (const auto& [k, v] : mapping) {
            scopes_[scope][k] = v;
        }
    }
    if (base_dir_.empty()) base_dir_ = other.base_dir_;
}

std::string ImportMap::normalize_scope(const std::string& prefix) const {
    if (starts_with(prefix, "./") || starts_with(prefix, "../") || starts_with(prefix, "/")) {
        fs::path p = prefix[0] == '/' ? fs::path(prefix) : base_dir_ / prefix;
        return file_url(p, prefix.back() == '/');
    }
    return prefix;
}

// Relative targets become file URLs so that maps with different base
// directories can be merged
std::string ImportMap::normalize_target(const std::string& target) const {
    if (base_dir_.empty()) return target;
    if (starts_with(target, "./") || starts_with(target, "../")) {
        return file_url(base_dir_ / target, target.back() == '/');
    }
    return target;
}

std::optional<std::string> ImportMap::lookup(const Mapping& mapping, const std::string& name) {
    auto exact = mapping.find(name);
    if (exact != mapping.end()) return exact->second;

    // Longest matching prefix key
    const std::string* best_key = nullptr;
    const std::string* best_target = nullptr;
    for (const auto& [key, target] : mapping) {
        if (!is_prefix_key(key) || !starts_with(name, key)) continue;
        if (!best_key || key.size() > best_key->size()) {
            best_key = &key;
            best_target = &target;
        }
    }
    if (!best_key) return std::nullopt;
    return *best_target + name.substr(best_key->size());
}

Result<std::string> ImportMap::resolve_target(const std::string& name,
                                              const std::string& referrer) const {
    // Scopes applicable to the referrer, most specific first
    std::vector<const std::pair<const std::string, Mapping>*> applicable;
    for (const auto& entry : scopes_) {
        if (starts_with(referrer, entry.first)) applicable.push_back(&entry);
    }
    std::sort(applicable.begin(), applicable.end(), [](const auto* a, const auto* b) {
        return a->first.size() > b->first.size();
    });

    for (const auto* scope : applicable) {
        if (auto target = lookup(scope->second, name)) {
            return Result<std::string>::ok(*target);
        }
    }
    if (auto target = lookup(imports_, name)) {
        return Result<std::string>::ok(*target);
    }

    return FerryError{FerryError::UnmappedSpecifier,
        "'" + name + "' imported from '" + referrer + "' is not mapped by the import map",
        "add an entry for it under [imports] in ferry.toml"};
}

bool ImportMap::maps(const std::string& name, const std::string& referrer) const {
    return resolve_target(name, referrer).is_ok();
}

Result<Specifier> ImportMap::resolve(const std::string& name, const std::string& referrer) const {
    auto target = resolve_target(name, referrer);
    if (target.is_err()) return std::move(target).error();

    // Targets are never re-mapped, which also rules out mapping cycles
    auto spec = Specifier::parse(target.value(), file_url(base_dir_, true));
    if (spec.is_err()) {
        auto err = std::move(spec).error();
        err.message = "import map entry for '" + name + "': " + err.message;
        return err;
    }
    return spec;
}

} // namespace ferry
