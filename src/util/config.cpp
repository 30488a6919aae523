#include <ferry/config.hpp>
#include <ferry/file_io.hpp>
#include <ferry/log.hpp>

#include <toml++/toml.hpp>

#include <cstdlib>

namespace ferry {

namespace fs = std::filesystem;

namespace {

std::string resolve_path(const std::string& p, const fs::path& base_dir) {
    if (p.empty() || base_dir.empty()) return p;
    fs::path path(p);
    if (path.is_absolute()) return p;
    return (base_dir / path).lexically_normal().string();
}

Status read_mapping(const toml::table& tbl, const std::string& where,
                    std::map<std::string, std::string>& out) {
    for (const auto& [key, val] : tbl) {
        auto s = val.value<std::string>();
        if (!s) {
            return FerryError{FerryError::Config,
                where + " entry '" + std::string(key.str()) + "' must be a string"};
        }
        out[std::string(key.str())] = *s;
    }
    return ok_status();
}

Result<int> read_positive(const toml::table& tbl, const char* key, const char* section,
                          int min_value) {
    const toml::node* node = tbl.get(key);
    auto v = node ? node->value<int64_t>() : std::nullopt;
    if (!v || *v < min_value) {
        return FerryError{FerryError::Config,
            std::string("[") + section + "] " + key + " must be an integer >= " +
                std::to_string(min_value)};
    }
    return Result<int>::ok(static_cast<int>(*v));
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str, const fs::path& base_dir) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return FerryError{FerryError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    // [imports] and [scopes."<prefix>"]
    if (auto imports = doc["imports"].as_table()) {
        FERRY_TRY(read_mapping(*imports, "[imports]", cfg.imports));
    } else if (doc.contains("imports")) {
        return FerryError{FerryError::Config, "imports must be a table"};
    }
    if (auto scopes = doc["scopes"].as_table()) {
        for (const auto& [prefix, val] : *scopes) {
            auto tbl = val.as_table();
            std::string p(prefix.str());
            if (!tbl) {
                return FerryError{FerryError::Config,
                    "[scopes] entry '" + p + "' must be a table"};
            }
            FERRY_TRY(read_mapping(*tbl, "[scopes.\"" + p + "\"]", cfg.scopes[p]));
        }
    }

    if (auto v = doc["import-map"].value<std::string>()) {
        cfg.import_map = resolve_path(*v, base_dir);
    }

    if (auto v = doc["vendor"].value<bool>()) {
        cfg.vendor = *v;
        cfg.vendor_set = true;
    }

    // lock = false | "path" | { path = "...", frozen = true }
    if (const toml::node* lock = doc.get("lock")) {
        if (auto b = lock->value<bool>()) {
            cfg.lock.enabled = *b;
            cfg.lock_enabled_set = true;
        } else if (auto s = lock->value<std::string>()) {
            cfg.lock.path = resolve_path(*s, base_dir);
            cfg.lock.enabled = true;
            cfg.lock_enabled_set = true;
        } else if (auto tbl = lock->as_table()) {
            cfg.lock.enabled = true;
            cfg.lock_enabled_set = true;
            if (auto p = (*tbl)["path"].value<std::string>()) {
                cfg.lock.path = resolve_path(*p, base_dir);
            }
            if (auto f = (*tbl)["frozen"].value<bool>()) {
                cfg.lock.frozen = *f;
                cfg.lock_frozen_set = true;
            }
        } else {
            return FerryError{FerryError::Config,
                "lock must be a boolean, a path, or a table { path, frozen }"};
        }
    }

    // [fetch] section
    if (auto fetch = doc["fetch"].as_table()) {
        if (fetch->contains("timeout")) {
            auto v = read_positive(*fetch, "timeout", "fetch", 1);
            if (v.is_err()) return std::move(v).error();
            cfg.fetch.timeout_secs = v.value();
            cfg.fetch_timeout_set = true;
        }
        if (fetch->contains("retries")) {
            auto v = read_positive(*fetch, "retries", "fetch", 0);
            if (v.is_err()) return std::move(v).error();
            cfg.fetch.retries = v.value();
            cfg.fetch_retries_set = true;
        }
        if (fetch->contains("jobs")) {
            auto v = read_positive(*fetch, "jobs", "fetch", 1);
            if (v.is_err()) return std::move(v).error();
            cfg.fetch.jobs = v.value();
            cfg.fetch_jobs_set = true;
        }
    }

    // [registry] section
    if (auto reg = doc["registry"].as_table()) {
        if (auto v = (*reg)["jsr"].value<std::string>()) {
            cfg.registry.jsr = *v;
            cfg.registry_jsr_set = true;
        }
        if (auto v = (*reg)["npm"].value<std::string>()) {
            cfg.registry.npm = *v;
            cfg.registry_npm_set = true;
        }
        if (auto v = (*reg)["jsr-mirror"].value<std::string>()) {
            cfg.registry.jsr_mirror = resolve_path(*v, base_dir);
        }
        if (auto v = (*reg)["npm-mirror"].value<std::string>()) {
            cfg.registry.npm_mirror = resolve_path(*v, base_dir);
        }
    }

    if (auto v = doc["cache"]["dir"].value<std::string>()) {
        cfg.cache_dir = resolve_path(*v, base_dir);
    }

    if (auto v = doc["log"]["level"].value<std::string>()) {
        if (!log::parse_level(*v)) {
            return FerryError{FerryError::Config,
                "unknown log level '" + *v + "'",
                "use one of trace, debug, info, warn, error, off"};
        }
        cfg.log_level = *v;
    }

    if (auto v = doc["run"]["runtime"].value<std::string>()) {
        cfg.runtime = *v;
        cfg.runtime_set = true;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const fs::path& path) {
    auto text = read_file(path);
    if (text.is_err()) {
        return FerryError{FerryError::IO, "cannot open config file: " + path.string()};
    }
    auto cfg = parse(text.value(), fs::absolute(path).parent_path());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path.string();
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    // Mappings: other overrides this per key
    for (const auto& [k, v] : other.imports) {
        imports[k] = v;
    }
    for (const auto& [scope, mapping] : other.scopes) {
        for (const auto& [k, v] : mapping) {
            scopes[scope][k] = v;
        }
    }
    if (!other.import_map.empty()) import_map = other.import_map;

    // Scalars: other overrides only explicitly-set fields
    if (other.vendor_set) {
        vendor = other.vendor;
        vendor_set = true;
    }
    if (other.lock_enabled_set) {
        lock.enabled = other.lock.enabled;
        lock_enabled_set = true;
    }
    if (!other.lock.path.empty()) lock.path = other.lock.path;
    if (other.lock_frozen_set) {
        lock.frozen = other.lock.frozen;
        lock_frozen_set = true;
    }
    if (other.fetch_timeout_set) {
        fetch.timeout_secs = other.fetch.timeout_secs;
        fetch_timeout_set = true;
    }
    if (other.fetch_retries_set) {
        fetch.retries = other.fetch.retries;
        fetch_retries_set = true;
    }
    if (other.fetch_jobs_set) {
        fetch.jobs = other.fetch.jobs;
        fetch_jobs_set = true;
    }
    if (other.registry_jsr_set) {
        registry.jsr = other.registry.jsr;
        registry_jsr_set = true;
    }
    if (other.registry_npm_set) {
        registry.npm = other.registry.npm;
        registry_npm_set = true;
    }
    if (!other.registry.jsr_mirror.empty()) registry.jsr_mirror = other.registry.jsr_mirror;
    if (!other.registry.npm_mirror.empty()) registry.npm_mirror = other.registry.npm_mirror;
    if (!other.cache_dir.empty()) cache_dir = other.cache_dir;
    if (!other.log_level.empty()) log_level = other.log_level;
    if (other.runtime_set) {
        runtime = other.runtime;
        runtime_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.ferry/config.toml";
}

} // namespace ferry
