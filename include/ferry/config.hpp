#pragma once

#include <ferry/result.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace ferry {

struct LockConfig {
    bool enabled = true;
    std::string path;      // empty: deno.lock next to ferry.toml
    bool frozen = false;
};

struct FetchConfig {
    int timeout_secs = 30;
    int retries = 2;
    int jobs = 8;
};

struct RegistryConfig {
    std::string jsr = "https://jsr.io";
    std::string npm = "https://registry.npmjs.org";
    std::string jsr_mirror;   // directory; replaces the jsr URL when set
    std::string npm_mirror;
};

// Layered configuration: global (~/.ferry/config.toml) then project
// (ferry.toml). Later layers override only the fields they set.
// Relative paths are resolved against the directory of the file that
// set them.
struct Config {
    std::map<std::string, std::string> imports;
    std::map<std::string, std::map<std::string, std::string>> scopes;
    std::string import_map;  // external JSON import map

    bool vendor = false;
    LockConfig lock;
    FetchConfig fetch;
    RegistryConfig registry;
    std::string cache_dir;
    std::string log_level;
    std::string runtime = "deno run";  // command line; the root module is appended

    // Track which fields were explicitly set (for merge)
    bool vendor_set = false;
    bool lock_enabled_set = false;
    bool lock_frozen_set = false;
    bool fetch_timeout_set = false;
    bool fetch_retries_set = false;
    bool fetch_jobs_set = false;
    bool registry_jsr_set = false;
    bool registry_npm_set = false;
    bool runtime_set = false;

    // Parse from TOML string. Relative paths are resolved against
    // `base_dir` when it is given.
    static Result<Config> parse(const std::string& toml_str,
                                const std::filesystem::path& base_dir = {});

    // Load from a TOML config file
    static Result<Config> load(const std::filesystem::path& path);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

// ~/.ferry/config.toml, or empty when HOME is unset
std::string global_config_path();

} // namespace ferry
