#pragma once

#include <ferry/config.hpp>
#include <ferry/import_map.hpp>
#include <ferry/result.hpp>

#include <filesystem>
#include <string>

namespace ferry {

constexpr const char* CONFIG_FILE_NAME = "ferry.toml";
constexpr const char* DEFAULT_LOCK_FILE_NAME = "deno.lock";

struct Project {
    Config config;                          // project layer only
    std::filesystem::path root_dir;         // dir containing ferry.toml
    std::filesystem::path config_path;      // empty for a project without one

    // Walk up from start_dir to find ferry.toml, then load. Without one,
    // start_dir itself is the project root with an empty config.
    static Result<Project> discover(const std::filesystem::path& start_dir);

    // Load a specific ferry.toml
    static Result<Project> load(const std::filesystem::path& config_path);

    // Effective lock path for `cfg` (the merged configuration)
    std::filesystem::path lock_path(const Config& cfg) const;

    std::filesystem::path vendor_dir() const { return root_dir / "vendor"; }

    // External JSON import map (if configured) overlaid by [imports]
    // and [scopes] from `cfg`
    Result<ImportMap> import_map(const Config& cfg) const;
};

// Walk up from start_dir to find the nearest ferry.toml, return its path
Result<std::filesystem::path> find_config(const std::filesystem::path& start_dir);

} // namespace ferry
