#include <ferry/project.hpp>
#include <ferry/log.hpp>

namespace ferry {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

Result<fs::path> find_config(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return FerryError{FerryError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        fs::path candidate = dir / CONFIG_FILE_NAME;
        if (fs::exists(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            // Reached filesystem root
            return FerryError{FerryError::NotFound,
                std::string("no ") + CONFIG_FILE_NAME + " found in " + start_dir.string() +
                    " or any parent directory"};
        }
        dir = parent;
    }
}

// ---------------------------------------------------------------------------
// Project
// ---------------------------------------------------------------------------

Result<Project> Project::load(const fs::path& config_path) {
    auto cfg = Config::load(config_path);
    if (cfg.is_err()) return std::move(cfg).error();

    Project p;
    p.config = std::move(cfg).value();
    p.config_path = fs::absolute(config_path).lexically_normal();
    p.root_dir = p.config_path.parent_path();
    log::debug("project root %s", p.root_dir.c_str());
    return Result<Project>::ok(std::move(p));
}

Result<Project> Project::discover(const fs::path& start_dir) {
    auto found = find_config(start_dir);
    if (found.is_ok()) return load(found.value());
    if (found.error().code != FerryError::NotFound) return std::move(found).error();

    std::error_code ec;
    Project p;
    p.root_dir = fs::absolute(start_dir, ec).lexically_normal();
    if (ec) {
        return FerryError{FerryError::IO, "cannot resolve path: " + start_dir.string()};
    }
    log::debug("no %s found, using %s as project root", CONFIG_FILE_NAME,
               p.root_dir.c_str());
    return Result<Project>::ok(std::move(p));
}

fs::path Project::lock_path(const Config& cfg) const {
    if (cfg.lock.path.empty()) return root_dir / DEFAULT_LOCK_FILE_NAME;
    fs::path p(cfg.lock.path);
    return p.is_absolute() ? p : (root_dir / p).lexically_normal();
}

Result<ImportMap> Project::import_map(const Config& cfg) const {
    ImportMap map(root_dir);

    if (!cfg.import_map.empty()) {
        fs::path path(cfg.import_map);
        if (!path.is_absolute()) path = root_dir / path;
        auto external = ImportMap::load_json(path);
        if (external.is_err()) return std::move(external).error();
        map = std::move(external).value();
    }

    // Config entries are relative to the project root
    ImportMap inline_map(root_dir);
    for (const auto& [k, v] : cfg.imports) {
        FERRY_TRY(inline_map.add_import(k, v));
    }
    for (const auto& [scope, mapping] : cfg.scopes) {
        for (const auto& [k, v] : mapping) {
            FERRY_TRY(inline_map.add_scope(scope, k, v));
        }
    }
    map.merge(inline_map);
    return Result<ImportMap>::ok(std::move(map));
}

} // namespace ferry
