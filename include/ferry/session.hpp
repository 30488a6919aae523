#pragma once

#include <ferry/cache.hpp>
#include <ferry/config.hpp>
#include <ferry/fetcher.hpp>
#include <ferry/http.hpp>
#include <ferry/import_map.hpp>
#include <ferry/loader.hpp>
#include <ferry/lockfile.hpp>
#include <ferry/project.hpp>
#include <ferry/proxy.hpp>
#include <ferry/registry.hpp>
#include <ferry/result.hpp>
#include <ferry/vendor.hpp>
#include <ferry/version_resolver.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

// Command-line overrides applied on top of the layered configuration
struct SessionOptions {
    std::string config_path;                 // --config; empty: discover
    bool reload = false;                     // --reload
    std::vector<std::string> reload_targets; // --reload=a,b
    bool cached_only = false;                // --cached-only
    std::string lock_path;                   // --lock
    bool no_lock = false;                    // --no-lock
    bool lock_write = false;                 // --lock-write
    bool frozen = false;                     // --frozen
    bool vendor = false;                     // --vendor
    int jobs = 0;                            // --jobs; 0: from config
};

// Everything one ferry invocation owns: configuration, cache, registries,
// lock file and the loader wired to them.
class Session {
    // Restricts construction to open()
    class Passkey {
        friend class Session;
        Passkey() {}
    };

public:
    explicit Session(Passkey) {}

    static Result<std::unique_ptr<Session>> open(const std::filesystem::path& cwd,
                                                 const SessionOptions& options);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const Config& config() const { return config_; }
    const Project& project() const { return project_; }
    const ImportMap& import_map() const { return import_map_; }
    ModuleCache& cache() { return cache_; }
    LockManager* lock() { return lock_.get(); }
    ModuleLoader& loader() { return *loader_; }
    const VendorDir* vendor() const { return vendor_ ? &*vendor_ : nullptr; }

    // Referrer for specifiers given on the command line
    std::string root_referrer() const;

    // Saves the lock file after a successful run; a failed run leaves it
    // untouched
    Status finish(bool success);

private:
    Config config_;
    Project project_;
    std::filesystem::path cwd_;
    ImportMap import_map_;
    std::unique_ptr<EnvProxyConfig> proxy_;
    std::unique_ptr<CurlHttpClient> http_;
    RegistrySet registries_;
    ModuleCache cache_;
    std::optional<VendorDir> vendor_;
    std::unique_ptr<Fetcher> fetcher_;
    std::unique_ptr<VersionResolver> resolver_;
    std::unique_ptr<LockManager> lock_;
    std::unique_ptr<ModuleLoader> loader_;
};

// Cache root selected by $FERRY_DIR, [cache] dir, or the default, without
// opening a session
Result<std::filesystem::path> cache_root_for(const std::filesystem::path& cwd,
                                             const std::string& config_path);

} // namespace ferry
