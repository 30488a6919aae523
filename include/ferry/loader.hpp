#pragma once

#include <ferry/cache.hpp>
#include <ferry/fetcher.hpp>
#include <ferry/import_map.hpp>
#include <ferry/lockfile.hpp>
#include <ferry/module_graph.hpp>
#include <ferry/result.hpp>
#include <ferry/specifier.hpp>
#include <ferry/version_resolver.hpp>

#include <string>
#include <vector>

namespace ferry {

struct LoadOptions {
    FetchPolicy policy;
    bool lock_update = false;   // record hashes and pins instead of checking them
    size_t jobs = 8;
};

// Drives specifier -> import map -> version -> fetch -> lock for single
// modules and for whole import graphs.
class ModuleLoader {
public:
    // `lock` may be null when locking is disabled
    ModuleLoader(const ImportMap& import_map, VersionResolver& resolver, Fetcher& fetcher,
                 ModuleCache& cache, LockManager* lock, LoadOptions options = {});

    // Classify, map and pin `raw` as imported from `referrer`. The result
    // is Local, Url, or Registry with an exact version.
    Result<Specifier> resolve(const std::string& raw, const std::string& referrer);

    // Fetch a resolved specifier; remote content is checked against (or,
    // with lock_update, written to) the lock file
    Result<FetchedModule> load_one(const Specifier& spec);

    // Load every root and all modules reachable through their imports.
    // The first error stops the walk and is returned; an integrity
    // failure is preferred over any other error.
    Result<ModuleGraph> load_graph(const std::vector<std::string>& roots,
                                   const std::string& referrer);

    const LoadOptions& options() const { return options_; }

private:
    Result<Version> select_version(const RegistrySpecifier& spec);

    const ImportMap& import_map_;
    VersionResolver& resolver_;
    Fetcher& fetcher_;
    ModuleCache& cache_;
    LockManager* lock_;
    LoadOptions options_;
};

// Whether fetched content is JS/TS source whose imports should be followed
bool is_scannable(const Specifier& spec);

} // namespace ferry
