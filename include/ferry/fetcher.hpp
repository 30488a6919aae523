#pragma once

#include <ferry/cache.hpp>
#include <ferry/http.hpp>
#include <ferry/registry.hpp>
#include <ferry/result.hpp>
#include <ferry/specifier.hpp>
#include <ferry/vendor.hpp>

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry {

enum class FetchMode {
    Normal,          // cache first, network on miss
    Reload,          // bypass cache reads for every key
    ReloadSpecific,  // Reload for keys matching a target, Normal otherwise
    CachedOnly,      // never touch the network
};

struct FetchPolicy {
    FetchMode mode = FetchMode::Normal;
    std::vector<std::string> reload_targets;  // key prefixes

    static FetchPolicy normal() { return {}; }
    static FetchPolicy reload() { return {FetchMode::Reload, {}}; }
    static FetchPolicy reload_only(std::vector<std::string> targets) {
        return {FetchMode::ReloadSpecific, std::move(targets)};
    }
    static FetchPolicy cached_only() { return {FetchMode::CachedOnly, {}}; }

    bool should_reload(const std::string& key) const;
    bool allows_network() const { return mode != FetchMode::CachedOnly; }
};

struct FetchedModule {
    std::string key;
    std::string content;
    std::string hash;         // SHA-256 hex of content
    bool from_cache = false;  // served by the cache or vendor dir
};

struct FetchOptions {
    int retries = 2;          // extra attempts after a Network/FetchTimeout error
    int backoff_ms = 200;     // doubled per attempt
    const VendorDir* vendor = nullptr;  // read before the cache, written after fetches
    std::function<void()> on_cancel;    // aborts transfers in progress
};

// Retrieves module bytes for resolved specifiers. Registry specifiers must
// carry an exact version.
class Fetcher {
public:
    Fetcher(ModuleCache& cache, RegistrySet& registries, HttpClient& http,
            FetchOptions options = {});

    Result<FetchedModule> fetch(const Specifier& spec, const FetchPolicy& policy);

    // Stops new retrievals; callers waiting on them get Cancelled
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // Retrievals that went to a registry or URL
    int network_fetches() const { return network_fetches_.load(); }

private:
    Result<FetchedModule> fetch_local(const Specifier& spec);
    Result<FetchedModule> fetch_remote(const Specifier& spec, const std::string& key,
                                       bool reload, const FetchPolicy& policy);
    Result<std::string> retrieve(const Specifier& spec);
    Result<std::string> retrieve_once(const Specifier& spec);

    ModuleCache& cache_;
    RegistrySet& registries_;
    HttpClient& http_;
    FetchOptions options_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<Result<FetchedModule>>> in_flight_;
    std::set<std::string> reloaded_;

    std::atomic<bool> cancelled_{false};
    std::atomic<int> network_fetches_{0};
};

} // namespace ferry
