#include <ferry/fetcher.hpp>
#include <ferry/file_io.hpp>
#include <ferry/log.hpp>
#include <ferry/sha256.hpp>

#include <chrono>
#include <exception>
#include <system_error>
#include <thread>

namespace ferry {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// FetchPolicy
// ---------------------------------------------------------------------------

bool FetchPolicy::should_reload(const std::string& key) const {
    switch (mode) {
    case FetchMode::Reload:
        return true;
    case FetchMode::ReloadSpecific:
        for (const auto& target : reload_targets) {
            if (key.compare(0, target.size(), target) == 0) return true;
        }
        return false;
    case FetchMode::Normal:
    case FetchMode::CachedOnly:
        return false;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Fetcher
// ---------------------------------------------------------------------------

Fetcher::Fetcher(ModuleCache& cache, RegistrySet& registries, HttpClient& http,
                 FetchOptions options)
    : cache_(cache), registries_(registries), http_(http), options_(std::move(options)) {}

void Fetcher::cancel() {
    if (cancelled_.exchange(true)) return;
    log::debug("fetcher cancelled");
    if (options_.on_cancel) options_.on_cancel();
}

Result<FetchedModule> Fetcher::fetch(const Specifier& spec, const FetchPolicy& policy) {
    if (spec.is_local()) return fetch_local(spec);
    if (spec.is_bare()) {
        return FerryError{FerryError::InvalidArg,
            "cannot fetch bare specifier '" + spec.to_string() + "' before mapping it"};
    }
    if (spec.is_registry() && !spec.registry().range.is_exact()) {
        return FerryError{FerryError::InvalidArg,
            "cannot fetch '" + spec.to_string() + "' before resolving its version"};
    }

    std::string key = spec.cache_key();

    std::promise<Result<FetchedModule>> promise;
    std::shared_future<Result<FetchedModule>> pending;
    bool reload = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(key);
        if (it != in_flight_.end()) {
            pending = it->second;
        } else {
            reload = policy.should_reload(key) && reloaded_.count(key) == 0;
            in_flight_.emplace(key, promise.get_future().share());
        }
    }
    if (pending.valid()) {
        log::trace("%s: joining fetch in flight", key.c_str());
        return pending.get();
    }

    // Waiters are released on every path, including a throwing retrieval
    Result<FetchedModule> result = [&]() -> Result<FetchedModule> {
        try {
            return fetch_remote(spec, key, reload, policy);
        } catch (const std::exception& e) {
            return FerryError{FerryError::IO, "fetching '" + key + "' failed: " + e.what()};
        }
    }();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reload && result.is_ok()) reloaded_.insert(key);
        in_flight_.erase(key);
    }
    promise.set_value(result);
    return result;
}

Result<FetchedModule> Fetcher::fetch_local(const Specifier& spec) {
    const fs::path& path = spec.local().path;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return FerryError{FerryError::UnresolvedSpecifier,
            "module not found '" + spec.to_string() + "'",
            "no file at " + path.string()};
    }
    auto content = read_file(path);
    if (content.is_err()) return std::move(content).error();

    FetchedModule m;
    m.key = spec.to_string();
    m.hash = sha256_hex(content.value());
    m.content = std::move(content).value();
    m.from_cache = false;
    return Result<FetchedModule>::ok(std::move(m));
}

Result<FetchedModule> Fetcher::fetch_remote(const Specifier& spec, const std::string& key,
                                            bool reload, const FetchPolicy& policy) {
    if (!reload) {
        if (options_.vendor && options_.vendor->contains(key)) {
            auto vendored = options_.vendor->read(key);
            if (vendored.is_ok()) {
                log::trace("%s: vendored", key.c_str());
                FetchedModule m;
                m.key = key;
                m.hash = sha256_hex(vendored.value());
                m.content = std::move(vendored).value();
                m.from_cache = true;
                return Result<FetchedModule>::ok(std::move(m));
            }
            log::warn("%s: cannot read vendored copy: %s", key.c_str(),
                      vendored.error().message.c_str());
        }

        auto cached = cache_.read(key);
        if (cached.is_ok()) {
            log::trace("%s: cache hit", key.c_str());
            FetchedModule m;
            m.key = key;
            m.hash = sha256_hex(cached.value());
            m.content = std::move(cached).value();
            m.from_cache = true;
            if (options_.vendor) {
                auto st = options_.vendor->write(key, m.content);
                if (st.is_err()) return std::move(st).error();
            }
            return Result<FetchedModule>::ok(std::move(m));
        }
        if (cached.error().code != FerryError::NotFound) {
            log::warn("%s: cache read failed: %s", key.c_str(),
                      cached.error().message.c_str());
        }
    }

    if (!policy.allows_network()) {
        return FerryError{FerryError::NotCached,
            "'" + key + "' is not in the cache",
            "run without --cached-only to download it"};
    }
    if (cancelled()) {
        return FerryError{FerryError::Cancelled, "fetch of '" + key + "' cancelled"};
    }

    log::info("%s %s", reload ? "Reload" : "Download", key.c_str());
    auto content = retrieve(spec);
    if (content.is_err()) return std::move(content).error();

    auto entry = cache_.store(key, content.value());
    if (entry.is_err()) return std::move(entry).error();

    if (options_.vendor) {
        auto st = options_.vendor->write(key, content.value());
        if (st.is_err()) return std::move(st).error();
    }

    FetchedModule m;
    m.key = key;
    m.hash = entry.value().hash;
    m.content = std::move(content).value();
    m.from_cache = false;
    return Result<FetchedModule>::ok(std::move(m));
}

Result<std::string> Fetcher::retrieve(const Specifier& spec) {
    int attempts = 1 + (options_.retries > 0 ? options_.retries : 0);
    for (int attempt = 0;; ++attempt) {
        if (cancelled()) {
            return FerryError{FerryError::Cancelled,
                "fetch of '" + spec.to_string() + "' cancelled"};
        }
        network_fetches_.fetch_add(1);
        auto result = retrieve_once(spec);
        if (result.is_ok() || !result.error().is_retryable() || attempt + 1 >= attempts) {
            if (result.is_err() && result.error().message.find(spec.cache_key()) ==
                                       std::string::npos) {
                auto err = std::move(result).error();
                err.message = spec.cache_key() + ": " + err.message;
                return err;
            }
            return result;
        }

        int delay = options_.backoff_ms << attempt;
        log::warn("%s: %s, retrying in %d ms (%d/%d)", spec.to_string().c_str(),
                  result.error().message.c_str(), delay, attempt + 1, attempts - 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
}

Result<std::string> Fetcher::retrieve_once(const Specifier& spec) {
    if (spec.is_url()) {
        const std::string& url = spec.url().url;
        auto resp = http_.get(url);
        if (resp.is_err()) return std::move(resp).error();
        FERRY_TRY(check_http_status(resp.value(), url));
        return Result<std::string>::ok(std::move(resp.value().body));
    }

    const RegistrySpecifier& r = spec.registry();
    auto registry = registries_.require(r.kind);
    if (registry.is_err()) return std::move(registry).error();
    return registry.value()->fetch_content(r.package, r.range.version, r.subpath);
}

} // namespace ferry
