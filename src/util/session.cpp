#include <ferry/session.hpp>
#include <ferry/log.hpp>
#include <ferry/url.hpp>

#include <cstdlib>

namespace ferry {

namespace fs = std::filesystem;

namespace {

struct LoadedConfig {
    Project project;
    Config config;
};

Result<LoadedConfig> load_config(const fs::path& cwd, const std::string& config_path) {
    LoadedConfig out;

    auto project = config_path.empty() ? Project::discover(cwd)
                                       : Project::load(fs::absolute(cwd / config_path));
    if (project.is_err()) return std::move(project).error();
    out.project = std::move(project).value();

    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
        log::debug("global config %s", global_path.c_str());
    }
    out.config = Config::effective(global, out.project.config);
    return Result<LoadedConfig>::ok(std::move(out));
}

fs::path select_cache_root(const Config& cfg) {
    if (const char* dir = std::getenv("FERRY_DIR")) {
        if (*dir) return fs::path(dir);
    }
    if (!cfg.cache_dir.empty()) return fs::path(cfg.cache_dir);
    return ModuleCache::default_cache_root();
}

Status check_options(const SessionOptions& o) {
    if (o.frozen && o.lock_write) {
        return FerryError{FerryError::InvalidArg,
            "--frozen and --lock-write cannot be used together"};
    }
    if (o.no_lock && (o.frozen || o.lock_write || !o.lock_path.empty())) {
        return FerryError{FerryError::InvalidArg,
            "--no-lock cannot be combined with --lock, --lock-write or --frozen"};
    }
    if (o.cached_only && (o.reload || !o.reload_targets.empty())) {
        return FerryError{FerryError::InvalidArg,
            "--cached-only and --reload cannot be used together"};
    }
    if (o.jobs < 0) {
        return FerryError{FerryError::InvalidArg, "--jobs must be at least 1"};
    }
    return ok_status();
}

} // namespace

Result<fs::path> cache_root_for(const fs::path& cwd, const std::string& config_path) {
    auto loaded = load_config(cwd, config_path);
    if (loaded.is_err()) return std::move(loaded).error();
    return Result<fs::path>::ok(select_cache_root(loaded.value().config));
}

Result<std::unique_ptr<Session>> Session::open(const fs::path& cwd,
                                               const SessionOptions& options) {
    FERRY_TRY(check_options(options));

    auto loaded = load_config(cwd, options.config_path);
    if (loaded.is_err()) return std::move(loaded).error();

    auto s = std::make_unique<Session>(Passkey{});
    s->cwd_ = fs::absolute(cwd).lexically_normal();
    s->project_ = std::move(loaded.value().project);
    s->config_ = std::move(loaded.value().config);
    const Config& cfg = s->config_;

    // Import map
    auto map = s->project_.import_map(cfg);
    if (map.is_err()) return std::move(map).error();
    s->import_map_ = std::move(map).value();

    // Transport and registries
    s->proxy_ = std::make_unique<EnvProxyConfig>(EnvProxyConfig::from_environment());
    HttpOptions http_opts;
    http_opts.timeout_secs = cfg.fetch.timeout_secs;
    s->http_ = std::make_unique<CurlHttpClient>(*s->proxy_, http_opts);

    if (!cfg.registry.jsr_mirror.empty()) {
        s->registries_.set(std::make_unique<LocalRegistry>(cfg.registry.jsr_mirror,
                                                           RegistryKind::Jsr));
    } else {
        s->registries_.set(std::make_unique<JsrRegistry>(*s->http_, cfg.registry.jsr));
    }
    if (!cfg.registry.npm_mirror.empty()) {
        s->registries_.set(std::make_unique<LocalRegistry>(cfg.registry.npm_mirror,
                                                           RegistryKind::Npm));
    } else {
        s->registries_.set(std::make_unique<NpmRegistry>(*s->http_, cfg.registry.npm));
    }

    // Cache and vendor directory
    FERRY_TRY(s->cache_.open(select_cache_root(cfg)));
    if (cfg.vendor || options.vendor) {
        s->vendor_.emplace(s->project_.vendor_dir());
    }

    FetchOptions fetch_opts;
    fetch_opts.retries = cfg.fetch.retries;
    fetch_opts.vendor = s->vendor_ ? &*s->vendor_ : nullptr;
    CurlHttpClient* http = s->http_.get();
    fetch_opts.on_cancel = [http] { http->cancel(); };
    s->fetcher_ = std::make_unique<Fetcher>(s->cache_, s->registries_, *s->http_, fetch_opts);
    s->resolver_ = std::make_unique<VersionResolver>(s->registries_);

    // Lock file: only a project with a config, --lock or --lock-write gets one
    bool wants_lock = !s->project_.config_path.empty() || !options.lock_path.empty() ||
                      options.lock_write;
    if (cfg.lock.enabled && !options.no_lock && wants_lock) {
        fs::path lock_path = options.lock_path.empty()
            ? s->project_.lock_path(cfg)
            : fs::absolute(cwd / options.lock_path).lexically_normal();
        LockMode mode = (cfg.lock.frozen || options.frozen) ? LockMode::Frozen
                                                            : LockMode::Additive;
        auto lock = LockManager::open(lock_path, mode);
        if (lock.is_err()) return std::move(lock).error();
        s->lock_ = std::move(lock).value();
    }

    // Loader
    LoadOptions load_opts;
    if (options.cached_only) {
        load_opts.policy = FetchPolicy::cached_only();
    } else if (!options.reload_targets.empty()) {
        load_opts.policy = FetchPolicy::reload_only(options.reload_targets);
    } else if (options.reload) {
        load_opts.policy = FetchPolicy::reload();
    }
    load_opts.lock_update = options.lock_write;
    load_opts.jobs = static_cast<size_t>(options.jobs > 0 ? options.jobs : cfg.fetch.jobs);
    s->loader_ = std::make_unique<ModuleLoader>(s->import_map_, *s->resolver_, *s->fetcher_,
                                                s->cache_, s->lock_.get(), load_opts);

    return Result<std::unique_ptr<Session>>::ok(std::move(s));
}

std::string Session::root_referrer() const {
    return file_url(cwd_, true);
}

Status Session::finish(bool success) {
    if (!success || !lock_) return ok_status();
    return lock_->flush();
}

} // namespace ferry
