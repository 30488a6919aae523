#include <ferry/loader.hpp>
#include <ferry/imports.hpp>
#include <ferry/log.hpp>
#include <ferry/task_pool.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

namespace ferry {

namespace {

bool has_source_extension(const std::string& path) {
    static const char* exts[] = {".ts", ".tsx", ".mts", ".cts", ".js", ".jsx", ".mjs", ".cjs"};
    std::string name = path.substr(path.find_last_of('/') + 1);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) return false;
    std::string ext = name.substr(dot);
    for (const char* e : exts) {
        if (ext == e) return true;
    }
    return false;
}

// Runtime built-ins are provided by the runtime, never fetched
bool is_builtin(const std::string& raw) {
    return raw.rfind("node:", 0) == 0;
}

} // namespace

bool is_scannable(const Specifier& spec) {
    switch (spec.kind()) {
    case Specifier::Kind::Local:
        return has_source_extension(spec.local().path.string());
    case Specifier::Kind::Url: {
        // Extensionless URLs usually serve TypeScript or JavaScript
        const std::string& url = spec.url().url;
        std::string path = url.substr(0, url.find('?'));
        return has_source_extension(path) || !has_module_extension(path);
    }
    case Specifier::Kind::Registry: {
        const auto& r = spec.registry();
        if (r.kind == RegistryKind::Npm) return false;
        return r.subpath.empty() || has_source_extension(r.subpath);
    }
    case Specifier::Kind::Bare:
        return false;
    }
    return false;
}

ModuleLoader::ModuleLoader(const ImportMap& import_map, VersionResolver& resolver,
                           Fetcher& fetcher, ModuleCache& cache, LockManager* lock,
                           LoadOptions options)
    : import_map_(import_map), resolver_(resolver), fetcher_(fetcher), cache_(cache),
      lock_(lock), options_(std::move(options)) {}

// ---------------------------------------------------------------------------
// Single module
// ---------------------------------------------------------------------------

Result<Version> ModuleLoader::select_version(const RegistrySpecifier& spec) {
    std::string range_key = spec.range_key();

    if (lock_ && !options_.lock_update) {
        if (auto pinned = lock_->pinned(range_key)) {
            log::trace("%s: pinned to %s", range_key.c_str(), pinned->to_string().c_str());
            return Result<Version>::ok(*pinned);
        }
    }

    Result<Version> chosen = FerryError{FerryError::VersionNotFound, range_key};
    if (!options_.policy.allows_network()) {
        auto cached = cache_.versions_cached(spec.package_key());
        if (cached.is_err()) return std::move(cached).error();
        chosen = VersionResolver::select(spec.package_key(), cached.value(), spec.range);
        if (chosen.is_err()) {
            return FerryError{FerryError::NotCached,
                "no cached version of " + spec.package_key() + " matches '" +
                    range_key + "'",
                "run without --cached-only to download it"};
        }
    } else {
        chosen = resolver_.resolve(spec.kind, spec.package, spec.range);
        if (chosen.is_err()) return chosen;
    }

    if (lock_) {
        FERRY_TRY(lock_->pin(range_key, chosen.value(), options_.lock_update));
    }
    log::debug("%s -> %s", range_key.c_str(), chosen.value().to_string().c_str());
    return chosen;
}

Result<Specifier> ModuleLoader::resolve(const std::string& raw, const std::string& referrer) {
    auto parsed = Specifier::parse(raw, referrer, &import_map_);
    if (parsed.is_err()) return parsed;

    Specifier spec = std::move(parsed).value();
    if (spec.is_bare()) {
        auto mapped = import_map_.resolve(spec.bare().name, referrer);
        if (mapped.is_err()) return mapped;
        spec = std::move(mapped).value();
    }

    if (spec.is_registry() && !spec.registry().range.is_exact()) {
        auto v = select_version(spec.registry());
        if (v.is_err()) return std::move(v).error();
        spec = spec.with_version(v.value());
    }
    return Result<Specifier>::ok(std::move(spec));
}

Result<FetchedModule> ModuleLoader::load_one(const Specifier& spec) {
    auto fetched = fetcher_.fetch(spec, options_.policy);
    if (fetched.is_err()) return fetched;

    if (spec.is_remote() && lock_) {
        const FetchedModule& m = fetched.value();
        if (options_.lock_update) {
            lock_->write(m.key, m.content);
        } else {
            FERRY_TRY(lock_->verify(m.key, m.content));
        }
    }
    return fetched;
}

// ---------------------------------------------------------------------------
// Graph
// ---------------------------------------------------------------------------

namespace {

struct GraphWalk {
    std::mutex mutex;
    ModuleGraph graph;
    std::set<std::string> scheduled;
    std::optional<FerryError> error;
    std::atomic<bool> failed{false};
};

} // namespace

Result<ModuleGraph> ModuleLoader::load_graph(const std::vector<std::string>& roots,
                                             const std::string& referrer) {
    auto walk = std::make_shared<GraphWalk>();
    TaskPool pool(options_.jobs);

    auto fail = [this, walk](FerryError err) {
        {
            std::lock_guard<std::mutex> lock(walk->mutex);
            if (!walk->error || (err.is_fatal() && !walk->error->is_fatal())) {
                walk->error = std::move(err);
            }
        }
        if (!walk->failed.exchange(true)) fetcher_.cancel();
    };

    // Recursive task body; tasks requeue it through a weak reference
    using Visit = std::function<void(Specifier, ModuleGraph::NodeId)>;
    auto visit = std::make_shared<Visit>();
    std::weak_ptr<Visit> weak_visit = visit;
    auto schedule = [&pool, walk, weak_visit](const Specifier& spec, ModuleGraph::NodeId id) {
        // caller holds walk->mutex
        if (!walk->scheduled.insert(spec.cache_key()).second) return;
        pool.submit([weak_visit, spec, id] {
            if (auto fn = weak_visit.lock()) (*fn)(spec, id);
        });
    };

    auto step = [this, walk, fail, schedule](const Specifier& spec, ModuleGraph::NodeId id) {
        if (walk->failed.load()) return;

        auto fetched = load_one(spec);
        if (fetched.is_err()) {
            fail(std::move(fetched).error());
            return;
        }
        const FetchedModule& m = fetched.value();
        {
            std::lock_guard<std::mutex> lock(walk->mutex);
            ModuleInfo& info = walk->graph.module(id);
            info.hash = m.hash;
            info.size = static_cast<int64_t>(m.content.size());
            info.from_cache = m.from_cache;
        }

        if (!is_scannable(spec)) return;

        std::string importer = spec.to_string();
        for (const auto& ref : scan_imports(m.content)) {
            if (walk->failed.load()) return;
            if (is_builtin(ref.specifier)) {
                log::trace("%s: skipping built-in %s", importer.c_str(), ref.specifier.c_str());
                continue;
            }

            auto child = resolve(ref.specifier, importer);
            if (child.is_err()) {
                auto err = std::move(child).error();
                if (err.file.empty()) {
                    err.file = importer;
                    err.line = ref.line;
                }
                fail(std::move(err));
                return;
            }

            std::lock_guard<std::mutex> lock(walk->mutex);
            ModuleInfo child_info;
            child_info.key = child.value().cache_key();
            child_info.remote = child.value().is_remote();
            auto child_id = walk->graph.add_module(std::move(child_info));
            walk->graph.add_import(id, child_id, ImportEdge{ref.specifier, ref.dynamic});
            schedule(child.value(), child_id);
        }
    };

    // An exception in a task fails the graph like any other error
    *visit = [step, fail](Specifier spec, ModuleGraph::NodeId id) {
        try {
            step(spec, id);
        } catch (const std::exception& e) {
            fail(FerryError{FerryError::IO,
                "loading '" + spec.to_string() + "' failed: " + e.what()});
        }
    };

    for (const auto& raw : roots) {
        auto spec = [&]() -> Result<Specifier> {
            try {
                return resolve(raw, referrer);
            } catch (const std::exception& e) {
                return FerryError{FerryError::IO,
                    "resolving '" + raw + "' failed: " + e.what()};
            }
        }();
        if (spec.is_err()) {
            fail(std::move(spec).error());
            break;
        }
        std::lock_guard<std::mutex> lock(walk->mutex);
        ModuleInfo info;
        info.key = spec.value().cache_key();
        info.remote = spec.value().is_remote();
        auto id = walk->graph.add_module(std::move(info));
        walk->graph.add_root(id);
        schedule(spec.value(), id);
    }

    pool.wait_idle();
    pool.shutdown();
    visit.reset();

    if (walk->error) return *walk->error;

    log::debug("loaded %zu modules", walk->graph.size());
    return Result<ModuleGraph>::ok(std::move(walk->graph));
}

} // namespace ferry
