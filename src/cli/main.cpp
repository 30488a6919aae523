#include <ferry/cache.hpp>
#include <ferry/log.hpp>
#include <ferry/process.hpp>
#include <ferry/session.hpp>
#include <ferry/specifier.hpp>

#include <CLI/CLI.hpp>

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace ferry;

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_INTEGRITY = 10;

struct GlobalFlags {
    std::string config_path;
    std::string log_level;
    bool quiet = false;
};

struct ResolveFlags {
    std::string reload;       // "*" or comma-separated targets
    CLI::Option* reload_opt = nullptr;
    std::string lock_path;
    bool no_lock = false;
    bool lock_write = false;
    bool frozen = false;
    bool cached_only = false;
    bool vendor = false;
    int jobs = 0;
};

void add_resolve_flags(CLI::App* cmd, ResolveFlags& f) {
    // "--reload" alone yields "*". One option object per subcommand; the
    // active one is recorded on parse.
    auto* reload = cmd->add_flag("--reload{*},-r{*}", f.reload,
        "Bypass the cache. With a value (--reload=jsr:@std/path,https://x.dev/lib/) "
        "only keys starting with one of the comma-separated prefixes are reloaded");
    cmd->callback([reload, &f] {
        if (reload->count() > 0) f.reload_opt = reload;
    });

    cmd->add_option("--lock", f.lock_path, "Lock file path (default deno.lock)");
    cmd->add_flag("--no-lock", f.no_lock, "Do not read or write a lock file");
    cmd->add_flag("--lock-write", f.lock_write,
                  "Record hashes and version pins instead of checking them");
    cmd->add_flag("--frozen", f.frozen,
                  "Fail when a dependency is missing from the lock file");
    cmd->add_flag("--cached-only", f.cached_only, "Never use the network");
    cmd->add_flag("--vendor", f.vendor, "Read and write modules under ./vendor");
    cmd->add_option("--jobs,-j", f.jobs, "Concurrent fetches")->check(CLI::PositiveNumber);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream in(s);
    while (std::getline(in, item, sep)) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

SessionOptions session_options(const GlobalFlags& g, const ResolveFlags& f) {
    SessionOptions o;
    o.config_path = g.config_path;
    if (f.reload_opt) {
        o.reload = true;
        if (f.reload != "*") o.reload_targets = split(f.reload, ',');
    }
    o.cached_only = f.cached_only;
    o.lock_path = f.lock_path;
    o.no_lock = f.no_lock;
    o.lock_write = f.lock_write;
    o.frozen = f.frozen;
    o.vendor = f.vendor;
    o.jobs = f.jobs;
    return o;
}

int report(const FerryError& err) {
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return err.is_fatal() ? EXIT_INTEGRITY : 1;
}

void apply_config_log_level(const GlobalFlags& g, const Config& cfg) {
    if (!g.log_level.empty() || g.quiet || cfg.log_level.empty()) return;
    if (auto lvl = log::parse_level(cfg.log_level)) log::set_level(*lvl);
}

std::string human_size(int64_t bytes) {
    char buf[32];
    if (bytes < 1024) {
        std::snprintf(buf, sizeof(buf), "%lldB", static_cast<long long>(bytes));
    } else if (bytes < 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1fKB", static_cast<double>(bytes) / 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1fMB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    }
    return buf;
}

// Loads the graph for `roots` and saves the lock file on success
Result<ModuleGraph> load(Session& session, const std::vector<std::string>& roots) {
    auto graph = session.loader().load_graph(roots, session.root_referrer());
    FERRY_TRY(session.finish(graph.is_ok()));
    return graph;
}

// ---- Commands ----

int cmd_cache(const GlobalFlags& g, const ResolveFlags& f,
              const std::vector<std::string>& specifiers, bool vendor) {
    SessionOptions opts = session_options(g, f);
    if (vendor) opts.vendor = true;

    auto session = Session::open(fs::current_path(), opts);
    if (session.is_err()) return report(session.error());
    Session& s = *session.value();
    apply_config_log_level(g, s.config());

    auto graph = load(s, specifiers);
    if (graph.is_err()) return report(graph.error());

    const ModuleGraph& mg = graph.value();
    size_t cached = 0;
    for (size_t i = 0; i < mg.size(); ++i) {
        if (mg.module(i).from_cache) ++cached;
    }
    log::info("%zu modules (%zu already cached), %s",
              mg.size(), cached, human_size(mg.total_size()).c_str());
    if (vendor && s.vendor()) {
        log::info("vendored into %s", s.vendor()->root().c_str());
    }
    return 0;
}

int cmd_info(const GlobalFlags& g, const ResolveFlags& f, const std::string& specifier) {
    auto session = Session::open(fs::current_path(), session_options(g, f));
    if (session.is_err()) return report(session.error());
    Session& s = *session.value();
    apply_config_log_level(g, s.config());

    auto graph = load(s, {specifier});
    if (graph.is_err()) return report(graph.error());

    const ModuleGraph& mg = graph.value();
    if (mg.roots().empty()) return 0;
    ModuleGraph::NodeId root = mg.roots().front();

    std::printf("specifier: %s\n", mg.module(root).key.c_str());
    std::printf("modules: %zu\n", mg.size());
    std::printf("size: %s\n\n", human_size(mg.total_size()).c_str());
    std::printf("%s", mg.tree_display(root, [](const ModuleInfo& m) {
        std::string line = m.key + " (" + human_size(m.size) + ")";
        if (m.from_cache) line += " (cached)";
        return line;
    }).c_str());
    return 0;
}

int cmd_run(const GlobalFlags& g, const ResolveFlags& f, const std::string& specifier,
            const std::vector<std::string>& args) {
    auto session = Session::open(fs::current_path(), session_options(g, f));
    if (session.is_err()) return report(session.error());
    Session& s = *session.value();
    apply_config_log_level(g, s.config());

    auto root = s.loader().resolve(specifier, s.root_referrer());
    if (root.is_err()) return report(root.error());

    auto graph = load(s, {specifier});
    if (graph.is_err()) return report(graph.error());

    std::vector<std::string> argv = split(s.config().runtime, ' ');
    if (argv.empty()) {
        return report(FerryError{FerryError::Config, "[run] runtime is empty"});
    }
    argv.push_back(root.value().is_local() ? root.value().local().path.string()
                                           : root.value().to_string());
    argv.insert(argv.end(), args.begin(), args.end());

    CommandOptions copts;
    copts.capture = false;
    auto result = run_command(argv, copts);
    if (result.is_err()) {
        auto err = std::move(result).error();
        err.hint = "set [run] runtime in ferry.toml";
        return report(err);
    }
    return result.value().exit_code;
}

int cmd_clean(const GlobalFlags& g) {
    auto root = cache_root_for(fs::current_path(), g.config_path);
    if (root.is_err()) return report(root.error());

    ModuleCache cache;
    auto opened = cache.open(root.value());
    if (opened.is_err()) return report(opened.error());

    auto stats = cache.stats();
    if (stats.is_err()) return report(stats.error());
    auto cleared = cache.clear();
    if (cleared.is_err()) return report(cleared.error());

    log::info("removed %lld entries (%s) from %s",
              static_cast<long long>(stats.value().entry_count),
              human_size(stats.value().content_bytes).c_str(),
              root.value().c_str());
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"ferry - module resolution, caching and lock files"};
    app.require_subcommand(1);

    GlobalFlags global;
    app.add_option("--config,-c", global.config_path, "Path to ferry.toml");
    app.add_option("--log-level", global.log_level,
                   "trace, debug, info, warn, error or off");
    app.add_flag("--quiet,-q", global.quiet, "Only print errors");

    ResolveFlags flags;

    std::vector<std::string> cache_specs;
    auto* cache = app.add_subcommand("cache", "Fetch and cache modules and their imports");
    cache->add_option("specifiers", cache_specs, "Root modules")->required();
    add_resolve_flags(cache, flags);

    std::vector<std::string> vendor_specs;
    auto* vendor = app.add_subcommand("vendor", "Copy remote dependencies into ./vendor");
    vendor->add_option("specifiers", vendor_specs, "Root modules")->required();
    add_resolve_flags(vendor, flags);

    std::string run_spec;
    auto* run = app.add_subcommand("run", "Load and verify a module graph, then run it");
    run->add_option("specifier", run_spec, "Root module")->required();
    run->prefix_command();
    add_resolve_flags(run, flags);

    std::string info_spec;
    auto* info = app.add_subcommand("info", "Show the dependency tree of a module");
    info->add_option("specifier", info_spec, "Root module")->required();
    add_resolve_flags(info, flags);

    auto* clean = app.add_subcommand("clean", "Remove every entry from the module cache");

    CLI11_PARSE(app, argc, argv);

    if (global.quiet) log::set_level(log::Error);
    if (!global.log_level.empty()) {
        auto lvl = log::parse_level(global.log_level);
        if (!lvl) {
            return report(FerryError{FerryError::InvalidArg,
                "unknown log level '" + global.log_level + "'",
                "use one of trace, debug, info, warn, error, off"});
        }
        log::set_level(*lvl);
    }

    if (cache->parsed()) return cmd_cache(global, flags, cache_specs, false);
    if (vendor->parsed()) return cmd_cache(global, flags, vendor_specs, true);
    if (run->parsed()) return cmd_run(global, flags, run_spec, run->remaining());
    if (info->parsed()) return cmd_info(global, flags, info_spec);
    if (clean->parsed()) return cmd_clean(global);
    return 1;
}
