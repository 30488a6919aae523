#include <catch2/catch.hpp>
#include <ferry/loader.hpp>
#include <ferry/url.hpp>
#include "test_support.hpp"

#include <stdexcept>

using namespace ferry;
using ferry_test::FakeHttpClient;
using ferry_test::FakeRegistry;
using ferry_test::TempDir;

namespace fs = std::filesystem;

namespace {

struct Fixture {
    TempDir td;
    ModuleCache cache;
    RegistrySet registries;
    FakeRegistry* jsr = nullptr;
    FakeRegistry* npm = nullptr;
    FakeHttpClient http;
    VersionResolver resolver{registries};
    std::unique_ptr<Fetcher> fetcher;
    ImportMap map;
    std::unique_ptr<LockManager> lock;

    Fixture() : map(td.path) {
        REQUIRE(cache.open(td.path / "cache").is_ok());
        auto j = std::make_unique<FakeRegistry>(RegistryKind::Jsr);
        jsr = j.get();
        registries.set(std::move(j));
        auto n = std::make_unique<FakeRegistry>(RegistryKind::Npm);
        npm = n.get();
        registries.set(std::move(n));

        FetchOptions opts;
        opts.backoff_ms = 1;
        fetcher = std::make_unique<Fetcher>(cache, registries, http, opts);
        use_lock(LockFile{}, LockMode::Additive);
    }

    void use_lock(LockFile lf, LockMode mode) {
        lock = std::make_unique<LockManager>(std::move(lf), td.path / "deno.lock", mode);
    }

    // Registry with 1.2.0, 1.3.0 and 2.0.0 of @x/y
    void publish_xy() {
        jsr->publish("@x/y", "1.2.0", "", "export const v = '1.2.0';");
        jsr->publish("@x/y", "1.3.0", "", "export const v = '1.3.0';");
        jsr->publish("@x/y", "2.0.0", "", "export const v = '2.0.0';");
    }

    std::string root() const { return file_url(td.path, true); }
    std::string key_of(const std::string& rel) const { return file_url(td.path / rel); }

    ModuleLoader loader(LoadOptions opts = {}) {
        opts.jobs = 2;
        return ModuleLoader(map, resolver, *fetcher, cache, lock.get(), opts);
    }
};

class ThrowingRegistry : public FakeRegistry {
public:
    ThrowingRegistry() : FakeRegistry(RegistryKind::Jsr) {}

    Result<std::vector<Version>> list_versions(const std::string&) override {
        throw std::runtime_error("malformed registry metadata");
    }
};

std::vector<std::string> import_keys(const ModuleGraph& g, const std::string& from) {
    std::vector<std::string> out;
    for (const auto& e : g.imports_of(*g.find(from))) {
        out.push_back(g.module(e.to).key);
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Import map
// ---------------------------------------------------------------------------

TEST_CASE("bare name mapped at the top level", "[loader]") {
    Fixture f;
    REQUIRE(f.map.add_import("calc", "./lib/calc.ts").is_ok());
    f.td.write_file("main.ts", "import { add } from \"calc\";\nconsole.log(add(1, 2));\n");
    f.td.write_file("lib/calc.ts", "export const add = (a, b) => a + b;\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().size() == 2);
    REQUIRE(import_keys(g.value(), f.key_of("main.ts")) ==
            std::vector<std::string>{f.key_of("lib/calc.ts")});
    REQUIRE(g.value().imports_of(*g.value().find(f.key_of("main.ts")))[0].data.raw == "calc");
}

TEST_CASE("scoped mapping applies to importers under the scope", "[loader]") {
    Fixture f;
    REQUIRE(f.map.add_import("calc", "./lib/calc.ts").is_ok());
    REQUIRE(f.map.add_scope("./legacy/", "calc", "./lib/calc_v1.ts").is_ok());
    f.td.write_file("main.ts", "import \"calc\";\nimport \"./legacy/old.ts\";\n");
    f.td.write_file("legacy/old.ts", "import { add } from \"calc\";\n");
    f.td.write_file("lib/calc.ts", "export const add = 2;\n");
    f.td.write_file("lib/calc_v1.ts", "export const add = 1;\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().size() == 4);
    REQUIRE(import_keys(g.value(), f.key_of("legacy/old.ts")) ==
            std::vector<std::string>{f.key_of("lib/calc_v1.ts")});
    REQUIRE(import_keys(g.value(), f.key_of("main.ts")) ==
            std::vector<std::string>{f.key_of("lib/calc.ts"), f.key_of("legacy/old.ts")});
}

TEST_CASE("unmapped bare import fails the graph", "[loader]") {
    Fixture f;
    f.td.write_file("main.ts", "import x from \"lodash\";\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == FerryError::UnmappedSpecifier);
    REQUIRE(g.error().file == f.key_of("main.ts"));
    REQUIRE(g.error().line == 1);
}

TEST_CASE("mapped name may target a registry package", "[loader]") {
    Fixture f;
    f.publish_xy();
    REQUIRE(f.map.add_import("@x/y", "jsr:@x/y@^1.2.0").is_ok());

    auto spec = f.loader().resolve("@x/y", f.root());
    REQUIRE(spec.is_ok());
    REQUIRE(spec.value().to_string() == "jsr:@x/y@1.3.0");
}

// ---------------------------------------------------------------------------
// Versions and pins
// ---------------------------------------------------------------------------

TEST_CASE("caret range picks the highest compatible version and pins it", "[loader]") {
    Fixture f;
    f.publish_xy();
    f.td.write_file("main.ts", "import { v } from \"jsr:@x/y@^1.2.0\";\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().contains("jsr:@x/y@1.3.0"));
    REQUIRE_FALSE(g.value().contains("jsr:@x/y@2.0.0"));

    auto pin = f.lock->pinned("jsr:@x/y@^1.2.0");
    REQUIRE(pin.has_value());
    REQUIRE(pin->to_string() == "1.3.0");

    auto snap = f.lock->snapshot();
    REQUIRE(snap.remote.at("jsr:@x/y@1.3.0") ==
            LockManager::compute_integrity("export const v = '1.3.0';"));
    // Local modules are never locked
    REQUIRE(snap.remote.size() == 1);
    REQUIRE(f.lock->dirty());
}

TEST_CASE("existing pin wins over newer versions", "[loader]") {
    Fixture f;
    f.publish_xy();
    LockFile lf;
    lf.specifiers["jsr:@x/y@^1.2.0"] = "1.2.0";
    f.use_lock(lf, LockMode::Additive);

    auto spec = f.loader().resolve("jsr:@x/y@^1.2.0", f.root());
    REQUIRE(spec.is_ok());
    REQUIRE(spec.value().to_string() == "jsr:@x/y@1.2.0");
    REQUIRE(f.jsr->list_calls() == 0);
}

TEST_CASE("a registry that throws fails the graph", "[loader]") {
    Fixture f;
    f.registries.set(std::make_unique<ThrowingRegistry>());
    f.jsr = nullptr;
    f.td.write_file("main.ts", "import \"./a.ts\";\nimport { v } from \"jsr:@x/y@^1.0.0\";\n");
    f.td.write_file("a.ts", "export const a = 1;\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_err());
    REQUIRE(g.error().message.find("malformed registry metadata") != std::string::npos);
}

TEST_CASE("no matching version", "[loader]") {
    Fixture f;
    f.publish_xy();

    auto spec = f.loader().resolve("jsr:@x/y@^9.0.0", f.root());
    REQUIRE(spec.is_err());
    REQUIRE(spec.error().code == FerryError::VersionNotFound);
}

TEST_CASE("lock update replaces pins and hashes", "[loader]") {
    Fixture f;
    f.publish_xy();
    LockFile lf;
    lf.specifiers["jsr:@x/y@^1.2.0"] = "1.2.0";
    lf.remote["jsr:@x/y@1.3.0"] = "abc123";
    f.use_lock(lf, LockMode::Additive);
    f.td.write_file("main.ts", "import \"jsr:@x/y@^1.2.0\";\n");

    LoadOptions opts;
    opts.lock_update = true;
    auto g = f.loader(opts).load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());

    auto snap = f.lock->snapshot();
    REQUIRE(snap.specifiers.at("jsr:@x/y@^1.2.0") == "1.3.0");
    REQUIRE(snap.remote.at("jsr:@x/y@1.3.0") ==
            LockManager::compute_integrity("export const v = '1.3.0';"));
}

// ---------------------------------------------------------------------------
// Lock enforcement
// ---------------------------------------------------------------------------

TEST_CASE("integrity mismatch is fatal", "[loader]") {
    Fixture f;
    f.publish_xy();
    LockFile lf;
    lf.remote["jsr:@x/y@1.3.0"] = "abc123";
    f.use_lock(lf, LockMode::Additive);
    f.td.write_file("main.ts", "import { v } from \"jsr:@x/y@1.3.0\";\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == FerryError::IntegrityMismatch);
    REQUIRE(g.error().is_fatal());
    REQUIRE(g.error().message.find("abc123") != std::string::npos);
    REQUIRE(f.lock->state("jsr:@x/y@1.3.0") == LockState::Fatal);
    REQUIRE(f.lock->snapshot().remote.at("jsr:@x/y@1.3.0") == "abc123");
}

TEST_CASE("frozen lock rejects untracked modules", "[loader]") {
    Fixture f;
    f.publish_xy();
    f.use_lock(LockFile{}, LockMode::Frozen);
    f.td.write_file("main.ts", "import { v } from \"jsr:@x/y@1.3.0\";\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == FerryError::UntrackedDependency);
    REQUIRE_FALSE(f.lock->dirty());
}

TEST_CASE("frozen lock rejects unpinned ranges", "[loader]") {
    Fixture f;
    f.publish_xy();
    f.use_lock(LockFile{}, LockMode::Frozen);

    auto spec = f.loader().resolve("jsr:@x/y@^1.2.0", f.root());
    REQUIRE(spec.is_err());
    REQUIRE(spec.error().code == FerryError::UntrackedDependency);
}

TEST_CASE("frozen lock accepts what it tracks", "[loader]") {
    Fixture f;
    f.publish_xy();
    LockFile lf;
    lf.specifiers["jsr:@x/y@^1.2.0"] = "1.3.0";
    lf.remote["jsr:@x/y@1.3.0"] = LockManager::compute_integrity("export const v = '1.3.0';");
    f.use_lock(lf, LockMode::Frozen);
    f.td.write_file("main.ts", "import \"jsr:@x/y@^1.2.0\";\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(f.lock->state("jsr:@x/y@1.3.0") == LockState::Locked);
    REQUIRE_FALSE(f.lock->dirty());
}

TEST_CASE("locking disabled", "[loader]") {
    Fixture f;
    f.publish_xy();
    f.td.write_file("main.ts", "import \"jsr:@x/y@^1.2.0\";\n");

    ModuleLoader loader(f.map, f.resolver, *f.fetcher, f.cache, nullptr, LoadOptions{});
    auto g = loader.load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().contains("jsr:@x/y@1.3.0"));
}

// ---------------------------------------------------------------------------
// Local files
// ---------------------------------------------------------------------------

TEST_CASE("extensionless relative import is unresolved", "[loader]") {
    Fixture f;
    f.td.write_file("main.ts", "// entry\nimport { add } from \"./calc\";\n");
    f.td.write_file("calc.ts", "export const add = 1;\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == FerryError::UnresolvedSpecifier);
    REQUIRE(g.error().file == f.key_of("main.ts"));
    REQUIRE(g.error().line == 2);
    REQUIRE(g.error().hint.find("./calc.ts") != std::string::npos);
}

TEST_CASE("relative import with extension", "[loader]") {
    Fixture f;
    f.td.write_file("main.ts", "// entry\nimport { add } from \"./calc.ts\";\n");
    f.td.write_file("calc.ts", "export const add = 1;\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().contains(f.key_of("calc.ts")));
    REQUIRE_FALSE(g.value().module(*g.value().find(f.key_of("calc.ts"))).remote);
}

TEST_CASE("missing local module", "[loader]") {
    Fixture f;
    f.td.write_file("main.ts", "import \"./gone.ts\";\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == FerryError::UnresolvedSpecifier);
}

TEST_CASE("runtime built-ins are skipped", "[loader]") {
    Fixture f;
    f.td.write_file("main.ts", "import fs from \"node:fs\";\nimport \"./a.ts\";\n");
    f.td.write_file("a.ts", "export {};\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().size() == 2);
}

// ---------------------------------------------------------------------------
// Graph shape
// ---------------------------------------------------------------------------

TEST_CASE("import cycles load once", "[loader]") {
    Fixture f;
    f.td.write_file("a.ts", "import \"./b.ts\";\n");
    f.td.write_file("b.ts", "import \"./a.ts\";\n");

    auto g = f.loader().load_graph({"./a.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().size() == 2);
    REQUIRE(g.value().has_cycle());
    REQUIRE(g.value().roots().size() == 1);
}

TEST_CASE("shared dependency fetched once", "[loader]") {
    Fixture f;
    f.publish_xy();
    f.td.write_file("main.ts", "import \"./a.ts\";\nimport \"./b.ts\";\n");
    f.td.write_file("a.ts", "import \"jsr:@x/y@^1.2.0\";\n");
    f.td.write_file("b.ts", "import \"jsr:@x/y@^1.2.0\";\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().size() == 4);
    REQUIRE(f.jsr->fetch_calls() == 1);
}

TEST_CASE("relative imports inside a registry package", "[loader]") {
    Fixture f;
    f.jsr->publish("@x/y", "1.3.0", "", "export * from \"./helper.ts\";\n");
    f.jsr->publish("@x/y", "1.3.0", "helper.ts", "export const h = 1;\n");

    auto g = f.loader().load_graph({"jsr:@x/y@^1.0.0"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().contains("jsr:@x/y@1.3.0"));
    REQUIRE(g.value().contains("jsr:@x/y@1.3.0/helper.ts"));
    REQUIRE(g.value().module(*g.value().find("jsr:@x/y@1.3.0/helper.ts")).remote);
}

TEST_CASE("npm packages are not scanned", "[loader]") {
    Fixture f;
    f.npm->publish("chalk", "5.3.0", "", "import \"./would-fail\";");
    f.td.write_file("main.ts", "import chalk from \"npm:chalk@5\";\n");

    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().size() == 2);
    REQUIRE(g.value().contains("npm:chalk@5.3.0"));
}

TEST_CASE("second load comes from the cache", "[loader]") {
    Fixture f;
    f.publish_xy();
    f.td.write_file("main.ts", "import \"jsr:@x/y@^1.2.0\";\n");

    REQUIRE(f.loader().load_graph({"./main.ts"}, f.root()).is_ok());
    auto g = f.loader().load_graph({"./main.ts"}, f.root());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().module(*g.value().find("jsr:@x/y@1.3.0")).from_cache);
    REQUIRE(f.jsr->fetch_calls() == 1);
}

// ---------------------------------------------------------------------------
// Cached-only
// ---------------------------------------------------------------------------

TEST_CASE("cached-only picks versions from the cache", "[loader]") {
    Fixture f;
    f.publish_xy();
    REQUIRE(f.cache.store("jsr:@x/y@1.2.0", "export const v = '1.2.0';").is_ok());

    LoadOptions opts;
    opts.policy = FetchPolicy::cached_only();
    ModuleLoader loader(f.map, f.resolver, *f.fetcher, f.cache, nullptr, opts);

    auto spec = loader.resolve("jsr:@x/y@^1.2.0", f.root());
    REQUIRE(spec.is_ok());
    REQUIRE(spec.value().to_string() == "jsr:@x/y@1.2.0");
    REQUIRE(f.jsr->list_calls() == 0);

    auto m = loader.load_one(spec.value());
    REQUIRE(m.is_ok());
    REQUIRE(m.value().from_cache);
}

TEST_CASE("cached-only without a cached version", "[loader]") {
    Fixture f;
    f.publish_xy();

    LoadOptions opts;
    opts.policy = FetchPolicy::cached_only();
    ModuleLoader loader(f.map, f.resolver, *f.fetcher, f.cache, nullptr, opts);

    auto spec = loader.resolve("jsr:@x/y@^1.2.0", f.root());
    REQUIRE(spec.is_err());
    REQUIRE(spec.error().code == FerryError::NotCached);
    REQUIRE(f.jsr->list_calls() == 0);
}

// ---------------------------------------------------------------------------
// is_scannable
// ---------------------------------------------------------------------------

TEST_CASE("which modules are scanned for imports", "[loader]") {
    auto parse = [](const std::string& raw) {
        return Specifier::parse(raw, "file:///app/").value();
    };
    REQUIRE(is_scannable(parse("./main.ts")));
    REQUIRE(is_scannable(parse("./view.tsx")));
    REQUIRE_FALSE(is_scannable(parse("./data.json")));
    REQUIRE(is_scannable(parse("jsr:@x/y@1.0.0")));
    REQUIRE(is_scannable(parse("jsr:@x/y@1.0.0/mod.ts")));
    REQUIRE_FALSE(is_scannable(parse("jsr:@x/y@1.0.0/data.json")));
    REQUIRE_FALSE(is_scannable(parse("npm:chalk@5.3.0")));
    REQUIRE(is_scannable(parse("https://esm.sh/preact")));
    REQUIRE(is_scannable(parse("https://deno.land/x/oak/mod.ts?v=1")));
    REQUIRE_FALSE(is_scannable(parse("https://example.com/config.json")));
}
