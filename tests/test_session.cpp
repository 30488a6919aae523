#include <catch2/catch.hpp>
#include <ferry/session.hpp>
#include "test_support.hpp"

#include <cstdlib>
#include <optional>

using namespace ferry;
using ferry_test::TempDir;

namespace fs = std::filesystem;

namespace {

// Sets or clears an environment variable for one test
struct EnvGuard {
    std::string name;
    std::optional<std::string> old;

    EnvGuard(std::string n, const char* value) : name(std::move(n)) {
        if (const char* v = std::getenv(name.c_str())) old = v;
        if (value) setenv(name.c_str(), value, 1);
        else unsetenv(name.c_str());
    }
    ~EnvGuard() {
        if (old) setenv(name.c_str(), old->c_str(), 1);
        else unsetenv(name.c_str());
    }
};

// Project using a directory mirror for jsr and a cache inside the project
void write_project(const TempDir& td) {
    td.write_file("ferry.toml",
        "[imports]\n"
        "calc = \"./lib/calc.ts\"\n"
        "\n"
        "[registry]\n"
        "jsr-mirror = \"./mirror/jsr\"\n"
        "\n"
        "[cache]\n"
        "dir = \"./cache\"\n");
    td.write_file("main.ts",
        "import { add } from \"calc\";\n"
        "import { v } from \"jsr:@x/y@^1.2.0\";\n");
    td.write_file("lib/calc.ts", "export const add = 1;\n");
    td.write_file("mirror/jsr/@x/y/1.2.0/mod.ts", "export const v = '1.2.0';\n");
    td.write_file("mirror/jsr/@x/y/1.3.0/mod.ts", "export const v = '1.3.0';\n");
}

} // namespace

TEST_CASE("conflicting options", "[session]") {
    TempDir td;
    write_project(td);
    EnvGuard dir("FERRY_DIR", nullptr);

    SessionOptions a;
    a.frozen = true;
    a.lock_write = true;
    auto r = Session::open(td.path, a);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FerryError::InvalidArg);

    SessionOptions b;
    b.no_lock = true;
    b.frozen = true;
    REQUIRE(Session::open(td.path, b).error().code == FerryError::InvalidArg);

    SessionOptions c;
    c.cached_only = true;
    c.reload = true;
    REQUIRE(Session::open(td.path, c).error().code == FerryError::InvalidArg);
}

TEST_CASE("load a project and write its lock file", "[session]") {
    TempDir td;
    write_project(td);
    EnvGuard dir("FERRY_DIR", nullptr);

    auto opened = Session::open(td.path, SessionOptions{});
    REQUIRE(opened.is_ok());
    auto session = std::move(opened).value();
    REQUIRE(session->cache().root() == td.path / "cache");
    REQUIRE(session->lock() != nullptr);
    REQUIRE(session->lock()->path() == td.path / "deno.lock");

    auto g = session->loader().load_graph({"./main.ts"}, session->root_referrer());
    REQUIRE(g.is_ok());
    REQUIRE(g.value().size() == 3);
    REQUIRE(g.value().contains("jsr:@x/y@1.3.0"));
    REQUIRE_FALSE(fs::exists(td.path / "deno.lock"));

    REQUIRE(session->finish(true).is_ok());
    auto lock = LockFile::load(td.path / "deno.lock");
    REQUIRE(lock.is_ok());
    REQUIRE(lock.value().specifiers.at("jsr:@x/y@^1.2.0") == "1.3.0");
    REQUIRE(lock.value().remote.count("jsr:@x/y@1.3.0") == 1);
}

TEST_CASE("failed run leaves the lock file alone", "[session]") {
    TempDir td;
    write_project(td);
    EnvGuard dir("FERRY_DIR", nullptr);

    auto session = Session::open(td.path, SessionOptions{}).value();
    REQUIRE(session->loader().load_graph({"./main.ts"}, session->root_referrer()).is_ok());
    REQUIRE(session->finish(false).is_ok());
    REQUIRE_FALSE(fs::exists(td.path / "deno.lock"));
}

TEST_CASE("lock options", "[session]") {
    TempDir td;
    write_project(td);
    EnvGuard dir("FERRY_DIR", nullptr);

    SECTION("disabled") {
        SessionOptions o;
        o.no_lock = true;
        auto s = Session::open(td.path, o).value();
        REQUIRE(s->lock() == nullptr);
    }
    SECTION("custom path") {
        SessionOptions o;
        o.lock_path = "locks/app.lock";
        auto s = Session::open(td.path, o).value();
        REQUIRE(s->lock()->path() == td.path / "locks" / "app.lock");
        REQUIRE(s->lock()->mode() == LockMode::Additive);
    }
    SECTION("frozen") {
        SessionOptions o;
        o.frozen = true;
        auto s = Session::open(td.path, o).value();
        REQUIRE(s->lock()->mode() == LockMode::Frozen);
    }
}

TEST_CASE("directory without a project config gets no lock file", "[session]") {
    TempDir td;
    std::string cache = (td.path / "cache").string();
    EnvGuard dir("FERRY_DIR", cache.c_str());
    td.write_file("main.ts", "import { a } from \"./a.ts\";\n");
    td.write_file("a.ts", "export const a = 1;\n");

    SECTION("auto mode") {
        auto s = Session::open(td.path, SessionOptions{}).value();
        REQUIRE(s->project().config_path.empty());
        REQUIRE(s->lock() == nullptr);
        REQUIRE(s->loader().load_graph({"./main.ts"}, s->root_referrer()).is_ok());
        REQUIRE(s->finish(true).is_ok());
        REQUIRE_FALSE(fs::exists(td.path / "deno.lock"));
    }
    SECTION("--lock-write") {
        SessionOptions o;
        o.lock_write = true;
        auto s = Session::open(td.path, o).value();
        REQUIRE(s->lock() != nullptr);
        REQUIRE(s->lock()->path() == td.path / "deno.lock");
        REQUIRE(s->loader().load_graph({"./main.ts"}, s->root_referrer()).is_ok());
        REQUIRE(s->finish(true).is_ok());
    }
    SECTION("--lock") {
        SessionOptions o;
        o.lock_path = "app.lock";
        auto s = Session::open(td.path, o).value();
        REQUIRE(s->lock() != nullptr);
        REQUIRE(s->lock()->path() == td.path / "app.lock");
    }
}

TEST_CASE("FERRY_DIR selects the cache root", "[session]") {
    TempDir td;
    write_project(td);
    std::string other = (td.path / "elsewhere").string();
    EnvGuard dir("FERRY_DIR", other.c_str());

    auto root = cache_root_for(td.path, "");
    REQUIRE(root.is_ok());
    REQUIRE(root.value() == td.path / "elsewhere");
}

TEST_CASE("explicit config path", "[session]") {
    TempDir td;
    write_project(td);
    EnvGuard dir("FERRY_DIR", nullptr);
    td.write_file("alt/ferry.toml", "[cache]\ndir = \"./alt-cache\"\n");

    auto root = cache_root_for(td.path, "alt/ferry.toml");
    REQUIRE(root.is_ok());
    REQUIRE(root.value() == td.path / "alt" / "alt-cache");

    auto missing = Session::open(td.path, SessionOptions{"nope/ferry.toml"});
    REQUIRE(missing.is_err());
}
