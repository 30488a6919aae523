#include <catch2/catch.hpp>
#include <ferry/import_map.hpp>
#include "test_support.hpp"

using namespace ferry;
using ferry_test::TempDir;

namespace fs = std::filesystem;

static const std::string MAIN = "file:///app/main.ts";

TEST_CASE("exact entry maps a bare name", "[import_map]") {
    ImportMap map(fs::path("/app"));
    REQUIRE(map.add_import("chalk", "npm:chalk@5").is_ok());

    auto r = map.resolve("chalk", MAIN);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_registry());
    REQUIRE(r.value().registry().range_key() == "npm:chalk@^5.0.0");
}

TEST_CASE("prefix entry maps package subpaths", "[import_map]") {
    ImportMap map(fs::path("/app"));
    REQUIRE(map.add_import("@std/", "jsr:@std/").is_ok());

    auto target = map.resolve_target("@std/path", MAIN);
    REQUIRE(target.value() == "jsr:@std/path");
}

TEST_CASE("longest prefix wins", "[import_map]") {
    ImportMap map(fs::path("/app"));
    REQUIRE(map.add_import("lib/", "https://a.dev/lib/").is_ok());
    REQUIRE(map.add_import("lib/fast/", "https://b.dev/fast/").is_ok());

    REQUIRE(map.resolve_target("lib/fast/x.ts", MAIN).value() == "https://b.dev/fast/x.ts");
    REQUIRE(map.resolve_target("lib/slow/x.ts", MAIN).value() == "https://a.dev/lib/slow/x.ts");
}

TEST_CASE("prefix key requires a prefix target", "[import_map]") {
    ImportMap map(fs::path("/app"));
    auto st = map.add_import("@std/", "jsr:@std/path");
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == FerryError::Config);
}

TEST_CASE("relative targets resolve against the base directory", "[import_map]") {
    ImportMap map(fs::path("/app"));
    REQUIRE(map.add_import("utils", "./src/utils.ts").is_ok());

    auto r = map.resolve("utils", "file:///app/deep/dir/mod.ts");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "file:///app/src/utils.ts");
}

TEST_CASE("scopes override top-level imports for matching referrers", "[import_map]") {
    ImportMap map(fs::path("/app"));
    REQUIRE(map.add_import("dep", "npm:dep@1").is_ok());
    REQUIRE(map.add_scope("./legacy/", "dep", "npm:dep@0.9").is_ok());
    REQUIRE(map.add_scope("https://deno.land/x/", "dep", "npm:dep@2").is_ok());

    REQUIRE(map.resolve_target("dep", MAIN).value() == "npm:dep@1");
    REQUIRE(map.resolve_target("dep", "file:///app/legacy/old.ts").value() == "npm:dep@0.9");
    REQUIRE(map.resolve_target("dep", "https://deno.land/x/mod.ts").value() == "npm:dep@2");
}

TEST_CASE("unmapped name is an error naming the referrer", "[import_map]") {
    ImportMap map(fs::path("/app"));
    auto r = map.resolve("express", MAIN);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FerryError::UnmappedSpecifier);
    REQUIRE(r.error().message.find(MAIN) != std::string::npos);
    REQUIRE_FALSE(map.maps("express", MAIN));
}

TEST_CASE("mapped targets are not mapped again", "[import_map]") {
    ImportMap map(fs::path("/app"));
    REQUIRE(map.add_import("a", "b").is_ok());
    REQUIRE(map.add_import("b", "a").is_ok());

    auto r = map.resolve("a", MAIN);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FerryError::UnmappedSpecifier);
}

TEST_CASE("parse JSON import map", "[import_map]") {
    auto r = ImportMap::parse_json(R"({
        "imports": { "@std/": "jsr:@std/", "app": "./main.ts" },
        "scopes": { "./vendor/": { "app": "./vendor/app.ts" } }
    })", fs::path("/proj"));
    REQUIRE(r.is_ok());
    const ImportMap& map = r.value();
    REQUIRE(map.imports().size() == 2);
    REQUIRE(map.imports().at("app") == "file:///proj/main.ts");
    REQUIRE(map.scopes().count("file:///proj/vendor/") == 1);
    REQUIRE(map.resolve_target("app", "file:///proj/vendor/x.ts").value() ==
            "file:///proj/vendor/app.ts");
}

TEST_CASE("malformed JSON import maps", "[import_map]") {
    REQUIRE(ImportMap::parse_json("{", fs::path("/p")).error().code == FerryError::Parse);
    REQUIRE(ImportMap::parse_json("[]", fs::path("/p")).error().code == FerryError::Config);
    REQUIRE(ImportMap::parse_json(R"({"imports": {"a": 1}})", fs::path("/p")).is_err());
    REQUIRE(ImportMap::parse_json(R"({"scopes": {"x/": "y"}})", fs::path("/p")).is_err());
}

TEST_CASE("load JSON import map from disk", "[import_map]") {
    TempDir td;
    auto path = td.write_file("maps/import_map.json",
                              R"({"imports": {"calc": "./calc.ts"}})");
    auto r = ImportMap::load_json(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().base_dir() == td.path / "maps");
    REQUIRE(r.value().resolve("calc", "file:///elsewhere/main.ts").value().to_string() ==
            "file://" + (td.path / "maps" / "calc.ts").string());

    auto missing = ImportMap::load_json(td.path / "none.json");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == FerryError::IO);
}

TEST_CASE("merge keeps targets from their own base directory", "[import_map]") {
    auto external = ImportMap::parse_json(R"({"imports": {"a": "./a.ts", "b": "./b.ts"}})",
                                          fs::path("/maps")).value();
    ImportMap inline_map(fs::path("/proj"));
    REQUIRE(inline_map.add_import("b", "./b2.ts").is_ok());

    external.merge(inline_map);
    REQUIRE(external.imports().at("a") == "file:///maps/a.ts");
    REQUIRE(external.imports().at("b") == "file:///proj/b2.ts");
}
