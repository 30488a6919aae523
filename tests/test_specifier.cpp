#include <catch2/catch.hpp>
#include <ferry/import_map.hpp>
#include <ferry/specifier.hpp>

using namespace ferry;

static const std::string ROOT = "file:///app/";
static const std::string MAIN = "file:///app/main.ts";

// ===== Registry specifiers =====

TEST_CASE("jsr specifier with range and subpath", "[specifier]") {
    auto r = Specifier::parse("jsr:@std/path@^1.2.0/posix/join.ts", ROOT);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_registry());
    const auto& reg = r.value().registry();
    REQUIRE(reg.kind == RegistryKind::Jsr);
    REQUIRE(reg.package == "@std/path");
    REQUIRE(reg.range.kind == RangeKind::Caret);
    REQUIRE(reg.subpath == "posix/join.ts");
    REQUIRE(reg.package_key() == "jsr:@std/path");
    REQUIRE(reg.range_key() == "jsr:@std/path@^1.2.0");
    REQUIRE(r.value().to_string() == "jsr:@std/path@^1.2.0/posix/join.ts");
}

TEST_CASE("jsr specifier without range is latest", "[specifier]") {
    auto r = Specifier::parse("jsr:@luca/flag", ROOT);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().registry().range.kind == RangeKind::Latest);
    REQUIRE(r.value().registry().subpath.empty());
    REQUIRE(r.value().to_string() == "jsr:@luca/flag");
}

TEST_CASE("jsr packages must be scoped", "[specifier]") {
    auto r = Specifier::parse("jsr:path@1.0.0", ROOT);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FerryError::UnresolvedSpecifier);
    REQUIRE(Specifier::parse("jsr:@std", ROOT).is_err());
    REQUIRE(Specifier::parse("jsr:@std/path@not-a-version", ROOT).is_err());
}

TEST_CASE("npm specifiers, plain and scoped", "[specifier]") {
    auto plain = Specifier::parse("npm:chalk@5", ROOT);
    REQUIRE(plain.is_ok());
    REQUIRE(plain.value().registry().kind == RegistryKind::Npm);
    REQUIRE(plain.value().registry().package == "chalk");
    REQUIRE(plain.value().registry().range_key() == "npm:chalk@^5.0.0");

    auto scoped = Specifier::parse("npm:@types/node@20.1.0/fs.d.ts", ROOT);
    REQUIRE(scoped.is_ok());
    REQUIRE(scoped.value().registry().package == "@types/node");
    REQUIRE(scoped.value().registry().subpath == "fs.d.ts");
}

TEST_CASE("cache key carries the concrete version", "[specifier]") {
    auto jsr = Specifier::parse("jsr:@std/path@^1.2.0/mod.ts", ROOT).value();
    auto pinned = jsr.with_version(Version::parse("1.3.0").value());
    REQUIRE(pinned.registry().range.is_exact());
    REQUIRE(pinned.cache_key() == "jsr:@std/path@1.3.0/mod.ts");

    // npm content is the whole tarball
    auto npm = Specifier::parse("npm:@types/node@20.1.0/fs.d.ts", ROOT).value();
    REQUIRE(npm.cache_key() == "npm:@types/node@20.1.0");
}

// ===== Local specifiers =====

TEST_CASE("relative local import resolves against the referrer", "[specifier]") {
    auto r = Specifier::parse("./lib/calc.ts", MAIN);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_local());
    REQUIRE(r.value().local().path == std::filesystem::path("/app/lib/calc.ts"));
    REQUIRE(r.value().to_string() == "file:///app/lib/calc.ts");

    auto up = Specifier::parse("../shared/util.js", "file:///app/lib/calc.ts");
    REQUIRE(up.value().to_string() == "file:///app/shared/util.js");
}

TEST_CASE("referrer directory keeps its trailing slash", "[specifier]") {
    auto r = Specifier::parse("./main.ts", ROOT);
    REQUIRE(r.value().to_string() == "file:///app/main.ts");
}

TEST_CASE("local import without an extension is unresolved", "[specifier]") {
    auto r = Specifier::parse("./calc", MAIN);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FerryError::UnresolvedSpecifier);
    REQUIRE(r.error().hint.find("./calc.ts") != std::string::npos);
}

TEST_CASE("absolute path and file URL", "[specifier]") {
    REQUIRE(Specifier::parse("/srv/mod.ts", MAIN).value().to_string() == "file:///srv/mod.ts");
    REQUIRE(Specifier::parse("file:///srv/a/../mod.ts", MAIN).value().to_string() ==
            "file:///srv/mod.ts");
}

// ===== URL specifiers =====

TEST_CASE("URL import is normalized", "[specifier]") {
    auto r = Specifier::parse("https://Deno.Land/x/oak@v12/mod.ts", MAIN);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_url());
    REQUIRE(r.value().to_string() == "https://deno.land/x/oak@v12/mod.ts");
    REQUIRE(r.value().is_remote());
}

TEST_CASE("relative import inside a URL module stays remote", "[specifier]") {
    auto r = Specifier::parse("./router.ts", "https://deno.land/x/oak@v12/mod.ts");
    REQUIRE(r.value().to_string() == "https://deno.land/x/oak@v12/router.ts");
}

TEST_CASE("relative import inside a jsr package", "[specifier]") {
    auto r = Specifier::parse("../util.ts", "jsr:@std/path@1.3.0/posix/join.ts");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().registry().subpath == "util.ts");
    REQUIRE(r.value().registry().range.is_exact());
    REQUIRE(r.value().cache_key() == "jsr:@std/path@1.3.0/util.ts");
}

// ===== Bare and unsupported =====

TEST_CASE("bare specifier without a mapping", "[specifier]") {
    auto r = Specifier::parse("lodash", MAIN);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FerryError::UnmappedSpecifier);
}

TEST_CASE("bare specifier known to the import map", "[specifier]") {
    ImportMap map(std::filesystem::path("/app"));
    REQUIRE(map.add_import("lodash", "npm:lodash@4").is_ok());
    auto r = Specifier::parse("lodash", MAIN, &map);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_bare());
    REQUIRE(r.value().bare().name == "lodash");
}

TEST_CASE("unsupported schemes and empty input", "[specifier]") {
    REQUIRE(Specifier::parse("data:text/javascript,1", MAIN).error().code ==
            FerryError::UnresolvedSpecifier);
    REQUIRE(Specifier::parse("", MAIN).is_err());
}

TEST_CASE("module extensions", "[specifier]") {
    REQUIRE(has_module_extension("a/b.ts"));
    REQUIRE(has_module_extension("x.MJS"));
    REQUIRE(has_module_extension("data.json"));
    REQUIRE_FALSE(has_module_extension("calc"));
    REQUIRE_FALSE(has_module_extension("dir.ts/calc"));
    REQUIRE_FALSE(has_module_extension(".ts"));
}
