#include <catch2/catch.hpp>
#include <ferry/version.hpp>

using namespace ferry;

static Version v(const std::string& s) { return Version::parse(s).value(); }
static VersionRange range(const std::string& s) { return VersionRange::parse(s).value(); }

// ===== Version parsing =====

TEST_CASE("parse simple version", "[version]") {
    auto r = Version::parse("1.2.3");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().major == 1);
    REQUIRE(r.value().minor == 2);
    REQUIRE(r.value().patch == 3);
    REQUIRE_FALSE(r.value().is_prerelease());
}

TEST_CASE("parse pre-release and build", "[version]") {
    auto r = Version::parse("2.0.0-rc.1+build.5");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().prerelease == std::vector<std::string>{"rc", "1"});
    REQUIRE(r.value().build == "build.5");
    REQUIRE(r.value().to_string() == "2.0.0-rc.1+build.5");
}

TEST_CASE("leading v is accepted", "[version]") {
    REQUIRE(v("v1.0.0") == v("1.0.0"));
}

TEST_CASE("version parse errors", "[version]") {
    REQUIRE(Version::parse("").is_err());
    REQUIRE(Version::parse("1").is_err());
    REQUIRE(Version::parse("1.2").is_err());
    REQUIRE(Version::parse("abc").is_err());
    REQUIRE(Version::parse("1.2.3-").is_err());
    REQUIRE(Version::parse("01.2.3").is_err());
    REQUIRE(Version::parse("1.2.3+").is_err());
}

// ===== Ordering =====

TEST_CASE("version ordering", "[version]") {
    REQUIRE(v("1.0.0") < v("1.1.0"));
    REQUIRE(v("1.1.0") < v("1.1.1"));
    REQUIRE(v("1.9.0") < v("1.10.0"));
    REQUIRE(v("2.0.0") > v("1.99.99"));
}

TEST_CASE("pre-release precedence", "[version]") {
    REQUIRE(v("1.0.0-alpha") < v("1.0.0"));
    REQUIRE(v("1.0.0-alpha") < v("1.0.0-alpha.1"));
    REQUIRE(v("1.0.0-alpha.1") < v("1.0.0-alpha.beta"));
    REQUIRE(v("1.0.0-beta.2") < v("1.0.0-beta.11"));
    REQUIRE(v("1.0.0-rc.1") < v("1.0.0"));
}

TEST_CASE("build metadata is ignored for precedence", "[version]") {
    REQUIRE(v("1.0.0+a") == v("1.0.0+b"));
}

// ===== Ranges =====

TEST_CASE("range parsing", "[version]") {
    REQUIRE(range("1.2.3").kind == RangeKind::Exact);
    REQUIRE(range("=1.2.3").kind == RangeKind::Exact);
    REQUIRE(range("^1.2.3").kind == RangeKind::Caret);
    REQUIRE(range("~1.2.3").kind == RangeKind::Tilde);
    REQUIRE(range("").kind == RangeKind::Latest);
    REQUIRE(range("*").kind == RangeKind::Latest);
    REQUIRE(range("latest").kind == RangeKind::Latest);
}

TEST_CASE("partial ranges are padded", "[version]") {
    REQUIRE(range("1").to_string() == "^1.0.0");
    REQUIRE(range("1.2").to_string() == "~1.2.0");
    REQUIRE(range("^2").to_string() == "^2.0.0");
    REQUIRE(range("~0.4").to_string() == "~0.4.0");
    REQUIRE(VersionRange::parse("=1.2").is_err());
    REQUIRE(VersionRange::parse("^x").is_err());
}

TEST_CASE("caret matches the same major", "[version]") {
    auto r = range("^1.2.0");
    REQUIRE(r.matches(v("1.2.0")));
    REQUIRE(r.matches(v("1.3.0")));
    REQUIRE(r.matches(v("1.99.0")));
    REQUIRE_FALSE(r.matches(v("1.1.9")));
    REQUIRE_FALSE(r.matches(v("2.0.0")));
}

TEST_CASE("caret below 1.0 stays on the minor", "[version]") {
    auto r = range("^0.2.3");
    REQUIRE(r.matches(v("0.2.3")));
    REQUIRE(r.matches(v("0.2.9")));
    REQUIRE_FALSE(r.matches(v("0.3.0")));

    auto zero = range("^0.0.3");
    REQUIRE(zero.matches(v("0.0.3")));
    REQUIRE(zero.matches(v("0.0.4")));
    REQUIRE_FALSE(zero.matches(v("0.1.0")));
}

TEST_CASE("tilde matches the same minor", "[version]") {
    auto r = range("~1.2.0");
    REQUIRE(r.matches(v("1.2.5")));
    REQUIRE_FALSE(r.matches(v("1.3.0")));
}

TEST_CASE("pre-releases need a pre-release range on the same line", "[version]") {
    REQUIRE_FALSE(range("^1.0.0").matches(v("1.1.0-beta")));
    REQUIRE(range("^1.1.0-alpha").matches(v("1.1.0-beta")));
    REQUIRE_FALSE(range("^1.1.0-alpha").matches(v("1.2.0-beta")));
    REQUIRE(range("^1.1.0-alpha").matches(v("1.2.0")));
}

TEST_CASE("exact and latest", "[version]") {
    REQUIRE(range("1.2.3").matches(v("1.2.3")));
    REQUIRE_FALSE(range("1.2.3").matches(v("1.2.4")));
    REQUIRE(VersionRange::latest().matches(v("0.0.1")));
    REQUIRE(VersionRange::exact(v("3.0.0")).is_exact());
    REQUIRE(VersionRange::latest().to_string().empty());
}
