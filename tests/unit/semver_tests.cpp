#include <doctest/doctest.h>
#include <hatch/semver.hpp>

using hatch::compare_versions;
using hatch::parse_version;

// ============================================================================
// Version Parsing Tests (SemVer 2.0.0)
// ============================================================================

TEST_CASE("parse_version accepts MAJOR.MINOR.PATCH") {
    auto v = parse_version("1.2.3");
    REQUIRE(v);
    CHECK(v->major() == 1);
    CHECK(v->minor() == 2);
    CHECK(v->patch() == 3);
    CHECK_FALSE(v->is_prerelease());
}

TEST_CASE("parse_version accepts pre-release versions") {
    auto v = parse_version("2.0.0-beta.2");
    REQUIRE(v);
    CHECK(v->is_prerelease());
    CHECK(v->prerelease() == "beta.2");
}

TEST_CASE("parse_version tolerates whitespace and a leading v") {
    auto v = parse_version("  v3.1.4 ");
    REQUIRE(v);
    CHECK(v->major() == 3);
    CHECK(v->patch() == 4);
}

TEST_CASE("parse_version rejects invalid versions") {
    CHECK_FALSE(parse_version(""));
    CHECK_FALSE(parse_version("v"));
    CHECK_FALSE(parse_version("1.2"));
    CHECK_FALSE(parse_version("one.two.three"));
}

// ============================================================================
// Comparison Tests
// ============================================================================

TEST_CASE("pre-release sorts before its release") {
    CHECK(compare_versions("1.0.0", "1.0.0-rc.1") == 1);
    CHECK(compare_versions("1.0.0-rc.1", "1.0.0-rc.2") == -1);
}

TEST_CASE("compare_versions orders parseable versions") {
    CHECK(compare_versions("1.0.0", "2.0.0") == -1);
    CHECK(compare_versions("2.0.0", "1.9.9") == 1);
    CHECK(compare_versions("1.10.0", "1.9.0") == 1);
    CHECK(compare_versions("1.0.0", "v1.0.0") == 0);
}

TEST_CASE("compare_versions is nullopt when either side does not parse") {
    CHECK_FALSE(compare_versions("1.0.0", "").has_value());
    CHECK_FALSE(compare_versions("build-7", "1.0.0").has_value());
}
