#include <doctest/doctest.h>
#include <hatch/path_utils.hpp>

using hatch::PathError;
using hatch::is_contained_relative_path;
using hatch::normalize_relative_path;
using hatch::normalize_under_root;

TEST_CASE("normalize simple relative path under root") {
    auto r = normalize_under_root("/opt/appx", "bin/appx");
    REQUIRE(r.ok);
    CHECK(r.path == "/opt/appx/bin/appx");
}

TEST_CASE("collapse dot and dotdot segments") {
    auto r = normalize_under_root("/opt/appx", "./bin/../lib/./file");
    REQUIRE(r.ok);
    CHECK(r.path == "/opt/appx/lib/file");
}

TEST_CASE("backslash is accepted as a separator") {
    auto r = normalize_relative_path("docs\\readme.txt");
    REQUIRE(r.ok);
    CHECK(r.path == "docs/readme.txt");
}

TEST_CASE("reject escape above root") {
    auto r = normalize_under_root("/opt/appx", "../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute and drive-qualified paths") {
    CHECK(normalize_under_root("/opt/appx", "/abs/path").error == PathError::AbsoluteNotAllowed);
    CHECK(normalize_under_root("/opt/appx", "\\abs").error == PathError::AbsoluteNotAllowed);
    CHECK(normalize_under_root("/opt/appx", "C:\\Windows").error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("reject NUL bytes") {
    std::string bad = std::string("bin/\0app", 8);
    auto r = normalize_under_root("/opt/appx", bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::ContainsNul);
}

TEST_CASE("reject paths resolving to the root itself") {
    CHECK(normalize_relative_path("").error == PathError::Empty);
    CHECK(normalize_relative_path(".").error == PathError::Empty);
    CHECK(normalize_relative_path("a/..").error == PathError::Empty);
}

TEST_CASE("normalized path has no trailing slash") {
    auto r = normalize_under_root("/opt/appx", "bin/subdir/");
    REQUIRE(r.ok);
    CHECK(r.path == "/opt/appx/bin/subdir");
}

TEST_CASE("is_contained_relative_path") {
    CHECK(is_contained_relative_path("a/b/c.txt"));
    CHECK(is_contained_relative_path("a/../b.txt"));
    CHECK_FALSE(is_contained_relative_path("../b.txt"));
    CHECK_FALSE(is_contained_relative_path("/etc/hosts"));
}

TEST_CASE("is_valid_utf8") {
    CHECK(is_valid_utf8("/opt/AppX"));
    CHECK(is_valid_utf8("/opt/\xc3\xa9t\xc3\xa9"));
    CHECK(is_valid_utf8("\xf0\x9f\x93\x81"));
    CHECK_FALSE(is_valid_utf8("/tmp/\xff"));
    CHECK_FALSE(is_valid_utf8("\xc0\xaf"));
    CHECK_FALSE(is_valid_utf8("\xed\xa0\x80"));
    CHECK_FALSE(is_valid_utf8("\xe2\x82"));
}
