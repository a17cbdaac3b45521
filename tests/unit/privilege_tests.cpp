#include <doctest/doctest.h>
#include <hatch/launcher.hpp>
#include <hatch/privilege.hpp>

#include "../test_support.hpp"

#include <filesystem>

#include <unistd.h>

using namespace hatch;
using hatch_test::TempDir;

namespace fs = std::filesystem;

// ============================================================================
// Privilege Context
// ============================================================================

TEST_CASE("acquire takes the session lock and creates its directory") {
    TempDir dir;
    auto ctx = PrivilegeContext::acquire(dir.sub("state/hatch.lock"), {dir.sub("install")});
    REQUIRE(ctx.isOk());
    CHECK(ctx.value().held());
    CHECK(fs::exists(dir.sub("state/hatch.lock")));
}

TEST_CASE("a second session is refused while the first holds the lock") {
    TempDir dir;
    std::string lock = dir.sub("hatch.lock");

    auto first = PrivilegeContext::acquire(lock, {});
    REQUIRE(first.isOk());

    auto second = PrivilegeContext::acquire(lock, {});
    REQUIRE(second.isErr());
    CHECK(second.error().code() == ErrorCode::PRIVILEGE_ERROR);
    CHECK(exit_code_for(second.error()) == EXIT_PRIVILEGE);
}

TEST_CASE("the lock is released with the context") {
    TempDir dir;
    std::string lock = dir.sub("hatch.lock");
    {
        auto first = PrivilegeContext::acquire(lock, {});
        REQUIRE(first.isOk());
        PrivilegeContext moved = std::move(first.value());
        CHECK(moved.held());
        CHECK_FALSE(first.value().held());
    }
    CHECK(PrivilegeContext::acquire(lock, {}).isOk());
}

TEST_CASE("require_root refuses ordinary users") {
    if (geteuid() == 0) {
        return;
    }
    TempDir dir;
    auto ctx = PrivilegeContext::acquire(dir.sub("hatch.lock"), {}, true);
    REQUIRE(ctx.isErr());
    CHECK(ctx.error().code() == ErrorCode::PRIVILEGE_ERROR);
    CHECK_FALSE(fs::exists(dir.sub("hatch.lock")));
}

TEST_CASE("unwritable target directories are refused") {
    if (geteuid() == 0) {
        return;
    }
    TempDir dir;
    fs::create_directories(dir.sub("locked"));
    fs::permissions(dir.sub("locked"), fs::perms::owner_read | fs::perms::owner_exec);

    auto ctx = PrivilegeContext::acquire(dir.sub("hatch.lock"), {dir.sub("locked/deep/install")});
    fs::permissions(dir.sub("locked"), fs::perms::owner_all);

    REQUIRE(ctx.isErr());
    CHECK(ctx.error().code() == ErrorCode::PRIVILEGE_ERROR);
    CHECK(ctx.error().path() == dir.sub("locked"));
}

TEST_CASE("nearest_existing_ancestor walks up to an existing path") {
    TempDir dir;
    CHECK(nearest_existing_ancestor(dir.sub("a/b/c")) == dir.path());
    CHECK(nearest_existing_ancestor(dir.path()) == dir.path());
}

// ============================================================================
// Launcher
// ============================================================================

TEST_CASE("launch_detached starts a program and reports its pid") {
    LaunchRequest request;
    request.command = "true";
    auto launched = launch_detached(request);
    CHECK(launched.ok);
    CHECK(launched.pid > 0);
}

TEST_CASE("launch_detached reports a missing program") {
    LaunchRequest request;
    request.command = "/nonexistent/hatch-test-binary";
    auto launched = launch_detached(request);
    CHECK_FALSE(launched.ok);
    CHECK_FALSE(launched.error.empty());
}
