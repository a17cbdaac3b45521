#include <doctest/doctest.h>
#include <hatch/manifest.hpp>

#include "../test_support.hpp"

using namespace hatch;
using hatch_test::TempDir;
using hatch_test::sample_manifest_json;
using hatch_test::write_text;

namespace {

std::string minimal(const std::string& extra = "") {
    return R"({
        "$schema": "hatch.manifest.v1",
        "app": { "id": "com.example.tool", "version": "1.0.0" },
        "install": { "dir": "/opt/tool" })" + extra + "}";
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("parse sample manifest") {
    auto r = parse_manifest_full(sample_manifest_json(), "/src/appx/hatch.json");
    REQUIRE(r.ok);
    const auto& m = r.manifest;
    CHECK(m.app_id == "com.example.appx");
    CHECK(m.app_name == "App X");
    CHECK(m.version == "1.4.0");
    CHECK(m.executable == "AppX.exe");
    CHECK(m.install_dir == "/opt/AppX");
    CHECK(m.payload_root == "/src/appx");

    REQUIRE(m.payload_files.size() == 2);
    CHECK(m.payload_files[1].recurse);
    CHECK(m.payload_files[0].overwrite == OverwritePolicy::Always);

    REQUIRE(m.tasks.size() == 2);
    CHECK(m.tasks[0].default_selected);
    CHECK_FALSE(m.tasks[1].default_selected);

    REQUIRE(m.associations.size() == 1);
    CHECK(m.associations[0].icon_ref == "{app}\\AppX.exe,0");
    CHECK(m.associations[0].gating_task == "assoc");

    REQUIRE(m.registry.size() == 1);
    CHECK(m.registry[0].rollback == RollbackPolicy::DeleteWholeKeyOnUninstall);

    REQUIRE(m.shortcuts.size() == 2);
    CHECK(m.shortcuts[1].location == ShortcutLocation::Desktop);
    CHECK_FALSE(m.post_install_run.has_value());
}

TEST_CASE("app.name defaults to app.id and dest defaults to the source file name") {
    auto r = parse_manifest_full(minimal(R"(, "files": [{ "source": "bin/tool" }])"));
    REQUIRE(r.ok);
    CHECK(r.manifest.app_name == "com.example.tool");
    REQUIRE(r.manifest.payload_files.size() == 1);
    CHECK(r.manifest.payload_files[0].dest_relative_path == "tool");
}

TEST_CASE("parse post-install run command") {
    auto r = parse_manifest_full(minimal(
        R"(, "run": { "command": "{app}/tool", "arguments": ["--first-run"] })"));
    REQUIRE(r.ok);
    REQUIRE(r.manifest.post_install_run);
    CHECK(r.manifest.post_install_run->command == "{app}/tool");
    REQUIRE(r.manifest.post_install_run->arguments.size() == 1);
}

TEST_CASE("reject wrong schema and missing sections") {
    CHECK_FALSE(parse_manifest_full(R"({"app": {}})").ok);
    CHECK_FALSE(parse_manifest_full(R"({"$schema": "other"})").ok);
    CHECK_FALSE(parse_manifest_full(R"({"$schema": "hatch.manifest.v1", "install": {"dir": "/x"}})").ok);
    CHECK_FALSE(parse_manifest_full("not json").ok);
    CHECK_FALSE(parse_manifest_full("[]").ok);
}

TEST_CASE("registry entry without an uninstall policy is rejected") {
    auto r = parse_manifest_full(minimal(
        R"(, "registry": [{ "path": "Software\\Example", "data": "x" }])"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("uninstall missing") != std::string::npos);
}

TEST_CASE("invalid enum values are rejected") {
    CHECK_FALSE(parse_manifest_full(minimal(
        R"(, "registry": [{ "path": "A", "uninstall": "sometimes" }])")).ok);
    CHECK_FALSE(parse_manifest_full(minimal(
        R"(, "files": [{ "source": "a", "overwrite": "never" }])")).ok);
    CHECK_FALSE(parse_manifest_full(minimal(
        R"(, "shortcuts": [{ "name": "a", "target": "b", "location": "dock" }])")).ok);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("unknown task reference is a configuration error") {
    auto r = parse_manifest_full(minimal(
        R"(, "registry": [{ "path": "A", "uninstall": "leave", "task": "nope" }])"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("unknown task 'nope'") != std::string::npos);
}

TEST_CASE("duplicate task ids are rejected") {
    auto r = parse_manifest_full(minimal(R"(, "tasks": [{ "id": "a" }, { "id": "a" }])"));
    CHECK_FALSE(r.ok);
}

TEST_CASE("install.dir cannot reference {app}") {
    auto r = parse_manifest_full(R"({
        "$schema": "hatch.manifest.v1",
        "app": { "id": "x", "version": "1.0.0" },
        "install": { "dir": "{app}/x" }
    })");
    CHECK_FALSE(r.ok);
}

TEST_CASE("unknown constants are rejected before anything runs") {
    auto r = parse_manifest_full(minimal(
        R"(, "registry": [{ "path": "A", "data": "{userdocs}", "uninstall": "leave" }])"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("{userdocs}") != std::string::npos);
}

TEST_CASE("destinations escaping the install directory are rejected") {
    CHECK_FALSE(parse_manifest_full(minimal(
        R"(, "files": [{ "source": "a", "dest": "../a" }])")).ok);
    CHECK_FALSE(parse_manifest_full(minimal(
        R"(, "files": [{ "source": "a", "dest": "/etc/a" }])")).ok);
}

TEST_CASE("associations require an executable and well formed extensions") {
    const char* assoc = R"(, "associations": [{ "extension": ".txt", "prog_id": "T.txt", "command": "x" }])";
    CHECK_FALSE(parse_manifest_full(minimal(assoc)).ok);

    auto bad_ext = parse_manifest_full(R"({
        "$schema": "hatch.manifest.v1",
        "app": { "id": "x", "version": "1.0.0", "executable": "x" },
        "install": { "dir": "/opt/x" },
        "associations": [{ "extension": "txt", "prog_id": "X.txt", "command": "x" }]
    })");
    CHECK_FALSE(bad_ext.ok);

    auto duplicate = parse_manifest_full(R"({
        "$schema": "hatch.manifest.v1",
        "app": { "id": "x", "version": "1.0.0", "executable": "x" },
        "install": { "dir": "/opt/x" },
        "associations": [
            { "extension": ".txt", "prog_id": "X.txt", "command": "x" },
            { "extension": ".txt", "prog_id": "X.text", "command": "x" }
        ]
    })");
    CHECK_FALSE(duplicate.ok);

    auto differ_in_case = parse_manifest_full(R"({
        "$schema": "hatch.manifest.v1",
        "app": { "id": "x", "version": "1.0.0", "executable": "x" },
        "install": { "dir": "/opt/x" },
        "associations": [
            { "extension": ".txt", "prog_id": "X.txt", "command": "x" },
            { "extension": ".TXT", "prog_id": "X.TXT", "command": "x" }
        ]
    })");
    CHECK_FALSE(differ_in_case.ok);
    CHECK(differ_in_case.error.find("duplicate extension .TXT") != std::string::npos);
}

TEST_CASE("app.id must be usable as a file name") {
    Manifest m;
    m.app_id = "com/example";
    m.install_dir = "/opt/x";
    auto r = validate_manifest(m);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("duplicate shortcut names are allowed in different locations only") {
    auto r = parse_manifest_full(minimal(R"(, "shortcuts": [
        { "name": "Tool", "target": "{app}/tool" },
        { "name": "Tool", "target": "{app}/tool" }
    ])"));
    CHECK_FALSE(r.ok);
}

// ============================================================================
// Loading and payload resolution
// ============================================================================

TEST_CASE("load_manifest reports unreadable and invalid files as configuration errors") {
    TempDir dir;
    auto missing = load_manifest(dir.sub("missing.json"));
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::CONFIGURATION_ERROR);

    write_text(dir.sub("bad.json"), "{");
    auto bad = load_manifest(dir.sub("bad.json"));
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(bad.error().path() == dir.sub("bad.json"));
}

TEST_CASE("resolve_payload_files expands recursive entries in sorted order") {
    TempDir dir;
    write_text(dir.sub("payload/AppX.exe"), "exe");
    write_text(dir.sub("payload/docs/b.txt"), "b");
    write_text(dir.sub("payload/docs/a/readme.txt"), "readme");
    write_text(dir.sub("hatch.json"), sample_manifest_json());

    auto m = load_manifest(dir.sub("hatch.json"));
    REQUIRE(m.isOk());

    auto files = resolve_payload_files(m.value());
    REQUIRE(files.isOk());
    const auto& list = files.value();
    REQUIRE(list.size() == 3);
    CHECK(list[0].dest_relative_path == "AppX.exe");
    CHECK(list[0].source_path == dir.sub("payload/AppX.exe"));
    CHECK(list[1].dest_relative_path == "docs/a/readme.txt");
    CHECK(list[2].dest_relative_path == "docs/b.txt");
    CHECK_FALSE(list[1].recurse);
}

TEST_CASE("resolve_payload_files fails on a missing source directory") {
    TempDir dir;
    write_text(dir.sub("hatch.json"), sample_manifest_json());
    auto m = load_manifest(dir.sub("hatch.json"));
    REQUIRE(m.isOk());

    auto files = resolve_payload_files(m.value());
    REQUIRE(files.isErr());
    CHECK(files.error().code() == ErrorCode::DEPLOYMENT_ERROR);
}
