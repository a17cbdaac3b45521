#include <doctest/doctest.h>
#include <hatch/config.hpp>
#include <hatch/plan.hpp>

#include "../test_support.hpp"

#include <cstdlib>

using namespace hatch;
using hatch_test::TempDir;
using hatch_test::write_text;

namespace {

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            had_ = true;
            old_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~EnvGuard() {
        if (had_) {
            setenv(name_.c_str(), old_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::string old_;
    bool had_ = false;
};

} // namespace

TEST_CASE("defaults live under the state root") {
    auto config = get_default_config("/var/lib/hatch");
    CHECK(config.paths.store == "/var/lib/hatch/store.json");
    CHECK(config.paths.journal_dir == "/var/lib/hatch/journal");
    CHECK(config.paths.records_dir == "/var/lib/hatch/records");
    CHECK(config.store.classes_root == DEFAULT_CLASSES_ROOT);
    CHECK(config.log.level == "warn");
    CHECK_FALSE(config.privilege.require_root);
    CHECK(config.lockPath() == "/var/lib/hatch/hatch.lock");
}

TEST_CASE("applications dir follows XDG_DATA_HOME") {
    EnvGuard xdg("XDG_DATA_HOME", "/home/u/.data");
    auto config = get_default_config("/r");
    CHECK(config.paths.applications_dir == "/home/u/.data/applications");
}

TEST_CASE("parse config overrides and resolves relative paths") {
    auto r = parse_config_full(R"({
        "$schema": "hatch.config.v1",
        "paths": { "store": "db/store.json", "desktop_dir": "/srv/desk" },
        "store": { "classes_root": "HKCU\\Software\\Classes" },
        "privilege": { "require_root": true },
        "log": { "level": "DEBUG" },
        "warnings": { "preexisting_key_deleted": "error", "launch_failed": "ignore" }
    })", "/r");
    REQUIRE(r.ok);
    CHECK(r.config.paths.store == "/r/db/store.json");
    CHECK(r.config.paths.desktop_dir == "/srv/desk");
    CHECK(r.config.paths.journal_dir == "/r/journal");
    CHECK(r.config.store.classes_root == "HKCU\\Software\\Classes");
    CHECK(r.config.privilege.require_root);
    CHECK(r.config.log.level == "debug");
    CHECK(r.config.warnings.at("preexisting_key_deleted") == WarningAction::Error);
    CHECK(r.config.warnings.at("launch_failed") == WarningAction::Ignore);
    CHECK(r.warnings.empty());
}

TEST_CASE("parse config rejects invalid values") {
    CHECK_FALSE(parse_config_full(R"({"paths": {}})", "/r").ok);
    CHECK_FALSE(parse_config_full(R"({"$schema": "hatch.config.v1", "log": {"level": "loud"}})", "/r").ok);
    CHECK_FALSE(parse_config_full(R"({"$schema": "hatch.config.v1", "privilege": {"require_root": "yes"}})", "/r").ok);
    CHECK_FALSE(parse_config_full(R"({"$schema": "hatch.config.v1", "store": {"classes_root": " "}})", "/r").ok);
    CHECK_FALSE(parse_config_full("{", "/r").ok);
}

TEST_CASE("unknown warning keys and actions are reported, not fatal") {
    auto r = parse_config_full(R"({
        "$schema": "hatch.config.v1",
        "warnings": { "made_up": "warn", "launch_failed": "explode" }
    })", "/r");
    REQUIRE(r.ok);
    CHECK(r.warnings.size() == 2);
    CHECK(r.config.warnings.count("launch_failed") == 0);
}

TEST_CASE("load_config without a file yields defaults") {
    TempDir dir;
    EnvGuard level("HATCH_LOG_LEVEL", nullptr);
    auto config = load_config(dir.path());
    REQUIRE(config.isOk());
    CHECK(config.value().paths.store == dir.sub("store.json"));
}

TEST_CASE("load_config fails on an explicit missing file or a malformed one") {
    TempDir dir;
    auto missing = load_config(dir.path(), dir.sub("nope.json"));
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::CONFIGURATION_ERROR);

    write_text(dir.sub("config.json"), R"({"$schema": "wrong"})");
    auto bad = load_config(dir.path());
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("environment overrides apply last") {
    TempDir dir;
    write_text(dir.sub("config.json"), R"({
        "$schema": "hatch.config.v1",
        "paths": { "applications_dir": "apps" },
        "log": { "level": "info" }
    })");
    EnvGuard apps("HATCH_APPLICATIONS_DIR", "/env/apps");
    EnvGuard level("HATCH_LOG_LEVEL", "trace");

    auto config = load_config(dir.path());
    REQUIRE(config.isOk());
    CHECK(config.value().paths.applications_dir == "/env/apps");
    CHECK(config.value().log.level == "trace");
}

TEST_CASE("state root resolution order") {
    EnvGuard root("HATCH_ROOT", "/env/root");
    CHECK(resolve_state_root(std::string("/flag/root")) == "/flag/root");
    CHECK(resolve_state_root(std::nullopt) == "/env/root");

    EnvGuard no_root("HATCH_ROOT", nullptr);
    EnvGuard xdg("XDG_DATA_HOME", "/xdg");
    CHECK(resolve_state_root(std::nullopt) == "/xdg/hatch");
}

TEST_CASE("log level names") {
    CHECK(is_valid_log_level("trace"));
    CHECK(is_valid_log_level("Warning"));
    CHECK(is_valid_log_level("off"));
    CHECK_FALSE(is_valid_log_level("verbose"));
    CHECK_FALSE(apply_log_level("verbose"));
    CHECK(apply_log_level("warn"));
}
