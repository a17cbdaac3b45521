#include <doctest/doctest.h>
#include <hatch/expansion.hpp>
#include <hatch/plan.hpp>

#include "../test_support.hpp"

using namespace hatch;

namespace {

Manifest sample() {
    auto parsed = parse_manifest_full(hatch_test::sample_manifest_json());
    REQUIRE(parsed.ok);
    return parsed.manifest;
}

ConstantMap constants_for(const Manifest& m) {
    return make_constants("/opt/AppX", m.app_id, m.app_name, m.version);
}

AssociationRule rule(const std::string& ext, const std::string& prog_id, const std::string& task = "") {
    AssociationRule r;
    r.extension = ext;
    r.prog_id = prog_id;
    r.friendly_name = prog_id;
    r.icon_ref = "{app}/" + prog_id + ".png";
    r.open_command_template = "{app}/open-" + prog_id + " %1";
    r.gating_task = task;
    return r;
}

} // namespace

TEST_CASE("text association plan matches the documented operations") {
    auto m = sample();
    auto plan = build_integration_plan(m, {"assoc"}, constants_for(m));
    REQUIRE(plan.isOk());
    const auto& ops = plan.value();
    REQUIRE(ops.size() == 8);

    CHECK(ops[0].path == "Software\\Classes\\.txt\\OpenWithProgids");
    CHECK(ops[0].value_name == "AppX.txt");
    CHECK(ops[0].data.empty());
    CHECK(ops[0].mode == WriteMode::AppendListMember);
    CHECK(ops[0].rollback == RollbackPolicy::DeleteValueOnUninstall);

    CHECK(ops[1].path == "Software\\Classes\\AppX.txt");
    CHECK(ops[1].value_name.empty());
    CHECK(ops[1].data == "Text Document");
    CHECK(ops[1].rollback == RollbackPolicy::DeleteWholeKeyOnUninstall);

    CHECK(ops[2].path == "Software\\Classes\\AppX.txt\\DefaultIcon");
    CHECK(ops[2].data == "/opt/AppX\\AppX.exe,0");

    CHECK(ops[3].path == "Software\\Classes\\AppX.txt\\shell\\open\\command");
    CHECK(ops[3].data == "\"/opt/AppX\\AppX.exe\" \"%1\"");

    CHECK(ops[4].path == "Software\\Classes\\Applications\\AppX.exe\\SupportedTypes");
    CHECK(ops[4].value_name == ".txt");
    CHECK(ops[5].path == "Software\\Classes\\Applications\\AppX.exe\\DefaultIcon");
    CHECK(ops[6].path == "Software\\Classes\\Applications\\AppX.exe\\shell\\open\\command");
    CHECK(ops[6].data == ops[3].data);

    CHECK(ops[7].path == "Software\\Example\\AppX");
    CHECK(ops[7].value_name == "InstallDir");
    CHECK(ops[7].data == "/opt/AppX");
    CHECK(ops[7].gating_task.empty());

    for (size_t i = 0; i < 7; ++i) {
        CHECK(ops[i].gating_task == "assoc");
    }
}

TEST_CASE("the shared extension key itself is never deleted whole") {
    auto m = sample();
    auto plan = build_integration_plan(m, {"assoc"}, constants_for(m));
    REQUIRE(plan.isOk());
    for (const auto& op : plan.value()) {
        if (op.rollback == RollbackPolicy::DeleteWholeKeyOnUninstall) {
            CHECK_FALSE(key_path_within("Software\\Classes\\.txt", op.path));
        }
    }
}

TEST_CASE("deselected association contributes nothing") {
    auto m = sample();
    auto plan = build_integration_plan(m, {}, constants_for(m));
    REQUIRE(plan.isOk());
    REQUIRE(plan.value().size() == 1);
    CHECK(plan.value()[0].origin == "registry[0]");
}

TEST_CASE("application entry lists every selected extension once") {
    auto m = sample();
    m.associations.push_back(rule(".md", "AppX.md"));
    m.associations.push_back(rule(".log", "AppX.log", "desktopicon"));

    auto plan = build_integration_plan(m, {"assoc"}, constants_for(m));
    REQUIRE(plan.isOk());
    const auto& ops = plan.value();

    std::vector<std::string> supported;
    for (const auto& op : ops) {
        if (key_path_equal(op.path, "Software\\Classes\\Applications\\AppX.exe\\SupportedTypes")) {
            supported.push_back(op.value_name);
        }
    }
    CHECK(supported == std::vector<std::string>{".txt", ".md"});
    CHECK(ops.size() == 4 + 4 + 2 + 2 + 1);
}

TEST_CASE("custom classes root is honoured") {
    auto m = sample();
    auto plan = build_integration_plan(m, {"assoc"}, constants_for(m), "\\Classes\\");
    REQUIRE(plan.isOk());
    CHECK(plan.value()[0].path == "Classes\\.txt\\OpenWithProgids");

    auto bad = build_integration_plan(m, {"assoc"}, constants_for(m), "");
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("authored entries keep their rollback policy verbatim") {
    auto m = sample();
    RegistryEntry leave;
    leave.path = "Software\\Example\\Shared\\";
    leave.value_name = "Plugin";
    leave.data = "{appid}";
    leave.rollback = RollbackPolicy::LeaveInPlaceOnUninstall;
    m.registry.push_back(leave);

    auto plan = build_integration_plan(m, {}, constants_for(m));
    REQUIRE(plan.isOk());
    REQUIRE(plan.value().size() == 2);
    CHECK(plan.value()[1].path == "Software\\Example\\Shared");
    CHECK(plan.value()[1].data == "com.example.appx");
    CHECK(plan.value()[1].rollback == RollbackPolicy::LeaveInPlaceOnUninstall);
}

TEST_CASE("plan construction fails on unresolved constants") {
    auto m = sample();
    m.registry[0].data = "{userdocs}";
    auto plan = build_integration_plan(m, {}, constants_for(m));
    REQUIRE(plan.isErr());
    CHECK(plan.error().code() == ErrorCode::CONFIGURATION_ERROR);
}
