#include <doctest/doctest.h>
#include <hatch/tasks.hpp>

#include "../test_support.hpp"

using namespace hatch;

namespace {

Manifest sample() {
    auto parsed = parse_manifest_full(hatch_test::sample_manifest_json());
    REQUIRE(parsed.ok);
    return parsed.manifest;
}

} // namespace

TEST_CASE("defaults apply when nothing is chosen") {
    auto selection = resolve_selected_tasks(sample(), {});
    REQUIRE(selection.isOk());
    CHECK(selection.value().count("assoc") == 1);
    CHECK(selection.value().count("desktopicon") == 0);
}

TEST_CASE("explicit choices override defaults") {
    TaskChoices choices{{"assoc", false}, {"desktopicon", true}};
    auto selection = resolve_selected_tasks(sample(), choices);
    REQUIRE(selection.isOk());
    CHECK(selection.value() == TaskSelection{"desktopicon"});
}

TEST_CASE("choosing an undeclared task is a configuration error") {
    auto selection = resolve_selected_tasks(sample(), {{"quicklaunch", true}});
    REQUIRE(selection.isErr());
    CHECK(selection.error().code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(selection.error().message().find("quicklaunch") != std::string::npos);
}

TEST_CASE("parse_task_choices handles selection, negation and whitespace") {
    auto choices = parse_task_choices(" assoc , !desktopicon,,");
    REQUIRE(choices.isOk());
    REQUIRE(choices.value().size() == 2);
    CHECK(choices.value().at("assoc"));
    CHECK_FALSE(choices.value().at("desktopicon"));

    auto empty = parse_task_choices("");
    REQUIRE(empty.isOk());
    CHECK(empty.value().empty());
}

TEST_CASE("choosing a task both ways is rejected") {
    auto choices = parse_task_choices("assoc,!assoc");
    REQUIRE(choices.isErr());
    CHECK(choices.error().code() == ErrorCode::CONFIGURATION_ERROR);

    TaskChoices manual;
    CHECK(add_task_choice(manual, "assoc", true).isOk());
    CHECK(add_task_choice(manual, "assoc", true).isOk());
    CHECK(add_task_choice(manual, "assoc", false).isErr());
    CHECK(add_task_choice(manual, "", true).isErr());
}

TEST_CASE("ungated steps always run") {
    TaskSelection selection{"assoc"};
    CHECK(is_step_selected("", selection));
    CHECK(is_step_selected("assoc", selection));
    CHECK_FALSE(is_step_selected("desktopicon", selection));
    CHECK(is_step_selected("", {}));
}
