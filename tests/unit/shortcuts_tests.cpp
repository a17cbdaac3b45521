#include <doctest/doctest.h>
#include <hatch/expansion.hpp>
#include <hatch/shortcuts.hpp>

#include "../test_support.hpp"

#include <filesystem>

using namespace hatch;
using hatch_test::TempDir;
using hatch_test::read_text;
using hatch_test::write_text;

namespace fs = std::filesystem;

namespace {

ShortcutContext context_for(const TempDir& dir) {
    ShortcutContext ctx;
    ctx.applications_dir = dir.sub("applications");
    ctx.desktop_dir = dir.sub("Desktop");
    ctx.app_id = "com.example.appx";
    ctx.install_dir = dir.sub("AppX");
    ctx.constants = make_constants(ctx.install_dir, ctx.app_id, "App X", "1.4.0");
    return ctx;
}

ShortcutEntry shortcut(const std::string& name, ShortcutLocation location = ShortcutLocation::StartMenu,
                       const std::string& task = "") {
    ShortcutEntry s;
    s.display_name = name;
    s.target_path = "{app}/AppX.exe";
    s.location = location;
    s.gating_task = task;
    return s;
}

} // namespace

TEST_CASE("shortcut_file_name replaces unsafe characters") {
    CHECK(shortcut_file_name("com.example.appx", "App X") == "com.example.appx-App-X.desktop");
    CHECK(shortcut_file_name("tool", "a/b\\c") == "tool-a-b-c.desktop");
}

TEST_CASE("quote_exec_argument follows desktop entry quoting") {
    CHECK(quote_exec_argument("plain") == "plain");
    CHECK(quote_exec_argument("with space") == "\"with space\"");
    CHECK(quote_exec_argument("100%") == "100%%");
    CHECK(quote_exec_argument("$HOME") == "\"\\$HOME\"");
    CHECK(quote_exec_argument("") == "\"\"");
}

TEST_CASE("render_desktop_entry writes the launcher keys") {
    ShortcutEntry s;
    s.display_name = "App X";
    s.target_path = "/opt/App X/AppX.exe";
    s.arguments = {"--open", "%f"};
    s.icon = "/opt/App X/appx.png";
    s.comment = "Edit text";

    std::string text = render_desktop_entry(s, "com.example.appx", "/opt/App X");
    CHECK(text.rfind("[Desktop Entry]\n", 0) == 0);
    CHECK(text.find("Type=Application\n") != std::string::npos);
    CHECK(text.find("Name=App X\n") != std::string::npos);
    CHECK(text.find("Exec=\"/opt/App X/AppX.exe\" --open %%f\n") != std::string::npos);
    CHECK(text.find("Path=/opt/App X\n") != std::string::npos);
    CHECK(text.find("Icon=/opt/App X/appx.png\n") != std::string::npos);
    CHECK(text.find("Comment=Edit text\n") != std::string::npos);
    CHECK(text.find("X-Hatch-AppId=com.example.appx\n") != std::string::npos);
}

TEST_CASE("create_shortcuts writes launchers for selected entries") {
    TempDir dir;
    auto ctx = context_for(dir);
    ctx.selection = {"desktopicon"};
    write_text(dir.sub("AppX/AppX.exe"), "exe");

    WarningCollector collector;
    auto created = create_shortcuts({shortcut("App X"),
                                     shortcut("App X", ShortcutLocation::Desktop, "desktopicon")},
                                    ctx, collector);
    REQUIRE(created.isOk());
    REQUIRE(created.value().size() == 2);

    const auto& menu = created.value()[0];
    CHECK(menu.location == "start_menu");
    CHECK(menu.path == dir.sub("applications/com.example.appx-App-X.desktop"));
    CHECK(read_text(menu.path).find("Exec=" + dir.sub("AppX/AppX.exe")) != std::string::npos);

    const auto& desktop = created.value()[1];
    CHECK(desktop.location == "desktop");
    auto perms = fs::status(desktop.path).permissions();
    CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
    CHECK_FALSE(collector.has_effective_warnings());
}

TEST_CASE("create_shortcuts honours task gating") {
    TempDir dir;
    auto ctx = context_for(dir);
    write_text(dir.sub("AppX/AppX.exe"), "exe");

    WarningCollector collector;
    auto created = create_shortcuts({shortcut("App X", ShortcutLocation::Desktop, "desktopicon")},
                                    ctx, collector);
    REQUIRE(created.isOk());
    CHECK(created.value().empty());
    CHECK_FALSE(fs::exists(dir.sub("Desktop")));
}

TEST_CASE("create_shortcuts skips a shortcut whose target is missing") {
    TempDir dir;
    auto ctx = context_for(dir);

    WarningCollector collector;
    auto created = create_shortcuts({shortcut("App X")}, ctx, collector);
    REQUIRE(created.isOk());
    CHECK(created.value().empty());

    auto list = collector.get_warnings();
    REQUIRE(list.size() == 1);
    CHECK(list[0].key == "shortcut_skipped");
    CHECK(list[0].fields.at("name") == "App X");
}

TEST_CASE("create_shortcuts in dry run reports paths only") {
    TempDir dir;
    auto ctx = context_for(dir);
    ctx.dry_run = true;

    WarningCollector collector;
    auto created = create_shortcuts({shortcut("App X")}, ctx, collector);
    REQUIRE(created.isOk());
    REQUIRE(created.value().size() == 1);
    CHECK_FALSE(fs::exists(created.value()[0].path));
}

TEST_CASE("create_shortcuts reports unwritable locations as deployment errors") {
    TempDir dir;
    auto ctx = context_for(dir);
    write_text(dir.sub("AppX/AppX.exe"), "exe");
    write_text(dir.sub("applications"), "not a directory");

    WarningCollector collector;
    auto created = create_shortcuts({shortcut("App X")}, ctx, collector);
    REQUIRE(created.isErr());
    CHECK(created.error().code() == ErrorCode::DEPLOYMENT_ERROR);
}

TEST_CASE("remove_shortcuts is idempotent") {
    TempDir dir;
    write_text(dir.sub("applications/a.desktop"), "x");
    std::vector<CreatedShortcut> shortcuts = {
        {"A", "start_menu", dir.sub("applications/a.desktop")},
        {"B", "desktop", dir.sub("Desktop/b.desktop")},
    };

    CHECK(remove_shortcuts(shortcuts).isOk());
    CHECK_FALSE(fs::exists(dir.sub("applications/a.desktop")));
    CHECK(remove_shortcuts(shortcuts).isOk());
}
