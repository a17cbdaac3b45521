/**
 * hatch CLI - Entry Point
 *
 * Install, register and uninstall applications described by a manifest.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef HATCH_VERSION
#define HATCH_VERSION "0.0.0"
#endif

// Forward declarations for commands
namespace hatch::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_uninstall(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_show(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace hatch::cli;

    CLI::App app{"hatch - declarative application installer"};
    app.set_version_flag("-V,--version", HATCH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "State root directory");
    app.add_option("--config", opts.config, "Configuration file (default: <root>/config.json)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install an application from a manifest");
    commands::setup_install(install_cmd, opts);

    auto* uninstall_cmd = app.add_subcommand("uninstall", "Remove an installed application");
    commands::setup_uninstall(uninstall_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List installed applications");
    commands::setup_list(list_cmd, opts);

    auto* show_cmd = app.add_subcommand("show", "Show an install record and its journal");
    commands::setup_show(show_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
