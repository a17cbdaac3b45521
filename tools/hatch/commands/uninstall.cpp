/**
 * hatch CLI - uninstall command
 *
 * Reverse everything an install recorded.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace hatch::cli::commands {

namespace {

struct UninstallCmdOptions {
    std::string install_id;
    bool silent = false;
};

int cmd_uninstall(const GlobalOptions& opts, const UninstallCmdOptions& cmd) {
    auto config = load_engine_config(opts);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return exit_code_for(config.error());
    }

    auto acquired = PrivilegeContext::acquire(config.value().lockPath(),
                                              session_directories(config.value()),
                                              config.value().privilege.require_root);
    if (acquired.isErr()) {
        print_error(acquired.error(), opts.json);
        return exit_code_for(acquired.error());
    }

    auto store = FileStore::open(config.value().paths.store);
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return exit_code_for(store.error());
    }
    FileJournal journal(config.value().paths.journal_dir);

    Installer installer(config.value(), store.value(), journal);
    auto outcome = installer.uninstall(cmd.install_id);
    if (outcome.isErr()) {
        print_error(outcome.error(), opts.json, &installer.warnings());
        return exit_code_for(outcome.error());
    }

    const auto& o = outcome.value();
    const auto& collector = installer.warnings();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !collector.has_errors();
        j["install_id"] = o.install_id;
        j["reversed"] = o.reversed;
        j["orphaned"] = o.orphaned;
        j["files_removed"] = o.files_removed;
        j["files_kept"] = o.files_kept;
        j["shortcuts_removed"] = o.shortcuts_removed;
        j["warnings"] = warnings_to_json(collector);
        output_json(j);
    } else {
        print_warnings(collector, opts.quiet || cmd.silent);
        if (!opts.quiet) {
            std::cout << "Uninstalled " << o.install_id << std::endl;
            std::cout << "  store entries reversed: " << o.reversed;
            if (o.orphaned > 0) {
                std::cout << " (" << o.orphaned << " kept for retry)";
            }
            std::cout << std::endl;
            std::cout << "  files removed:          " << o.files_removed;
            if (o.files_kept > 0) {
                std::cout << " (" << o.files_kept << " modified, kept)";
            }
            std::cout << std::endl;
            std::cout << "  shortcuts removed:      " << o.shortcuts_removed << std::endl;
        }
    }

    // Partial failures are reported, not fatal
    return session_exit_code(collector);
}

} // anonymous namespace

void setup_uninstall(CLI::App* app, GlobalOptions& opts) {
    static UninstallCmdOptions cmd;

    app->add_option("install_id", cmd.install_id, "Installed application id")->required();
    app->add_flag("--silent", cmd.silent, "Unattended: do not print warnings");

    app->callback([&opts]() {
        std::exit(cmd_uninstall(opts, cmd));
    });
}

} // namespace hatch::cli::commands
