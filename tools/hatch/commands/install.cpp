/**
 * hatch CLI - install command
 *
 * Deploy a manifest's payload, register its associations and create its
 * launchers.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace hatch::cli::commands {

namespace {

struct InstallCmdOptions {
    std::string manifest;
    std::string dir;
    std::string tasks;
    std::vector<std::string> with_tasks;
    std::vector<std::string> without_tasks;
    bool silent = false;
    bool dry_run = false;
};

Result<TaskChoices> collect_task_choices(const InstallCmdOptions& cmd) {
    auto choices = parse_task_choices(cmd.tasks);
    if (choices.isErr()) {
        return choices;
    }
    for (const auto& t : cmd.with_tasks) {
        auto added = add_task_choice(choices.value(), t, true);
        if (added.isErr()) return Result<TaskChoices>::err(added.error());
    }
    for (const auto& t : cmd.without_tasks) {
        auto added = add_task_choice(choices.value(), t, false);
        if (added.isErr()) return Result<TaskChoices>::err(added.error());
    }
    return choices;
}

nlohmann::json outcome_to_json(const InstallOutcome& outcome, const WarningCollector& collector) {
    nlohmann::json j;
    j["ok"] = !collector.has_errors();
    j["dry_run"] = outcome.dry_run;
    j["install_id"] = outcome.install_id;
    j["run_id"] = outcome.run_id;
    j["install_dir"] = outcome.install_dir;
    j["selected_tasks"] = outcome.selected_tasks;

    j["files"] = nlohmann::json::array();
    for (const auto& f : outcome.deployment.files) {
        nlohmann::json file = {{"path", f.relative_path}, {"copied", f.copied}};
        if (!f.sha256.empty()) file["sha256"] = f.sha256;
        if (!f.skip_reason.empty()) file["skip_reason"] = f.skip_reason;
        j["files"].push_back(std::move(file));
    }

    j["operations"] = nlohmann::json::array();
    for (const auto& op : outcome.plan) {
        j["operations"].push_back({
            {"path", op.path},
            {"value", display_value_name(op.value_name)},
            {"data", op.data},
            {"uninstall", rollback_policy_to_string(op.rollback)},
            {"mode", write_mode_to_string(op.mode)},
        });
    }
    j["integration"] = {
        {"applied", outcome.integration.applied},
        {"unchanged", outcome.integration.unchanged},
        {"journaled", outcome.integration.journaled},
    };

    j["shortcuts"] = nlohmann::json::array();
    for (const auto& s : outcome.shortcuts) {
        j["shortcuts"].push_back({{"name", s.name}, {"location", s.location}, {"path", s.path}});
    }
    j["launched"] = outcome.launched;
    j["warnings"] = warnings_to_json(collector);
    return j;
}

void print_outcome(const InstallOutcome& outcome, const GlobalOptions& opts) {
    if (opts.quiet) return;

    if (outcome.dry_run) {
        std::cout << "Dry run for " << outcome.install_id << " into " << outcome.install_dir
                  << std::endl;
        for (const auto& f : outcome.deployment.files) {
            std::cout << "  " << (f.copied ? "copy " : "keep ") << f.relative_path << std::endl;
        }
        for (const auto& op : outcome.plan) {
            std::cout << "  set  " << op.path << " [" << display_value_name(op.value_name)
                      << "] = \"" << op.data << "\" (" << rollback_policy_to_string(op.rollback)
                      << ")" << std::endl;
        }
        for (const auto& s : outcome.shortcuts) {
            std::cout << "  link " << s.path << std::endl;
        }
        return;
    }

    std::cout << "Installed " << outcome.install_id << " to " << outcome.install_dir << std::endl;
    std::cout << "  files:      " << outcome.deployment.copied << " copied, "
              << outcome.deployment.skipped << " unchanged" << std::endl;
    std::cout << "  store:      " << outcome.integration.applied << " written, "
              << outcome.integration.unchanged << " unchanged" << std::endl;
    std::cout << "  shortcuts:  " << outcome.shortcuts.size() << std::endl;
    if (opts.verbose && !outcome.selected_tasks.empty()) {
        std::cout << "  tasks:     ";
        for (const auto& t : outcome.selected_tasks) std::cout << " " << t;
        std::cout << std::endl;
    }
}

int cmd_install(const GlobalOptions& opts, const InstallCmdOptions& cmd) {
    auto config = load_engine_config(opts);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return exit_code_for(config.error());
    }

    auto manifest = load_manifest(cmd.manifest);
    if (manifest.isErr()) {
        print_error(manifest.error(), opts.json);
        return exit_code_for(manifest.error());
    }

    auto choices = collect_task_choices(cmd);
    if (choices.isErr()) {
        print_error(choices.error(), opts.json);
        return exit_code_for(choices.error());
    }

    InstallOptions install_opts;
    install_opts.task_choices = choices.value();
    install_opts.silent = cmd.silent;
    install_opts.dry_run = cmd.dry_run;
    if (!cmd.dir.empty()) {
        install_opts.install_dir = cmd.dir;
    }

    // Held until the command returns
    std::optional<PrivilegeContext> privilege;
    if (!cmd.dry_run) {
        auto install_dir = resolve_install_dir(manifest.value(), install_opts.install_dir);
        if (install_dir.isErr()) {
            print_error(install_dir.error(), opts.json);
            return exit_code_for(install_dir.error());
        }

        auto dirs = session_directories(config.value());
        dirs.push_back(install_dir.value());
        auto acquired = PrivilegeContext::acquire(config.value().lockPath(), dirs,
                                                  config.value().privilege.require_root);
        if (acquired.isErr()) {
            print_error(acquired.error(), opts.json);
            return exit_code_for(acquired.error());
        }
        privilege.emplace(std::move(acquired.value()));
    }

    auto store = FileStore::open(config.value().paths.store);
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return exit_code_for(store.error());
    }
    FileJournal journal(config.value().paths.journal_dir);

    Installer installer(config.value(), store.value(), journal);
    auto outcome = installer.install(manifest.value(), install_opts);
    if (outcome.isErr()) {
        print_error(outcome.error(), opts.json, &installer.warnings());
        return exit_code_for(outcome.error());
    }

    if (opts.json) {
        output_json(outcome_to_json(outcome.value(), installer.warnings()));
    } else {
        print_warnings(installer.warnings(), opts.quiet);
        print_outcome(outcome.value(), opts);
    }

    return session_exit_code(installer.warnings());
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallCmdOptions cmd;

    app->add_option("manifest", cmd.manifest, "Path to hatch.manifest.v1 JSON")->required();
    app->add_option("--dir", cmd.dir, "Install directory (overrides install.dir)");
    app->add_option("--tasks", cmd.tasks, "Task choices, e.g. \"txtassoc,!desktopicon\"");
    app->add_option("--task", cmd.with_tasks, "Select a task")->allow_extra_args(false);
    app->add_option("--no-task", cmd.without_tasks, "Deselect a task")->allow_extra_args(false);
    app->add_flag("--silent", cmd.silent, "Unattended: no post-install launch");
    app->add_flag("--dry-run", cmd.dry_run, "Show what would be done without changing anything");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, cmd));
    });
}

} // namespace hatch::cli::commands
