/**
 * hatch CLI - show command
 *
 * Print an install record and its journal.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace hatch::cli::commands {

namespace {

struct ShowCmdOptions {
    std::string install_id;
};

nlohmann::json entry_to_json(const JournalEntry& e) {
    nlohmann::json j;
    j["path"] = e.operation.path;
    j["value"] = display_value_name(e.operation.value_name);
    j["data"] = e.operation.data;
    j["uninstall"] = rollback_policy_to_string(e.operation.rollback);
    j["mode"] = write_mode_to_string(e.operation.mode);
    j["prior_value_present"] = e.prior_value_present;
    if (e.prior_value) {
        j["prior_value"] = *e.prior_value;
    }
    j["prior_key_present"] = e.prior_key_present;
    j["applied_at"] = e.applied_at;
    j["run_id"] = e.run_id;
    return j;
}

int cmd_show(const GlobalOptions& opts, const ShowCmdOptions& cmd) {
    auto config = load_engine_config(opts);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return exit_code_for(config.error());
    }

    WarningCollector collector(config.value().warnings);
    FileJournal journal(config.value().paths.journal_dir);
    journal.attachWarnings(&collector);

    auto record = load_install_record(config.value().paths.records_dir, cmd.install_id);
    if (record.isErr()) {
        print_error(record.error(), opts.json);
        return exit_code_for(record.error());
    }
    auto entries = journal.allEntries(cmd.install_id);
    if (entries.isErr()) {
        print_error(entries.error(), opts.json);
        return exit_code_for(entries.error());
    }

    if (!record.value() && entries.value().empty()) {
        Error error(ErrorCode::NOT_INSTALLED, "'" + cmd.install_id + "' is not installed");
        print_error(error, opts.json);
        return exit_code_for(error);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["install_id"] = cmd.install_id;
        if (record.value()) {
            j["record"] = nlohmann::json::parse(serialize_install_record(*record.value()));
        } else {
            j["record"] = nullptr;
        }
        j["journal"] = nlohmann::json::array();
        for (const auto& e : entries.value()) {
            j["journal"].push_back(entry_to_json(e));
        }
        j["warnings"] = warnings_to_json(collector);
        output_json(j);
        return 0;
    }

    print_warnings(collector, opts.quiet);

    if (const auto& r = record.value()) {
        std::cout << r->app.name << " " << r->app.version << " (" << r->install.install_id << ")"
                  << std::endl;
        std::cout << "  install root: " << r->paths.install_root << std::endl;
        std::cout << "  installed:    " << r->provenance.installed_at << std::endl;
        if (r->provenance.updated_at != r->provenance.installed_at) {
            std::cout << "  updated:      " << r->provenance.updated_at << std::endl;
        }
        std::cout << "  tasks:       ";
        for (const auto& t : r->selected_tasks) std::cout << " " << t;
        std::cout << std::endl;
        std::cout << "  files:        " << r->files.size() << std::endl;
        if (opts.verbose) {
            for (const auto& f : r->files) {
                std::cout << "    " << f.path << "  " << f.sha256.substr(0, 12) << std::endl;
            }
        }
        for (const auto& s : r->shortcuts) {
            std::cout << "  shortcut:     " << s.path << std::endl;
        }
    } else {
        std::cout << cmd.install_id << " (no install record)" << std::endl;
    }

    std::cout << "  journal:      " << entries.value().size() << " entr"
              << (entries.value().size() == 1 ? "y" : "ies") << std::endl;
    for (const auto& e : entries.value()) {
        std::cout << "    " << e.operation.path << " [" << display_value_name(e.operation.value_name)
                  << "] " << rollback_policy_to_string(e.operation.rollback) << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_show(CLI::App* app, GlobalOptions& opts) {
    static ShowCmdOptions cmd;

    app->add_option("install_id", cmd.install_id, "Installed application id")->required();

    app->callback([&opts]() {
        std::exit(cmd_show(opts, cmd));
    });
}

} // namespace hatch::cli::commands
