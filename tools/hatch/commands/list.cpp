/**
 * hatch CLI - list command
 *
 * List installed applications.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>

namespace hatch::cli::commands {

namespace {

int cmd_list(const GlobalOptions& opts) {
    auto config = load_engine_config(opts);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return exit_code_for(config.error());
    }

    auto records = list_install_records(config.value().paths.records_dir);
    FileJournal journal(config.value().paths.journal_dir);

    // Journals without a record: interrupted installs or orphans
    std::vector<std::string> journal_only;
    for (const auto& id : journal.installIds()) {
        auto has_record = [&](const InstallRecord& r) { return r.install.install_id == id; };
        if (std::none_of(records.begin(), records.end(), has_record)) {
            journal_only.push_back(id);
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["installs"] = nlohmann::json::array();
        for (const auto& r : records) {
            j["installs"].push_back({
                {"id", r.install.install_id},
                {"name", r.app.name},
                {"version", r.app.version},
                {"install_root", r.paths.install_root},
                {"installed_at", r.provenance.installed_at},
            });
        }
        j["journal_only"] = journal_only;
        output_json(j);
        return 0;
    }

    if (records.empty() && journal_only.empty()) {
        if (!opts.quiet) {
            std::cout << "No applications installed" << std::endl;
        }
        return 0;
    }

    for (const auto& r : records) {
        std::cout << r.install.install_id << "  " << r.app.version << "  "
                  << r.paths.install_root << std::endl;
    }
    for (const auto& id : journal_only) {
        std::cout << id << "  (journal only)" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_list(opts));
    });
}

} // namespace hatch::cli::commands
