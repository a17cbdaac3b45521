#pragma once

/**
 * @file installer.hpp
 * @brief Install and uninstall sessions
 *
 * Installer drives one session end to end:
 *
 *   install:   validate -> select tasks -> plan -> deploy files ->
 *              apply store operations (journaled) -> shortcuts ->
 *              install record -> optional post-install launch
 *   uninstall: reverse journal newest first -> remove shortcuts ->
 *              remove unmodified files -> remove record
 *
 * The caller holds the PrivilegeContext for the duration of a session.
 *
 * @example
 * ```cpp
 * hatch::FileJournal journal(config.paths.journal_dir);
 * hatch::Installer installer(config, store, journal);
 * auto outcome = installer.install(manifest, {});
 * if (outcome.isErr()) {
 *     return hatch::exit_code_for(outcome.error());
 * }
 * ```
 */

#include "hatch/config.hpp"
#include "hatch/deploy.hpp"
#include "hatch/install_record.hpp"
#include "hatch/integration.hpp"
#include "hatch/journal.hpp"
#include "hatch/manifest.hpp"
#include "hatch/result.hpp"
#include "hatch/store.hpp"
#include "hatch/tasks.hpp"
#include "hatch/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hatch {

struct InstallOptions {
    TaskChoices task_choices;
    std::optional<std::string> install_dir;  // overrides install.dir
    bool silent = false;                     // no post-install launch
    bool dry_run = false;                    // plan and report, mutate nothing
};

struct InstallOutcome {
    std::string install_id;
    std::string run_id;
    std::string install_dir;
    TaskSelection selected_tasks;
    DeployResult deployment;
    IntegrationPlan plan;
    IntegrationReport integration;
    std::vector<CreatedShortcut> shortcuts;
    bool launched = false;
    bool dry_run = false;
};

struct UninstallOutcome {
    std::string install_id;
    size_t reversed = 0;
    size_t orphaned = 0;
    size_t files_removed = 0;
    size_t files_kept = 0;
    size_t shortcuts_removed = 0;
};

// Absolute install directory: override when given, else install.dir with
// constants expanded ({app} is not available there)
Result<std::string> resolve_install_dir(const Manifest& manifest,
                                        const std::optional<std::string>& override_dir);

class Installer {
public:
    Installer(EngineConfig config, SystemStore& store, UninstallJournal& journal);

    Result<InstallOutcome> install(const Manifest& manifest, const InstallOptions& options);

    // Best effort: every step is attempted and individual failures become
    // warnings. NOT_INSTALLED when there is neither a record nor a journal.
    Result<UninstallOutcome> uninstall(const std::string& install_id);

    // Warnings of the last session, policy applied
    const WarningCollector& warnings() const { return warnings_; }

private:
    void launch_post_install(const Manifest& manifest, const ConstantMap& constants,
                             const std::string& install_dir, InstallOutcome& outcome);
    void remove_files(const InstallRecord& record, UninstallOutcome& outcome);

    EngineConfig config_;
    SystemStore& store_;
    UninstallJournal& journal_;
    WarningCollector warnings_;
};

} // namespace hatch
