#include "hatch/installer.hpp"
#include "hatch/digest.hpp"
#include "hatch/expansion.hpp"
#include "hatch/launcher.hpp"
#include "hatch/path_utils.hpp"
#include "hatch/plan.hpp"
#include "hatch/platform.hpp"
#include "hatch/shortcuts.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace hatch {

Installer::Installer(EngineConfig config, SystemStore& store, UninstallJournal& journal)
    : config_(std::move(config)), store_(store), journal_(journal), warnings_(config_.warnings) {}

Result<std::string> resolve_install_dir(const Manifest& manifest,
                                        const std::optional<std::string>& override_dir) {
    if (override_dir && !override_dir->empty()) {
        // The path is written into the store, the journal and the record
        if (!is_valid_utf8(*override_dir)) {
            return Result<std::string>::err(Error(ErrorCode::CONFIGURATION_ERROR,
                                                  "install directory is not valid UTF-8"));
        }
        return Result<std::string>::ok(absolute_path(*override_dir));
    }

    // {app} is the value being computed, so only the other constants apply
    auto constants = make_constants("", manifest.app_id, manifest.app_name, manifest.version);
    constants.erase("app");
    auto expanded = expand_constants(manifest.install_dir, constants);
    if (!expanded.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::CONFIGURATION_ERROR,
                  "install.dir: " + (!expanded.error.empty() ? expanded.error
                                     : "unknown constant {" + expanded.unknown.front() + "}")));
    }
    return Result<std::string>::ok(absolute_path(expanded.value));
}

Result<InstallOutcome> Installer::install(const Manifest& manifest, const InstallOptions& options) {
    warnings_.clear();
    journal_.attachWarnings(&warnings_);

    InstallOutcome outcome;
    outcome.install_id = manifest.app_id;
    outcome.run_id = generate_uuid();
    outcome.dry_run = options.dry_run;

    // Everything that can be rejected is rejected before the first mutation
    auto valid = validate_manifest(manifest);
    if (valid.isErr()) {
        return Result<InstallOutcome>::err(valid.error());
    }

    auto selection = resolve_selected_tasks(manifest, options.task_choices);
    if (selection.isErr()) {
        return Result<InstallOutcome>::err(selection.error());
    }
    outcome.selected_tasks = selection.value();

    auto install_dir = resolve_install_dir(manifest, options.install_dir);
    if (install_dir.isErr()) {
        return Result<InstallOutcome>::err(install_dir.error());
    }
    outcome.install_dir = install_dir.value();

    auto constants = make_constants(outcome.install_dir, manifest.app_id,
                                    manifest.app_name, manifest.version);

    auto plan = build_integration_plan(manifest, outcome.selected_tasks, constants,
                                       config_.store.classes_root);
    if (plan.isErr()) {
        return Result<InstallOutcome>::err(plan.error());
    }
    outcome.plan = plan.value();

    auto files = resolve_payload_files(manifest);
    if (files.isErr()) {
        return Result<InstallOutcome>::err(files.error());
    }

    std::optional<InstallRecord> previous;
    auto loaded = load_install_record(config_.paths.records_dir, manifest.app_id);
    if (loaded.isErr()) {
        spdlog::warn("ignoring previous install record: {}", loaded.error().toString());
    } else {
        previous = loaded.value();
    }

    spdlog::info("{} {} {} into {}", options.dry_run ? "planning" : "installing",
                 manifest.app_id, manifest.version, outcome.install_dir);

    // Files
    DeployOptions deploy_options;
    deploy_options.previous = previous ? &*previous : nullptr;
    deploy_options.dry_run = options.dry_run;
    auto deployed = deploy(files.value(), outcome.install_dir, deploy_options);
    if (deployed.isErr()) {
        return Result<InstallOutcome>::err(deployed.error());
    }
    outcome.deployment = deployed.value();

    ShortcutContext shortcut_context;
    shortcut_context.applications_dir = config_.paths.applications_dir;
    shortcut_context.desktop_dir = config_.paths.desktop_dir;
    shortcut_context.app_id = manifest.app_id;
    shortcut_context.install_dir = outcome.install_dir;
    shortcut_context.constants = constants;
    shortcut_context.selection = outcome.selected_tasks;
    shortcut_context.dry_run = options.dry_run;

    if (options.dry_run) {
        auto planned = create_shortcuts(manifest.shortcuts, shortcut_context, warnings_);
        if (planned.isErr()) {
            return Result<InstallOutcome>::err(planned.error());
        }
        outcome.shortcuts = planned.value();
        return Result<InstallOutcome>::ok(std::move(outcome));
    }

    InstallRecord record;
    record.install.install_id = manifest.app_id;
    record.install.instance_id = outcome.run_id;
    record.app.id = manifest.app_id;
    record.app.name = manifest.app_name;
    record.app.version = manifest.version;
    record.app.publisher = manifest.publisher;
    record.paths.install_root = outcome.install_dir;
    record.provenance.installed_at = get_current_timestamp();
    record.provenance.updated_at = record.provenance.installed_at;
    record.provenance.source = manifest.source_path;
    record.selected_tasks.assign(outcome.selected_tasks.begin(), outcome.selected_tasks.end());
    for (const auto& f : outcome.deployment.files) {
        record.files.push_back({f.relative_path, f.sha256, f.version});
    }
    if (previous) {
        merge_install_records(record, *previous);
    }

    // Written before integration so an interrupted run can still be uninstalled
    auto saved = save_install_record(config_.paths.records_dir, record);
    if (saved.isErr()) {
        return Result<InstallOutcome>::err(
            Error(ErrorCode::DEPLOYMENT_ERROR, saved.error().message(), saved.error().path()));
    }

    // Store
    IntegrationEngine engine(store_, journal_, warnings_);
    auto applied = engine.apply(outcome.plan, manifest.app_id, outcome.run_id);
    if (applied.isErr()) {
        return Result<InstallOutcome>::err(applied.error());
    }
    outcome.integration = applied.value();

    // Shortcuts
    auto shortcuts = create_shortcuts(manifest.shortcuts, shortcut_context, warnings_);
    if (shortcuts.isErr()) {
        return Result<InstallOutcome>::err(shortcuts.error());
    }
    outcome.shortcuts = shortcuts.value();

    InstallRecord final_record = record;
    final_record.shortcuts = outcome.shortcuts;
    merge_install_records(final_record, record);
    saved = save_install_record(config_.paths.records_dir, final_record);
    if (saved.isErr()) {
        return Result<InstallOutcome>::err(
            Error(ErrorCode::DEPLOYMENT_ERROR, saved.error().message(), saved.error().path()));
    }

    if (!options.silent) {
        launch_post_install(manifest, constants, outcome.install_dir, outcome);
    }

    spdlog::info("installed {} {}", manifest.app_id, manifest.version);
    return Result<InstallOutcome>::ok(std::move(outcome));
}

void Installer::launch_post_install(const Manifest& manifest, const ConstantMap& constants,
                                    const std::string& install_dir, InstallOutcome& outcome) {
    if (!manifest.post_install_run) {
        return;
    }
    const auto& run = *manifest.post_install_run;

    LaunchRequest request;
    request.command = expand_constants(run.command, constants).value;
    for (const auto& arg : run.arguments) {
        request.arguments.push_back(expand_constants(arg, constants).value);
    }
    request.working_dir = install_dir;

    auto launched = launch_detached(request);
    if (!launched.ok) {
        spdlog::warn("post-install launch failed: {}", launched.error);
        warnings_.emit(Warning::launch_failed,
                       warnings::launch_failed(request.command, launched.error));
        return;
    }
    outcome.launched = true;
    spdlog::info("launched {}", request.command);
}

Result<UninstallOutcome> Installer::uninstall(const std::string& install_id) {
    warnings_.clear();
    journal_.attachWarnings(&warnings_);

    UninstallOutcome outcome;
    outcome.install_id = install_id;

    std::optional<InstallRecord> record;
    auto loaded = load_install_record(config_.paths.records_dir, install_id);
    if (loaded.isErr()) {
        spdlog::warn("install record unusable, reversing journal only: {}",
                     loaded.error().toString());
    } else {
        record = loaded.value();
    }

    auto entries = journal_.allEntries(install_id);
    if (entries.isErr()) {
        return Result<UninstallOutcome>::err(entries.error());
    }

    if (!record && entries.value().empty()) {
        return Result<UninstallOutcome>::err(
            Error(ErrorCode::NOT_INSTALLED, "'" + install_id + "' is not installed"));
    }

    spdlog::info("uninstalling {}", install_id);

    // Store, newest first
    auto reversal = reverse_all(store_, entries.value(), warnings_);
    outcome.reversed = reversal.reversed;
    outcome.orphaned = reversal.orphans.size();

    auto retained = journal_.retain(install_id, reversal.orphans);
    if (retained.isErr()) {
        spdlog::error("could not update journal: {}", retained.error().toString());
        warnings_.emit(Warning::uninstall_partial_failure,
                       warnings::reversal_failed(retained.error().path(), "",
                                                 retained.error().message()));
    }
    if (!reversal.orphans.empty()) {
        warnings_.emit(Warning::orphaned_journal_entry,
                       warnings::orphaned_entries(install_id, reversal.orphans.size()));
    }

    if (record) {
        // Shortcuts
        auto removed = remove_shortcuts(record->shortcuts);
        if (removed.isErr()) {
            warnings_.emit(Warning::uninstall_partial_failure,
                           warnings::reversal_failed(removed.error().path(), "",
                                                     removed.error().message()));
        }
        for (const auto& s : record->shortcuts) {
            if (!path_exists(s.path)) ++outcome.shortcuts_removed;
        }

        // Files
        remove_files(*record, outcome);

        // Kept while orphans remain, so a retry still knows the install
        if (reversal.orphans.empty()) {
            auto gone = remove_install_record(config_.paths.records_dir, install_id);
            if (gone.isErr()) {
                warnings_.emit(Warning::uninstall_partial_failure,
                               warnings::reversal_failed(gone.error().path(), "",
                                                         gone.error().message()));
            }
        }
    }

    spdlog::info("uninstalled {}: {} store entries reversed, {} file(s) removed",
                 install_id, outcome.reversed, outcome.files_removed);
    return Result<UninstallOutcome>::ok(outcome);
}

void Installer::remove_files(const InstallRecord& record, UninstallOutcome& outcome) {
    const std::string& root = record.paths.install_root;
    std::set<std::string> dirs;

    for (const auto& file : record.files) {
        std::string path = join_path(root, file.path);

        for (std::string dir = get_parent_directory(path);
             dir.size() > root.size() && dir.compare(0, root.size(), root) == 0;
             dir = get_parent_directory(dir)) {
            dirs.insert(dir);
        }

        if (!path_exists(path)) {
            continue;
        }

        auto digest = compute_file_sha256(path);
        if (!digest.ok || digest.hex_digest != file.sha256) {
            spdlog::warn("keeping {}: modified since install", path);
            warnings_.emit(Warning::modified_file_kept, warnings::modified_file(path));
            ++outcome.files_kept;
            continue;
        }

        if (!remove_file(path)) {
            warnings_.emit(Warning::uninstall_partial_failure,
                           warnings::reversal_failed(path, "", "cannot remove file"));
            continue;
        }
        ++outcome.files_removed;
    }

    // Deepest first
    std::vector<std::string> ordered(dirs.begin(), dirs.end());
    std::sort(ordered.begin(), ordered.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });
    for (const auto& dir : ordered) {
        remove_empty_directory(dir);
    }
    if (remove_empty_directory(root)) {
        spdlog::debug("removed install directory {}", root);
    }
}

} // namespace hatch
