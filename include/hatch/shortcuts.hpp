#pragma once

#include "hatch/install_record.hpp"
#include "hatch/manifest.hpp"
#include "hatch/result.hpp"
#include "hatch/tasks.hpp"
#include "hatch/types.hpp"
#include "hatch/warnings.hpp"

#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Shortcut / Launcher Generator
// ============================================================================
//
// Shortcuts are freedesktop desktop entries: start_menu entries go to the
// applications directory, desktop entries to the desktop directory (and are
// marked executable so file managers trust them).

struct ShortcutContext {
    std::string applications_dir;
    std::string desktop_dir;
    std::string app_id;
    std::string install_dir;
    ConstantMap constants;
    TaskSelection selection;
    bool dry_run = false;
};

// "<app_id>-<name>.desktop" with anything outside [A-Za-z0-9._-] replaced by '-'
std::string shortcut_file_name(const std::string& app_id, const std::string& display_name);

// Quote one Exec argument per the desktop entry rules ('%' doubled)
std::string quote_exec_argument(const std::string& arg);

// Text of the desktop entry for an already expanded shortcut
std::string render_desktop_entry(const ShortcutEntry& shortcut,
                                 const std::string& app_id,
                                 const std::string& working_dir);

// Create (or overwrite) the launchers whose gating task is selected.
// Shortcuts whose target does not exist are skipped with shortcut_skipped.
// Write failures are DEPLOYMENT_ERROR.
Result<std::vector<CreatedShortcut>> create_shortcuts(const std::vector<ShortcutEntry>& entries,
                                                      const ShortcutContext& context,
                                                      WarningCollector& collector);

// Remove launchers. Missing files are not an error; every file is attempted
// and the first failure is returned as IO_ERROR.
Result<void> remove_shortcuts(const std::vector<CreatedShortcut>& shortcuts);

} // namespace hatch
