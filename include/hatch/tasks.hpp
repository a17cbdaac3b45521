#pragma once

#include "hatch/manifest.hpp"
#include "hatch/result.hpp"

#include <map>
#include <set>
#include <string>

namespace hatch {

// ============================================================================
// Task Selection
// ============================================================================

// User choices for optional install units: task id -> selected
using TaskChoices = std::map<std::string, bool>;

// Frozen set of selected task ids for one run
using TaskSelection = std::set<std::string>;

// Resolve the selection for a run. Tasks absent from choices fall back to
// their default. Naming a task the manifest does not declare is a
// CONFIGURATION_ERROR.
Result<TaskSelection> resolve_selected_tasks(const Manifest& manifest,
                                             const TaskChoices& choices);

// Parse "a,!b,c" into choices ('!' deselects). Whitespace around items is
// ignored. Choosing the same task both ways is a CONFIGURATION_ERROR.
Result<TaskChoices> parse_task_choices(const std::string& list);

// Add one choice, rejecting a contradiction with an earlier one
Result<void> add_task_choice(TaskChoices& choices, const std::string& task_id, bool selected);

// Ungated steps (empty gating task) always run
inline bool is_step_selected(const std::string& gating_task, const TaskSelection& selection) {
    return gating_task.empty() || selection.count(gating_task) > 0;
}

} // namespace hatch
