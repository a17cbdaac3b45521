#pragma once

#include "hatch/manifest.hpp"
#include "hatch/result.hpp"
#include "hatch/tasks.hpp"
#include "hatch/types.hpp"

#include <string>

namespace hatch {

// ============================================================================
// Integration Plan
// ============================================================================
//
// The ordered list of store mutations for one run, built once from the
// manifest and the frozen task selection:
//
//   per selected association, in manifest order
//     <C>\<ext>\OpenWithProgids        [<progId>] = ""        append, delete_value
//     <C>\<progId>                     (default)  = friendly  delete_key
//     <C>\<progId>\DefaultIcon         (default)  = icon      delete_key
//     <C>\<progId>\shell\open\command  (default)  = command   delete_key
//   if any association was selected
//     <C>\Applications\<exe>\SupportedTypes  [<ext>] = ""     delete_key
//     <C>\Applications\<exe>\DefaultIcon, shell\open\command  delete_key
//   selected authored registry entries, in manifest order
//
// <C> is the classes root.

constexpr const char* DEFAULT_CLASSES_ROOT = "Software\\Classes";

// Constants are expanded into every data field and authored path. Expansion
// failures are CONFIGURATION_ERROR.
Result<IntegrationPlan> build_integration_plan(const Manifest& manifest,
                                               const TaskSelection& selection,
                                               const ConstantMap& constants,
                                               const std::string& classes_root = DEFAULT_CLASSES_ROOT);

} // namespace hatch
