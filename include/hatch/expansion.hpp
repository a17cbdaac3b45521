#pragma once

#include "hatch/types.hpp"

#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Constant Expansion
// ============================================================================
//
// Manifest strings may reference install-time constants as {name}:
//   {app}      install directory
//   {appid}    app.id
//   {appname}  app.name
//   {version}  app.version
// "{{" produces a literal '{'. Expansion is single-pass; substituted values
// are never re-scanned.

constexpr size_t MAX_EXPANDED_SIZE = 64 * 1024;  // 64 KiB

// Names accepted inside braces
const std::vector<std::string>& known_constants();

struct ExpansionResult {
    bool ok = true;
    std::string value;
    std::vector<std::string> unknown;  // names that are not known constants
    std::string error;
};

// Expand constants in input. Unknown names make the result not ok and are
// left verbatim in value.
ExpansionResult expand_constants(const std::string& input, const ConstantMap& constants);

// Names in input that would not expand (used to validate a manifest before
// the install directory is known)
std::vector<std::string> find_unknown_constants(const std::string& input);

ConstantMap make_constants(const std::string& install_dir,
                           const std::string& app_id,
                           const std::string& app_name,
                           const std::string& version);

} // namespace hatch
