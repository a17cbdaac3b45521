#pragma once

#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Post-Install Launch
// ============================================================================

struct LaunchResult {
    bool ok = false;
    int pid = -1;
    std::string error;
};

struct LaunchRequest {
    std::string command;             // absolute path, or a name looked up in PATH
    std::vector<std::string> arguments;
    std::string working_dir;         // empty = inherit
};

// Start command in its own session without waiting for it. ok is true once
// exec has succeeded in the child; a failing exec (missing binary, no
// permission) is reported with its errno text.
LaunchResult launch_detached(const LaunchRequest& request);

} // namespace hatch
