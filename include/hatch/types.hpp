#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hatch {

// ============================================================================
// File Overwrite Policy
// ============================================================================

enum class OverwritePolicy {
    Always,
    IfNewerVersion
};

inline const char* overwrite_policy_to_string(OverwritePolicy p) {
    switch (p) {
        case OverwritePolicy::Always: return "always";
        case OverwritePolicy::IfNewerVersion: return "if_newer_version";
        default: return "always";
    }
}

std::optional<OverwritePolicy> parse_overwrite_policy(const std::string& s);

// ============================================================================
// Rollback Policy
// ============================================================================
//
// Fixed when the operation is authored. The engine never infers a policy
// from the shape of a key path.

enum class RollbackPolicy {
    DeleteWholeKeyOnUninstall,
    DeleteValueOnUninstall,
    LeaveInPlaceOnUninstall
};

inline const char* rollback_policy_to_string(RollbackPolicy p) {
    switch (p) {
        case RollbackPolicy::DeleteWholeKeyOnUninstall: return "delete_key";
        case RollbackPolicy::DeleteValueOnUninstall: return "delete_value";
        case RollbackPolicy::LeaveInPlaceOnUninstall: return "leave";
        default: return "leave";
    }
}

std::optional<RollbackPolicy> parse_rollback_policy(const std::string& s);

// ============================================================================
// Write Mode
// ============================================================================

enum class WriteMode {
    Overwrite,         // value is owned outright by this application
    AppendListMember   // value name is one member of a list shared with other owners
};

inline const char* write_mode_to_string(WriteMode m) {
    switch (m) {
        case WriteMode::Overwrite: return "overwrite";
        case WriteMode::AppendListMember: return "append_member";
        default: return "overwrite";
    }
}

std::optional<WriteMode> parse_write_mode(const std::string& s);

// ============================================================================
// Shortcut Location
// ============================================================================

enum class ShortcutLocation {
    StartMenu,
    Desktop
};

inline const char* shortcut_location_to_string(ShortcutLocation l) {
    switch (l) {
        case ShortcutLocation::StartMenu: return "start_menu";
        case ShortcutLocation::Desktop: return "desktop";
        default: return "start_menu";
    }
}

std::optional<ShortcutLocation> parse_shortcut_location(const std::string& s);

// ============================================================================
// Registry Operation
// ============================================================================

struct RegistryOperation {
    std::string path;         // hierarchical key, '\' separated
    std::string value_name;   // empty = default value
    std::string data;
    RollbackPolicy rollback = RollbackPolicy::LeaveInPlaceOnUninstall;
    WriteMode mode = WriteMode::Overwrite;
    std::string gating_task;  // empty = ungated
    std::string origin;       // e.g. "association:.txt", for diagnostics only
};

// Two operations are the same mutation when they write the same data to the
// same place under the same policy. origin is not part of the identity.
bool same_mutation(const RegistryOperation& a, const RegistryOperation& b);

using IntegrationPlan = std::vector<RegistryOperation>;

// Display form of a value name ("(default)" for the empty name)
inline std::string display_value_name(const std::string& value_name) {
    return value_name.empty() ? std::string("(default)") : value_name;
}

using ConstantMap = std::unordered_map<std::string, std::string>;

} // namespace hatch
