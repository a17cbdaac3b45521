#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hatch {

// ============================================================================
// Warning Keys
// ============================================================================

enum class Warning {
    uninstall_partial_failure,
    preexisting_key_claimed,
    preexisting_key_deleted,
    modified_file_kept,
    orphaned_journal_entry,
    journal_line_corrupt,
    launch_failed,
    shortcut_skipped,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::uninstall_partial_failure: return "uninstall_partial_failure";
        case Warning::preexisting_key_claimed: return "preexisting_key_claimed";
        case Warning::preexisting_key_deleted: return "preexisting_key_deleted";
        case Warning::modified_file_kept: return "modified_file_kept";
        case Warning::orphaned_journal_entry: return "orphaned_journal_entry";
        case Warning::journal_line_corrupt: return "journal_line_corrupt";
        case Warning::launch_failed: return "launch_failed";
        case Warning::shortcut_skipped: return "shortcut_skipped";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

// ============================================================================
// Warning Action
// ============================================================================

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

using WarningPolicy = std::unordered_map<std::string, WarningAction>;

// ============================================================================
// Warning Object
// ============================================================================

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const WarningPolicy& policy)
        : policy_(policy) {}

    void set_policy(const WarningPolicy& policy) { policy_ = policy; }

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Append everything another collector gathered, keeping its effective actions
    void merge(const WarningCollector& other);

    // Warnings after policy application. "ignore" warnings are excluded.
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    // Check if any effective warnings remain (excluding ignored)
    bool has_effective_warnings() const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    WarningPolicy policy_;
    std::vector<CollectedWarning> warnings_;

    WarningAction get_effective_action(const std::string& key) const;
};

// Render a warning as one human-readable line ("key: field=value, ...")
std::string format_warning(const WarningObject& warning);

// ============================================================================
// Field builders for specific warnings
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> reversal_failed(
    const std::string& path,
    const std::string& value_name,
    const std::string& reason) {
    return {{"path", path}, {"value", value_name}, {"reason", reason}};
}

inline std::unordered_map<std::string, std::string> preexisting_key(
    const std::string& path) {
    return {{"path", path}};
}

inline std::unordered_map<std::string, std::string> modified_file(
    const std::string& path) {
    return {{"path", path}};
}

inline std::unordered_map<std::string, std::string> journal_line(
    const std::string& journal_path,
    size_t line) {
    return {{"journal", journal_path}, {"line", std::to_string(line)}};
}

inline std::unordered_map<std::string, std::string> orphaned_entries(
    const std::string& install_id,
    size_t count) {
    return {{"install_id", install_id}, {"count", std::to_string(count)}};
}

inline std::unordered_map<std::string, std::string> launch_failed(
    const std::string& command,
    const std::string& reason) {
    return {{"command", command}, {"reason", reason}};
}

inline std::unordered_map<std::string, std::string> shortcut_skipped(
    const std::string& name,
    const std::string& reason) {
    return {{"name", name}, {"reason", reason}};
}

} // namespace warnings

} // namespace hatch
