#include "hatch/warnings.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace hatch {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    static const Warning all[] = {
        Warning::uninstall_partial_failure,
        Warning::preexisting_key_claimed,
        Warning::preexisting_key_deleted,
        Warning::modified_file_kept,
        Warning::orphaned_journal_entry,
        Warning::journal_line_corrupt,
        Warning::launch_failed,
        Warning::shortcut_skipped,
    };
    std::string lower = to_lower(key);
    for (Warning w : all) {
        if (lower == warning_to_string(w)) {
            return w;
        }
    }
    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    WarningAction action = get_effective_action(warning_key);
    warnings_.push_back({to_lower(warning_key), std::move(fields), action});
}

void WarningCollector::merge(const WarningCollector& other) {
    warnings_.insert(warnings_.end(), other.warnings_.begin(), other.warnings_.end());
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> visible;
    for (const auto& w : warnings_) {
        if (w.effective_action != WarningAction::Ignore) {
            visible.push_back({w.key, action_to_string(w.effective_action), w.fields});
        }
    }
    return visible;
}

bool WarningCollector::has_errors() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action == WarningAction::Error;
    });
}

bool WarningCollector::has_effective_warnings() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action != WarningAction::Ignore;
    });
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    auto it = policy_.find(to_lower(key));
    return it == policy_.end() ? WarningAction::Warn : it->second;
}

std::string format_warning(const WarningObject& warning) {
    // Sorted so the rendering is stable
    std::map<std::string, std::string> sorted(warning.fields.begin(), warning.fields.end());

    std::string out = warning.key;
    bool first = true;
    for (const auto& [name, value] : sorted) {
        out += first ? ": " : ", ";
        out += name + "=" + value;
        first = false;
    }
    return out;
}

} // namespace hatch
