#include "hatch/journal.hpp"

#include <nlohmann/json.hpp>

namespace hatch {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

bool get_bool(const nlohmann::json& j, const std::string& key) {
    return j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

} // namespace

std::string serialize_journal_entry(const JournalEntry& entry) {
    const auto& op = entry.operation;
    nlohmann::json j;
    j["install_id"] = entry.install_id;
    j["run_id"] = entry.run_id;
    j["applied_at"] = entry.applied_at;
    j["op"] = {
        {"path", op.path},
        {"value", op.value_name},
        {"data", op.data},
        {"rollback", rollback_policy_to_string(op.rollback)},
        {"mode", write_mode_to_string(op.mode)},
        {"task", op.gating_task},
        {"origin", op.origin},
    };
    j["prior"] = {
        {"value_present", entry.prior_value_present},
        {"key_present", entry.prior_key_present},
    };
    if (entry.prior_value) {
        j["prior"]["value"] = *entry.prior_value;
    }
    // One entry per line
    return j.dump();
}

std::optional<JournalEntry> parse_journal_entry(const std::string& line) {
    try {
        auto j = nlohmann::json::parse(line);
        if (!j.is_object() || !j.contains("op") || !j["op"].is_object()) {
            return std::nullopt;
        }

        JournalEntry entry;
        auto install_id = get_string(j, "install_id");
        if (!install_id) return std::nullopt;
        entry.install_id = *install_id;
        entry.run_id = get_string(j, "run_id").value_or("");
        entry.applied_at = get_string(j, "applied_at").value_or("");

        const auto& op = j["op"];
        auto path = get_string(op, "path");
        auto data = get_string(op, "data");
        auto rollback = get_string(op, "rollback");
        if (!path || !data || !rollback) return std::nullopt;

        auto policy = parse_rollback_policy(*rollback);
        if (!policy) return std::nullopt;
        auto mode = parse_write_mode(get_string(op, "mode").value_or("overwrite"));
        if (!mode) return std::nullopt;

        entry.operation.path = *path;
        entry.operation.value_name = get_string(op, "value").value_or("");
        entry.operation.data = *data;
        entry.operation.rollback = *policy;
        entry.operation.mode = *mode;
        entry.operation.gating_task = get_string(op, "task").value_or("");
        entry.operation.origin = get_string(op, "origin").value_or("");

        if (j.contains("prior") && j["prior"].is_object()) {
            const auto& prior = j["prior"];
            entry.prior_value_present = get_bool(prior, "value_present");
            entry.prior_key_present = get_bool(prior, "key_present");
            entry.prior_value = get_string(prior, "value");
        }
        return entry;

    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

} // namespace hatch
