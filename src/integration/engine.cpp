#include "hatch/integration.hpp"
#include "hatch/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hatch {

namespace {

Result<IntegrationReport> integration_failure(const RegistryOperation& op,
                                              const std::string& what,
                                              const Error& cause) {
    spdlog::error("{} {}\\{} failed: {}", what, op.path, display_value_name(op.value_name),
                  cause.message());
    return Result<IntegrationReport>::err(
        Error(ErrorCode::INTEGRATION_ERROR, what + " failed: " + cause.message(), op.path));
}

} // namespace

Result<IntegrationReport> IntegrationEngine::apply(const IntegrationPlan& plan,
                                                   const std::string& install_id,
                                                   const std::string& run_id) {
    IntegrationReport report;

    auto existing = journal_.allEntries(install_id);
    if (existing.isErr()) {
        return Result<IntegrationReport>::err(
            Error(ErrorCode::INTEGRATION_ERROR, "cannot read journal: " + existing.error().message(),
                  existing.error().path()));
    }
    std::vector<JournalEntry> journaled = std::move(existing.value());

    for (const auto& op : plan) {
        auto prior = store_.get(op.path, op.value_name);
        if (prior.isErr()) return integration_failure(op, "read", prior.error());

        auto key_exists = store_.keyExists(op.path);
        if (key_exists.isErr()) return integration_failure(op, "read", key_exists.error());

        bool already_journaled = std::any_of(journaled.begin(), journaled.end(),
            [&](const JournalEntry& e) { return same_mutation(e.operation, op); });

        // A key at or under which we already wrote was created by us, not
        // found in place
        bool touched_by_us = std::any_of(journaled.begin(), journaled.end(),
            [&](const JournalEntry& e) { return key_path_within(e.operation.path, op.path); });
        bool preexisting_key = key_exists.value() && !touched_by_us;

        if (op.rollback == RollbackPolicy::DeleteWholeKeyOnUninstall && preexisting_key) {
            spdlog::warn("claiming existing key {}; uninstall will delete it", op.path);
            warnings_.emit(Warning::preexisting_key_claimed, warnings::preexisting_key(op.path));
        }

        const auto& prior_value = prior.value();
        if (op.mode == WriteMode::AppendListMember && prior_value && *prior_value == op.data) {
            ++report.unchanged;
            spdlog::debug("{}\\{} already present", op.path, display_value_name(op.value_name));
        } else {
            auto written = store_.setValue(op.path, op.value_name, op.data);
            if (written.isErr()) return integration_failure(op, "write", written.error());
            ++report.applied;
            spdlog::debug("set {}\\{} = \"{}\"", op.path, display_value_name(op.value_name), op.data);
        }

        if (already_journaled) {
            continue;
        }

        JournalEntry entry;
        entry.operation = op;
        entry.prior_value_present = prior_value.has_value();
        entry.prior_value = prior_value;
        entry.prior_key_present = preexisting_key;
        entry.install_id = install_id;
        entry.applied_at = get_current_timestamp();
        entry.run_id = run_id;

        auto recorded = journal_.record(entry);
        if (recorded.isErr()) return integration_failure(op, "journal", recorded.error());

        journaled.push_back(std::move(entry));
        ++report.journaled;
    }

    spdlog::info("integration: {} written, {} unchanged, {} journaled",
                 report.applied, report.unchanged, report.journaled);
    return Result<IntegrationReport>::ok(report);
}

} // namespace hatch
