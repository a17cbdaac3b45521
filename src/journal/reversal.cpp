#include "hatch/journal.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hatch {

namespace {

Result<void> store_failure(const Error& error, const RegistryOperation& op) {
    return Result<void>::err(Error(ErrorCode::INTEGRATION_ERROR, error.message(), op.path));
}

} // namespace

Result<void> reverse_entry(SystemStore& store, const JournalEntry& entry,
                           WarningCollector& collector) {
    const auto& op = entry.operation;

    switch (op.rollback) {
        case RollbackPolicy::DeleteWholeKeyOnUninstall: {
            auto exists = store.keyExists(op.path);
            if (exists.isErr()) return store_failure(exists.error(), op);
            if (!exists.value()) {
                return Result<void>::ok();
            }

            if (entry.prior_key_present) {
                spdlog::warn("deleting key {} which existed before this install", op.path);
                collector.emit(Warning::preexisting_key_deleted, warnings::preexisting_key(op.path));
            }

            auto deleted = store.deleteKeyTree(op.path);
            if (deleted.isErr()) return store_failure(deleted.error(), op);
            spdlog::debug("deleted key {}", op.path);
            return Result<void>::ok();
        }

        case RollbackPolicy::DeleteValueOnUninstall: {
            auto current = store.get(op.path, op.value_name);
            if (current.isErr()) return store_failure(current.error(), op);

            if (!current.value()) {
                return Result<void>::ok();
            }
            if (*current.value() != op.data) {
                // Rewritten by someone else since; theirs now
                spdlog::info("leaving {}\\{}: value changed since install", op.path,
                             display_value_name(op.value_name));
                return Result<void>::ok();
            }

            auto deleted = store.deleteValue(op.path, op.value_name);
            if (deleted.isErr()) return store_failure(deleted.error(), op);
            spdlog::debug("deleted value {}\\{}", op.path, display_value_name(op.value_name));
            return Result<void>::ok();
        }

        case RollbackPolicy::LeaveInPlaceOnUninstall:
        default:
            return Result<void>::ok();
    }
}

ReversalResult reverse_all(SystemStore& store, const std::vector<JournalEntry>& entries,
                           WarningCollector& collector) {
    ReversalResult result;

    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        auto reversed = reverse_entry(store, *it, collector);
        if (reversed.isErr()) {
            const auto& op = it->operation;
            spdlog::error("failed to reverse {}\\{}: {}", op.path,
                          display_value_name(op.value_name), reversed.error().message());
            collector.emit(Warning::uninstall_partial_failure,
                          warnings::reversal_failed(op.path, display_value_name(op.value_name),
                                                    reversed.error().message()));
            result.orphans.push_back(*it);
            continue;
        }
        ++result.reversed;
    }

    // Orphans keep application order so a retry reverses them newest first
    std::reverse(result.orphans.begin(), result.orphans.end());
    return result;
}

} // namespace hatch
