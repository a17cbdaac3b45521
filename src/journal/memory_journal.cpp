#include "hatch/journal.hpp"

namespace hatch {

Result<void> MemoryJournal::record(const JournalEntry& entry) {
    entries_[entry.install_id].push_back(entry);
    return Result<void>::ok();
}

Result<std::vector<JournalEntry>> MemoryJournal::allEntries(const std::string& install_id) const {
    auto it = entries_.find(install_id);
    if (it == entries_.end()) {
        return Result<std::vector<JournalEntry>>::ok({});
    }
    return Result<std::vector<JournalEntry>>::ok(it->second);
}

Result<void> MemoryJournal::clear(const std::string& install_id) {
    entries_.erase(install_id);
    return Result<void>::ok();
}

Result<void> MemoryJournal::retain(const std::string& install_id,
                                   const std::vector<JournalEntry>& entries) {
    if (entries.empty()) {
        entries_.erase(install_id);
    } else {
        entries_[install_id] = entries;
    }
    return Result<void>::ok();
}

std::vector<std::string> MemoryJournal::installIds() const {
    std::vector<std::string> ids;
    for (const auto& [id, entries] : entries_) {
        if (!entries.empty()) ids.push_back(id);
    }
    return ids;
}

} // namespace hatch
