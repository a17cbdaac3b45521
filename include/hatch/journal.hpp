#pragma once

/**
 * @file journal.hpp
 * @brief Uninstall journal: the record of every store mutation an install made
 *
 * Entries are appended while installing, one per applied operation, and read
 * back by uninstall, which reverses them newest first. A FileJournal entry is
 * durable once record() returns.
 */

#include "hatch/result.hpp"
#include "hatch/store.hpp"
#include "hatch/types.hpp"
#include "hatch/warnings.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Journal Entry
// ============================================================================

struct JournalEntry {
    RegistryOperation operation;

    // State at (path, value_name) just before the write
    bool prior_value_present = false;
    std::optional<std::string> prior_value;

    // The key existed before this application first touched it
    bool prior_key_present = false;

    std::string install_id;
    std::string applied_at;  // RFC3339
    std::string run_id;      // UUID of the install run that applied it
};

std::string serialize_journal_entry(const JournalEntry& entry);

// nullopt if the line is not a well-formed entry
std::optional<JournalEntry> parse_journal_entry(const std::string& line);

// ============================================================================
// UninstallJournal Interface
// ============================================================================

class UninstallJournal {
public:
    virtual ~UninstallJournal() = default;

    virtual Result<void> record(const JournalEntry& entry) = 0;

    // Entries for install_id in application order
    virtual Result<std::vector<JournalEntry>> allEntries(const std::string& install_id) const = 0;

    virtual Result<void> clear(const std::string& install_id) = 0;

    // Replace the entries for install_id with the given ones (orphans kept
    // after a partial uninstall). An empty list clears.
    virtual Result<void> retain(const std::string& install_id,
                                const std::vector<JournalEntry>& entries) = 0;

    // Install ids with at least one entry, sorted
    virtual std::vector<std::string> installIds() const = 0;

    // Where corrupt entries encountered while reading are reported
    void attachWarnings(WarningCollector* warnings) { warnings_ = warnings; }

protected:
    WarningCollector* warnings_ = nullptr;
};

// ============================================================================
// MemoryJournal
// ============================================================================

class MemoryJournal : public UninstallJournal {
public:
    Result<void> record(const JournalEntry& entry) override;
    Result<std::vector<JournalEntry>> allEntries(const std::string& install_id) const override;
    Result<void> clear(const std::string& install_id) override;
    Result<void> retain(const std::string& install_id,
                        const std::vector<JournalEntry>& entries) override;
    std::vector<std::string> installIds() const override;

private:
    std::map<std::string, std::vector<JournalEntry>> entries_;
};

// ============================================================================
// FileJournal
// ============================================================================
//
// One JSON-lines file per install id: <dir>/<install_id>.journal. Each
// record() appends a line and fsyncs. A torn trailing line left by an
// interrupted run is skipped with journal_line_corrupt.

class FileJournal : public UninstallJournal {
public:
    explicit FileJournal(std::string dir) : dir_(std::move(dir)) {}

    Result<void> record(const JournalEntry& entry) override;
    Result<std::vector<JournalEntry>> allEntries(const std::string& install_id) const override;
    Result<void> clear(const std::string& install_id) override;
    Result<void> retain(const std::string& install_id,
                        const std::vector<JournalEntry>& entries) override;
    std::vector<std::string> installIds() const override;

    std::string journalPath(const std::string& install_id) const;

private:
    std::string dir_;
};

// ============================================================================
// Reversal
// ============================================================================

// Undo one entry according to its rollback policy:
//   delete_key    delete the key subtree (preexisting_key_deleted if the key
//                 existed before the install claimed it)
//   delete_value  delete the value only while it still holds the data this
//                 install wrote
//   leave         nothing
// Store failures are INTEGRATION_ERROR.
Result<void> reverse_entry(SystemStore& store, const JournalEntry& entry,
                           WarningCollector& collector);

struct ReversalResult {
    size_t reversed = 0;
    std::vector<JournalEntry> orphans;  // entries whose reversal failed
};

// Reverse entries newest first. Every entry is attempted; each failure adds
// an uninstall_partial_failure warning and keeps the entry as an orphan.
ReversalResult reverse_all(SystemStore& store, const std::vector<JournalEntry>& entries,
                           WarningCollector& collector);

} // namespace hatch
