#pragma once

#include "hatch/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Install Record
// ============================================================================
//
// records/<install_id>.json. Written after every successful install and read
// by uninstall to find deployed files and shortcuts.

constexpr const char* INSTALL_RECORD_SCHEMA = "hatch.install.v1";

struct DeployedFile {
    std::string path;     // relative to paths.install_root, '/' separated
    std::string sha256;   // digest of the bytes this install wrote
    std::string version;  // version metadata of the deployed source, if any
};

struct CreatedShortcut {
    std::string name;
    std::string location;  // "start_menu" | "desktop"
    std::string path;      // absolute path of the launcher file
};

struct InstallRecord {
    std::string schema;

    // [install] section
    struct {
        std::string install_id;   // = manifest app.id
        std::string instance_id;  // UUID of the run that last wrote the record
    } install;

    // [app] section (snapshot)
    struct {
        std::string id;
        std::string name;
        std::string version;
        std::string publisher;
    } app;

    // [paths] section
    struct {
        std::string install_root;  // absolute
    } paths;

    // [provenance] section
    struct {
        std::string installed_at;  // RFC3339, first install
        std::string updated_at;    // RFC3339, latest install
        std::string source;        // manifest path
    } provenance;

    std::vector<std::string> selected_tasks;
    std::vector<DeployedFile> files;
    std::vector<CreatedShortcut> shortcuts;

    // Source path for diagnostics
    std::string source_path;

    const DeployedFile* find_file(const std::string& path) const;
};

// ============================================================================
// Parsing / Serialization
// ============================================================================

struct InstallRecordParseResult {
    bool ok = false;
    std::string error;
    InstallRecord record;
    std::vector<std::string> warnings;
};

InstallRecordParseResult parse_install_record_full(const std::string& json_str,
                                                   const std::string& source_path = "");

std::string serialize_install_record(const InstallRecord& record);

// Fold the lists of an earlier record into a newer one. Entries already
// present in next win; earlier-only entries are kept so a later uninstall
// still sees them.
void merge_install_records(InstallRecord& next, const InstallRecord& previous);

// ============================================================================
// Record Directory
// ============================================================================

std::string install_record_path(const std::string& records_dir, const std::string& install_id);

// nullopt when no record exists; an unreadable or malformed record is an IO_ERROR
Result<std::optional<InstallRecord>> load_install_record(const std::string& records_dir,
                                                         const std::string& install_id);

Result<void> save_install_record(const std::string& records_dir, const InstallRecord& record);

// Missing record is not an error
Result<void> remove_install_record(const std::string& records_dir, const std::string& install_id);

// All parseable records, ordered by install id. Malformed files are skipped.
std::vector<InstallRecord> list_install_records(const std::string& records_dir);

} // namespace hatch
