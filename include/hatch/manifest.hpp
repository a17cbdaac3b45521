#pragma once

#include "hatch/result.hpp"
#include "hatch/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Manifest Model
// ============================================================================
//
// Read-only description of what to install. Built once from the packaging
// pipeline's descriptor and never mutated while a run is in progress.

constexpr const char* MANIFEST_SCHEMA = "hatch.manifest.v1";

struct FileEntry {
    std::string source_path;        // relative to the payload root, or absolute
    std::string dest_relative_path; // relative to the install directory
    OverwritePolicy overwrite = OverwritePolicy::Always;
    std::string version;            // optional SemVer used by IfNewerVersion
    bool recurse = false;           // source is a directory tree
};

struct Task {
    std::string id;
    std::string description;
    bool default_selected = false;
};

struct AssociationRule {
    std::string extension;              // ".txt"
    std::string prog_id;                // "AppX.txt"
    std::string friendly_name;
    std::string icon_ref;               // may contain {app}
    std::string open_command_template;  // may contain {app} and %1
    std::string gating_task;            // empty = ungated
};

// Store mutation authored directly in the manifest. The rollback policy is
// mandatory and taken verbatim.
struct RegistryEntry {
    std::string path;
    std::string value_name;
    std::string data;
    RollbackPolicy rollback = RollbackPolicy::LeaveInPlaceOnUninstall;
    std::string gating_task;
};

struct ShortcutEntry {
    std::string display_name;
    std::string target_path;
    ShortcutLocation location = ShortcutLocation::StartMenu;
    std::vector<std::string> arguments;
    std::string icon;
    std::string comment;
    std::string gating_task;
};

struct RunCommand {
    std::string command;
    std::vector<std::string> arguments;
    std::string description;
};

struct Manifest {
    std::string schema;

    // [app]
    std::string app_id;
    std::string app_name;
    std::string version;
    std::string publisher;
    std::string executable;   // file name registered under Applications\<exe>

    // [install]
    std::string install_dir;  // may contain constants other than {app}

    std::vector<FileEntry> payload_files;
    std::vector<Task> tasks;
    std::vector<AssociationRule> associations;
    std::vector<RegistryEntry> registry;
    std::vector<ShortcutEntry> shortcuts;
    std::optional<RunCommand> post_install_run;

    // Directory relative sources resolve against (manifest's directory)
    std::string payload_root;
    std::string source_path;

    const Task* find_task(const std::string& id) const;
};

// ============================================================================
// Manifest Parsing
// ============================================================================

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    Manifest manifest;
    std::vector<std::string> warnings;
};

// Parse and validate a manifest from JSON text. payload_root defaults to the
// directory of source_path.
ManifestParseResult parse_manifest_full(const std::string& json_str,
                                        const std::string& source_path = "",
                                        const std::string& payload_root = "");

// Read, parse and validate a manifest file. Failures are CONFIGURATION_ERROR.
Result<Manifest> load_manifest(const std::string& path);

// Structural checks shared by the parser and by hand-built manifests
// (task references, unique ids, constant names, destination containment).
Result<void> validate_manifest(const Manifest& manifest);

// Expand recursive directory entries into one FileEntry per file, with
// absolute source paths, in a deterministic order. A missing source
// directory is a DEPLOYMENT_ERROR.
Result<std::vector<FileEntry>> resolve_payload_files(const Manifest& manifest);

} // namespace hatch
