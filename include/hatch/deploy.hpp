#pragma once

#include "hatch/install_record.hpp"
#include "hatch/manifest.hpp"
#include "hatch/result.hpp"

#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// File Deployment Engine
// ============================================================================

struct DeployedEntry {
    std::string relative_path;  // normalized, '/' separated
    std::string dest_path;      // absolute destination
    std::string sha256;         // digest of the destination after deployment
    std::string version;        // version metadata now describing the destination
    bool copied = false;
    bool created = false;       // destination did not exist before this run
    std::string skip_reason;    // set when copied is false
};

struct DeployResult {
    std::vector<DeployedEntry> files;
    size_t copied = 0;
    size_t skipped = 0;
};

struct DeployOptions {
    // Record of the previous install; supplies destination versions for
    // if_newer_version
    const InstallRecord* previous = nullptr;
    // Decide every copy but write nothing
    bool dry_run = false;
};

// Deploy entries (sources already resolved, see resolve_payload_files) into
// install_dir. Missing parent directories are created. Each copy is atomic.
// The first failure removes the destination files this run created and
// returns DEPLOYMENT_ERROR naming the path.
Result<DeployResult> deploy(const std::vector<FileEntry>& entries,
                            const std::string& install_dir,
                            const DeployOptions& options = {});

// Decision for one if_newer_version entry whose destination exists. Versions
// decide when both parse; otherwise the newer modification time wins. A tie
// keeps the destination.
bool should_replace(const std::string& source_version,
                    const std::string& dest_version,
                    const std::string& source_path,
                    const std::string& dest_path);

} // namespace hatch
