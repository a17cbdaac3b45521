#include "hatch/deploy.hpp"
#include "hatch/digest.hpp"
#include "hatch/path_utils.hpp"
#include "hatch/platform.hpp"
#include "hatch/semver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hatch {

namespace {

// Undo a failed run: files it created, then directories it created
void remove_created(const std::vector<std::string>& files,
                    const std::vector<std::string>& dirs) {
    for (auto it = files.rbegin(); it != files.rend(); ++it) {
        if (!remove_file(*it)) {
            spdlog::warn("could not remove partially deployed file {}", *it);
        }
    }
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        remove_empty_directory(*it);
    }
}

// Create every missing directory from install_dir down to dir, remembering
// which ones this run created
bool ensure_directory(const std::string& dir, std::vector<std::string>& created,
                      std::string& error) {
    std::vector<std::string> missing;
    std::string current = dir;
    while (!current.empty() && !path_exists(current)) {
        missing.push_back(current);
        std::string parent = get_parent_directory(current);
        if (parent == current) break;
        current = parent;
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        auto made = atomic_create_directory(*it);
        if (!made.ok) {
            error = made.error;
            return false;
        }
        created.push_back(*it);
    }
    return true;
}

} // namespace

bool should_replace(const std::string& source_version,
                    const std::string& dest_version,
                    const std::string& source_path,
                    const std::string& dest_path) {
    if (auto cmp = compare_versions(source_version, dest_version)) {
        return *cmp > 0;
    }

    auto src_mtime = file_mtime(source_path);
    auto dst_mtime = file_mtime(dest_path);
    if (!src_mtime || !dst_mtime) {
        // Cannot tell which is newer; keep what is there
        return false;
    }
    return *src_mtime > *dst_mtime;
}

Result<DeployResult> deploy(const std::vector<FileEntry>& entries,
                            const std::string& install_dir,
                            const DeployOptions& options) {
    DeployResult result;
    std::vector<std::string> created_files;
    std::vector<std::string> created_dirs;

    auto fail = [&](const std::string& message, const std::string& path) {
        spdlog::error("deployment failed at {}: {}", path, message);
        if (!options.dry_run) {
            remove_created(created_files, created_dirs);
        }
        return Result<DeployResult>::err(Error(ErrorCode::DEPLOYMENT_ERROR, message, path));
    };

    std::string root = absolute_path(install_dir);
    if (!options.dry_run) {
        std::string error;
        if (!ensure_directory(root, created_dirs, error)) {
            return fail("cannot create install directory: " + error, root);
        }
    }

    for (const auto& entry : entries) {
        auto rel = normalize_relative_path(entry.dest_relative_path);
        if (!rel.ok) {
            if (!options.dry_run) {
                remove_created(created_files, created_dirs);
            }
            return Result<DeployResult>::err(
                Error(ErrorCode::CONFIGURATION_ERROR,
                      std::string("invalid destination: ") + path_error_to_string(rel.error),
                      entry.dest_relative_path));
        }
        auto dest = normalize_under_root(root, rel.path);

        if (!is_regular_file(entry.source_path)) {
            return fail("source file not found", entry.source_path);
        }

        DeployedEntry deployed;
        deployed.relative_path = rel.path;
        deployed.dest_path = dest.path;
        deployed.version = entry.version;

        bool exists = path_exists(dest.path);
        bool copy = true;
        if (exists && entry.overwrite == OverwritePolicy::IfNewerVersion) {
            std::string dest_version;
            if (options.previous) {
                if (const auto* prior = options.previous->find_file(rel.path)) {
                    dest_version = prior->version;
                }
            }
            copy = should_replace(entry.version, dest_version, entry.source_path, dest.path);
            if (!copy) {
                deployed.version = dest_version;
                deployed.skip_reason = "destination is not older";
            }
        }

        if (copy && !options.dry_run) {
            std::string error;
            if (!ensure_directory(get_parent_directory(dest.path), created_dirs, error)) {
                return fail("cannot create directory: " + error, dest.path);
            }

            auto copied = atomic_copy_file(entry.source_path, dest.path);
            if (!copied.ok) {
                return fail(copied.error, dest.path);
            }
            if (!exists) {
                created_files.push_back(dest.path);
            }
        }

        deployed.copied = copy;
        deployed.created = copy && !exists;

        if (!options.dry_run || exists) {
            auto digest = compute_file_sha256(dest.path);
            if (!digest.ok) {
                return fail(digest.error, dest.path);
            }
            deployed.sha256 = digest.hex_digest;
        }

        if (copy) {
            ++result.copied;
            spdlog::debug("{} {} -> {}", options.dry_run ? "would copy" : "copied",
                          entry.source_path, dest.path);
        } else {
            ++result.skipped;
            spdlog::debug("skipped {}: {}", dest.path, deployed.skip_reason);
        }

        // A later entry for the same destination replaces the earlier one
        auto same = [&](const DeployedEntry& e) { return e.relative_path == rel.path; };
        result.files.erase(std::remove_if(result.files.begin(), result.files.end(), same),
                           result.files.end());
        result.files.push_back(std::move(deployed));
    }

    spdlog::info("deployed {} file(s) to {} ({} skipped)", result.copied, root, result.skipped);
    return Result<DeployResult>::ok(std::move(result));
}

} // namespace hatch
