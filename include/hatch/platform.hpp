#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace hatch {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Copy src to dst atomically: stream into a temp name next to dst, fsync,
// rename into place. Permission bits and modification time of src are carried
// over. dst is never observed half-written.
AtomicWriteResult atomic_copy_file(const std::string& src, const std::string& dst);

// Append one line to a file and fsync before returning (creates the file)
AtomicWriteResult durable_append_line(const std::string& path, const std::string& line);

// Create a directory tree (mkdir -p with fsync on parent)
AtomicWriteResult atomic_create_directory(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Regular files under root, relative to it, sorted
std::vector<std::string> list_files_recursive(const std::string& root);

// Modification time in nanoseconds since the filesystem clock epoch
std::optional<int64_t> file_mtime(const std::string& path);

std::optional<std::string> read_file(const std::string& path);

bool remove_file(const std::string& path);

// Remove path if it is an empty directory. Returns true if it was removed.
bool remove_empty_directory(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable (unset and empty are both nullopt)
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace hatch
