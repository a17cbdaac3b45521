#pragma once

#include <string>

namespace hatch {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::Empty: return "empty path";
        case PathError::ContainsNul: return "path contains NUL";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes install directory";
        default: return "invalid path";
    }
}

struct PathResult {
    bool ok;
    std::string path;  // normalized path under root when ok
    PathError error;
};

// Canonical '/'-separated form of a relative path ("a/./b/../c" -> "a/c").
// Fails on the same inputs as normalize_under_root.
PathResult normalize_relative_path(const std::string& relative_path);

// Resolve a destination path relative to root without touching the filesystem.
// - Accepts '/' and '\' as separators
// - Rejects empty paths, NUL bytes and absolute paths (including "C:" drives)
// - Collapses "." and ".." segments
// - Fails if the result would escape root
PathResult normalize_under_root(const std::string& root, const std::string& relative_path);

// True if relative_path would resolve inside any root
bool is_contained_relative_path(const std::string& relative_path);

// Well-formed UTF-8 (no overlong forms, surrogates or code points past U+10FFFF)
bool is_valid_utf8(const std::string& s);

} // namespace hatch
