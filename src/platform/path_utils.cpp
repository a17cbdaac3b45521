#include "hatch/path_utils.hpp"
#include "hatch/platform.hpp"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hatch {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_absolute_like(const std::string& s) {
    if (s.empty()) return false;
    if (s[0] == '/' || s[0] == '\\') return true;
    return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
}

std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == '/' || c == '\\') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

} // namespace

PathResult normalize_relative_path(const std::string& relative_path) {
    if (relative_path.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }
    if (is_absolute_like(relative_path)) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split_segments(relative_path)) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    if (normalized.empty()) {
        // Resolves to root itself, which is not a file destination
        return {false, {}, PathError::Empty};
    }

    std::string joined;
    for (const auto& c : normalized) {
        if (!joined.empty()) joined += '/';
        joined += c;
    }
    return {true, joined, PathError::None};
}

PathResult normalize_under_root(const std::string& root, const std::string& relative_path) {
    if (contains_nul(root)) {
        return {false, {}, PathError::ContainsNul};
    }
    auto rel = normalize_relative_path(relative_path);
    if (!rel.ok) {
        return rel;
    }

    std::filesystem::path p(root);
    p /= rel.path;
    return {true, to_portable_path(p.lexically_normal().string()), PathError::None};
}

bool is_contained_relative_path(const std::string& relative_path) {
    return normalize_under_root("/root", relative_path).ok;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        static const uint32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace hatch
