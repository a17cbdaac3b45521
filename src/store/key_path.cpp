#include "hatch/store.hpp"

#include <algorithm>
#include <cctype>

namespace hatch {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<std::vector<std::string>> split_key_path(const std::string& path) {
    size_t start = 0;
    size_t end = path.size();
    while (start < end && path[start] == '\\') ++start;
    while (end > start && path[end - 1] == '\\') --end;
    if (start == end) return std::nullopt;

    std::vector<std::string> segments;
    std::string current;
    for (size_t i = start; i < end; ++i) {
        char c = path[i];
        if (c == '\0') return std::nullopt;
        if (c == '\\') {
            if (current.empty()) return std::nullopt;
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    segments.push_back(current);
    return segments;
}

std::string join_key_path(const std::vector<std::string>& segments) {
    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '\\';
        result += segments[i];
    }
    return result;
}

std::optional<std::string> normalize_key_path(const std::string& path) {
    auto segments = split_key_path(path);
    if (!segments) return std::nullopt;
    return join_key_path(*segments);
}

bool key_path_equal(const std::string& a, const std::string& b) {
    auto na = normalize_key_path(a);
    auto nb = normalize_key_path(b);
    if (!na || !nb) return false;
    return to_lower(*na) == to_lower(*nb);
}

bool name_equal(const std::string& a, const std::string& b) {
    return to_lower(a) == to_lower(b);
}

bool key_path_within(const std::string& descendant, const std::string& key) {
    auto nd = normalize_key_path(descendant);
    auto nk = normalize_key_path(key);
    if (!nd || !nk) return false;
    std::string d = to_lower(*nd);
    std::string k = to_lower(*nk);
    if (d == k) return true;
    return d.size() > k.size() && d.compare(0, k.size(), k) == 0 && d[k.size()] == '\\';
}

} // namespace hatch
