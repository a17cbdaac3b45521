#include "hatch/store.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace hatch {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

Error invalid_path(const std::string& path) {
    return Error(ErrorCode::CONFIGURATION_ERROR, "invalid key path", path);
}

// Lowered canonical path, used as the map key
std::optional<std::string> lookup_key(const std::string& path) {
    auto normalized = normalize_key_path(path);
    if (!normalized) return std::nullopt;
    return to_lower(*normalized);
}

bool is_strict_descendant(const std::string& candidate, const std::string& key) {
    return candidate.size() > key.size() &&
           candidate.compare(0, key.size(), key) == 0 &&
           candidate[key.size()] == '\\';
}

} // namespace

Result<void> MemoryStore::finish(KeyMap snapshot) {
    auto committed = commit();
    if (committed.isErr()) {
        keys_ = std::move(snapshot);
    }
    return committed;
}

Result<std::optional<std::string>> MemoryStore::get(const std::string& path,
                                                    const std::string& value_name) const {
    auto key = lookup_key(path);
    if (!key) {
        return Result<std::optional<std::string>>::err(invalid_path(path));
    }

    auto it = keys_.find(*key);
    if (it == keys_.end()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    auto vit = it->second.values.find(to_lower(value_name));
    if (vit == it->second.values.end()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>>::ok(vit->second.data);
}

Result<bool> MemoryStore::keyExists(const std::string& path) const {
    auto key = lookup_key(path);
    if (!key) {
        return Result<bool>::err(invalid_path(path));
    }
    return Result<bool>::ok(keys_.count(*key) > 0);
}

Result<void> MemoryStore::setValue(const std::string& path,
                                   const std::string& value_name,
                                   const std::string& data) {
    auto segments = split_key_path(path);
    if (!segments) {
        return Result<void>::err(invalid_path(path));
    }

    KeyMap snapshot = keys_;

    // Create missing ancestors, keeping the spelling of those already present
    std::string lowered;
    std::string spelled;
    KeyRecord* record = nullptr;
    for (const auto& segment : *segments) {
        if (!lowered.empty()) {
            lowered += '\\';
            spelled += '\\';
        }
        lowered += to_lower(segment);
        spelled += segment;

        auto it = keys_.find(lowered);
        if (it == keys_.end()) {
            it = keys_.emplace(lowered, KeyRecord{spelled, {}}).first;
        }
        spelled = it->second.path;
        record = &it->second;
    }

    auto& slot = record->values[to_lower(value_name)];
    if (slot.name.empty()) {
        slot.name = value_name;
    }
    slot.data = data;

    return finish(std::move(snapshot));
}

Result<void> MemoryStore::deleteValue(const std::string& path,
                                      const std::string& value_name) {
    auto key = lookup_key(path);
    if (!key) {
        return Result<void>::err(invalid_path(path));
    }

    auto it = keys_.find(*key);
    if (it == keys_.end()) {
        return Result<void>::ok();
    }
    auto vit = it->second.values.find(to_lower(value_name));
    if (vit == it->second.values.end()) {
        return Result<void>::ok();
    }

    KeyMap snapshot = keys_;
    keys_[*key].values.erase(to_lower(value_name));
    return finish(std::move(snapshot));
}

Result<void> MemoryStore::deleteKeyTree(const std::string& path) {
    auto key = lookup_key(path);
    if (!key) {
        return Result<void>::err(invalid_path(path));
    }

    auto it = keys_.lower_bound(*key);
    if (it == keys_.end() || (it->first != *key && !is_strict_descendant(it->first, *key))) {
        return Result<void>::ok();
    }

    KeyMap snapshot = keys_;
    for (auto cur = keys_.begin(); cur != keys_.end();) {
        if (cur->first == *key || is_strict_descendant(cur->first, *key)) {
            cur = keys_.erase(cur);
        } else {
            ++cur;
        }
    }
    return finish(std::move(snapshot));
}

Result<std::vector<StoreValue>> MemoryStore::listValues(const std::string& path) const {
    auto key = lookup_key(path);
    if (!key) {
        return Result<std::vector<StoreValue>>::err(invalid_path(path));
    }

    std::vector<StoreValue> values;
    auto it = keys_.find(*key);
    if (it != keys_.end()) {
        for (const auto& [lowered, value] : it->second.values) {
            values.push_back(value);
        }
    }
    return Result<std::vector<StoreValue>>::ok(std::move(values));
}

Result<std::vector<std::string>> MemoryStore::listSubkeys(const std::string& path) const {
    auto key = lookup_key(path);
    if (!key) {
        return Result<std::vector<std::string>>::err(invalid_path(path));
    }

    std::set<std::string> seen;
    std::vector<std::string> names;
    for (const auto& [lowered, record] : keys_) {
        if (!is_strict_descendant(lowered, *key)) continue;
        std::string rest = lowered.substr(key->size() + 1);
        if (rest.find('\\') != std::string::npos) continue;

        // Child spelling comes from its own record
        auto segments = split_key_path(record.path);
        if (segments && seen.insert(rest).second) {
            names.push_back(segments->back());
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(names));
}

} // namespace hatch
