#include "hatch/store.hpp"
#include "hatch/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

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

Result<FileStore> FileStore::open(const std::string& path) {
    FileStore store(path);

    auto content = read_file(path);
    if (!content) {
        if (path_exists(path)) {
            return Result<FileStore>::err(
                Error(ErrorCode::IO_ERROR, "cannot read store", path));
        }
        spdlog::debug("store {} does not exist yet, starting empty", path);
        return Result<FileStore>::ok(std::move(store));
    }

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object() || j.value("$schema", "") != STORE_SCHEMA) {
            return Result<FileStore>::err(
                Error(ErrorCode::IO_ERROR, std::string("store is not ") + STORE_SCHEMA, path));
        }

        if (j.contains("keys") && j["keys"].is_array()) {
            for (const auto& k : j["keys"]) {
                if (!k.is_object() || !k.contains("path") || !k["path"].is_string()) {
                    continue;
                }
                auto normalized = normalize_key_path(k["path"].get<std::string>());
                if (!normalized) {
                    spdlog::warn("store {}: skipping invalid key path", path);
                    continue;
                }

                KeyRecord record;
                record.path = *normalized;
                if (k.contains("values") && k["values"].is_array()) {
                    for (const auto& v : k["values"]) {
                        if (!v.is_object()) continue;
                        StoreValue value;
                        value.name = v.value("name", "");
                        value.data = v.value("data", "");
                        record.values[to_lower(value.name)] = value;
                    }
                }
                store.keys_[to_lower(*normalized)] = std::move(record);
            }
        }

        // Documents written by hand may omit intermediate keys
        KeyMap complete = store.keys_;
        for (const auto& [lowered, record] : store.keys_) {
            auto segments = split_key_path(record.path);
            if (!segments) continue;
            std::vector<std::string> prefix;
            for (size_t i = 0; i + 1 < segments->size(); ++i) {
                prefix.push_back((*segments)[i]);
                std::string ancestor = join_key_path(prefix);
                complete.emplace(to_lower(ancestor), KeyRecord{ancestor, {}});
            }
        }
        store.keys_ = std::move(complete);

    } catch (const nlohmann::json::exception& e) {
        return Result<FileStore>::err(
            Error(ErrorCode::IO_ERROR, std::string("store parse error: ") + e.what(), path));
    }

    spdlog::debug("loaded store {} ({} keys)", path, store.keys_.size());
    return Result<FileStore>::ok(std::move(store));
}

std::string FileStore::serialize() const {
    nlohmann::json j;
    j["$schema"] = STORE_SCHEMA;
    j["keys"] = nlohmann::json::array();
    for (const auto& [lowered, record] : keys_) {
        nlohmann::json k;
        k["path"] = record.path;
        k["values"] = nlohmann::json::array();
        for (const auto& [name, value] : record.values) {
            k["values"].push_back({{"name", value.name}, {"data", value.data}});
        }
        j["keys"].push_back(std::move(k));
    }
    return j.dump(2) + "\n";
}

Result<void> FileStore::commit() {
    std::string parent = get_parent_directory(path_);
    if (!parent.empty() && !is_directory(parent)) {
        auto dir = atomic_create_directory(parent);
        if (!dir.ok) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, dir.error, parent));
        }
    }

    std::string document;
    try {
        document = serialize();
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("cannot encode store {}: {}", path_, e.what());
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, std::string("cannot encode store: ") + e.what(), path_));
    }

    auto written = atomic_write_file(path_, document);
    if (!written.ok) {
        spdlog::error("failed to persist store {}: {}", path_, written.error);
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error, path_));
    }
    return Result<void>::ok();
}

} // namespace hatch
