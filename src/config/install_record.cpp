#include "hatch/install_record.hpp"
#include "hatch/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace hatch {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool is_empty_after_trim(const std::string& s) {
    return trim(s).empty();
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

} // namespace

const DeployedFile* InstallRecord::find_file(const std::string& path) const {
    for (const auto& f : files) {
        if (f.path == path) return &f;
    }
    return nullptr;
}

InstallRecordParseResult parse_install_record_full(const std::string& json_str,
                                                   const std::string& source_path) {
    InstallRecordParseResult result;
    result.record.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.record.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.record.schema != INSTALL_RECORD_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + INSTALL_RECORD_SCHEMA;
            return result;
        }

        // "install" section (REQUIRED)
        if (j.contains("install") && j["install"].is_object()) {
            const auto& install = j["install"];
            auto id = get_string(install, "install_id");
            if (!id || is_empty_after_trim(*id)) {
                result.error = "install.install_id missing or empty";
                return result;
            }
            result.record.install.install_id = *id;
            result.record.install.instance_id = get_string(install, "instance_id").value_or("");
        } else {
            result.error = "install section missing";
            return result;
        }

        // "app" section (snapshot)
        if (j.contains("app") && j["app"].is_object()) {
            const auto& app = j["app"];
            result.record.app.id = get_string(app, "id").value_or("");
            result.record.app.name = get_string(app, "name").value_or("");
            result.record.app.version = get_string(app, "version").value_or("");
            result.record.app.publisher = get_string(app, "publisher").value_or("");
        }

        // "paths" section (REQUIRED)
        if (j.contains("paths") && j["paths"].is_object()) {
            auto root = get_string(j["paths"], "install_root");
            if (!root || is_empty_after_trim(*root)) {
                result.error = "paths.install_root missing or empty";
                return result;
            }
            result.record.paths.install_root = *root;
        } else {
            result.error = "paths section missing";
            return result;
        }

        // "provenance" section
        if (j.contains("provenance") && j["provenance"].is_object()) {
            const auto& prov = j["provenance"];
            result.record.provenance.installed_at = get_string(prov, "installed_at").value_or("");
            result.record.provenance.updated_at = get_string(prov, "updated_at").value_or("");
            result.record.provenance.source = get_string(prov, "source").value_or("");
        }

        result.record.selected_tasks = get_string_array(j, "selected_tasks");

        if (j.contains("files") && j["files"].is_array()) {
            for (const auto& f : j["files"]) {
                auto path = f.is_object() ? get_string(f, "path") : std::nullopt;
                if (!path) {
                    result.warnings.push_back("invalid_file_entry");
                    continue;
                }
                DeployedFile file;
                file.path = *path;
                file.sha256 = get_string(f, "sha256").value_or("");
                file.version = get_string(f, "version").value_or("");
                result.record.files.push_back(std::move(file));
            }
        }

        if (j.contains("shortcuts") && j["shortcuts"].is_array()) {
            for (const auto& s : j["shortcuts"]) {
                auto path = s.is_object() ? get_string(s, "path") : std::nullopt;
                if (!path) {
                    result.warnings.push_back("invalid_shortcut_entry");
                    continue;
                }
                CreatedShortcut shortcut;
                shortcut.path = *path;
                shortcut.name = get_string(s, "name").value_or("");
                shortcut.location = get_string(s, "location").value_or("");
                result.record.shortcuts.push_back(std::move(shortcut));
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

std::string serialize_install_record(const InstallRecord& record) {
    nlohmann::json j;
    j["$schema"] = INSTALL_RECORD_SCHEMA;
    j["install"] = {
        {"install_id", record.install.install_id},
        {"instance_id", record.install.instance_id},
    };
    j["app"] = {
        {"id", record.app.id},
        {"name", record.app.name},
        {"version", record.app.version},
    };
    if (!record.app.publisher.empty()) {
        j["app"]["publisher"] = record.app.publisher;
    }
    j["paths"] = {{"install_root", record.paths.install_root}};
    j["provenance"] = {
        {"installed_at", record.provenance.installed_at},
        {"updated_at", record.provenance.updated_at},
        {"source", record.provenance.source},
    };
    j["selected_tasks"] = record.selected_tasks;

    j["files"] = nlohmann::json::array();
    for (const auto& f : record.files) {
        nlohmann::json file = {{"path", f.path}, {"sha256", f.sha256}};
        if (!f.version.empty()) {
            file["version"] = f.version;
        }
        j["files"].push_back(std::move(file));
    }

    j["shortcuts"] = nlohmann::json::array();
    for (const auto& s : record.shortcuts) {
        j["shortcuts"].push_back({{"name", s.name}, {"location", s.location}, {"path", s.path}});
    }

    return j.dump(2) + "\n";
}

void merge_install_records(InstallRecord& next, const InstallRecord& previous) {
    if (!previous.provenance.installed_at.empty()) {
        next.provenance.installed_at = previous.provenance.installed_at;
    }

    for (const auto& f : previous.files) {
        if (!next.find_file(f.path)) {
            next.files.push_back(f);
        }
    }

    for (const auto& s : previous.shortcuts) {
        auto same = [&](const CreatedShortcut& c) { return c.path == s.path; };
        if (std::none_of(next.shortcuts.begin(), next.shortcuts.end(), same)) {
            next.shortcuts.push_back(s);
        }
    }
}

std::string install_record_path(const std::string& records_dir, const std::string& install_id) {
    return join_path(records_dir, install_id + ".json");
}

Result<std::optional<InstallRecord>> load_install_record(const std::string& records_dir,
                                                         const std::string& install_id) {
    std::string path = install_record_path(records_dir, install_id);
    if (!path_exists(path)) {
        return Result<std::optional<InstallRecord>>::ok(std::nullopt);
    }

    auto content = read_file(path);
    if (!content) {
        return Result<std::optional<InstallRecord>>::err(
            Error(ErrorCode::IO_ERROR, "cannot read install record", path));
    }

    auto parsed = parse_install_record_full(*content, path);
    if (!parsed.ok) {
        return Result<std::optional<InstallRecord>>::err(
            Error(ErrorCode::IO_ERROR, "invalid install record: " + parsed.error, path));
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("install record {}: {}", path, w);
    }
    return Result<std::optional<InstallRecord>>::ok(std::move(parsed.record));
}

Result<void> save_install_record(const std::string& records_dir, const InstallRecord& record) {
    if (!is_directory(records_dir)) {
        auto dir = atomic_create_directory(records_dir);
        if (!dir.ok) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, dir.error, records_dir));
        }
    }

    std::string path = install_record_path(records_dir, record.install.install_id);
    std::string document;
    try {
        document = serialize_install_record(record);
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       std::string("cannot encode install record: ") + e.what(), path));
    }
    auto written = atomic_write_file(path, document);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error, path));
    }
    spdlog::debug("wrote install record {}", path);
    return Result<void>::ok();
}

Result<void> remove_install_record(const std::string& records_dir, const std::string& install_id) {
    std::string path = install_record_path(records_dir, install_id);
    if (path_exists(path) && !remove_file(path)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot remove install record", path));
    }
    return Result<void>::ok();
}

std::vector<InstallRecord> list_install_records(const std::string& records_dir) {
    std::vector<InstallRecord> records;
    if (!is_directory(records_dir)) {
        return records;
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(records_dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        std::string path = entry.path().string();
        auto content = read_file(path);
        if (!content) continue;

        auto parsed = parse_install_record_full(*content, path);
        if (!parsed.ok) {
            spdlog::warn("skipping install record {}: {}", path, parsed.error);
            continue;
        }
        records.push_back(std::move(parsed.record));
    }

    std::sort(records.begin(), records.end(),
              [](const InstallRecord& a, const InstallRecord& b) {
                  return a.install.install_id < b.install.install_id;
              });
    return records;
}

} // namespace hatch
