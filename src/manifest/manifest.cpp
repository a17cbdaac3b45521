#include "hatch/manifest.hpp"
#include "hatch/expansion.hpp"
#include "hatch/path_utils.hpp"
#include "hatch/platform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace hatch {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
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

bool get_bool(const nlohmann::json& j, const std::string& key, bool fallback) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return fallback;
}

// Required non-empty string; sets error and returns nullopt otherwise
std::optional<std::string> require_string(const nlohmann::json& j, const std::string& key,
                                          const std::string& where, std::string& error) {
    auto value = get_string(j, key);
    if (!value || trim(*value).empty()) {
        error = where + "." + key + " missing or empty";
        return std::nullopt;
    }
    return value;
}

const nlohmann::json* get_array(const nlohmann::json& j, const std::string& key,
                                std::string& error) {
    if (!j.contains(key)) return nullptr;
    if (!j[key].is_array()) {
        error = key + " must be an array";
        return nullptr;
    }
    return &j[key];
}

bool has_separator(const std::string& s) {
    return s.find('/') != std::string::npos || s.find('\\') != std::string::npos;
}

Result<void> config_error(const std::string& message) {
    return Result<void>::err(Error(ErrorCode::CONFIGURATION_ERROR, message));
}

Result<void> check_constants(const std::string& value, const std::string& where) {
    auto unknown = find_unknown_constants(value);
    if (!unknown.empty()) {
        return config_error(where + ": unknown constant {" + unknown.front() + "}");
    }
    return Result<void>::ok();
}

Result<void> check_task_ref(const Manifest& manifest, const std::string& task,
                            const std::string& where) {
    if (!task.empty() && !manifest.find_task(task)) {
        return config_error(where + ": unknown task '" + task + "'");
    }
    return Result<void>::ok();
}

} // namespace

const Task* Manifest::find_task(const std::string& id) const {
    for (const auto& task : tasks) {
        if (task.id == id) return &task;
    }
    return nullptr;
}

ManifestParseResult parse_manifest_full(const std::string& json_str,
                                        const std::string& source_path,
                                        const std::string& payload_root) {
    ManifestParseResult result;
    Manifest& m = result.manifest;
    m.source_path = source_path;
    m.payload_root = !payload_root.empty() ? payload_root
                   : !source_path.empty() ? get_parent_directory(absolute_path(source_path))
                   : std::string(".");

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            m.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }
        if (m.schema != MANIFEST_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + MANIFEST_SCHEMA;
            return result;
        }

        // "app" section (REQUIRED)
        if (!j.contains("app") || !j["app"].is_object()) {
            result.error = "app section missing";
            return result;
        }
        const auto& app = j["app"];
        auto id = require_string(app, "id", "app", result.error);
        if (!id) return result;
        m.app_id = trim(*id);
        m.app_name = get_string(app, "name").value_or(m.app_id);
        auto version = require_string(app, "version", "app", result.error);
        if (!version) return result;
        m.version = trim(*version);
        m.publisher = get_string(app, "publisher").value_or("");
        m.executable = get_string(app, "executable").value_or("");

        // "install" section (REQUIRED)
        if (!j.contains("install") || !j["install"].is_object()) {
            result.error = "install section missing";
            return result;
        }
        auto dir = require_string(j["install"], "dir", "install", result.error);
        if (!dir) return result;
        m.install_dir = *dir;

        // "files"
        if (auto* files = get_array(j, "files", result.error)) {
            for (size_t i = 0; i < files->size(); ++i) {
                const auto& f = (*files)[i];
                std::string where = "files[" + std::to_string(i) + "]";
                if (!f.is_object()) {
                    result.error = where + " must be an object";
                    return result;
                }
                FileEntry entry;
                auto src = require_string(f, "source", where, result.error);
                if (!src) return result;
                entry.source_path = *src;
                entry.dest_relative_path = get_string(f, "dest").value_or(get_filename(*src));
                auto overwrite = get_string(f, "overwrite").value_or("always");
                auto policy = parse_overwrite_policy(overwrite);
                if (!policy) {
                    result.error = where + ".overwrite invalid: " + overwrite;
                    return result;
                }
                entry.overwrite = *policy;
                entry.version = get_string(f, "version").value_or("");
                entry.recurse = get_bool(f, "recurse", false);
                m.payload_files.push_back(std::move(entry));
            }
        } else if (!result.error.empty()) {
            return result;
        }

        // "tasks"
        if (auto* tasks = get_array(j, "tasks", result.error)) {
            for (size_t i = 0; i < tasks->size(); ++i) {
                const auto& t = (*tasks)[i];
                std::string where = "tasks[" + std::to_string(i) + "]";
                if (!t.is_object()) {
                    result.error = where + " must be an object";
                    return result;
                }
                Task task;
                auto task_id = require_string(t, "id", where, result.error);
                if (!task_id) return result;
                task.id = trim(*task_id);
                task.description = get_string(t, "description").value_or("");
                task.default_selected = get_bool(t, "default", false);
                m.tasks.push_back(std::move(task));
            }
        } else if (!result.error.empty()) {
            return result;
        }

        // "associations"
        if (auto* assocs = get_array(j, "associations", result.error)) {
            for (size_t i = 0; i < assocs->size(); ++i) {
                const auto& a = (*assocs)[i];
                std::string where = "associations[" + std::to_string(i) + "]";
                if (!a.is_object()) {
                    result.error = where + " must be an object";
                    return result;
                }
                AssociationRule rule;
                auto ext = require_string(a, "extension", where, result.error);
                if (!ext) return result;
                auto prog_id = require_string(a, "prog_id", where, result.error);
                if (!prog_id) return result;
                auto command = require_string(a, "command", where, result.error);
                if (!command) return result;
                rule.extension = trim(*ext);
                rule.prog_id = trim(*prog_id);
                rule.open_command_template = *command;
                rule.friendly_name = get_string(a, "friendly_name").value_or("");
                rule.icon_ref = get_string(a, "icon").value_or("");
                rule.gating_task = get_string(a, "task").value_or("");
                m.associations.push_back(std::move(rule));
            }
        } else if (!result.error.empty()) {
            return result;
        }

        // "registry"
        if (auto* entries = get_array(j, "registry", result.error)) {
            for (size_t i = 0; i < entries->size(); ++i) {
                const auto& r = (*entries)[i];
                std::string where = "registry[" + std::to_string(i) + "]";
                if (!r.is_object()) {
                    result.error = where + " must be an object";
                    return result;
                }
                RegistryEntry entry;
                auto path = require_string(r, "path", where, result.error);
                if (!path) return result;
                entry.path = *path;
                entry.value_name = get_string(r, "value").value_or("");
                entry.data = get_string(r, "data").value_or("");
                // Never defaulted: the author decides what uninstall does
                auto uninstall = get_string(r, "uninstall");
                if (!uninstall) {
                    result.error = where + ".uninstall missing (delete_key | delete_value | leave)";
                    return result;
                }
                auto policy = parse_rollback_policy(*uninstall);
                if (!policy) {
                    result.error = where + ".uninstall invalid: " + *uninstall;
                    return result;
                }
                entry.rollback = *policy;
                entry.gating_task = get_string(r, "task").value_or("");
                m.registry.push_back(std::move(entry));
            }
        } else if (!result.error.empty()) {
            return result;
        }

        // "shortcuts"
        if (auto* shortcuts = get_array(j, "shortcuts", result.error)) {
            for (size_t i = 0; i < shortcuts->size(); ++i) {
                const auto& s = (*shortcuts)[i];
                std::string where = "shortcuts[" + std::to_string(i) + "]";
                if (!s.is_object()) {
                    result.error = where + " must be an object";
                    return result;
                }
                ShortcutEntry entry;
                auto name = require_string(s, "name", where, result.error);
                if (!name) return result;
                auto target = require_string(s, "target", where, result.error);
                if (!target) return result;
                entry.display_name = trim(*name);
                entry.target_path = *target;
                auto location = get_string(s, "location").value_or("start_menu");
                auto parsed = parse_shortcut_location(location);
                if (!parsed) {
                    result.error = where + ".location invalid: " + location;
                    return result;
                }
                entry.location = *parsed;
                entry.arguments = get_string_array(s, "arguments");
                entry.icon = get_string(s, "icon").value_or("");
                entry.comment = get_string(s, "comment").value_or("");
                entry.gating_task = get_string(s, "task").value_or("");
                m.shortcuts.push_back(std::move(entry));
            }
        } else if (!result.error.empty()) {
            return result;
        }

        // "run"
        if (j.contains("run")) {
            if (!j["run"].is_object()) {
                result.error = "run must be an object";
                return result;
            }
            RunCommand run;
            auto command = require_string(j["run"], "command", "run", result.error);
            if (!command) return result;
            run.command = *command;
            run.arguments = get_string_array(j["run"], "arguments");
            run.description = get_string(j["run"], "description").value_or("");
            m.post_install_run = std::move(run);
        }

        auto validation = validate_manifest(m);
        if (validation.isErr()) {
            result.error = validation.error().message();
            return result;
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

Result<Manifest> load_manifest(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<Manifest>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "cannot read manifest", path));
    }

    auto parsed = parse_manifest_full(*content, path);
    if (!parsed.ok) {
        return Result<Manifest>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, parsed.error, path));
    }
    return Result<Manifest>::ok(std::move(parsed.manifest));
}

Result<void> validate_manifest(const Manifest& m) {
    if (trim(m.app_id).empty()) {
        return config_error("app.id missing or empty");
    }
    if (has_separator(m.app_id) || m.app_id == "." || m.app_id == "..") {
        // Used as a file name for the journal and the install record
        return config_error("app.id must not contain path separators: " + m.app_id);
    }
    if (trim(m.install_dir).empty()) {
        return config_error("install.dir missing or empty");
    }
    if (m.install_dir.find("{app}") != std::string::npos) {
        return config_error("install.dir cannot reference {app}");
    }
    auto check = check_constants(m.install_dir, "install.dir");
    if (check.isErr()) return check;

    std::set<std::string> task_ids;
    for (const auto& task : m.tasks) {
        if (!task_ids.insert(task.id).second) {
            return config_error("duplicate task id '" + task.id + "'");
        }
    }

    for (size_t i = 0; i < m.payload_files.size(); ++i) {
        const auto& f = m.payload_files[i];
        std::string where = "files[" + std::to_string(i) + "]";
        if (!is_contained_relative_path(f.dest_relative_path)) {
            return config_error(where + ".dest must stay inside the install directory: " +
                                f.dest_relative_path);
        }
    }

    if (!m.associations.empty() && trim(m.executable).empty()) {
        return config_error("app.executable is required when associations are declared");
    }
    if (has_separator(m.executable)) {
        return config_error("app.executable must be a file name: " + m.executable);
    }

    std::set<std::string> extensions;
    for (size_t i = 0; i < m.associations.size(); ++i) {
        const auto& a = m.associations[i];
        std::string where = "associations[" + std::to_string(i) + "]";
        if (a.extension.size() < 2 || a.extension[0] != '.' || has_separator(a.extension)) {
            return config_error(where + ".extension invalid: " + a.extension);
        }
        if (a.prog_id.empty() || has_separator(a.prog_id)) {
            return config_error(where + ".prog_id invalid: " + a.prog_id);
        }
        // Store key names compare case-insensitively
        std::string lowered = a.extension;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!extensions.insert(lowered).second) {
            return config_error(where + ": duplicate extension " + a.extension);
        }
        for (const auto* field : {&a.icon_ref, &a.open_command_template, &a.friendly_name}) {
            check = check_constants(*field, where);
            if (check.isErr()) return check;
        }
        check = check_task_ref(m, a.gating_task, where);
        if (check.isErr()) return check;
    }

    for (size_t i = 0; i < m.registry.size(); ++i) {
        const auto& r = m.registry[i];
        std::string where = "registry[" + std::to_string(i) + "]";
        check = check_constants(r.path, where);
        if (check.isErr()) return check;
        check = check_constants(r.data, where);
        if (check.isErr()) return check;
        check = check_task_ref(m, r.gating_task, where);
        if (check.isErr()) return check;
    }

    std::set<std::pair<int, std::string>> shortcut_names;
    for (size_t i = 0; i < m.shortcuts.size(); ++i) {
        const auto& s = m.shortcuts[i];
        std::string where = "shortcuts[" + std::to_string(i) + "]";
        if (!shortcut_names.insert({static_cast<int>(s.location), s.display_name}).second) {
            return config_error(where + ": duplicate shortcut '" + s.display_name + "'");
        }
        check = check_constants(s.target_path, where);
        if (check.isErr()) return check;
        check = check_constants(s.icon, where);
        if (check.isErr()) return check;
        for (const auto& arg : s.arguments) {
            check = check_constants(arg, where);
            if (check.isErr()) return check;
        }
        check = check_task_ref(m, s.gating_task, where);
        if (check.isErr()) return check;
    }

    if (m.post_install_run) {
        check = check_constants(m.post_install_run->command, "run");
        if (check.isErr()) return check;
        for (const auto& arg : m.post_install_run->arguments) {
            check = check_constants(arg, "run");
            if (check.isErr()) return check;
        }
    }

    return Result<void>::ok();
}

Result<std::vector<FileEntry>> resolve_payload_files(const Manifest& manifest) {
    std::vector<FileEntry> resolved;

    for (const auto& entry : manifest.payload_files) {
        std::string source = entry.source_path;
        if (!source.empty() && source[0] != '/') {
            source = join_path(manifest.payload_root, source);
        }

        if (!entry.recurse) {
            FileEntry copy = entry;
            copy.source_path = source;
            resolved.push_back(std::move(copy));
            continue;
        }

        if (!is_directory(source)) {
            return Result<std::vector<FileEntry>>::err(
                Error(ErrorCode::DEPLOYMENT_ERROR, "source directory not found", source));
        }

        for (const auto& rel : list_files_recursive(source)) {
            FileEntry file;
            file.source_path = join_path(source, rel);
            file.dest_relative_path = join_path(entry.dest_relative_path, rel);
            file.overwrite = entry.overwrite;
            file.version = entry.version;
            resolved.push_back(std::move(file));
        }
    }

    return Result<std::vector<FileEntry>>::ok(std::move(resolved));
}

} // namespace hatch
