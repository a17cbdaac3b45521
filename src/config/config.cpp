#include "hatch/config.hpp"
#include "hatch/plan.hpp"
#include "hatch/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace hatch {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string resolve_against(const std::string& root, const std::string& path) {
    if (path.empty() || path[0] == '/') return path;
    return join_path(root, path);
}

std::string data_home() {
    if (auto xdg = get_env("XDG_DATA_HOME")) return *xdg;
    if (auto home = get_env("HOME")) return *home + "/.local/share";
    return "";
}

std::optional<spdlog::level::level_enum> to_spdlog_level(const std::string& level) {
    std::string lower = to_lower(trim(level));
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace

std::string EngineConfig::lockPath() const {
    return join_path(root, "hatch.lock");
}

EngineConfig get_default_config(const std::string& root) {
    EngineConfig config;
    config.schema = CONFIG_SCHEMA;
    config.root = root;

    std::string share = data_home();
    config.paths.applications_dir = !share.empty() ? share + "/applications"
                                                   : join_path(root, "applications");
    if (auto desktop = get_env("XDG_DESKTOP_DIR")) {
        config.paths.desktop_dir = *desktop;
    } else if (auto home = get_env("HOME")) {
        config.paths.desktop_dir = *home + "/Desktop";
    } else {
        config.paths.desktop_dir = join_path(root, "Desktop");
    }

    config.paths.store = join_path(root, "store.json");
    config.paths.journal_dir = join_path(root, "journal");
    config.paths.records_dir = join_path(root, "records");
    config.store.classes_root = DEFAULT_CLASSES_ROOT;
    return config;
}

ConfigParseResult parse_config_full(const std::string& json_str,
                                    const std::string& root,
                                    const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_default_config(root);
    result.config.source_path = source_path;
    EngineConfig& config = result.config;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }
        if (config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        // "paths" section
        if (j.contains("paths") && j["paths"].is_object()) {
            const auto& paths = j["paths"];
            if (auto v = get_string(paths, "applications_dir")) {
                config.paths.applications_dir = resolve_against(root, *v);
            }
            if (auto v = get_string(paths, "desktop_dir")) {
                config.paths.desktop_dir = resolve_against(root, *v);
            }
            if (auto v = get_string(paths, "store")) {
                config.paths.store = resolve_against(root, *v);
            }
            if (auto v = get_string(paths, "journal_dir")) {
                config.paths.journal_dir = resolve_against(root, *v);
            }
            if (auto v = get_string(paths, "records_dir")) {
                config.paths.records_dir = resolve_against(root, *v);
            }
        }

        // "store" section
        if (j.contains("store") && j["store"].is_object()) {
            if (auto v = get_string(j["store"], "classes_root")) {
                if (trim(*v).empty()) {
                    result.error = "store.classes_root empty";
                    return result;
                }
                config.store.classes_root = *v;
            }
        }

        // "privilege" section
        if (j.contains("privilege") && j["privilege"].is_object()) {
            const auto& privilege = j["privilege"];
            if (privilege.contains("require_root")) {
                if (!privilege["require_root"].is_boolean()) {
                    result.error = "privilege.require_root must be a boolean";
                    return result;
                }
                config.privilege.require_root = privilege["require_root"].get<bool>();
            }
        }

        // "log" section
        if (j.contains("log") && j["log"].is_object()) {
            if (auto v = get_string(j["log"], "level")) {
                if (!is_valid_log_level(*v)) {
                    result.error = "log.level invalid: " + *v;
                    return result;
                }
                config.log.level = to_lower(trim(*v));
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (!val.is_string()) {
                    result.warnings.push_back("invalid_warning_action:" + key);
                    continue;
                }
                auto action = parse_warning_action(val.get<std::string>());
                if (!action) {
                    result.warnings.push_back("invalid_warning_action:" + key);
                    continue;
                }
                if (!parse_warning_key(key)) {
                    result.warnings.push_back("unknown_warning_key:" + key);
                }
                config.warnings[to_lower(key)] = *action;
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

Result<EngineConfig> load_config(const std::string& root,
                                 const std::optional<std::string>& config_path) {
    std::string path = config_path ? *config_path : join_path(root, "config.json");

    EngineConfig config;
    auto content = read_file(path);
    if (!content) {
        if (config_path) {
            return Result<EngineConfig>::err(
                Error(ErrorCode::CONFIGURATION_ERROR, "cannot read config", path));
        }
        config = get_default_config(root);
    } else {
        auto parsed = parse_config_full(*content, root, path);
        if (!parsed.ok) {
            return Result<EngineConfig>::err(
                Error(ErrorCode::CONFIGURATION_ERROR, parsed.error, path));
        }
        for (const auto& w : parsed.warnings) {
            spdlog::warn("config {}: {}", path, w);
        }
        config = std::move(parsed.config);
    }

    apply_env_overrides(config);
    return Result<EngineConfig>::ok(std::move(config));
}

void apply_env_overrides(EngineConfig& config) {
    if (auto v = get_env("HATCH_APPLICATIONS_DIR")) {
        config.paths.applications_dir = *v;
    }
    if (auto v = get_env("HATCH_DESKTOP_DIR")) {
        config.paths.desktop_dir = *v;
    }
    if (auto v = get_env("HATCH_LOG_LEVEL")) {
        if (is_valid_log_level(*v)) {
            config.log.level = to_lower(trim(*v));
        } else {
            spdlog::warn("ignoring invalid HATCH_LOG_LEVEL '{}'", *v);
        }
    }
}

std::string resolve_state_root(const std::optional<std::string>& override_root) {
    // 1. Explicit override
    if (override_root && !override_root->empty()) {
        return *override_root;
    }

    // 2. Environment variable
    if (auto env_root = get_env("HATCH_ROOT")) {
        return *env_root;
    }

    // 3. XDG data home
    std::string share = data_home();
    if (!share.empty()) {
        return share + "/hatch";
    }

    return ".hatch";
}

bool is_valid_log_level(const std::string& level) {
    return to_spdlog_level(level).has_value();
}

bool apply_log_level(const std::string& level) {
    auto parsed = to_spdlog_level(level);
    if (!parsed) return false;
    spdlog::set_level(*parsed);
    return true;
}

} // namespace hatch
