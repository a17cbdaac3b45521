/**
 * hatch CLI - Common utilities and types
 */

#pragma once

#include <hatch/hatch.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <optional>
#include <string>

namespace hatch::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr so --json output on stdout stays clean.
 */
inline void init_logging() {
    static bool initialized = false;
    if (initialized) return;
    auto logger = spdlog::stderr_color_mt("hatch");
    logger->set_pattern("%^[%l]%$ %v");
    spdlog::set_default_logger(logger);
    initialized = true;
}

/**
 * Resolve the state root and load its configuration. The log level comes from
 * the config, raised by -v and lowered by -q.
 */
inline Result<EngineConfig> load_engine_config(const GlobalOptions& opts) {
    init_logging();

    std::string root = resolve_state_root(
        opts.root.empty() ? std::nullopt : std::make_optional(opts.root));

    auto config = load_config(root,
        opts.config.empty() ? std::nullopt : std::make_optional(opts.config));
    if (config.isErr()) {
        return config;
    }

    if (opts.verbose) {
        apply_log_level("debug");
    } else if (opts.quiet) {
        apply_log_level("error");
    } else {
        apply_log_level(config.value().log.level);
    }

    spdlog::debug("state root: {}", config.value().root);
    return config;
}

/**
 * Output utilities.
 */
inline nlohmann::json warnings_to_json(const WarningCollector& collector) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : collector.get_warnings()) {
        nlohmann::json j;
        j["key"] = w.key;
        j["action"] = w.action;
        j["fields"] = nlohmann::json::object();
        for (const auto& [k, v] : w.fields) {
            j["fields"][k] = v;
        }
        arr.push_back(std::move(j));
    }
    return arr;
}

inline void print_warnings(const WarningCollector& collector, bool quiet) {
    if (quiet) return;
    for (const auto& w : collector.get_warnings()) {
        std::cerr << (w.action == "error" ? "Error: " : "Warning: ")
                  << format_warning(w) << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode,
                        const WarningCollector* collector = nullptr) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = {
            {"code", error_code_to_string(error.code())},
            {"message", error.message()},
        };
        if (!error.path().empty()) {
            j["error"]["path"] = error.path();
        }
        j["exit_code"] = exit_code_for(error);
        if (collector) {
            j["warnings"] = warnings_to_json(*collector);
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        if (collector) {
            print_warnings(*collector, false);
        }
        std::cerr << "Error: " << error.toString() << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Directories a mutating session writes to, for the privilege check.
 */
inline std::vector<std::string> session_directories(const EngineConfig& config) {
    return {
        config.root,
        get_parent_directory(config.paths.store),
        config.paths.journal_dir,
        config.paths.records_dir,
        config.paths.applications_dir,
        config.paths.desktop_dir,
    };
}

/**
 * Exit code for a finished session: warnings escalated to errors by the
 * configured policy turn success into a generic failure.
 */
inline int session_exit_code(const WarningCollector& collector) {
    return collector.has_errors() ? EXIT_GENERIC : EXIT_OK;
}

} // namespace hatch::cli
