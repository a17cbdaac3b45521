#pragma once

#include "hatch/result.hpp"
#include "hatch/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Engine Configuration
// ============================================================================
//
// <root>/config.json ("hatch.config.v1"). Every field is optional; relative
// paths resolve against the state root.

constexpr const char* CONFIG_SCHEMA = "hatch.config.v1";

struct EngineConfig {
    std::string schema;

    // State root everything else defaults under
    std::string root;

    // [paths] section
    struct {
        std::string applications_dir;  // start_menu launchers
        std::string desktop_dir;       // desktop launchers
        std::string store;             // file-backed system store
        std::string journal_dir;
        std::string records_dir;
    } paths;

    // [store] section
    struct {
        std::string classes_root;
    } store;

    // [privilege] section
    struct {
        bool require_root = false;
    } privilege;

    // [log] section
    struct {
        std::string level = "warn";
    } log;

    // [warnings] section - maps warning key to action
    WarningPolicy warnings;

    // Source path for trace
    std::string source_path;

    std::string lockPath() const;
};

// Defaults for a state root (XDG locations for launchers)
EngineConfig get_default_config(const std::string& root);

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    EngineConfig config;
    std::vector<std::string> warnings;
};

// Parse config JSON on top of the defaults for root
ConfigParseResult parse_config_full(const std::string& json_str,
                                    const std::string& root,
                                    const std::string& source_path = "");

// Load <root>/config.json, or config_path when given. A missing default file
// yields the defaults; a missing explicit file or a malformed one is a
// CONFIGURATION_ERROR. Environment overrides are applied last.
Result<EngineConfig> load_config(const std::string& root,
                                 const std::optional<std::string>& config_path = std::nullopt);

// HATCH_APPLICATIONS_DIR, HATCH_DESKTOP_DIR, HATCH_LOG_LEVEL
void apply_env_overrides(EngineConfig& config);

// --root > HATCH_ROOT > $XDG_DATA_HOME/hatch > ~/.local/share/hatch > .hatch
std::string resolve_state_root(const std::optional<std::string>& override_root);

// ============================================================================
// Logging
// ============================================================================

// trace | debug | info | warn | error | off
bool is_valid_log_level(const std::string& level);

// Set the spdlog level; unknown names leave it unchanged and return false
bool apply_log_level(const std::string& level);

} // namespace hatch
