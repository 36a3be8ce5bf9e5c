#pragma once

#include "progman/export.hpp"
#include "progman/result.hpp"

#include <optional>
#include <string>

namespace progman {

// ============================================================================
// Application Configuration
// ============================================================================

/// File name of the configuration inside the config directory
constexpr const char* CONFIG_FILENAME = "config.json";

/**
 * @brief User settings persisted as config.json
 *
 * Stored as {"localPath": "...", "mirrorPath": "..."}.
 */
struct AppConfig {
    std::string local_path;   // library root holding program/version directories
    std::string mirror_path;  // optional mirror location, stored only
};

/**
 * @brief Resolve the directory holding config.json
 *
 * Priority: explicit override > PROGMAN_CONFIG_DIR > $XDG_CONFIG_HOME/progman
 * > $HOME/.config/progman > %APPDATA%/progman > .progman
 */
PROGMAN_API std::string resolve_config_dir(const std::optional<std::string>& override_dir);

/// Default library root: PROGMAN_LIBRARY > $HOME/ProgramManager > ProgramManager
PROGMAN_API std::string default_library_path();

PROGMAN_API AppConfig default_config();

// Parse config.json content. Missing keys keep their defaults.
PROGMAN_API Result<AppConfig> parse_config(const std::string& json_str,
                                           const std::string& source_path = "");

PROGMAN_API std::string serialize_config(const AppConfig& config);

/// Load config.json from a directory; a missing file yields the defaults
PROGMAN_API Result<AppConfig> load_config(const std::string& config_dir);

/// Write config.json atomically, creating the directory if needed
PROGMAN_API Result<void> save_config(const std::string& config_dir, const AppConfig& config);

} // namespace progman
