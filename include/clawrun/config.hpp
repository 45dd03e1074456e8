#pragma once

#include <string>
#include <vector>

namespace clawrun {

// ============================================================================
// Runner Configuration
// ============================================================================

struct RunnerConfig {
    std::string dashboard_url = "http://127.0.0.1:18789/";
    std::string cli = "clawdbot";
    std::vector<std::string> cli_aliases = {"clawdbot", "moltbot", "openclaw"};
    std::string gateway_service = "clawdbot-gateway.service";
    std::string runner_service = "claw-runner.service";
    std::string terminal;  // empty: $TERMINAL, then autodetect

    // File the config was loaded from; empty when not loaded from a file
    std::string source_path;
};

// Location shown to users in messages
inline constexpr const char* kConfigDisplayPath = "~/.config/claw-runner/config.json";

// ~/.config/claw-runner/config.json, expanded
std::string default_config_path();

// ============================================================================
// Config Parsing Result
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    RunnerConfig config;  // defaults when !ok
    std::vector<std::string> warnings;
};

// Parse a config from a JSON string. Invalid fields keep their defaults.
ConfigParseResult parse_config(const std::string& json_str,
                               const std::string& source_path = "");

/**
 * Load the config file at path.
 *
 * A missing file is not an error: the result is ok with defaults. A file
 * that cannot be parsed yields defaults, ok=false and the parse error.
 */
ConfigParseResult load_config(const std::string& path);

// Serialize the fields a user can edit, pretty-printed with a trailing newline
std::string config_to_json(const RunnerConfig& config);

struct DefaultConfigResult {
    bool ok = false;
    bool created = false;
    std::string path;
    std::string error;
};

// Write config to path unless a file already exists there
DefaultConfigResult write_default_config(const std::string& path, const RunnerConfig& config);

} // namespace clawrun
