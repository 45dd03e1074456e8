/**
 * clawrun CLI - Common utilities and types
 */

#pragma once

#include <clawrun/clawrun.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>

#include <iostream>
#include <string>
#include <vector>

namespace clawrun::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_path;  // --config
    bool json = false;        // --json
    bool verbose = false;     // -v, --verbose
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Logging goes to stderr so stdout stays parseable.
 * Priority: -v > CLAW_RUNNER_LOGLEVEL > info
 */
inline void setup_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("clawrun");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(log_level_from_name(get_env("CLAW_RUNNER_LOGLEVEL")));
    }
}

/**
 * Load the runner config.
 * Priority: --config flag > ~/.config/claw-runner/config.json
 *
 * Problems never stop a command: defaults are used. load_config already
 * logs them; JSON output also carries them as warnings.
 */
inline RunnerConfig load_runner_config(const GlobalOptions& opts) {
    std::string path = opts.config_path.empty() ? default_config_path()
                                                : expand_user(opts.config_path);
    auto result = load_config(path);
    if (!opts.json) {
        return result.config;
    }
    if (!result.ok) {
        get_warning_collector().add("ignoring " + path + ": " + result.error);
    }
    for (const auto& w : result.warnings) {
        get_warning_collector().add(w);
    }
    return result.config;
}

inline ResolvedExecutable resolve_cli(const RunnerConfig& config) {
    return resolve_executable(config.cli, config.cli_aliases);
}

inline nlohmann::json resolved_to_json(const ResolvedExecutable& exe) {
    nlohmann::json j;
    j["path"] = exe.path;
    j["found"] = exe.found;
    j["configured"] = exe.configured;
    return j;
}

} // namespace clawrun::cli
