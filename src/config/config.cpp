#include "clawrun/config.hpp"

#include "clawrun/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace clawrun {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

const nlohmann::json* find_key(const nlohmann::json& j,
                               const char* key,
                               const char* alt_key,
                               std::string& found_as) {
    if (j.contains(key)) {
        found_as = key;
        return &j[key];
    }
    if (alt_key && j.contains(alt_key)) {
        found_as = alt_key;
        return &j[alt_key];
    }
    return nullptr;
}

// Read a non-blank string field; anything else keeps the default and warns
void read_string(const nlohmann::json& j,
                 const char* key,
                 const char* alt_key,
                 std::string& target,
                 std::vector<std::string>& warnings,
                 bool allow_blank = false) {
    std::string found_as;
    const auto* value = find_key(j, key, alt_key, found_as);
    if (!value) return;

    if (!value->is_string()) {
        warnings.push_back("invalid_configuration:" + found_as);
        return;
    }

    std::string s = trim(value->get<std::string>());
    if (s.empty() && !allow_blank) {
        warnings.push_back("invalid_configuration:" + found_as);
        return;
    }
    target = s;
}

void read_string_array(const nlohmann::json& j,
                       const char* key,
                       const char* alt_key,
                       std::vector<std::string>& target,
                       std::vector<std::string>& warnings) {
    std::string found_as;
    const auto* value = find_key(j, key, alt_key, found_as);
    if (!value) return;

    if (!value->is_array()) {
        warnings.push_back("invalid_configuration:" + found_as);
        return;
    }

    std::vector<std::string> result;
    for (const auto& elem : *value) {
        if (elem.is_string()) {
            std::string s = trim(elem.get<std::string>());
            if (!s.empty()) result.push_back(s);
        }
    }
    target = result;
}

} // namespace

std::string default_config_path() {
    return expand_user(kConfigDisplayPath);
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        auto& cfg = result.config;
        read_string(j, "dashboardUrl", "dashboard_url", cfg.dashboard_url, result.warnings);
        read_string(j, "cli", nullptr, cfg.cli, result.warnings);
        read_string_array(j, "cliAliases", "cli_aliases", cfg.cli_aliases, result.warnings);
        read_string(j, "gatewayService", "gateway_service", cfg.gateway_service, result.warnings);
        read_string(j, "runnerService", "runner_service", cfg.runner_service, result.warnings);
        // A blank terminal means "autodetect"
        read_string(j, "terminal", nullptr, cfg.terminal, result.warnings, true);

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

ConfigParseResult load_config(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        ConfigParseResult result;
        result.ok = true;
        result.config.source_path = path;
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.config.source_path = path;
        result.error = "cannot read " + path;
        spdlog::warn("config: {}; using defaults", result.error);
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();

    auto result = parse_config(ss.str(), path);
    if (!result.ok) {
        // Fail closed to defaults
        spdlog::warn("config: {} in {}; using defaults", result.error, path);
        result.config = RunnerConfig{};
        result.config.source_path = path;
    }
    for (const auto& w : result.warnings) {
        spdlog::warn("config: {} ({})", w, path);
    }
    return result;
}

std::string config_to_json(const RunnerConfig& config) {
    nlohmann::ordered_json j;
    j["dashboardUrl"] = config.dashboard_url;
    j["cli"] = config.cli;
    j["cliAliases"] = config.cli_aliases;
    j["gatewayService"] = config.gateway_service;
    j["runnerService"] = config.runner_service;
    j["terminal"] = config.terminal;
    return j.dump(2) + "\n";
}

DefaultConfigResult write_default_config(const std::string& path, const RunnerConfig& config) {
    DefaultConfigResult result;
    result.path = path;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        result.ok = true;
        return result;
    }

    auto write = atomic_write_file(path, config_to_json(config));
    if (!write.ok) {
        result.error = write.error;
        return result;
    }

    spdlog::info("config: created {}", path);
    result.ok = true;
    result.created = true;
    return result;
}

} // namespace clawrun
