#include "clawrun/actions.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace clawrun {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

const char* service_verb_to_string(ServiceVerb verb) {
    switch (verb) {
        case ServiceVerb::Start: return "start";
        case ServiceVerb::Stop: return "stop";
        case ServiceVerb::Restart: return "restart";
    }
    return "restart";
}

ServiceVerb parse_service_verb(const std::string& verb) {
    std::string v = trim(verb);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "start") return ServiceVerb::Start;
    if (v == "stop") return ServiceVerb::Stop;
    if (v != "restart") {
        spdlog::debug("service: unknown verb '{}', using restart", verb);
    }
    return ServiceVerb::Restart;
}

std::vector<std::string> systemctl_user_argv(ServiceVerb verb, const std::string& unit) {
    return {"systemctl", "--user", service_verb_to_string(verb), unit};
}

ServiceActionResult systemctl_user(ServiceVerb verb,
                                   const std::string& unit,
                                   const CommandRunner& run) {
    ServiceActionResult result;

    std::string name = trim(unit);
    if (name.empty()) {
        result.message = "No unit configured";
        return result;
    }

    std::string prefix = std::string(service_verb_to_string(verb)) + " " + name + ": ";
    ProcessResult proc = run(systemctl_user_argv(verb, name), kServiceTimeout);
    if (!proc.ok()) {
        result.message = prefix + describe_failure(proc, kServiceTimeout);
        spdlog::warn("service: {}", result.message);
        return result;
    }

    spdlog::info("service: {} {}", service_verb_to_string(verb), name);
    result.ok = true;
    result.message = prefix + "OK";
    return result;
}

std::vector<std::string> journal_follow_argv(const std::string& unit) {
    return {"journalctl", "--user", "-u", trim(unit), "-f"};
}

} // namespace clawrun
