#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clawrun {

// ============================================================================
// Executable Resolution
// ============================================================================

struct ResolvedExecutable {
    std::string path;        // absolute path when found, best guess otherwise
    bool found = false;
    std::string configured;  // reference exactly as the user configured it
};

// ============================================================================
// Status Record
// ============================================================================

// Canonical channel states. Anything else is carried as an uppercased token.
inline constexpr const char* kStateOk = "OK";
inline constexpr const char* kStateDown = "DOWN";
inline constexpr const char* kStateUnknown = "?";

struct StatusRecord {
    bool gateway_ok = false;
    std::map<std::string, std::string> channels;  // lowercase name -> state
    std::optional<int> session_count;

    // State for a channel, "?" when the record holds nothing for it
    std::string channel_state(const std::string& name) const;
};

// ============================================================================
// Terminal Invocation
// ============================================================================

struct TerminalInvocation {
    std::string program;             // always argv[0]
    std::vector<std::string> argv;
};

} // namespace clawrun
