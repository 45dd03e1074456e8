#pragma once

/**
 * @file actions.hpp
 * @brief Side-effecting runner actions: user services and the desktop
 *
 * Service control is captured and waited on. Desktop actions (notifications,
 * URL openers) are launched detached and never waited on.
 */

#include "clawrun/process.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace clawrun {

// ============================================================================
// User Services
// ============================================================================

enum class ServiceVerb {
    Start,
    Stop,
    Restart
};

const char* service_verb_to_string(ServiceVerb verb);

// Unknown or blank verbs become Restart
ServiceVerb parse_service_verb(const std::string& verb);

inline constexpr std::chrono::milliseconds kServiceTimeout{8000};

struct ServiceActionResult {
    bool ok = false;
    std::string message;  // "<verb> <unit>: OK" or "<verb> <unit>: <error>"
};

std::vector<std::string> systemctl_user_argv(ServiceVerb verb, const std::string& unit);

// systemctl --user <verb> <unit>, bounded by kServiceTimeout
ServiceActionResult systemctl_user(ServiceVerb verb,
                                   const std::string& unit,
                                   const CommandRunner& run = run_process);

// journalctl --user -u <unit> -f
std::vector<std::string> journal_follow_argv(const std::string& unit);

// ============================================================================
// Desktop
// ============================================================================

// Seams for everything that touches the desktop session
struct DesktopOps {
    std::function<bool(const std::string&)> has_program;
    Launcher launch;

    // PATH lookup and spawn_detached
    static DesktopOps system();
};

enum class NotifyChannel {
    Kdialog,
    NotifySend,
    LogOnly
};

const char* notify_channel_to_string(NotifyChannel channel);

inline constexpr int kDefaultNotifySeconds = 3;

std::vector<std::string> notify_argv(NotifyChannel channel,
                                     const std::string& message,
                                     int seconds);

/**
 * Best-effort notification: kdialog, then notify-send, then the log alone.
 * The message is always logged. Returns the channel that delivered it.
 */
NotifyChannel notify(const std::string& message,
                     int seconds,
                     const DesktopOps& ops);

NotifyChannel notify(const std::string& message, int seconds = kDefaultNotifySeconds);

// Failures stay on screen longer
inline constexpr int kFailureNotifySeconds = 6;

// "<label>: <message>", shown for kDefaultNotifySeconds or kFailureNotifySeconds
NotifyChannel notify_service_result(const std::string& label,
                                    const ServiceActionResult& result,
                                    const DesktopOps& ops);

NotifyChannel notify_service_result(const std::string& label,
                                    const ServiceActionResult& result);

// Opener commands for url, in preference order
std::vector<std::vector<std::string>> open_url_candidates(const std::string& url);

/**
 * Open url with the first present opener that launches. A non-empty
 * activation_token is passed as XDG_ACTIVATION_TOKEN.
 */
LaunchResult open_url(const std::string& url,
                      const std::string& activation_token,
                      const DesktopOps& ops);

// file://<path>, with ~ expanded
std::string file_url(const std::string& path);

LaunchResult open_file(const std::string& path,
                       const std::string& activation_token,
                       const DesktopOps& ops);

} // namespace clawrun
