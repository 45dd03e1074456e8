#include "clawrun/actions.hpp"

#include "clawrun/platform.hpp"

#include <spdlog/spdlog.h>

#include <initializer_list>

namespace clawrun {

DesktopOps DesktopOps::system() {
    DesktopOps ops;
    ops.has_program = [](const std::string& name) { return find_on_path(name).has_value(); };
    ops.launch = [](const std::vector<std::string>& argv, const EnvOverrides& env) {
        return spawn_detached(argv, env);
    };
    return ops;
}

// ============================================================================
// Notifications
// ============================================================================

const char* notify_channel_to_string(NotifyChannel channel) {
    switch (channel) {
        case NotifyChannel::Kdialog: return "kdialog";
        case NotifyChannel::NotifySend: return "notify-send";
        case NotifyChannel::LogOnly: return "log";
    }
    return "log";
}

std::vector<std::string> notify_argv(NotifyChannel channel,
                                     const std::string& message,
                                     int seconds) {
    switch (channel) {
        case NotifyChannel::Kdialog:
            return {"kdialog", "--passivepopup", message, std::to_string(seconds)};
        case NotifyChannel::NotifySend:
            return {"notify-send", "claw-runner", message};
        case NotifyChannel::LogOnly:
            break;
    }
    return {};
}

NotifyChannel notify(const std::string& message, int seconds, const DesktopOps& ops) {
    spdlog::info("notify: {}", message);

    for (auto channel : {NotifyChannel::Kdialog, NotifyChannel::NotifySend}) {
        auto argv = notify_argv(channel, message, seconds);
        if (!ops.has_program(argv.front())) continue;

        auto launched = ops.launch(argv, {});
        if (launched.ok) return channel;
        spdlog::warn("notify: {} failed: {}", argv.front(), launched.error);
    }
    return NotifyChannel::LogOnly;
}

NotifyChannel notify(const std::string& message, int seconds) {
    return notify(message, seconds, DesktopOps::system());
}

NotifyChannel notify_service_result(const std::string& label,
                                    const ServiceActionResult& result,
                                    const DesktopOps& ops) {
    int seconds = result.ok ? kDefaultNotifySeconds : kFailureNotifySeconds;
    return notify(label + ": " + result.message, seconds, ops);
}

NotifyChannel notify_service_result(const std::string& label,
                                    const ServiceActionResult& result) {
    return notify_service_result(label, result, DesktopOps::system());
}

// ============================================================================
// Openers
// ============================================================================

std::vector<std::vector<std::string>> open_url_candidates(const std::string& url) {
    return {
        {"xdg-open", url},
        {"kde-open6", url},
        {"kde-open5", url},
        {"gio", "open", url},
    };
}

LaunchResult open_url(const std::string& url,
                      const std::string& activation_token,
                      const DesktopOps& ops) {
    EnvOverrides env;
    if (!activation_token.empty()) {
        env.emplace_back("XDG_ACTIVATION_TOKEN", activation_token);
    }

    LaunchResult last;
    last.error = "no URL opener found";

    for (const auto& argv : open_url_candidates(url)) {
        if (!ops.has_program(argv.front())) continue;

        last = ops.launch(argv, env);
        if (last.ok) {
            spdlog::info("open: {} via {}", url, argv.front());
            return last;
        }
        spdlog::warn("open: {} failed: {}", argv.front(), last.error);
    }

    spdlog::warn("open: cannot open {}: {}", url, last.error);
    return last;
}

std::string file_url(const std::string& path) {
    return "file://" + expand_user(path);
}

LaunchResult open_file(const std::string& path,
                       const std::string& activation_token,
                       const DesktopOps& ops) {
    return open_url(file_url(path), activation_token, ops);
}

} // namespace clawrun
