/**
 * clawrun CLI - open and notify commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace clawrun::cli::commands {

namespace {

struct OpenOptions {
    std::string target;
    std::string activation_token;
};

struct NotifyOptions {
    std::string message;
    int seconds = kDefaultNotifySeconds;
};

int cmd_open(const GlobalOptions& opts, const OpenOptions& open_opts) {
    auto config = load_runner_config(opts);
    auto ops = DesktopOps::system();

    std::string opened;
    LaunchResult launched;

    if (open_opts.target == "config") {
        std::string path = config.source_path.empty() ? default_config_path()
                                                      : config.source_path;
        auto created = write_default_config(path, config);
        if (!created.ok) {
            print_error("Failed to create " + path + ": " + created.error, opts.json);
            return 1;
        }
        opened = path;
        launched = open_file(path, open_opts.activation_token, ops);
        notify("Config: " + path, kDefaultNotifySeconds, ops);
    } else {
        opened = config.dashboard_url;
        launched = open_url(config.dashboard_url, open_opts.activation_token, ops);
    }

    if (!launched.ok) {
        print_error("Cannot open " + opened + ": " + launched.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["opened"] = opened;
        output_json(j);
    }
    return 0;
}

int cmd_notify(const GlobalOptions& opts, const NotifyOptions& notify_opts) {
    auto channel = notify(notify_opts.message, notify_opts.seconds);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["channel"] = notify_channel_to_string(channel);
        output_json(j);
    }
    return 0;
}

} // anonymous namespace

void setup_open(CLI::App* app, GlobalOptions& opts) {
    static OpenOptions open_opts;

    app->add_option("target", open_opts.target, "What to open")
        ->required()
        ->check(CLI::IsMember({"dashboard", "config"}));
    app->add_option("--activation-token", open_opts.activation_token,
                    "Token passed to the opener as XDG_ACTIVATION_TOKEN");

    app->callback([&opts]() {
        std::exit(cmd_open(opts, open_opts));
    });
}

void setup_notify(CLI::App* app, GlobalOptions& opts) {
    static NotifyOptions notify_opts;

    app->add_option("message", notify_opts.message, "Notification text")->required();
    app->add_option("--seconds", notify_opts.seconds, "How long the popup stays")
        ->check(CLI::PositiveNumber);

    app->callback([&opts]() {
        std::exit(cmd_notify(opts, notify_opts));
    });
}

} // namespace clawrun::cli::commands
