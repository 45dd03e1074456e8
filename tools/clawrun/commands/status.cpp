/**
 * clawrun CLI - status, resolve and verbose-status commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace clawrun::cli::commands {

namespace {

struct StatusOptions {
    bool notify = false;
};

int cmd_status(const GlobalOptions& opts, const StatusOptions& status_opts) {
    auto config = load_runner_config(opts);
    auto exe = resolve_cli(config);

    std::string summary = summarize_status(exe);
    if (status_opts.notify) {
        notify(summary);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = exe.found;
        j["summary"] = summary;
        j["cli"] = resolved_to_json(exe);
        output_json(j);
    } else {
        std::cout << summary << std::endl;
    }

    return exe.found ? 0 : 1;
}

int cmd_resolve(const GlobalOptions& opts) {
    auto config = load_runner_config(opts);
    auto exe = resolve_cli(config);

    if (opts.json) {
        nlohmann::json j = resolved_to_json(exe);
        j["ok"] = exe.found;
        j["aliases"] = config.cli_aliases;
        output_json(j);
        return exe.found ? 0 : 1;
    }

    if (!exe.found) {
        print_error(cli_not_found_message(exe), opts.json);
        return 1;
    }

    std::cout << exe.path << std::endl;
    return 0;
}

int cmd_verbose_status(const GlobalOptions& opts) {
    auto config = load_runner_config(opts);
    auto exe = resolve_cli(config);

    if (!exe.found) {
        std::string msg = cli_not_found_message(exe);
        notify(msg);
        print_error(msg, opts.json);
        return 1;
    }

    auto argv = verbose_status_argv(exe);
    auto launched = open_in_terminal(config.terminal, argv);
    if (!launched.ok()) {
        notify(launched.error);
        print_error(launched.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["command"] = argv;
        j["terminal"] = launched.invocation->argv;
        output_json(j);
    }
    return 0;
}

} // anonymous namespace

void setup_status(CLI::App* app, GlobalOptions& opts) {
    static StatusOptions status_opts;

    app->add_flag("--notify", status_opts.notify, "Also show the summary as a notification");

    app->callback([&opts]() {
        std::exit(cmd_status(opts, status_opts));
    });
}

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_resolve(opts));
    });
}

void setup_verbose_status(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_verbose_status(opts));
    });
}

} // namespace clawrun::cli::commands
