/**
 * clawrun CLI - terminal and logs commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace clawrun::cli::commands {

namespace {

struct TerminalOptions {
    std::vector<std::string> command;
    bool dry_run = false;
};

struct LogsOptions {
    std::string service;
};

int launch_in_terminal(const GlobalOptions& opts,
                       const RunnerConfig& config,
                       const std::vector<std::string>& command) {
    auto launched = open_in_terminal(config.terminal, command);
    if (!launched.ok()) {
        notify(launched.error);
        print_error(launched.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["argv"] = launched.invocation->argv;
        output_json(j);
    }
    return 0;
}

int cmd_terminal(const GlobalOptions& opts, const TerminalOptions& term_opts) {
    auto config = load_runner_config(opts);

    if (!term_opts.dry_run) {
        return launch_in_terminal(opts, config, term_opts.command);
    }

    auto invocation = build_terminal_invocation(config.terminal, shell_join(term_opts.command));
    if (!invocation) {
        print_error("No terminal emulator found", opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["program"] = invocation->program;
        j["argv"] = invocation->argv;
        output_json(j);
    } else {
        std::cout << shell_join(invocation->argv) << std::endl;
    }
    return 0;
}

int cmd_logs(const GlobalOptions& opts, const LogsOptions& logs_opts) {
    auto config = load_runner_config(opts);

    std::string unit = logs_opts.service == "runner" ? config.runner_service
                                                     : config.gateway_service;
    if (unit.empty()) {
        print_error("No unit configured", opts.json);
        return 1;
    }

    return launch_in_terminal(opts, config, journal_follow_argv(unit));
}

} // anonymous namespace

void setup_terminal(CLI::App* app, GlobalOptions& opts) {
    static TerminalOptions term_opts;

    app->add_flag("--dry-run", term_opts.dry_run, "Print the terminal command instead of running it");
    app->add_option("command", term_opts.command, "Command to run (after --)")->required();

    app->callback([&opts]() {
        std::exit(cmd_terminal(opts, term_opts));
    });
}

void setup_logs(CLI::App* app, GlobalOptions& opts) {
    static LogsOptions logs_opts;

    app->add_option("service", logs_opts.service, "Which service journal to follow")
        ->required()
        ->check(CLI::IsMember({"gateway", "runner"}));

    app->callback([&opts]() {
        std::exit(cmd_logs(opts, logs_opts));
    });
}

} // namespace clawrun::cli::commands
