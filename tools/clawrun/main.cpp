/**
 * clawrun CLI - Entry Point
 *
 * Status, service control and terminals for the claw CLI from one command.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace clawrun::cli::commands {
    void setup_status(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_verbose_status(CLI::App* app, GlobalOptions& opts);
    void setup_terminal(CLI::App* app, GlobalOptions& opts);
    void setup_gateway(CLI::App* app, GlobalOptions& opts);
    void setup_logs(CLI::App* app, GlobalOptions& opts);
    void setup_open(CLI::App* app, GlobalOptions& opts);
    void setup_notify(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace clawrun::cli;

    CLI::App app{"clawrun - desktop runner for the claw CLI"};
    app.set_version_flag("-V,--version", CLAWRUN_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config_path, "Config file (default ~/.config/claw-runner/config.json)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");

    // Runs after global options are parsed and before any subcommand callback
    app.parse_complete_callback([&opts]() {
        setup_logging(opts);
        init_warning_collector(opts.json);
    });

    auto* status_cmd = app.add_subcommand("status", "Print the one-line status summary");
    commands::setup_status(status_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Show which CLI executable would be used");
    commands::setup_resolve(resolve_cmd, opts);

    auto* verbose_cmd = app.add_subcommand("verbose-status", "Open a terminal with the full status");
    commands::setup_verbose_status(verbose_cmd, opts);

    auto* terminal_cmd = app.add_subcommand("terminal", "Run a command in a terminal window");
    commands::setup_terminal(terminal_cmd, opts);

    auto* gateway_cmd = app.add_subcommand("gateway", "Start, stop or restart the gateway service");
    commands::setup_gateway(gateway_cmd, opts);

    auto* logs_cmd = app.add_subcommand("logs", "Follow a service journal in a terminal");
    commands::setup_logs(logs_cmd, opts);

    auto* open_cmd = app.add_subcommand("open", "Open the dashboard or the config file");
    commands::setup_open(open_cmd, opts);

    auto* notify_cmd = app.add_subcommand("notify", "Show a desktop notification");
    commands::setup_notify(notify_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
