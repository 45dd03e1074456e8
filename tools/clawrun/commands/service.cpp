/**
 * clawrun CLI - gateway command
 *
 * Control the gateway's systemd user unit and report the outcome.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace clawrun::cli::commands {

namespace {

struct GatewayOptions {
    std::string verb;
};

int cmd_gateway(const GlobalOptions& opts, const GatewayOptions& gateway_opts) {
    auto config = load_runner_config(opts);

    ServiceVerb verb = parse_service_verb(gateway_opts.verb);
    auto result = systemctl_user(verb, config.gateway_service);
    notify_service_result("Gateway", result);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["verb"] = service_verb_to_string(verb);
        j["unit"] = config.gateway_service;
        j["message"] = result.message;
        output_json(j);
    } else if (result.ok) {
        print_success(result.message, opts.json);
    } else {
        print_error(result.message, opts.json);
    }

    return result.ok ? 0 : 1;
}

} // anonymous namespace

void setup_gateway(CLI::App* app, GlobalOptions& opts) {
    static GatewayOptions gateway_opts;

    // Unknown verbs fall back to restart rather than failing
    app->add_option("verb", gateway_opts.verb, "start, stop or restart")->required();

    app->callback([&opts]() {
        std::exit(cmd_gateway(opts, gateway_opts));
    });
}

} // namespace clawrun::cli::commands
