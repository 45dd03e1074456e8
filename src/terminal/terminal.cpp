#include "clawrun/terminal.hpp"

#include "clawrun/platform.hpp"
#include "clawrun/shell_words.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <map>

namespace clawrun {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Arguments placed between the emulator (with its own args) and the command
const std::map<std::string, std::vector<std::string>>& terminal_handlers() {
    static const std::map<std::string, std::vector<std::string>> handlers = {
        {"kitty", {"--hold", "sh", "-lc"}},
        {"konsole", {"--hold", "-e", "sh", "-lc"}},
        {"alacritty", {"--hold", "-e", "sh", "-lc"}},
        {"xterm", {"-hold", "-e", "sh", "-lc"}},
        {"gnome-terminal", {"--", "bash", "-lc"}},
    };
    return handlers;
}

const std::vector<std::string>& generic_handler() {
    static const std::vector<std::string> args = {"-e", "sh", "-lc"};
    return args;
}

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

} // namespace

// ============================================================================
// Discovery
// ============================================================================

TerminalEnvironment TerminalEnvironment::from_environment() {
    TerminalEnvironment env;
    env.env_terminal = get_env("TERMINAL");
    env.path_dirs = split_search_path(get_env("PATH"));
    return env;
}

const std::vector<std::string>& known_terminals() {
    static const std::vector<std::string> names = {
        "x-terminal-emulator",
        "kitty",
        "alacritty",
        "konsole",
        "gnome-terminal",
        "xterm",
    };
    return names;
}

std::string resolve_terminal(const std::string& configured, const TerminalEnvironment& env) {
    std::string terminal = trim(configured);
    if (!terminal.empty()) {
        spdlog::debug("terminal: using configured '{}'", terminal);
        return terminal;
    }

    terminal = trim(env.env_terminal);
    if (!terminal.empty()) {
        spdlog::debug("terminal: using $TERMINAL '{}'", terminal);
        return terminal;
    }

    for (const auto& name : known_terminals()) {
        if (find_in_directories(env.path_dirs, name)) {
            spdlog::debug("terminal: detected {}", name);
            return name;
        }
    }

    spdlog::debug("terminal: none of {} known terminals on PATH", known_terminals().size());
    return "";
}

// ============================================================================
// Argv Synthesis
// ============================================================================

std::string keep_open_command(const std::string& shell_command) {
    return shell_command + "; echo; exec \"${SHELL:-bash}\" -l";
}

std::vector<std::string> terminal_argv(const std::string& terminal_command,
                                       const std::string& shell_command) {
    if (trim(terminal_command).empty()) return {};

    std::string wrapped = keep_open_command(shell_command);

    if (terminal_command.find(kCommandPlaceholder) != std::string::npos) {
        auto words = shell_split(
            replace_all(terminal_command, kCommandPlaceholder, shell_quote(wrapped)));
        if (!words) {
            spdlog::warn("terminal: cannot split '{}': unbalanced quotes", terminal_command);
            return {};
        }
        return *words;
    }

    auto words = shell_split(terminal_command);
    if (!words) {
        spdlog::warn("terminal: cannot split '{}': unbalanced quotes", terminal_command);
        return {};
    }
    if (words->empty()) return {};

    std::vector<std::string> argv = *words;
    const auto& handlers = terminal_handlers();
    auto it = handlers.find(get_filename(argv.front()));
    const auto& trailing = it != handlers.end() ? it->second : generic_handler();

    argv.insert(argv.end(), trailing.begin(), trailing.end());
    argv.push_back(wrapped);
    return argv;
}

std::optional<TerminalInvocation> build_terminal_invocation(
    const std::string& terminal_reference,
    const std::string& shell_command,
    const TerminalEnvironment& env) {
    std::string terminal = resolve_terminal(terminal_reference, env);
    if (terminal.empty()) return std::nullopt;

    auto argv = terminal_argv(terminal, shell_command);
    if (argv.empty()) return std::nullopt;

    TerminalInvocation invocation;
    invocation.program = argv.front();
    invocation.argv = std::move(argv);
    return invocation;
}

std::optional<TerminalInvocation> build_terminal_invocation(
    const std::string& terminal_reference,
    const std::string& shell_command) {
    return build_terminal_invocation(terminal_reference, shell_command,
                                     TerminalEnvironment::from_environment());
}

// ============================================================================
// Launch
// ============================================================================

TerminalLaunchResult open_in_terminal(const std::string& configured_terminal,
                                      const std::vector<std::string>& command,
                                      const TerminalEnvironment& env,
                                      const Launcher& launch) {
    TerminalLaunchResult result;

    auto invocation = build_terminal_invocation(configured_terminal, shell_join(command), env);
    if (!invocation) {
        result.status = TerminalLaunchStatus::NoTerminal;
        result.error = "No terminal emulator found";
        return result;
    }
    result.invocation = invocation;

    auto launched = launch(invocation->argv, {});
    if (!launched.ok) {
        spdlog::warn("terminal: failed to launch {}: {}", invocation->program, launched.error);
        result.status = TerminalLaunchStatus::LaunchFailed;
        result.error = "Failed to open terminal: " + launched.error;
        return result;
    }

    spdlog::info("terminal: opened {}", invocation->program);
    result.status = TerminalLaunchStatus::Launched;
    return result;
}

TerminalLaunchResult open_in_terminal(const std::string& configured_terminal,
                                      const std::vector<std::string>& command) {
    return open_in_terminal(configured_terminal, command,
                            TerminalEnvironment::from_environment(), spawn_detached);
}

} // namespace clawrun
