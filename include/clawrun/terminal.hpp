#pragma once

/**
 * @file terminal.hpp
 * @brief Terminal emulator selection and argv synthesis
 *
 * Every emulator has its own convention for "run this and keep the window
 * open". Those conventions live in one closed table keyed by the program's
 * base name; anything not in the table gets the common `-e` form.
 */

#include "clawrun/process.hpp"
#include "clawrun/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clawrun {

// ============================================================================
// Discovery
// ============================================================================

struct TerminalEnvironment {
    std::string env_terminal;            // $TERMINAL
    std::vector<std::string> path_dirs;  // $PATH, in order

    static TerminalEnvironment from_environment();
};

// Autodetection order when nothing is configured
const std::vector<std::string>& known_terminals();

/**
 * Terminal command string to use, possibly with arguments.
 *
 * Precedence: configured reference (trimmed), then $TERMINAL, then the first
 * known terminal present on PATH. Empty when none applies.
 */
std::string resolve_terminal(const std::string& configured, const TerminalEnvironment& env);

// ============================================================================
// Argv Synthesis
// ============================================================================

// Placeholder a configured terminal command may use for the shell command
inline constexpr const char* kCommandPlaceholder = "{cmd}";

// `<cmd>; echo; exec "${SHELL:-bash}" -l`
std::string keep_open_command(const std::string& shell_command);

/**
 * Argv running shell_command inside terminal_command, keeping the window open.
 *
 * With a {cmd} placeholder the quoted keep-open command is substituted and
 * the result split with shell rules. Otherwise the emulator table decides
 * the trailing arguments. Empty when terminal_command is blank or cannot be
 * split.
 */
std::vector<std::string> terminal_argv(const std::string& terminal_command,
                                       const std::string& shell_command);

// nullopt when no terminal can be found or synthesis yields nothing
std::optional<TerminalInvocation> build_terminal_invocation(
    const std::string& terminal_reference,
    const std::string& shell_command,
    const TerminalEnvironment& env);

std::optional<TerminalInvocation> build_terminal_invocation(
    const std::string& terminal_reference,
    const std::string& shell_command);

// ============================================================================
// Launch
// ============================================================================

enum class TerminalLaunchStatus {
    Launched,
    NoTerminal,
    LaunchFailed
};

struct TerminalLaunchResult {
    TerminalLaunchStatus status = TerminalLaunchStatus::NoTerminal;
    std::string error;
    std::optional<TerminalInvocation> invocation;

    bool ok() const { return status == TerminalLaunchStatus::Launched; }
};

/**
 * Open command (an argv, joined with shell quoting) in a terminal, detached.
 */
TerminalLaunchResult open_in_terminal(const std::string& configured_terminal,
                                      const std::vector<std::string>& command,
                                      const TerminalEnvironment& env,
                                      const Launcher& launch = spawn_detached);

TerminalLaunchResult open_in_terminal(const std::string& configured_terminal,
                                      const std::vector<std::string>& command);

} // namespace clawrun
