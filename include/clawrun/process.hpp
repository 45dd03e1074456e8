#pragma once

/**
 * @file process.hpp
 * @brief Subprocess execution for clawrun
 *
 * Two ways to run an external program:
 * - run_process(): captured, bounded by a timeout, waited on
 * - spawn_detached(): fire-and-forget in a new session, never waited on
 *
 * Neither throws. Every failure is reported through the result value.
 */

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace clawrun {

// ============================================================================
// Captured Execution
// ============================================================================

enum class ProcessOutcome {
    Exited,       ///< Program ran to completion; see exit_code
    TimedOut,     ///< Killed after the timeout elapsed
    NotFound,     ///< exec reported the program does not exist
    SpawnFailed   ///< pipe/fork/exec failed for another reason
};

const char* outcome_to_string(ProcessOutcome outcome);

struct ProcessResult {
    ProcessOutcome outcome = ProcessOutcome::SpawnFailed;
    int exit_code = -1;  // 128 + signal when killed by a signal
    std::string out;
    std::string err;
    std::string error;   // spawn error description

    bool ok() const { return outcome == ProcessOutcome::Exited && exit_code == 0; }
};

/**
 * Run argv (argv[0] looked up on PATH) and capture stdout/stderr.
 *
 * The child is killed with SIGKILL once the timeout elapses and the result
 * is TimedOut with whatever output was read until then.
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout);

// Seam for anything that shells out, so callers can be driven by fakes
using CommandRunner = std::function<ProcessResult(const std::vector<std::string>&,
                                                  std::chrono::milliseconds)>;

// ============================================================================
// Detached Launch
// ============================================================================

using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

struct LaunchResult {
    bool ok = false;
    std::string error;
};

// The current environment as KEY=VALUE entries with overrides applied.
// An override replaces an inherited entry of the same key in place.
std::vector<std::string> build_child_environment(const EnvOverrides& env);

/**
 * Launch argv detached from the caller: double fork, setsid() in the
 * intermediate child, exec in the grandchild. Exec failures are reported
 * back through a close-on-exec pipe; the launched program is never waited on.
 * The child environment is built before forking so nothing allocates after it.
 */
LaunchResult spawn_detached(const std::vector<std::string>& argv,
                            const EnvOverrides& env = {});

using Launcher = std::function<LaunchResult(const std::vector<std::string>&,
                                            const EnvOverrides&)>;

// Describe a non-successful result in one line
std::string describe_failure(const ProcessResult& result, std::chrono::milliseconds timeout);

} // namespace clawrun
