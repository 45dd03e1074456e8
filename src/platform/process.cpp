#include "clawrun/process.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace clawrun {

namespace {

using Clock = std::chrono::steady_clock;

std::vector<char*> make_c_argv(const std::vector<std::string>& argv) {
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) {
        cargv.push_back(const_cast<char*>(s.c_str()));
    }
    cargv.push_back(nullptr);
    return cargv;
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Point stdin at /dev/null so children never block on our terminal
void redirect_stdin_to_null() {
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        close(null_fd);
    }
}

// Report errno through the exec-status pipe and leave the child
[[noreturn]] void report_exec_failure(int status_fd) {
    int err = errno;
    ssize_t n = write(status_fd, &err, sizeof(err));
    (void)n;
    _exit(127);
}

// Read the exec-status pipe. Returns 0 when exec succeeded (pipe closed).
int read_exec_status(int status_fd) {
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void wait_blocking(pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

const char* outcome_to_string(ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::Exited: return "exited";
        case ProcessOutcome::TimedOut: return "timed_out";
        case ProcessOutcome::NotFound: return "not_found";
        case ProcessOutcome::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout) {
    ProcessResult result;

    if (argv.empty() || argv[0].empty()) {
        result.error = "empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return result;
    }

    auto cargv = make_c_argv(argv);

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process
        redirect_stdin_to_null();
        if (dup2(out_pipe[1], STDOUT_FILENO) == -1 || dup2(err_pipe[1], STDERR_FILENO) == -1) {
            report_exec_failure(status_pipe[1]);
        }
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(status_pipe[0]);

        execvp(cargv[0], cargv.data());
        report_exec_failure(status_pipe[1]);
    }

    // Parent process
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    int exec_errno = read_exec_status(status_pipe[0]);
    close(status_pipe[0]);

    if (exec_errno != 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        int status = 0;
        wait_blocking(pid, status);
        result.outcome = (exec_errno == ENOENT || exec_errno == ENOTDIR)
                             ? ProcessOutcome::NotFound
                             : ProcessOutcome::SpawnFailed;
        result.error = argv[0] + ": " + strerror(exec_errno);
        spdlog::debug("exec of {} failed: {}", argv[0], strerror(exec_errno));
        return result;
    }

    const auto deadline = Clock::now() + timeout;
    bool timed_out = false;

    std::array<pollfd, 2> fds = {{
        {out_pipe[0], POLLIN, 0},
        {err_pipe[0], POLLIN, 0},
    }};
    std::array<std::string*, 2> sinks = {&result.out, &result.err};
    std::array<char, 4096> buffer{};

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        int rc = poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
            }
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    // Output closed; the program may still be finishing up
    int status = 0;
    bool reaped = false;
    while (!timed_out) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0 && errno != EINTR) {
            break;
        }
        if (Clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (timed_out) {
        kill(pid, SIGKILL);
        wait_blocking(pid, status);
        result.outcome = ProcessOutcome::TimedOut;
        result.exit_code = -1;
        spdlog::debug("{} timed out after {}ms", argv[0], timeout.count());
        return result;
    }

    if (!reaped) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    result.outcome = ProcessOutcome::Exited;
    result.exit_code = decode_wait_status(status);
    return result;
}

std::vector<std::string> build_child_environment(const EnvOverrides& env) {
    std::vector<std::string> entries;
    std::vector<bool> applied(env.size(), false);

    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        for (size_t i = 0; i < env.size(); ++i) {
            if (env[i].first == key) {
                entry = key + "=" + env[i].second;
                applied[i] = true;
                break;
            }
        }
        entries.push_back(std::move(entry));
    }

    for (size_t i = 0; i < env.size(); ++i) {
        if (!applied[i]) entries.push_back(env[i].first + "=" + env[i].second);
    }
    return entries;
}

LaunchResult spawn_detached(const std::vector<std::string>& argv, const EnvOverrides& env) {
    LaunchResult result;

    if (argv.empty() || argv[0].empty()) {
        result.error = "empty command";
        return result;
    }

    int status_pipe[2] = {-1, -1};
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    auto cargv = make_c_argv(argv);
    auto env_strings = build_child_environment(env);
    auto envp = make_c_argv(env_strings);

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close_pair(status_pipe);
        return result;
    }

    if (pid == 0) {
        // Intermediate child: new session, then hand off to the grandchild
        close(status_pipe[0]);
        setsid();

        pid_t grandchild = fork();
        if (grandchild == -1) {
            report_exec_failure(status_pipe[1]);
        }
        if (grandchild > 0) {
            _exit(0);
        }

        redirect_stdin_to_null();
        execvpe(cargv[0], cargv.data(), envp.data());
        report_exec_failure(status_pipe[1]);
    }

    close(status_pipe[1]);

    int status = 0;
    wait_blocking(pid, status);

    int exec_errno = read_exec_status(status_pipe[0]);
    close(status_pipe[0]);

    if (exec_errno != 0) {
        result.error = argv[0] + ": " + strerror(exec_errno);
        spdlog::warn("failed to launch {}: {}", argv[0], strerror(exec_errno));
        return result;
    }

    result.ok = true;
    return result;
}

std::string describe_failure(const ProcessResult& result, std::chrono::milliseconds timeout) {
    auto trim = [](const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return std::string();
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    };

    switch (result.outcome) {
        case ProcessOutcome::TimedOut: {
            auto seconds = std::chrono::duration<double>(timeout).count();
            std::string text = std::to_string(seconds);
            text.erase(text.find_last_not_of('0') + 1);
            if (!text.empty() && text.back() == '.') text.pop_back();
            return "timed out after " + text + "s";
        }
        case ProcessOutcome::NotFound:
            return "program not found (" + result.error + ")";
        case ProcessOutcome::SpawnFailed:
            return "could not start (" + result.error + ")";
        case ProcessOutcome::Exited:
            break;
    }

    std::string msg = trim(result.err);
    if (msg.empty()) msg = trim(result.out);
    if (msg.empty()) msg = "exit code " + std::to_string(result.exit_code);
    return msg;
}

} // namespace clawrun
