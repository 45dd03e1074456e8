#include "clawrun/status.hpp"

#include "clawrun/config.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace clawrun {

namespace {

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<std::string> with_program(const std::string& program,
                                      const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

} // namespace

std::vector<std::vector<std::string>> structured_status_forms() {
    return {
        {"status", "--json"},
        {"status", "--format", "json"},
    };
}

std::string cli_not_found_message(const ResolvedExecutable& executable) {
    const std::string& name = is_blank(executable.configured) ? executable.path
                                                              : executable.configured;
    return "CLI not found (" + name + "). Set 'cli' in " + kConfigDisplayPath;
}

std::string summarize_status(const ResolvedExecutable& executable, const CommandRunner& run) {
    if (!executable.found) {
        spdlog::debug("status: '{}' did not resolve", executable.configured);
        return cli_not_found_message(executable);
    }

    for (const auto& form : structured_status_forms()) {
        auto argv = with_program(executable.path, form);
        ProcessResult result = run(argv, kStructuredStatusTimeout);

        if (!result.ok()) {
            spdlog::debug("status: {} {} failed: {}", form[0], form.back(),
                          describe_failure(result, kStructuredStatusTimeout));
            continue;
        }
        if (is_blank(result.out)) {
            spdlog::debug("status: structured form printed nothing");
            continue;
        }

        if (auto record = parse_status_json(result.out)) {
            return render_status(*record);
        }
    }

    spdlog::debug("status: falling back to plain text");
    ProcessResult result = run(with_program(executable.path, {"status"}), kPlainStatusTimeout);
    if (!result.ok()) {
        std::string message = describe_failure(result, kPlainStatusTimeout);
        spdlog::warn("status: {} status: {}", executable.path, message);
        return "Status: " + message;
    }

    return render_status(parse_status_text(result.out));
}

std::vector<std::string> verbose_status_argv(const ResolvedExecutable& executable,
                                             const CommandRunner& run) {
    if (!executable.found) {
        return {};
    }

    auto verbose = with_program(executable.path, {"status", "--all"});
    ProcessResult probe = run(verbose, kVerboseProbeTimeout);
    if (probe.ok()) {
        return verbose;
    }

    spdlog::debug("status: --all unsupported ({}), using plain status",
                  describe_failure(probe, kVerboseProbeTimeout));
    return with_program(executable.path, {"status"});
}

} // namespace clawrun
