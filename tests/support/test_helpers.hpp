#pragma once

#include <clawrun/process.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace clawrun::testing {

// Helper to create a temporary test directory, removed on destruction
class TempTestDir {
public:
    TempTestDir() {
        std::random_device rd;
        std::string unique_name = "clawrun_test_" + std::to_string(rd()) + "_" + std::to_string(rd());
        path = (std::filesystem::temp_directory_path() / unique_name).string();
        std::filesystem::create_directories(path);
    }

    ~TempTestDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempTestDir(const TempTestDir&) = delete;
    TempTestDir& operator=(const TempTestDir&) = delete;

    std::string sub(const std::string& rel) const { return path + "/" + rel; }

    std::string path;
};

// Write a file (creating parents) and return its path
inline std::string write_file(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream(path) << content;
    return path;
}

// Write a shell script with mode 0755
inline std::string write_script(const std::string& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    chmod(path.c_str(), 0755);
    return path;
}

// Write a non-executable file with mode 0644
inline std::string write_plain(const std::string& path) {
    write_file(path, "not a program\n");
    chmod(path.c_str(), 0644);
    return path;
}

/**
 * Scripted CommandRunner: answers by the argv joined with spaces and
 * records every call. Unscripted commands exit 1 with no output.
 */
struct FakeRunner {
    std::map<std::string, ProcessResult> responses;
    std::vector<std::vector<std::string>> calls;
    std::vector<std::chrono::milliseconds> timeouts;

    static std::string key(const std::vector<std::string>& argv) {
        std::string k;
        for (const auto& a : argv) {
            if (!k.empty()) k += ' ';
            k += a;
        }
        return k;
    }

    static ProcessResult exited(int code, const std::string& out, const std::string& err = "") {
        ProcessResult r;
        r.outcome = ProcessOutcome::Exited;
        r.exit_code = code;
        r.out = out;
        r.err = err;
        return r;
    }

    static ProcessResult timed_out() {
        ProcessResult r;
        r.outcome = ProcessOutcome::TimedOut;
        return r;
    }

    void on(const std::string& command, ProcessResult result) {
        responses[command] = std::move(result);
    }

    CommandRunner runner() {
        return [this](const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
            calls.push_back(argv);
            timeouts.push_back(timeout);
            auto it = responses.find(key(argv));
            if (it != responses.end()) return it->second;
            return exited(1, "");
        };
    }
};

} // namespace clawrun::testing
