#include "clawrun/platform.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace clawrun {

namespace fs = std::filesystem;

std::string get_env(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

std::string home_directory() {
    std::string home = get_env("HOME");
    if (!home.empty()) {
        return home;
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "";
}

std::string expand_user(const std::string& path, const std::string& home) {
    if (path.empty() || path[0] != '~' || home.empty()) {
        return path;
    }
    if (path.size() == 1) {
        return home;
    }
    // "~user" forms are left alone
    if (path[1] != '/') {
        return path;
    }
    return join_path(home, path.substr(2));
}

std::string expand_user(const std::string& path) {
    return expand_user(path, home_directory());
}

std::vector<std::string> split_search_path(const std::string& value) {
    std::vector<std::string> dirs;
    std::string current;
    std::istringstream ss(value);
    while (std::getline(ss, current, ':')) {
        if (!current.empty()) {
            dirs.push_back(current);
        }
    }
    return dirs;
}

bool is_absolute_path(const std::string& path) {
    return !path.empty() && path[0] == '/';
}

bool is_executable_file(const std::string& path) {
    if (path.empty()) return false;

    struct stat st{};
    if (stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(path.c_str(), X_OK) == 0;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& name) {
    if (base.empty()) return name;
    if (name.empty()) return base;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

std::optional<std::string> find_in_directories(const std::vector<std::string>& dirs,
                                               const std::string& name) {
    if (name.empty()) return std::nullopt;

    for (const auto& dir : dirs) {
        std::string candidate = join_path(dir, name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_on_path(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }
    return find_in_directories(split_search_path(get_env("PATH")), name);
}

} // namespace clawrun
