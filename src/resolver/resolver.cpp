#include "clawrun/resolver.hpp"

#include "clawrun/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace clawrun {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Subdirectories of root in iteration order; empty when root is unreadable
std::vector<fs::path> list_subdirectories(const std::string& root) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        return dirs;
    }

    fs::directory_iterator it(root, ec), end;
    while (!ec && it != end) {
        std::error_code dir_ec;
        if (it->is_directory(dir_ec) && !dir_ec) {
            dirs.push_back(it->path());
        }
        it.increment(ec);
    }
    return dirs;
}

ResolvedExecutable trusted_path(const std::string& path, const std::string& configured) {
    ResolvedExecutable result;
    result.path = path;
    result.found = is_executable_file(path);
    result.configured = configured;
    spdlog::debug("resolve: '{}' is an explicit path {} (found={})", configured, path, result.found);
    return result;
}

} // namespace

SearchRoots SearchRoots::from_environment() {
    SearchRoots roots;
    roots.home = home_directory();
    roots.path_dirs = split_search_path(get_env("PATH"));
    if (!roots.home.empty()) {
        roots.version_manager_root = join_path(roots.home, ".nvm/versions/node");
        roots.common_dirs.push_back(join_path(roots.home, ".local/bin"));
    }
    roots.common_dirs.push_back("/usr/local/bin");
    roots.common_dirs.push_back("/usr/bin");
    return roots;
}

std::vector<std::string> default_cli_aliases() {
    return {"clawdbot", "moltbot", "openclaw"};
}

std::vector<std::string> candidate_names(const std::string& primary,
                                         const std::vector<std::string>& aliases) {
    std::vector<std::string> names;
    names.push_back(primary);
    for (const auto& alias : aliases) {
        if (alias.empty()) continue;
        if (std::find(names.begin(), names.end(), alias) != names.end()) continue;
        names.push_back(alias);
    }
    return names;
}

std::vector<VersionedInstallCandidate> scan_version_manager_root(
    const std::string& root,
    const std::vector<std::string>& names) {
    std::vector<VersionedInstallCandidate> hits;

    for (const auto& version_dir : list_subdirectories(root)) {
        Version version = parse_install_dir_version(version_dir.filename().string());
        std::string bin_dir = (version_dir / "bin").string();
        for (const auto& name : names) {
            std::string candidate = join_path(bin_dir, name);
            if (is_executable_file(candidate)) {
                hits.push_back({version, candidate});
            }
        }
    }
    return hits;
}

std::optional<VersionedInstallCandidate> pick_newest(
    const std::vector<VersionedInstallCandidate>& candidates) {
    const VersionedInstallCandidate* best = nullptr;
    for (const auto& candidate : candidates) {
        // Strictly greater, so the first of equal versions stays selected
        if (best == nullptr || best->version < candidate.version) {
            best = &candidate;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

ResolvedExecutable resolve_executable(const std::string& reference,
                                      const std::vector<std::string>& aliases,
                                      const SearchRoots& roots) {
    std::string primary = trim(reference);
    if (primary.empty()) {
        primary = kDefaultCliName;
    }

    std::string expanded = expand_user(primary, roots.home);

    if (is_absolute_path(expanded)) {
        return trusted_path(expanded, reference);
    }

    if (expanded.find('/') != std::string::npos) {
        fs::path p = fs::path(roots.home) / expanded;
        return trusted_path(p.lexically_normal().string(), reference);
    }

    auto names = candidate_names(expanded, aliases);

    for (const auto& name : names) {
        if (auto hit = find_in_directories(roots.path_dirs, name)) {
            spdlog::debug("resolve: '{}' found on PATH at {}", reference, *hit);
            return {*hit, true, reference};
        }
    }

    auto versioned = scan_version_manager_root(roots.version_manager_root, names);
    if (auto newest = pick_newest(versioned)) {
        spdlog::debug("resolve: '{}' found in version manager at {} ({} candidates)",
                      reference, newest->path, versioned.size());
        return {newest->path, true, reference};
    }

    for (const auto& dir : roots.common_dirs) {
        for (const auto& name : names) {
            std::string candidate = join_path(dir, name);
            if (is_executable_file(candidate)) {
                spdlog::debug("resolve: '{}' found in common location {}", reference, candidate);
                return {candidate, true, reference};
            }
        }
    }

    spdlog::debug("resolve: '{}' not found (tried {} names)", reference, names.size());
    return {expanded, false, reference};
}

ResolvedExecutable resolve_executable(const std::string& reference,
                                      const std::vector<std::string>& aliases) {
    return resolve_executable(reference, aliases, SearchRoots::from_environment());
}

} // namespace clawrun
