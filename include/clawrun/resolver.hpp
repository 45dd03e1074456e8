#pragma once

#include "clawrun/semver.hpp"
#include "clawrun/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clawrun {

// ============================================================================
// Search Roots
// ============================================================================

/**
 * Every environment-derived input the resolver looks at.
 *
 * from_environment() fills it from the running process; tests build one by
 * hand so resolution never depends on the machine it runs on.
 */
struct SearchRoots {
    std::string home;
    std::vector<std::string> path_dirs;           // $PATH, in order
    std::string version_manager_root;             // <root>/<vX.Y.Z>/bin/<name>
    std::vector<std::string> common_dirs;         // searched last, in order

    static SearchRoots from_environment();
};

// Program name used when the configured reference is blank
inline constexpr const char* kDefaultCliName = "clawdbot";

// Alternative names the managed CLI has shipped under
std::vector<std::string> default_cli_aliases();

// ============================================================================
// Resolution
// ============================================================================

struct VersionedInstallCandidate {
    Version version;
    std::string path;
};

// Primary name first, then aliases in order without repeating the primary
std::vector<std::string> candidate_names(const std::string& primary,
                                         const std::vector<std::string>& aliases);

// All version-manager hits for the given names, in discovery order
std::vector<VersionedInstallCandidate> scan_version_manager_root(
    const std::string& root,
    const std::vector<std::string>& names);

// Greatest version wins, first discovered wins a tie
std::optional<VersionedInstallCandidate> pick_newest(
    const std::vector<VersionedInstallCandidate>& candidates);

/**
 * Resolve a configured program reference.
 *
 * Search order, first hit wins:
 * 1. absolute path (after ~ expansion): trusted verbatim
 * 2. path with a separator: resolved against home, trusted verbatim
 * 3. PATH, each candidate name in order
 * 4. version-manager installs, newest version across all names
 * 5. common install directories, directory-major
 *
 * Never throws. found=false keeps the primary name as path and the
 * reference exactly as configured.
 */
ResolvedExecutable resolve_executable(const std::string& reference,
                                      const std::vector<std::string>& aliases,
                                      const SearchRoots& roots);

ResolvedExecutable resolve_executable(const std::string& reference,
                                      const std::vector<std::string>& aliases);

} // namespace clawrun
