#pragma once

#include <optional>
#include <string>
#include <vector>

namespace clawrun {

// ============================================================================
// Environment
// ============================================================================

// Value of an environment variable, empty when unset
std::string get_env(const char* name);

// Current user's home directory ($HOME, then the passwd entry)
std::string home_directory();

// Expand a leading "~" or "~/" against home. Other forms are returned as-is.
std::string expand_user(const std::string& path, const std::string& home);
std::string expand_user(const std::string& path);

// Split a PATH-style list. Empty entries are dropped.
std::vector<std::string> split_search_path(const std::string& value);

// ============================================================================
// Path Utilities
// ============================================================================

bool is_absolute_path(const std::string& path);

// Regular file with at least one execute bit, checked with access(X_OK)
bool is_executable_file(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the final path component
std::string get_filename(const std::string& path);

// Join path components with a single '/'
std::string join_path(const std::string& base, const std::string& name);

// First executable <dir>/<name> over dirs, in order
std::optional<std::string> find_in_directories(const std::vector<std::string>& dirs,
                                               const std::string& name);

// First executable <name> on the process PATH
std::optional<std::string> find_on_path(const std::string& name);

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Parent directories are created when missing.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

} // namespace clawrun
