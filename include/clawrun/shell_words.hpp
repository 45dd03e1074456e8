#pragma once

#include <optional>
#include <string>
#include <vector>

namespace clawrun {

// ============================================================================
// POSIX Shell Words
// ============================================================================

/**
 * Split a command string into words using POSIX shell quoting rules:
 * whitespace separates words, single quotes are literal, double quotes allow
 * \" \\ \$ \` and a backslash outside quotes escapes the next character.
 *
 * No expansion of any kind is performed. Returns nullopt on an unterminated
 * quote or a trailing backslash.
 */
std::optional<std::vector<std::string>> shell_split(const std::string& command);

// Quote a word so a POSIX shell reads it back as exactly one word
std::string shell_quote(const std::string& word);

// shell_quote each word and join with single spaces
std::string shell_join(const std::vector<std::string>& words);

} // namespace clawrun
