#include "clawrun/shell_words.hpp"

#include <cctype>

namespace clawrun {

namespace {

bool is_safe_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    switch (c) {
        case '@': case '%': case '+': case '=': case ':': case ',':
        case '.': case '/': case '-': case '_':
            return true;
        default:
            return false;
    }
}

} // namespace

std::optional<std::vector<std::string>> shell_split(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    bool in_single = false;
    bool in_double = false;

    size_t i = 0;
    while (i < command.size()) {
        char c = command[i++];

        if (in_single) {
            if (c == '\'') in_single = false;
            else current.push_back(c);
            continue;
        }

        if (in_double) {
            if (c == '"') {
                in_double = false;
            } else if (c == '\\' && i < command.size()) {
                char n = command[i];
                if (n == '"' || n == '\\' || n == '$' || n == '`') {
                    current.push_back(n);
                    ++i;
                } else if (n == '\n') {
                    ++i;
                } else {
                    current.push_back(c);
                }
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\'') {
            in_single = true;
        } else if (c == '"') {
            in_double = true;
        } else if (c == '\\') {
            if (i >= command.size()) return std::nullopt;
            char n = command[i++];
            // Backslash-newline is a line continuation
            if (n != '\n') current.push_back(n);
        } else {
            current.push_back(c);
        }
    }

    if (in_single || in_double) return std::nullopt;
    if (in_word) words.push_back(current);
    return words;
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) return "''";

    bool safe = true;
    for (char c : word) {
        if (!is_safe_char(c)) {
            safe = false;
            break;
        }
    }
    if (safe) return word;

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\"'\"'";
        else out += c;
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out += ' ';
        out += shell_quote(words[i]);
    }
    return out;
}

} // namespace clawrun
