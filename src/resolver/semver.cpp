#include "clawrun/semver.hpp"

#include <cctype>

namespace clawrun {

namespace {

// Digits and exactly two dots, no empty components
bool is_plain_version_core(const std::string& s) {
    int dots = 0;
    bool component_has_digit = false;
    for (char c : s) {
        if (c == '.') {
            if (!component_has_digit) return false;
            ++dots;
            component_has_digit = false;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            component_has_digit = true;
        } else {
            return false;
        }
    }
    return dots == 2 && component_has_digit;
}

} // namespace

std::optional<Version> parse_version_core(const std::string& str) {
    std::string s = str;
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
        s.erase(0, 1);
    }

    if (!is_plain_version_core(s)) {
        return std::nullopt;
    }

    try {
        auto version = semver::version::parse(s);
        if (version.is_prerelease() || !version.build_meta().empty()) {
            return std::nullopt;
        }
        return version;
    } catch (const semver::semver_exception&) {
        // Leading zeros and out-of-range components land here
        return std::nullopt;
    }
}

Version floor_version() {
    return semver::version::parse("0.0.0");
}

Version parse_install_dir_version(const std::string& dir_name) {
    if (auto version = parse_version_core(dir_name)) {
        return *version;
    }
    return floor_version();
}

} // namespace clawrun
