#include "clawrun/logging.hpp"

#include <algorithm>
#include <cctype>

namespace clawrun {

spdlog::level::level_enum log_level_from_name(const std::string& name) {
    std::string level = name;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "debug") {
        return spdlog::level::debug;
    } else if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    } else if (level == "error") {
        return spdlog::level::err;
    } else if (level == "critical") {
        return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace clawrun
