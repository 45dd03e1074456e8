#pragma once

#include <spdlog/common.h>

#include <string>

namespace clawrun {

// Level for a CLAW_RUNNER_LOGLEVEL value, matched case-insensitively.
// Accepts debug, info, warn/warning, error, critical; anything else is info.
spdlog::level::level_enum log_level_from_name(const std::string& name);

} // namespace clawrun
