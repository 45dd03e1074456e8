#pragma once

/**
 * @file clawrun.hpp
 * @brief clawrun - orchestration core for a desktop runner of the claw CLI
 *
 * - Executable resolution across PATH, version-manager installs and common
 *   install directories (resolver.hpp)
 * - Status normalization of drifting CLI output into one summary line
 *   (status.hpp)
 * - Terminal emulator selection and keep-open argv synthesis (terminal.hpp)
 * - User service control and desktop actions (actions.hpp)
 */

#include "clawrun/actions.hpp"
#include "clawrun/config.hpp"
#include "clawrun/logging.hpp"
#include "clawrun/platform.hpp"
#include "clawrun/process.hpp"
#include "clawrun/resolver.hpp"
#include "clawrun/semver.hpp"
#include "clawrun/shell_words.hpp"
#include "clawrun/status.hpp"
#include "clawrun/terminal.hpp"
#include "clawrun/types.hpp"
