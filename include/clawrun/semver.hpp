#pragma once

/**
 * @file semver.hpp
 * @brief Version handling for version-manager install directories
 *
 * Version managers such as nvm lay out installs as one directory per
 * version (`~/.nvm/versions/node/v22.14.0/bin/...`). clawrun only needs to
 * order those directories, so it accepts exactly `MAJOR.MINOR.PATCH` with an
 * optional leading `v`. Anything else sorts as 0.0.0: lowest priority, but
 * never disqualified.
 *
 * @example
 * ```cpp
 * #include <clawrun/semver.hpp>
 *
 * auto v = clawrun::parse_install_dir_version("v22.14.0");
 * // v.major() == 22
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace clawrun {

/// Semantic version type (MAJOR.MINOR.PATCH)
using Version = semver::version;

/**
 * @brief Parse a strict `MAJOR.MINOR.PATCH` string (optional leading `v`)
 * @return Parsed version, or nullopt for pre-release/build suffixes and
 *         anything that is not a plain version core
 */
std::optional<Version> parse_version_core(const std::string& str);

/// The version used for names that do not parse
Version floor_version();

/// Version of an install directory name, floor_version() when unparseable
Version parse_install_dir_version(const std::string& dir_name);

} // namespace clawrun
