/* ========================================================================== *
 *
 * @file nixy/platform.hh
 *
 * @brief Platform restrictions for packages.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>
#include <vector>


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/** @brief A sorted list of `nix` system names, ex: `x86_64-linux`. */
using Platforms = std::vector<std::string>;


/**
 * @brief Validate and expand a list of user supplied platform names.
 *
 * Matching is case-insensitive. The aliases `darwin`/`macos` and `linux`
 * expand to both architectures of that kernel.
 * The result is sorted and free of duplicates.
 *
 * @throws InvalidPlatformException for unknown names.
 */
[[nodiscard]] Platforms
normalizePlatforms( const std::vector<std::string> & platforms );


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
