/* ========================================================================== *
 *
 * @file nixy/core/nix-state.hh
 *
 * @brief One time `nix` runtime setup and helpers for running the `nix` CLI.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <list>
#include <map>
#include <string>


/* -------------------------------------------------------------------------- */

/* Forward Declarations. */

namespace nix {
class Logger;
}


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/**
 * @brief Create a custom `nix::Logger` which hides build logs unless
 *        @a printBuildLogs is set.
 */
nix::Logger *
makeFilteredLogger( bool printBuildLogs );


/* -------------------------------------------------------------------------- */

/**
 * @brief Perform one time `nix` global runtime setup.
 *
 * You may safely call this function multiple times, after the first invocation
 * it is effectively a no-op.
 *
 * This replaces the default `nix::Logger` with a @a nixy::FilteredLogger.
 */
void
initNix();


/* -------------------------------------------------------------------------- */

/**
 * @brief Set `nix::verbosity` from `NIXY_VERBOSITY`.
 *
 * Accepted values are `0` ( errors only ) through `4` ( everything ).
 */
void
setVerbosityFromEnv();


/* -------------------------------------------------------------------------- */

/** @brief Flags passed to every `nix` invocation. */
[[nodiscard]] const std::list<std::string> &
getNixFlags();


/** @brief Result of a `nix` CLI invocation. */
struct NixCommandResult
{
  /** Raw wait status, inspect with `nix::statusOk`. */
  int         status = 0;
  std::string out;
}; /* End struct `NixCommandResult' */


/**
 * @brief Run the `nix` executable with @a args ( after @a getNixFlags ).
 *
 * `stdout` is captured, `stderr` is inherited so build logs reach the user
 * unless @a mergeStderr is set.
 * @param args Arguments following the experimental feature flags.
 * @param extraEnv Variables added to the inherited environment.
 * @param mergeStderr Capture `stderr` along with `stdout`.
 */
[[nodiscard]] NixCommandResult
runNix( const std::list<std::string> &             args,
        const std::map<std::string, std::string> & extraEnv    = {},
        bool                                       mergeStderr = false );


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
