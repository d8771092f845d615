/* ========================================================================== *
 *
 * @file nixy/builder.hh
 *
 * @brief Build profiles and query flakes with the `nix` CLI.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nixy/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/**
 * @class nixy::NixCommandException
 * @brief An exception thrown when a `nix` subprocess fails.
 * @{
 */
NIXY_DEFINE_EXCEPTION( NixCommandException,
                       EC_NIX_COMMAND,
                       "nix command failed" )
/** @} */

/**
 * @class nixy::BuildFailureException
 * @brief An exception thrown when building a profile's environment fails.
 * @{
 */
NIXY_DEFINE_EXCEPTION( BuildFailureException,
                       EC_BUILD_FAILURE,
                       "failed to build environment" )
/** @} */

/**
 * @class nixy::FlakePackageNotFoundException
 * @brief An exception thrown when a flake does not provide a package.
 * @{
 */
NIXY_DEFINE_EXCEPTION( FlakePackageNotFoundException,
                       EC_FLAKE_PACKAGE_NOT_FOUND,
                       "package not found in flake" )
/** @} */

/**
 * @class nixy::NoFlakeLockException
 * @brief An exception thrown when a profile has no `flake.lock` yet.
 * @{
 */
NIXY_DEFINE_EXCEPTION( NoFlakeLockException,
                       EC_NO_FLAKE_LOCK,
                       "no flake.lock found" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief Realises an output of a flake and links the result. */
class Builder
{

public:

  virtual ~Builder() = default;

  /**
   * @brief Build `<flakeDir>#<output>` and point @a outLink at the result.
   * @throws BuildFailureException on failure.
   */
  virtual void
  build( const std::filesystem::path & flakeDir,
         const std::string &           output,
         const std::filesystem::path & outLink )
    = 0;


}; /* End class `Builder' */


/** @brief A @a nixy::Builder running `nix build`. */
class NixBuilder : public Builder
{

public:

  void
  build( const std::filesystem::path & flakeDir,
         const std::string &           output,
         const std::filesystem::path & outLink ) override;


}; /* End class `NixBuilder' */


/* -------------------------------------------------------------------------- */

/** @brief The system `nix` builds for, ex: `x86_64-linux`. */
[[nodiscard]] const std::string &
currentSystem();


/**
 * @brief Check that @a url provides @a pkg for the current system.
 * @return The output holding the package, either `packages` or
 *         `legacyPackages`, or `std::nullopt` if neither does.
 */
[[nodiscard]] std::optional<std::string>
validateFlakePackage( const std::string & url, const std::string & pkg );


/**
 * @brief Names of the packages @a url provides for the current system.
 *
 * With @a output only that output is listed, otherwise `packages` is tried
 * before `legacyPackages`. Returns an empty list if nothing can be listed.
 */
[[nodiscard]] std::vector<std::string>
listFlakePackages( const std::string &                url,
                   const std::optional<std::string> & output = std::nullopt );


/**
 * @brief Fetch @a url into the store with `nix flake prefetch`.
 * @return The store path of the flake's source tree.
 */
[[nodiscard]] std::filesystem::path
flakePrefetch( const std::string & url );


/**
 * @brief The file defining @a attr in `nixpkgs` at @a rev, read from the
 *        package's `meta.position`.
 * @param rev A commit hash or a branch such as `nixos-unstable`.
 */
[[nodiscard]] std::filesystem::path
getPackageSourcePath( const std::string & rev,
                      const std::string & attr,
                      const std::string & system );


/**
 * @brief Run `nix flake update` in @a flakeDir.
 * @param inputs Inputs to update, all of them when empty.
 */
void
flakeUpdate( const std::filesystem::path &    flakeDir,
             const std::vector<std::string> & inputs = {} );


/**
 * @brief Read the names of the root inputs from a `flake.lock` file.
 * @throws NoFlakeLockException if @a lockFile does not exist.
 */
[[nodiscard]] std::vector<std::string>
getFlakeInputs( const std::filesystem::path & lockFile );


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
