/* ========================================================================== *
 *
 * @file nixy/flake/local-packages.hh
 *
 * @brief Discover package definitions kept in the local packages directory.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


/* -------------------------------------------------------------------------- */

namespace nixy::flake {

/* -------------------------------------------------------------------------- */

/** @brief A `<name>.nix` file defining a single package. */
struct LocalPackage
{
  std::string                name;
  std::optional<std::string> inputName;
  std::optional<std::string> inputUrl;
  std::optional<std::string> overlay;
  std::string                packageExpr;
}; /* End struct `LocalPackage' */


/** @brief A subdirectory containing its own `flake.nix`. */
struct LocalFlake
{
  std::string name;
}; /* End struct `LocalFlake' */


/** @brief Everything found by @a scanLocalPackages. */
struct LocalScan
{
  std::vector<LocalPackage> packages;
  std::vector<LocalFlake>   flakes;

  /** @brief Whether @a name is provided by a local package or flake. */
  [[nodiscard]] bool
  provides( std::string_view name ) const;
}; /* End struct `LocalScan' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Read the static value bound to @a attr in Nix source @a content.
 *
 * Only the first binding of the form `attr = <value>;` is considered.
 * Double quoted strings without `${}` interpolation and bare identifiers or
 * literals are static; anything else yields `std::nullopt`.
 */
[[nodiscard]] std::optional<std::string>
parseStaticAttr( std::string_view content, std::string_view attr );


/**
 * @brief Read the first `<input>.url = "<url>";` binding in @a content.
 * @return The pair `<input>`, `<url>` if one was found.
 */
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
parseInputUrl( std::string_view content );


/**
 * @brief Parse a single local package file.
 * @return `std::nullopt` if the file has neither a static `pname`
 *         nor a static `name`.
 */
[[nodiscard]] std::optional<LocalPackage>
parseLocalPackageFile( const std::filesystem::path & file );


/**
 * @brief Scan @a packagesDir for local packages and local flakes.
 *
 * A missing directory yields an empty result.
 * Results are sorted by name.
 */
[[nodiscard]] LocalScan
scanLocalPackages( const std::filesystem::path & packagesDir );


/**
 * @brief Locate the local definition of @a name in @a packagesDir.
 * @return `<name>.nix` if it is a file, otherwise `<name>/` if it holds a
 *         `flake.nix`, otherwise `std::nullopt`.
 */
[[nodiscard]] std::optional<std::filesystem::path>
findLocalDefinition( const std::filesystem::path & packagesDir,
                     const std::string &           name );


/* -------------------------------------------------------------------------- */

}  // namespace nixy::flake


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
