/* ========================================================================== *
 *
 * @file nixy/packages/flake-ref.hh
 *
 * @brief Naming packages and inputs installed from flake URLs.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>
#include <string_view>


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

/** @brief Whether an `install` argument names a flake rather than a package. */
[[nodiscard]] inline bool
isFlakeReference( std::string_view spec )
{
  return spec.find( ':' ) != std::string_view::npos;
}


/**
 * @brief Replace characters other than ASCII letters, digits, and `-` with
 *        `-`, then strip leading and trailing `-`.
 */
[[nodiscard]] std::string
sanitizeInputName( std::string_view str );


/**
 * @brief Name of the package a flake URL without a `#` fragment refers to.
 *
 * This is the last path component without a `.git` suffix, ex:
 * `github:user/repo.git` -> `repo`, or `default` if there is none.
 */
[[nodiscard]] std::string
derivePackageNameFromUrl( std::string_view url );


/**
 * @brief Name of the flake input declared for @a url.
 *
 * The last two path components joined by `-`, ex:
 * `github:NixOS/nixpkgs` -> `github-NixOS-nixpkgs`, or `custom-flake` if
 * there are fewer than two.
 */
[[nodiscard]] std::string
deriveInputNameFromUrl( std::string_view url );


/** @brief A flake URL and the package to install from it. */
struct FlakeInstallable
{
  std::string url;
  std::string package;
}; /* End struct `FlakeInstallable' */


/** @brief Split `<url>#<package>`, deriving the package if absent. */
[[nodiscard]] FlakeInstallable
parseFlakeInstallable( std::string_view spec );


/* -------------------------------------------------------------------------- */

}  // namespace nixy::packages


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
