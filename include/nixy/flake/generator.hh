/* ========================================================================== *
 *
 * @file nixy/flake/generator.hh
 *
 * @brief Render a profile's `flake.nix` from its package state.
 *
 * Rendering is deterministic: the same state and the same local packages
 * directory always produce byte identical output.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "nixy/state.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::flake {

/* -------------------------------------------------------------------------- */

/** @brief Line which marks a file as fully owned by `nixy`. */
inline constexpr std::string_view MANAGED_HEADER
  = "description = \"nixy managed packages\";";

/** @brief URL of the default `nixpkgs` input. */
inline constexpr std::string_view DEFAULT_NIXPKGS_URL
  = "github:NixOS/nixpkgs/nixos-unstable";


/* -------------------------------------------------------------------------- */

/** @brief Whether @a text was produced by @a renderFlake. */
[[nodiscard]] bool
isManagedFlake( std::string_view text );

/**
 * @brief Whether @a url refers to the `nixpkgs` repository, ex:
 *        `nixpkgs`, `flake:nixpkgs` or `github:NixOS/nixpkgs/<ref>`.
 */
[[nodiscard]] bool
isNixpkgsUrl( std::string_view url );


/* -------------------------------------------------------------------------- */

/**
 * @brief Render `flake.nix` contents for @a state.
 *
 * When @a packagesDir is given and exists it is scanned for local packages
 * and flakes; state entries sharing a name with a local definition are
 * left out.
 */
[[nodiscard]] std::string
renderFlake( const PackageState &                         state,
             const std::optional<std::filesystem::path> & packagesDir
             = std::nullopt );


/**
 * @brief Write the rendered flake to `<flakeDir>/flake.nix`.
 *
 * @a flakeDir is created if needed.
 */
void
regenerateFlake( const std::filesystem::path &                flakeDir,
                 const PackageState &                         state,
                 const std::optional<std::filesystem::path> & packagesDir
                 = std::nullopt );


/* -------------------------------------------------------------------------- */

}  // namespace nixy::flake


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
