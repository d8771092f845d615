/* ========================================================================== *
 *
 * @file nixy/flake/editor.hh
 *
 * @brief Line oriented edits of `flake.nix` files containing marker comments.
 *
 * Older releases wrote flakes in which each managed region is delimited by
 * a pair of comments:
 *
 *   # [nixy:packages]
 *             hello = pkgs.hello;
 *   # [/nixy:packages]
 *
 * Everything outside such regions belongs to the user.
 * Matching is done on substrings, so a marker may share its line with
 * other text. Unbalanced markers yield empty or partial sections.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "nixy/state.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::flake {

/* -------------------------------------------------------------------------- */

/** @brief Names of the managed regions. */
namespace sections {
inline constexpr std::string_view PACKAGES        = "nixy:packages";
inline constexpr std::string_view LOCAL_PACKAGES  = "nixy:local-packages";
inline constexpr std::string_view CUSTOM_PACKAGES = "nixy:custom-packages";
inline constexpr std::string_view CUSTOM_INPUTS   = "nixy:custom-inputs";
inline constexpr std::string_view LOCAL_INPUTS    = "nixy:local-inputs";
inline constexpr std::string_view ENV_PATHS       = "nixy:env-paths";
inline constexpr std::string_view CUSTOM_PATHS    = "nixy:custom-paths";
}  // namespace sections


/** @brief The opening token of a region, ex: `# [nixy:packages]`. */
[[nodiscard]] std::string
openMarker( std::string_view name );

/** @brief The closing token of a region, ex: `# [/nixy:packages]`. */
[[nodiscard]] std::string
closeMarker( std::string_view name );


/* -------------------------------------------------------------------------- */

/** @brief Whether @a text contains the opening token of region @a name. */
[[nodiscard]] bool
hasMarker( std::string_view text, std::string_view name );

/** @brief Whether @a text contains any region opening token. */
[[nodiscard]] bool
hasAnyMarker( std::string_view text );


/**
 * @brief Insert @a newLine after every line containing the opening token of
 *        region @a name.
 *
 * All other lines are preserved, as is the presence or absence of a final
 * newline.
 */
[[nodiscard]] std::string
insertAfterMarker( std::string_view text,
                   std::string_view name,
                   std::string_view newLine );


/**
 * @brief Drop lines matching @a pattern between @a startToken and
 *        @a endToken.
 *
 * A line containing @a startToken switches removal on, one containing
 * @a endToken switches it off. Lines outside of a region and the marker
 * lines themselves are kept.
 */
[[nodiscard]] std::string
removeFromSection( std::string_view   text,
                   std::string_view   startToken,
                   std::string_view   endToken,
                   const std::regex & pattern );


/** @brief Lines strictly between the tokens of region @a name. */
[[nodiscard]] std::vector<std::string>
extractSectionContent( std::string_view text, std::string_view name );


/** @brief Whether @a str is a plain Nix identifier usable as a name. */
[[nodiscard]] bool
isValidNixIdentifier( std::string_view str );


/**
 * @brief Names bound inside the `nixy:packages`, `nixy:local-packages`
 *        and `nixy:custom-packages` regions.
 */
[[nodiscard]] std::vector<std::string>
extractPackagesFromFlake( std::string_view text );


/* -------------------------------------------------------------------------- */

/** @brief Result of @a recoverStateFromMarkedFlake. */
struct RecoveredState
{
  PackageState             state;
  /** Human readable notes about skipped or altered entries. */
  std::vector<std::string> warnings;
}; /* End struct `RecoveredState' */


/**
 * @brief Rebuild a package state from the managed regions of @a text.
 *
 * Plain packages are read from `nixy:packages` when bound as
 * `<name> = pkgs.<name>;`. Custom packages are read from
 * `nixy:custom-packages` and need their input's URL to be declared in
 * `nixy:custom-inputs` or `nixy:local-inputs`.
 */
[[nodiscard]] RecoveredState
recoverStateFromMarkedFlake( std::string_view text );


/* -------------------------------------------------------------------------- */

/**
 * @brief Add any missing region to a marker based flake.
 *
 * Package regions are placed before the `default =` binding, input regions
 * before the end of the `inputs` block, and path regions at the start of
 * the `paths` list.
 */
[[nodiscard]] std::string
ensureMarkers( std::string_view text );


/**
 * @brief Make `outputs = { ... }` accept @a inputName and bind `@inputs`.
 *
 * The text is returned unchanged if @a inputName is already a parameter or
 * no `outputs` function is recognized.
 */
[[nodiscard]] std::string
widenOutputsSignature( std::string_view text, std::string_view inputName );


/* -------------------------------------------------------------------------- */

/**
 * @brief Add a plain `nixpkgs` package to a marker based flake without
 *        touching content outside of its regions.
 */
[[nodiscard]] std::string
addPackageIncrementally( std::string_view text, std::string_view name );

/** @brief Add a custom package ( and its input ) to a marker based flake. */
[[nodiscard]] std::string
addPackageIncrementally( std::string_view text, const CustomPackage & pkg );

/** @brief Remove every binding and path entry of @a name from the regions. */
[[nodiscard]] std::string
removePackageIncrementally( std::string_view text, std::string_view name );


/* -------------------------------------------------------------------------- */

}  // namespace nixy::flake


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
