/* ========================================================================== *
 *
 * @file nixy/migration.hh
 *
 * @brief Convert the legacy per-profile layout into `nixy.json`.
 *
 * Older releases kept one directory per profile under
 * `<config>/profiles/<name>/` holding `flake.nix`, `flake.lock`,
 * `packages.json` and `packages/`, with the active profile named in
 * `<config>/active`. The oldest releases kept a single `<config>/flake.nix`.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include "nixy/core/exceptions.hh"
#include "nixy/nixy-config.hh"
#include "nixy/paths.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/**
 * @class nixy::MigrationException
 * @brief An exception thrown when the legacy layout cannot be converted.
 * @{
 */
NIXY_DEFINE_EXCEPTION( MigrationException,
                       EC_MIGRATION,
                       "failed to migrate configuration" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @brief Whether a legacy layout exists and `nixy.json` does not.
 *
 * A legacy layout is any profile directory under `<config>/profiles`, an
 * `<config>/active` file, or an `<config>/flake.nix`.
 */
[[nodiscard]] bool
needsMigration( const Paths & paths );


/**
 * @brief Build a @a nixy::NixyConfig from the legacy layout.
 *
 * Generated files of each profile are copied to the state directory and
 * local packages of every profile are merged into the global packages
 * directory, never overwriting existing entries. A profile without
 * `packages.json` whose `flake.nix` has management markers is recovered
 * from those markers.
 *
 * Nothing is written to `nixy.json`.
 */
[[nodiscard]] NixyConfig
migrateToNixyJson( const Paths & paths );


/** @brief Migrate and save `nixy.json` if @a needsMigration. */
void
runMigrationIfNeeded( const Paths & paths );


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
