/* ========================================================================== *
 *
 * @file migration.cc
 *
 * @brief Convert the legacy per-profile layout into `nixy.json`.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <string>

#include <nix/logging.hh>

#include "nixy/core/util.hh"
#include "nixy/flake/editor.hh"
#include "nixy/migration.hh"
#include "nixy/state.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

namespace {

/** @brief Copy @a from to @a to if @a from exists. */
void
copyIfExists( const std::filesystem::path & from,
              const std::filesystem::path & to )
{
  if ( std::filesystem::exists( from ) )
    {
      std::filesystem::copy_file(
        from,
        to,
        std::filesystem::copy_options::overwrite_existing );
    }
}


/**
 * @brief Copy each entry of @a from into @a to unless @a to already has an
 *        entry of that name.
 */
void
mergeLocalPackages( const std::filesystem::path & from,
                    const std::filesystem::path & to )
{
  if ( ! std::filesystem::is_directory( from ) ) { return; }
  std::filesystem::create_directories( to );

  for ( const auto & entry : std::filesystem::directory_iterator( from ) )
    {
      auto dest = to / entry.path().filename();
      if ( std::filesystem::exists( dest ) )
        {
          debugLog( "not overwriting local package '" + dest.string() + "'" );
          continue;
        }
      std::filesystem::copy( entry.path(),
                             dest,
                             std::filesystem::copy_options::recursive );
    }
}


/** @brief Read the package list of one legacy profile directory. */
ProfileConfig
migrateProfile( const std::filesystem::path & profileDir )
{
  auto statePath = getStatePath( profileDir );
  if ( std::filesystem::exists( statePath ) )
    {
      return PackageState::load( statePath );
    }

  auto flakePath = profileDir / "flake.nix";
  if ( std::filesystem::exists( flakePath ) )
    {
      std::string text = readTextFile( flakePath );
      if ( flake::hasAnyMarker( text ) )
        {
          auto recovered = flake::recoverStateFromMarkedFlake( text );
          for ( const auto & warning : recovered.warnings )
            {
              nix::warn( "%s", warning );
            }
          return recovered.state;
        }
    }
  return ProfileConfig {};
}

}  // namespace


/* -------------------------------------------------------------------------- */

bool
needsMigration( const Paths & paths )
{
  if ( std::filesystem::exists( paths.getNixyJson() ) ) { return false; }

  auto legacyProfiles = paths.getLegacyProfilesDir();
  if ( std::filesystem::is_directory( legacyProfiles ) )
    {
      for ( const auto & entry :
            std::filesystem::directory_iterator( legacyProfiles ) )
        {
          if ( entry.is_directory() ) { return true; }
        }
    }

  return std::filesystem::exists( paths.getLegacyActiveFile() )
         || std::filesystem::exists( paths.getLegacyFlake() );
}


/* -------------------------------------------------------------------------- */

NixyConfig
migrateToNixyJson( const Paths & paths )
{
  NixyConfig config;
  config.profiles.clear();

  try
    {
      if ( std::filesystem::exists( paths.getLegacyActiveFile() ) )
        {
          std::string active
            = trim_copy( readTextFile( paths.getLegacyActiveFile() ) );
          if ( ! active.empty() ) { config.activeProfile = active; }
        }

      auto legacyProfiles = paths.getLegacyProfilesDir();
      if ( std::filesystem::is_directory( legacyProfiles ) )
        {
          for ( const auto & entry :
                std::filesystem::directory_iterator( legacyProfiles ) )
            {
              if ( ! entry.is_directory() ) { continue; }
              const auto & dir  = entry.path();
              std::string  name = dir.filename().string();
              verboseLog( "migrating profile '" + name + "'" );

              config.profiles[name] = migrateProfile( dir );

              auto stateDir = paths.getProfileDir( name );
              std::filesystem::create_directories( stateDir );
              copyIfExists( dir / "flake.nix", stateDir / "flake.nix" );
              copyIfExists( dir / "flake.lock", stateDir / "flake.lock" );
              mergeLocalPackages( dir / "packages", paths.getPackagesDir() );
            }
        }

      /* Single flake in the config directory. */
      if ( std::filesystem::exists( paths.getLegacyFlake() )
           && ( ! config.profileExists( DEFAULT_PROFILE ) ) )
        {
          config.profiles[DEFAULT_PROFILE] = migrateProfile( paths.configDir );

          auto stateDir = paths.getProfileDir( DEFAULT_PROFILE );
          std::filesystem::create_directories( stateDir );
          copyIfExists( paths.getLegacyFlake(), stateDir / "flake.nix" );
          copyIfExists( paths.configDir / "flake.lock",
                        stateDir / "flake.lock" );
          mergeLocalPackages( paths.configDir / "packages",
                              paths.getPackagesDir() );
        }
    }
  catch ( const std::filesystem::filesystem_error & err )
    {
      throw MigrationException( "failed to copy legacy files", err.what() );
    }

  config.normalize();
  return config;
}


/* -------------------------------------------------------------------------- */

void
runMigrationIfNeeded( const Paths & paths )
{
  if ( ! needsMigration( paths ) ) { return; }

  infoLog( "==> Migrating to new nixy.json configuration format..." );
  NixyConfig config = migrateToNixyJson( paths );
  config.save( paths.getNixyJson() );

  infoLog( "==> Migration complete! Your configuration has been updated." );
  infoLog( "==> Configuration is now stored in: "
           + paths.getNixyJson().string() );
  infoLog( "==> Generated files are now in: "
           + paths.getProfilesStateDir().string() );
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
