/* ========================================================================== *
 *
 * @file mixins.cc
 *
 * @brief State blobs shared by commands which operate on profiles.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <optional>
#include <string>

#include "nixy/core/util.hh"
#include "nixy/flake/editor.hh"
#include "nixy/flake/generator.hh"
#include "nixy/mixins.hh"
#include "nixy/rollback.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

FlakeUpdateKind
planFlakeUpdate( const std::optional<std::string> & flakeText,
                 bool                               canEditIncrementally,
                 bool                               force )
{
  if ( ( ! flakeText.has_value() ) || flake::isManagedFlake( *flakeText ) )
    {
      return FlakeUpdateKind::Regenerate;
    }

  if ( flake::hasAnyMarker( *flakeText ) )
    {
      if ( canEditIncrementally && ( ! force ) )
        {
          return FlakeUpdateKind::Incremental;
        }
      if ( force ) { return FlakeUpdateKind::Regenerate; }
      throw UnmanagedConfigException(
        "flake.nix uses management markers and this change requires "
        "regenerating it",
        "use --force to replace it; edits outside the markers will be lost" );
    }

  if ( force ) { return FlakeUpdateKind::Regenerate; }
  throw UnmanagedConfigException( "flake.nix was not generated by nixy",
                                  "use --force to replace it" );
}


/* -------------------------------------------------------------------------- */

NixyConfig
EnvironmentMixin::loadConfig() const
{
  return NixyConfig::load( this->paths.getNixyJson() );
}


std::optional<std::filesystem::path>
EnvironmentMixin::getPackagesDir() const
{
  auto dir = this->paths.getPackagesDir();
  if ( std::filesystem::is_directory( dir ) ) { return dir; }
  return std::nullopt;
}


/* -------------------------------------------------------------------------- */

void
EnvironmentMixin::buildEnvironment( const std::filesystem::path & flakeDir )
{
  infoLog( "==> Building nixy environment..." );
  if ( this->paths.envLink.has_parent_path() )
    {
      std::filesystem::create_directories( this->paths.envLink.parent_path() );
    }
  this->builder->build( flakeDir, "default", this->paths.envLink );
}


/* -------------------------------------------------------------------------- */

void
EnvironmentMixin::applyProfileChange(
  const NixyConfig &                                           original,
  const NixyConfig &                                           updated,
  const std::string &                                          profile,
  const IncrementalEdit &                                      edit,
  bool                                                         force,
  const std::function<void( const std::filesystem::path & )> & beforeBuild,
  const std::optional<std::filesystem::path> &                 removeLocal )
{
  auto flakeDir    = this->getFlakeDir( profile );
  auto flakePath   = flakeDir / "flake.nix";
  auto packagesDir = this->getPackagesDir();

  std::optional<std::string> flakeText;
  if ( std::filesystem::exists( flakePath ) )
    {
      flakeText = readTextFile( flakePath );
    }

  /* Refuse before anything is written. */
  FlakeUpdateKind kind
    = planFlakeUpdate( flakeText, static_cast<bool>( edit ), force );

  auto found = updated.profiles.find( profile );
  if ( found == updated.profiles.end() )
    {
      throw ProfileNotFoundException( "'" + profile + "'" );
    }

  Transaction txn( RollbackContext::captureProfile( flakeDir,
                                                    this->paths.getNixyJson(),
                                                    original,
                                                    profile,
                                                    packagesDir ) );

  /* Kept beside the packages directory so scans no longer see it. */
  if ( removeLocal.has_value() )
    {
      infoLog( "==> Removing local package definition: "
               + removeLocal->string() );
      txn.stash( *removeLocal,
                 removeLocal->parent_path().parent_path() / ".nixy-stash"
                   / removeLocal->filename() );
    }

  txn.write(
    [&]()
    {
      updated.save( this->paths.getNixyJson() );
      if ( kind == FlakeUpdateKind::Incremental )
        {
          verboseLog( "editing managed sections of " + flakePath.string() );
          writeFileAtomically( flakePath, edit( *flakeText ) );
        }
      else { flake::regenerateFlake( flakeDir, found->second, packagesDir ); }
    } );

  if ( beforeBuild ) { beforeBuild( flakeDir ); }
  this->buildEnvironment( flakeDir );
  txn.commit();
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
