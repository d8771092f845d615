/* ========================================================================== *
 *
 * @file packages/sync.cc
 *
 * @brief Regenerate a missing flake and build the active profile.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>

#include "nixy/core/util.hh"
#include "nixy/flake/generator.hh"
#include "nixy/packages/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

SyncCommand::SyncCommand() : parser( "sync" )
{
  this->parser.add_description(
    "Build the active profile and link it as the environment" );
}


/* -------------------------------------------------------------------------- */

int
SyncCommand::run()
{
  NixyConfig config    = this->loadConfig();
  auto       flakeDir  = this->getFlakeDir( config.activeProfile );
  auto       flakePath = flakeDir / "flake.nix";

  if ( ! std::filesystem::exists( flakePath ) )
    {
      infoLog( "==> Regenerating flake.nix from nixy.json..." );
      flake::regenerateFlake( flakeDir,
                              config.getActiveProfile(),
                              this->getPackagesDir() );
    }

  infoLog( "==> Syncing packages with " + flakePath.string() + "..." );
  this->buildEnvironment( flakeDir );
  infoLog( "==> Sync complete" );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::packages


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
