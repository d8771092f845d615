/* ========================================================================== *
 *
 * @file packages/upgrade.cc
 *
 * @brief Re-resolve pinned packages and update flake inputs.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <nix/logging.hh>

#include "nixy/builder.hh"
#include "nixy/core/util.hh"
#include "nixy/flake/generator.hh"
#include "nixy/packages/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

UpgradeCommand::UpgradeCommand() : parser( "upgrade" )
{
  this->parser.add_description(
    "Upgrade pinned packages and update flake inputs" );
  this->parser.add_argument( "inputs" )
    .help( "pinned packages or flake inputs to upgrade, all when omitted" )
    .metavar( "INPUT" )
    .remaining()
    .action( [&]( const std::string & input )
             { this->inputs.emplace_back( input ); } );
}


/* -------------------------------------------------------------------------- */

bool
UpgradeCommand::reresolve( PackageState &                   state,
                           const std::vector<std::string> & names )
{
  bool changed = false;
  for ( const auto & name : names )
    {
      std::optional<ResolvedPackage> existing = state.getResolvedPackage( name );
      if ( ! existing.has_value() ) { continue; }

      std::string version = existing->versionSpec.value_or( "latest" );
      infoLog( "==> Resolving " + name + "@" + version + "..." );

      ResolvedVersion resolved;
      try
        {
          resolved = this->registry->resolve( name, version );
        }
      catch ( const NixyException & err )
        {
          nix::warn( "  Failed to resolve %s: %s", name, err.what() );
          continue;
        }

      if ( ( resolved.version == existing->resolvedVersion )
           && ( resolved.commitHash == existing->commitHash ) )
        {
          infoLog( "==>   " + name + " is already at the latest version" );
          continue;
        }

      infoLog( "==>   " + existing->resolvedVersion + " -> " + resolved.version
               + " (commit " + resolved.commitHash.substr( 0, 8 ) + ")" );
      state.addResolvedPackage( ResolvedPackage { resolved.name,
                                                  existing->versionSpec,
                                                  resolved.version,
                                                  resolved.attributePath,
                                                  resolved.commitHash,
                                                  existing->platforms } );
      changed = true;
    }
  return changed;
}


/* -------------------------------------------------------------------------- */

int
UpgradeCommand::run()
{
  NixyConfig     original = this->loadConfig();
  NixyConfig     updated  = original;
  std::string    profile  = original.activeProfile;
  PackageState & state    = updated.getActiveProfile();

  auto flakeDir = this->getFlakeDir( profile );
  if ( ! std::filesystem::exists( flakeDir / "flake.nix" ) )
    {
      infoLog( "==> Regenerating flake.nix from nixy.json..." );
      flake::regenerateFlake( flakeDir, state, this->getPackagesDir() );
    }

  std::vector<std::string> packages;
  std::vector<std::string> flakeInputs;
  if ( this->inputs.empty() )
    {
      for ( const auto & pkg : state.resolvedPackages )
        {
          packages.emplace_back( pkg.name );
        }
    }
  else
    {
      for ( const auto & input : this->inputs )
        {
          if ( state.getResolvedPackage( input ).has_value() )
            {
              packages.emplace_back( input );
            }
          else { flakeInputs.emplace_back( input ); }
        }
    }

  /* Validate inputs before changing anything. */
  if ( ! flakeInputs.empty() )
    {
      std::vector<std::string> available
        = getFlakeInputs( flakeDir / "flake.lock" );
      std::vector<std::string> unpinned;
      std::vector<std::string> invalid;
      for ( const auto & input : flakeInputs )
        {
          if ( std::find( available.begin(), available.end(), input )
               != available.end() )
            {
              continue;
            }
          if ( state.hasPackage( input ) ) { unpinned.emplace_back( input ); }
          else { invalid.emplace_back( input ); }
        }

      if ( ! unpinned.empty() )
        {
          nix::warn( "Per-package upgrade is only supported for versioned "
                     "packages (installed with @version)." );
          nix::warn( "Legacy packages (%s) are upgraded when you run 'nixy "
                     "upgrade' without arguments.",
                     concatStringsSep( ", ", unpinned ) );
          return EXIT_SUCCESS;
        }
      if ( ! invalid.empty() )
        {
          throw InvalidFlakeInputsException(
            concatStringsSep( ", ", invalid ),
            "available inputs: " + concatStringsSep( " ", available ) );
        }
    }

  bool changed = this->reresolve( state, packages );

  auto updateInputs = [&]( const std::filesystem::path & dir )
  {
    if ( this->inputs.empty() )
      {
        infoLog( "==> Updating all flake inputs..." );
        flakeUpdate( dir );
      }
    else if ( ! flakeInputs.empty() )
      {
        infoLog( "==> Updating inputs: " + concatStringsSep( ", ", flakeInputs )
                 + "..." );
        flakeUpdate( dir, flakeInputs );
      }
  };

  infoLog( "==> Rebuilding environment..." );
  if ( changed )
    {
      this->applyProfileChange( original,
                                updated,
                                profile,
                                nullptr,
                                false,
                                updateInputs );
    }
  else
    {
      updateInputs( flakeDir );
      this->buildEnvironment( flakeDir );
    }

  if ( this->inputs.empty() ) { infoLog( "==> All packages upgraded" ); }
  else
    {
      infoLog( "==> Upgraded: " + concatStringsSep( ", ", this->inputs ) );
    }
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::packages


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
