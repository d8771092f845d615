/* ========================================================================== *
 *
 * @file packages/uninstall.cc
 *
 * @brief Remove a package, and its local definition, from the profile.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#include <nix/logging.hh>

#include "nixy/core/util.hh"
#include "nixy/flake/editor.hh"
#include "nixy/flake/local-packages.hh"
#include "nixy/packages/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

UninstallCommand::UninstallCommand()
  : parser( "uninstall" ), aliasParser( "remove" )
{
  this->parser.add_description( "Remove a package from the active profile" );
  this->addArguments( this->parser );
  this->aliasParser.add_description( "Alias of `uninstall'" );
  this->addArguments( this->aliasParser );
}


void
UninstallCommand::addArguments( argparse::ArgumentParser & parser )
{
  parser.add_argument( "package" )
    .help( "name of the package to remove" )
    .metavar( "PACKAGE" )
    .action( [&]( const std::string & name ) { this->package = name; } );

  parser.add_argument( "--force" )
    .help( "regenerate flake.nix even if it contains manual edits" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->force = true; } );
}


/* -------------------------------------------------------------------------- */

int
UninstallCommand::run()
{
  NixyConfig original = this->loadConfig();
  NixyConfig updated  = original;

  infoLog( "==> Uninstalling " + this->package + "..." );

  std::optional<std::filesystem::path> localDef;
  if ( auto packagesDir = this->getPackagesDir(); packagesDir.has_value() )
    {
      localDef = flake::findLocalDefinition( *packagesDir, this->package );
    }

  bool removed = updated.getActiveProfile().removePackage( this->package );
  if ( ! ( removed || localDef.has_value() ) )
    {
      nix::warn( "Package '%s' is not installed", this->package );
      return EXIT_SUCCESS;
    }

  std::string name = this->package;
  this->applyProfileChange(
    original,
    updated,
    updated.activeProfile,
    [name]( std::string_view text )
    { return flake::removePackageIncrementally( text, name ); },
    this->force,
    nullptr,
    localDef );

  infoLog( "==> Removed " + this->package );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::packages


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
