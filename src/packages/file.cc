/* ========================================================================== *
 *
 * @file packages/file.cc
 *
 * @brief Print the file defining a package.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "nixy/builder.hh"
#include "nixy/core/util.hh"
#include "nixy/flake/local-packages.hh"
#include "nixy/packages/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

FileCommand::FileCommand() : parser( "file" )
{
  this->parser.add_description( "Show the file defining a package" );
  this->parser.add_argument( "package" )
    .help( "name of an installed package" )
    .metavar( "PACKAGE" )
    .action( [&]( const std::string & name ) { this->package = name; } );
}


/* -------------------------------------------------------------------------- */

std::filesystem::path
FileCommand::getSourcePath() const
{
  if ( auto packagesDir = this->getPackagesDir(); packagesDir.has_value() )
    {
      auto local = flake::findLocalDefinition( *packagesDir, this->package );
      if ( local.has_value() )
        {
          if ( std::filesystem::is_directory( *local ) )
            {
              return *local / "flake.nix";
            }
          return *local;
        }
    }

  NixyConfig            config  = this->loadConfig();
  const ProfileConfig & profile = config.getActiveProfile();

  for ( const auto & pkg : profile.customPackages )
    {
      if ( pkg.name != this->package ) { continue; }
      verboseLog( "fetching " + pkg.inputUrl );
      return flakePrefetch( pkg.inputUrl ) / "flake.nix";
    }

  for ( const auto & pkg : profile.resolvedPackages )
    {
      if ( pkg.name != this->package ) { continue; }
      return getPackageSourcePath( pkg.commitHash,
                                   pkg.attributePath,
                                   currentSystem() );
    }

  if ( std::find( profile.packages.begin(),
                  profile.packages.end(),
                  this->package )
       != profile.packages.end() )
    {
      return getPackageSourcePath( "nixos-unstable",
                                   this->package,
                                   currentSystem() );
    }

  throw PackageNotInstalledException(
    "'" + this->package + "'",
    "run `nixy list' to see installed packages" );
}


/* -------------------------------------------------------------------------- */

int
FileCommand::run()
{
  std::cout << this->getSourcePath().string() << std::endl;
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::packages


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
