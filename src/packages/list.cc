/* ========================================================================== *
 *
 * @file packages/list.cc
 *
 * @brief Print the packages of the active profile.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "nixy/core/util.hh"
#include "nixy/flake/local-packages.hh"
#include "nixy/packages/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

ListCommand::ListCommand() : parser( "list" ), aliasParser( "ls" )
{
  this->parser.add_description( "List packages in the active profile" );
  this->aliasParser.add_description( "Alias of `list'" );
}


/* -------------------------------------------------------------------------- */

std::vector<std::string>
ListCommand::getPackageNames() const
{
  std::vector<std::string> names
    = this->loadConfig().getActiveProfile().allPackageNames();

  if ( auto packagesDir = this->getPackagesDir(); packagesDir.has_value() )
    {
      flake::LocalScan scan = flake::scanLocalPackages( *packagesDir );
      for ( const auto & pkg : scan.packages ) { names.emplace_back( pkg.name ); }
      for ( const auto & local : scan.flakes )
        {
          names.emplace_back( local.name );
        }
    }

  std::sort( names.begin(), names.end() );
  names.erase( std::unique( names.begin(), names.end() ), names.end() );
  return names;
}


/* -------------------------------------------------------------------------- */

int
ListCommand::run()
{
  infoLog( "==> Installed packages:" );
  std::vector<std::string> names = this->getPackageNames();
  if ( names.empty() ) { std::cout << "  (none)" << std::endl; }
  for ( const auto & name : names ) { std::cout << "  " << name << std::endl; }
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::packages


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
