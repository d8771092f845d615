/* ========================================================================== *
 *
 * @file packages/search.cc
 *
 * @brief Search the registry for packages.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <iostream>
#include <string>

#include "nixy/core/util.hh"
#include "nixy/packages/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

SearchCommand::SearchCommand() : parser( "search" )
{
  this->parser.add_description( "Search for packages" );
  this->parser.add_argument( "query" )
    .help( "text to search for" )
    .metavar( "QUERY" )
    .action( [&]( const std::string & query ) { this->query = query; } );
}


/* -------------------------------------------------------------------------- */

int
SearchCommand::run()
{
  infoLog( "==> Searching for " + this->query + "..." );
  auto results = this->registry->search( this->query );
  if ( results.empty() )
    {
      infoLog( "==> No packages found for '" + this->query + "'" );
      return EXIT_SUCCESS;
    }
  for ( const auto & result : results )
    {
      std::cout << result.name << " - " << result.summary << std::endl;
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
