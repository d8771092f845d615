/* ========================================================================== *
 *
 * @file command.cc
 *
 * @brief Verbosity flags and command line parsing shared by every
 *        `nixy` subcommand.
 *
 *
 * -------------------------------------------------------------------------- */

#include <stdexcept>
#include <string>

#include <argparse/argparse.hpp>
#include <nix/logging.hh>

#include "nixy/core/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::command {

/* -------------------------------------------------------------------------- */

/** @brief Move `nix::verbosity` by @a delta, staying within Nix's levels. */
static void
adjustVerbosity( int delta )
{
  int level = static_cast<int>( nix::verbosity ) + delta;
  if ( level < static_cast<int>( nix::lvlError ) )
    {
      level = static_cast<int>( nix::lvlError );
    }
  else if ( static_cast<int>( nix::lvlVomit ) < level )
    {
      level = static_cast<int>( nix::lvlVomit );
    }
  nix::verbosity = static_cast<nix::Verbosity>( level );
}


/* -------------------------------------------------------------------------- */

VerboseParser::VerboseParser( const std::string & name,
                              const std::string & version )
  : argparse::ArgumentParser( name, version, argparse::default_arguments::help )
{
  this->add_argument( "-q", "--quiet" )
    .help( "only print warnings and errors, repeat to hide warnings" )
    .action( []( const auto & ) { adjustVerbosity( -1 ); } )
    .default_value( false )
    .implicit_value( true )
    .append();

  this->add_argument( "-v", "--verbose" )
    .help( "show what nixy and nix are doing, may be repeated" )
    .action( []( const auto & ) { adjustVerbosity( 1 ); } )
    .default_value( false )
    .implicit_value( true )
    .append();
}


/* -------------------------------------------------------------------------- */

void
parseCommandLine( argparse::ArgumentParser & parser, int argc, char * argv[] )
{
  try
    {
      parser.parse_args( argc, argv );
    }
  catch ( const std::runtime_error & err )
    {
      /* argparse reports missing and unknown arguments this way. */
      throw InvalidArgException( err.what(), "see `nixy --help' for usage" );
    }
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
