/* ========================================================================== *
 *
 * @file main.cc
 *
 * @brief Executable keeping a `nix` flake in sync with declared packages.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <unistd.h>

#include <nix/error.hh>
#include <nix/util.hh>
#include <nlohmann/json.hpp>

#include "nixy/core/command.hh"
#include "nixy/core/exceptions.hh"
#include "nixy/core/nix-state.hh"
#include "nixy/migration.hh"
#include "nixy/packages/command.hh"
#include "nixy/profile/command.hh"
#include "nixy/rollback.hh"
#include "nixy/shell/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/**
 * @class CaughtException
 * @brief An exception thrown when an otherwise unhandled exception is caught.
 *        This ensures proper JSON formatting.
 * @{
 */
NIXY_DEFINE_EXCEPTION( CaughtException,
                       EC_FAILURE,
                       "caught an unhandled exception" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @class NixException
 * @brief An exception thrown when an otherwise unhandled Nix exception is
 *        caught. This ensures proper JSON formatting.
 * @{
 */
NIXY_DEFINE_EXCEPTION( NixException, EC_NIX, "caught a nix exception" )
/** @} */


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- */

int
run( int argc, char * argv[] )
{
  nixy::initNix();
  nixy::setVerbosityFromEnv();
  nixy::installSignalHandler();

  /* Define arg parsers. */

  nixy::command::VerboseParser prog( "nixy", NIXY_VERSION );
  prog.add_description( "Declarative package management with nix flakes" );

  nixy::packages::InstallCommand cmdInstall;
  prog.add_subparser( cmdInstall.getParser() );
  prog.add_subparser( cmdInstall.getAliasParser() );

  nixy::packages::UninstallCommand cmdUninstall;
  prog.add_subparser( cmdUninstall.getParser() );
  prog.add_subparser( cmdUninstall.getAliasParser() );

  nixy::packages::ListCommand cmdList;
  prog.add_subparser( cmdList.getParser() );
  prog.add_subparser( cmdList.getAliasParser() );

  nixy::packages::FileCommand cmdFile;
  prog.add_subparser( cmdFile.getParser() );

  nixy::packages::SearchCommand cmdSearch;
  prog.add_subparser( cmdSearch.getParser() );

  nixy::packages::UpgradeCommand cmdUpgrade;
  prog.add_subparser( cmdUpgrade.getParser() );

  nixy::packages::SyncCommand cmdSync;
  prog.add_subparser( cmdSync.getParser() );

  nixy::shell::ConfigCommand cmdConfig;
  prog.add_subparser( cmdConfig.getParser() );

  nixy::profile::ProfileCommand cmdProfile;
  prog.add_subparser( cmdProfile.getParser() );

  nixy::command::VerboseParser cmdVersion( "version" );
  cmdVersion.add_description( "Show nixy version" );
  prog.add_subparser( cmdVersion );

  nixy::command::parseCommandLine( prog, argc, argv );

  if ( prog.is_subcommand_used( cmdVersion ) )
    {
      std::cout << "nixy " << NIXY_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  if ( prog.is_subcommand_used( cmdConfig.getParser() ) )
    {
      return cmdConfig.run();
    }
  if ( prog.is_subcommand_used( cmdSearch.getParser() ) )
    {
      return cmdSearch.run();
    }

  /* Everything else reads the configuration. */
  nixy::runMigrationIfNeeded( nixy::Paths::fromEnv() );

  if ( prog.is_subcommand_used( cmdInstall.getParser() )
       || prog.is_subcommand_used( cmdInstall.getAliasParser() ) )
    {
      return cmdInstall.run();
    }
  if ( prog.is_subcommand_used( cmdUninstall.getParser() )
       || prog.is_subcommand_used( cmdUninstall.getAliasParser() ) )
    {
      return cmdUninstall.run();
    }
  if ( prog.is_subcommand_used( cmdList.getParser() )
       || prog.is_subcommand_used( cmdList.getAliasParser() ) )
    {
      return cmdList.run();
    }
  if ( prog.is_subcommand_used( cmdFile.getParser() ) )
    {
      return cmdFile.run();
    }
  if ( prog.is_subcommand_used( cmdUpgrade.getParser() ) )
    {
      return cmdUpgrade.run();
    }
  if ( prog.is_subcommand_used( cmdSync.getParser() ) )
    {
      return cmdSync.run();
    }
  if ( prog.is_subcommand_used( cmdProfile.getParser() ) )
    {
      return cmdProfile.run();
    }

  std::cerr << prog << std::endl;
  throw nixy::command::InvalidArgException( "You must provide a command" );
}


/* -------------------------------------------------------------------------- */

int
printAndReturnException( const nixy::NixyException & err )
{
  if ( isatty( STDOUT_FILENO ) == 0 )
    {
      std::cout << nlohmann::json( err ).dump() << '\n';
    }
  else { std::cerr << nixy::formatException( err ) << '\n'; }

  return err.getErrorCode();
}


/* -------------------------------------------------------------------------- */

int
main( int argc, char * argv[] )
{
  /* Allows you to run without catching which is useful for
   * `gdb'/`lldb' backtraces. */
  auto * maybeNC = std::getenv( "NIXY_NO_CATCH" );
  if ( maybeNC != nullptr )
    {
      std::string noCatch = std::string( maybeNC );
      if ( ( noCatch != std::string( "" ) )
           && ( noCatch != std::string( "0" ) ) )
        {
          return run( argc, argv );
        }
    }

  /* Wrap all execution in an error handler that pretty prints exceptions. */
  int exit_code = 0;
  try
    {
      exit_code = run( argc, argv );
    }
  catch ( const nixy::NixyException & err )
    {
      exit_code = printAndReturnException( err );
    }
  catch ( const nix::Error & err )
    {
      exit_code = printAndReturnException(
        nixy::NixException( "running nixy subcommand",
                            nix::filterANSIEscapes( err.what(), true ) ) );
    }
  catch ( const std::exception & err )
    {
      exit_code = printAndReturnException(
        nixy::CaughtException( "running nixy subcommand", err.what() ) );
    }

  return exit_code;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
