/* ========================================================================== *
 *
 * @file profile/command.cc
 *
 * @brief Create, switch between, list, and delete profiles.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <nix/logging.hh>

#include "nixy/builder.hh"
#include "nixy/core/util.hh"
#include "nixy/flake/generator.hh"
#include "nixy/profile/command.hh"
#include "nixy/rollback.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::profile {

/* -------------------------------------------------------------------------- */

ProfileCommand::ProfileCommand()
  : parser( "profile" )
  , pSwitch( "switch" )
  , pUse( "use" )
  , pList( "list" )
  , pLs( "ls" )
  , pDelete( "delete" )
  , pRm( "rm" )
{
  this->parser.add_description( "Manage profiles" );

  this->pSwitch.add_description( "Switch to a profile" );
  this->addSwitchArguments( this->pSwitch );
  this->parser.add_subparser( this->pSwitch );

  this->pUse.add_description( "Alias of `switch'" );
  this->addSwitchArguments( this->pUse );
  this->parser.add_subparser( this->pUse );

  this->pList.add_description( "List profiles" );
  this->parser.add_subparser( this->pList );

  this->pLs.add_description( "Alias of `list'" );
  this->parser.add_subparser( this->pLs );

  this->pDelete.add_description( "Delete a profile" );
  this->addDeleteArguments( this->pDelete );
  this->parser.add_subparser( this->pDelete );

  this->pRm.add_description( "Alias of `delete'" );
  this->addDeleteArguments( this->pRm );
  this->parser.add_subparser( this->pRm );
}


void
ProfileCommand::addSwitchArguments( argparse::ArgumentParser & parser )
{
  parser.add_argument( "-c", "--create" )
    .help( "create the profile if it does not exist" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->create = true; } );
  parser.add_argument( "name" )
    .help( "name of the profile" )
    .metavar( "NAME" )
    .action( [&]( const std::string & name ) { this->name = name; } );
}


void
ProfileCommand::addDeleteArguments( argparse::ArgumentParser & parser )
{
  parser.add_argument( "--force" )
    .help( "confirm deletion" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->force = true; } );
  parser.add_argument( "name" )
    .help( "name of the profile" )
    .metavar( "NAME" )
    .action( [&]( const std::string & name ) { this->name = name; } );
}


/* -------------------------------------------------------------------------- */

int
ProfileCommand::runSwitch()
{
  validateProfileName( this->name );

  NixyConfig original = this->loadConfig();
  if ( ! original.profileExists( this->name ) )
    {
      if ( ! this->create )
        {
          throw command::InvalidArgException(
            "Profile '" + this->name
            + "' does not exist. Use -c to create it: nixy profile switch -c "
            + this->name );
        }
      infoLog( "==> Creating profile '" + this->name + "'..." );
    }

  infoLog( "==> Switching to profile '" + this->name + "'..." );
  NixyConfig updated = original;
  updated.createProfile( this->name );
  updated.setActiveProfile( this->name );

  auto flakeDir = this->getFlakeDir( this->name );
  {
    Transaction txn(
      RollbackContext::captureProfile( flakeDir,
                                       this->paths.getNixyJson(),
                                       original,
                                       this->name,
                                       this->getPackagesDir() ) );
    txn.write(
      [&]()
      {
        updated.save( this->paths.getNixyJson() );
        if ( ! std::filesystem::exists( flakeDir / "flake.nix" ) )
          {
            flake::regenerateFlake( flakeDir,
                                    updated.getActiveProfile(),
                                    this->getPackagesDir() );
          }
      } );
    txn.commit();
  }

  infoLog( "==> Building environment for profile '" + this->name + "'..." );
  try
    {
      this->buildEnvironment( flakeDir );
    }
  catch ( const BuildFailureException & err )
    {
      debugLog( err.what() );
      nix::warn( "Profile switched but environment build failed. Run 'nixy "
                 "sync' to rebuild." );
    }
  infoLog( "==> Switched to profile '" + this->name + "'" );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
ProfileCommand::runList()
{
  NixyConfig config = this->loadConfig();
  infoLog( "==> Available profiles:" );
  for ( const auto & name : config.listProfiles() )
    {
      if ( name == config.activeProfile )
        {
          std::cout << "  * " << name << " (active)" << std::endl;
        }
      else { std::cout << "    " << name << std::endl; }
    }
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
ProfileCommand::runDelete()
{
  validateProfileName( this->name );

  NixyConfig config = this->loadConfig();
  if ( ! config.profileExists( this->name ) )
    {
      throw ProfileNotFoundException( "'" + this->name + "'" );
    }
  if ( this->name == config.activeProfile )
    {
      throw CannotDeleteActiveProfileException(
        "'" + this->name + "'",
        "switch to another profile first" );
    }

  if ( ! this->force )
    {
      nix::warn( "This will delete profile '%s' and all its packages.",
                 this->name );
      throw command::InvalidArgException( "Use --force to confirm deletion." );
    }

  infoLog( "==> Deleting profile '" + this->name + "'..." );
  config.deleteProfile( this->name );
  config.save( this->paths.getNixyJson() );

  std::filesystem::remove_all( this->getFlakeDir( this->name ) );
  std::filesystem::remove_all( this->paths.getLegacyProfilesDir()
                               / this->name );
  infoLog( "==> Deleted profile '" + this->name + "'" );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
ProfileCommand::run()
{
  if ( this->parser.is_subcommand_used( this->pSwitch )
       || this->parser.is_subcommand_used( this->pUse ) )
    {
      return this->runSwitch();
    }
  if ( this->parser.is_subcommand_used( this->pList )
       || this->parser.is_subcommand_used( this->pLs ) )
    {
      return this->runList();
    }
  if ( this->parser.is_subcommand_used( this->pDelete )
       || this->parser.is_subcommand_used( this->pRm ) )
    {
      return this->runDelete();
    }

  infoLog( "==> Active profile: " + this->loadConfig().activeProfile );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::profile


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
