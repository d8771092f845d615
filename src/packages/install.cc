/* ========================================================================== *
 *
 * @file packages/install.cc
 *
 * @brief Add a package to the active profile.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "nixy/builder.hh"
#include "nixy/core/util.hh"
#include "nixy/flake/editor.hh"
#include "nixy/packages/command.hh"
#include "nixy/packages/flake-ref.hh"
#include "nixy/registry.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

InstallCommand::InstallCommand() : parser( "install" ), aliasParser( "add" )
{
  this->parser.add_description( "Install a package into the active profile" );
  this->addArguments( this->parser );
  this->aliasParser.add_description( "Alias of `install'" );
  this->addArguments( this->aliasParser );
}


void
InstallCommand::addArguments( argparse::ArgumentParser & parser )
{
  parser.add_argument( "package" )
    .help( "`<pkg>[@<version>]' or `<flake-url>[#<pkg>]'" )
    .metavar( "PACKAGE" )
    .action( [&]( const std::string & spec ) { this->spec = spec; } );

  parser.add_argument( "--platform" )
    .help( "only install on PLATFORM, may be repeated" )
    .metavar( "PLATFORM" )
    .append()
    .action( [&]( const std::string & platform )
             { this->platforms.emplace_back( platform ); } );

  parser.add_argument( "--force" )
    .help( "regenerate flake.nix even if it contains manual edits" )
    .nargs( 0 )
    .action( [&]( const auto & ) { this->force = true; } );
}


/* -------------------------------------------------------------------------- */

int
InstallCommand::run()
{
  std::optional<Platforms> platforms;
  if ( ! this->platforms.empty() )
    {
      platforms = normalizePlatforms( this->platforms );
    }

  if ( isFlakeReference( this->spec ) ) { return this->runFlake( platforms ); }
  return this->runResolved( platforms );
}


/* -------------------------------------------------------------------------- */

int
InstallCommand::runResolved( const std::optional<Platforms> & platforms )
{
  PackageSpec pkgSpec = parsePackageSpec( this->spec );
  if ( pkgSpec.name.empty() )
    {
      throw command::InvalidArgException(
        "Usage: nixy install <package>[@version] or nixy install <flake-ref>" );
    }

  NixyConfig original = this->loadConfig();
  if ( original.getActiveProfile().hasPackage( pkgSpec.name ) )
    {
      infoLog( "==> Package '" + pkgSpec.name + "' is already installed" );
      return EXIT_SUCCESS;
    }

  std::string version = pkgSpec.version.value_or( "latest" );
  infoLog( "==> Resolving " + pkgSpec.name + "@" + version + " via Nixhub..." );
  ResolvedVersion resolved = this->registry->resolve( pkgSpec.name, version );
  infoLog( "==> Found " + resolved.name + " version " + resolved.version
           + " (commit " + resolved.commitHash.substr( 0, 8 ) + ")" );

  NixyConfig updated = original;
  updated.getActiveProfile().addResolvedPackage(
    ResolvedPackage { resolved.name,
                      pkgSpec.version,
                      resolved.version,
                      resolved.attributePath,
                      resolved.commitHash,
                      platforms } );

  infoLog( "==> Installing " + resolved.name + "@" + resolved.version + "..." );
  this->applyProfileChange( original,
                            updated,
                            updated.activeProfile,
                            nullptr,
                            this->force );
  infoLog( "==> Sync complete" );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

int
InstallCommand::runFlake( const std::optional<Platforms> & platforms )
{
  FlakeInstallable installable = parseFlakeInstallable( this->spec );

  /* The name becomes an attribute and a `paths' entry of the flake. */
  if ( ! flake::isValidNixIdentifier( installable.package ) )
    {
      throw command::InvalidArgException(
        "Invalid package name '" + installable.package
        + "'. Install a top level package of the flake, e.g. "
          "github:user/repo#name" );
    }

  NixyConfig original = this->loadConfig();
  if ( original.getActiveProfile().hasPackage( installable.package ) )
    {
      infoLog( "==> Package '" + installable.package + "' is already installed" );
      return EXIT_SUCCESS;
    }

  infoLog( "==> Using flake URL: " + installable.url );
  std::string inputName = deriveInputNameFromUrl( installable.url );

  infoLog( "==> Validating package '" + installable.package + "' in "
           + inputName + "..." );
  std::optional<std::string> output
    = validateFlakePackage( installable.url, installable.package );
  if ( ! output.has_value() )
    {
      std::vector<std::string> available
        = listFlakePackages( installable.url );
      if ( available.empty() )
        {
          throw FlakePackageNotFoundException( "'" + installable.package
                                               + "' in '" + inputName + "'" );
        }
      if ( 10 < available.size() ) { available.resize( 10 ); }
      throw command::InvalidArgException(
        "Package '" + installable.package + "' not found in '" + inputName
        + "'. Available packages: " + concatStringsSep( " ", available )
        + "..." );
    }

  CustomPackage pkg { installable.package,
                      inputName,
                      installable.url,
                      *output,
                      std::nullopt,
                      platforms };

  NixyConfig updated = original;
  updated.getActiveProfile().addCustomPackage( pkg );

  /* Marker based files can take the package without regeneration unless it
   * needs a platform guard. */
  IncrementalEdit edit;
  if ( ! platforms.has_value() )
    {
      edit = [pkg]( std::string_view text )
      { return flake::addPackageIncrementally( text, pkg ); };
    }

  infoLog( "==> Installing " + installable.package + " from " + inputName
           + "..." );
  this->applyProfileChange( original,
                            updated,
                            updated.activeProfile,
                            edit,
                            this->force );
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
