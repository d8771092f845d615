/* ========================================================================== *
 *
 * @file state.cc
 *
 * @brief The set of packages requested for a single profile.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nixy/core/exceptions.hh"
#include "nixy/core/util.hh"
#include "nixy/state.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/**
 * @brief Read a single field, wrapping `nlohmann::json` errors in a
 *        @a nixy::StateFileException naming the field.
 */
template<typename T>
static void
getField( const nlohmann::json & value,
          const std::string &    key,
          const std::string &    who,
          T &                    out )
{
  try
    {
      value.get_to( out );
    }
  catch ( nlohmann::json::exception & err )
    {
      throw StateFileException( "couldn't parse " + who + " field '" + key
                                  + "'",
                                extract_json_errmsg( err ) );
    }
}


/** @brief Like @a getField but `null` leaves @a out empty. */
template<typename T>
static void
getOptionalField( const nlohmann::json & value,
                  const std::string &    key,
                  const std::string &    who,
                  std::optional<T> &     out )
{
  if ( value.is_null() )
    {
      out = std::nullopt;
      return;
    }
  T tmp;
  getField( value, key, who, tmp );
  out = std::move( tmp );
}


/**
 * @brief Throw a @a nixy::StateFileException naming the first of @a required
 *        which is not a key of @a jfrom.
 */
static void
assertHasFields( const nlohmann::json &           jfrom,
                 const std::vector<std::string> & required,
                 const std::string &              who )
{
  for ( const auto & key : required )
    {
      if ( ! jfrom.contains( key ) )
        {
          throw StateFileException( who + " is missing field '" + key + "'" );
        }
    }
}


/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, ResolvedPackage & pkg )
{
  assertIsJSONObject<StateFileException>( jfrom, "resolved package" );
  assertHasFields(
    jfrom,
    { "name", "resolved_version", "attribute_path", "commit_hash" },
    "resolved package" );
  for ( const auto & [key, value] : jfrom.items() )
    {
      if ( key == "name" )
        {
          getField( value, key, "resolved package", pkg.name );
        }
      else if ( key == "version_spec" )
        {
          getOptionalField( value, key, "resolved package", pkg.versionSpec );
        }
      else if ( key == "resolved_version" )
        {
          getField( value, key, "resolved package", pkg.resolvedVersion );
        }
      else if ( key == "attribute_path" )
        {
          getField( value, key, "resolved package", pkg.attributePath );
        }
      else if ( key == "commit_hash" )
        {
          getField( value, key, "resolved package", pkg.commitHash );
        }
      else if ( key == "platforms" )
        {
          getOptionalField( value, key, "resolved package", pkg.platforms );
        }
      else
        {
          throw StateFileException( "encountered unexpected field '" + key
                                    + "' while parsing resolved package" );
        }
    }
}


void
to_json( nlohmann::json & jto, const ResolvedPackage & pkg )
{
  jto = { { "name", pkg.name },
          { "resolved_version", pkg.resolvedVersion },
          { "attribute_path", pkg.attributePath },
          { "commit_hash", pkg.commitHash } };
  if ( pkg.versionSpec.has_value() ) { jto["version_spec"] = *pkg.versionSpec; }
  if ( pkg.platforms.has_value() ) { jto["platforms"] = *pkg.platforms; }
}


/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, CustomPackage & pkg )
{
  assertIsJSONObject<StateFileException>( jfrom, "custom package" );
  assertHasFields( jfrom,
                   { "name", "input_name", "input_url", "package_output" },
                   "custom package" );
  for ( const auto & [key, value] : jfrom.items() )
    {
      if ( key == "name" )
        {
          getField( value, key, "custom package", pkg.name );
        }
      else if ( key == "input_name" )
        {
          getField( value, key, "custom package", pkg.inputName );
        }
      else if ( key == "input_url" )
        {
          getField( value, key, "custom package", pkg.inputUrl );
        }
      else if ( key == "package_output" )
        {
          getField( value, key, "custom package", pkg.packageOutput );
        }
      else if ( key == "source_name" )
        {
          getOptionalField( value, key, "custom package", pkg.sourceName );
        }
      else if ( key == "platforms" )
        {
          getOptionalField( value, key, "custom package", pkg.platforms );
        }
      else
        {
          throw StateFileException( "encountered unexpected field '" + key
                                    + "' while parsing custom package" );
        }
    }
}


void
to_json( nlohmann::json & jto, const CustomPackage & pkg )
{
  jto = { { "name", pkg.name },
          { "input_name", pkg.inputName },
          { "input_url", pkg.inputUrl },
          { "package_output", pkg.packageOutput } };
  if ( pkg.sourceName.has_value() ) { jto["source_name"] = *pkg.sourceName; }
  if ( pkg.platforms.has_value() ) { jto["platforms"] = *pkg.platforms; }
}


/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, PackageState & state )
{
  assertIsJSONObject<StateFileException>( jfrom, "package state" );
  state = PackageState {};
  /* Profiles inside `nixy.json' may omit the version. */
  for ( const auto & [key, value] : jfrom.items() )
    {
      if ( key == "version" )
        {
          getField( value, key, "package state", state.version );
        }
      else if ( key == "packages" )
        {
          getField( value, key, "package state", state.packages );
        }
      else if ( key == "resolved_packages" )
        {
          if ( value.is_null() ) { continue; }
          getField( value, key, "package state", state.resolvedPackages );
        }
      else if ( key == "custom_packages" )
        {
          if ( value.is_null() ) { continue; }
          getField( value, key, "package state", state.customPackages );
        }
      else
        {
          throw StateFileException( "encountered unexpected field '" + key
                                    + "' while parsing package state" );
        }
    }
}


void
to_json( nlohmann::json & jto, const PackageState & state )
{
  jto = { { "version", state.version },
          { "packages", state.packages },
          { "resolved_packages", state.resolvedPackages },
          { "custom_packages", state.customPackages } };
}


/* -------------------------------------------------------------------------- */

PackageState
PackageState::load( const std::filesystem::path & path )
{
  if ( ! std::filesystem::exists( path ) ) { return PackageState {}; }

  PackageState state;
  try
    {
      nlohmann::json::parse( readTextFile( path ) ).get_to( state );
    }
  catch ( nlohmann::json::exception & err )
    {
      throw StateFileException( "failed to parse '" + path.string() + "'",
                                extract_json_errmsg( err ) );
    }

  if ( state.version < PACKAGE_STATE_VERSION )
    {
      debugLog( nix::fmt( "upgrading '%s' from version %d in memory",
                          path.string(),
                          state.version ) );
      state.version = PACKAGE_STATE_VERSION;
    }
  return state;
}


/* -------------------------------------------------------------------------- */

void
PackageState::save( const std::filesystem::path & path ) const
{
  writeFileAtomically<StateFileException>(
    path,
    nlohmann::json( *this ).dump( 2 ) + "\n" );
}


/* -------------------------------------------------------------------------- */

void
PackageState::evict( std::string_view name )
{
  std::erase( this->packages, name );
  std::erase_if( this->resolvedPackages,
                 [&]( const ResolvedPackage & pkg ) { return pkg.name == name; } );
  std::erase_if( this->customPackages,
                 [&]( const CustomPackage & pkg ) { return pkg.name == name; } );
}


void
PackageState::addLegacyPackage( const std::string & name )
{
  this->evict( name );
  this->packages.emplace_back( name );
  std::sort( this->packages.begin(), this->packages.end() );
}


void
PackageState::addResolvedPackage( ResolvedPackage pkg )
{
  this->evict( pkg.name );
  this->resolvedPackages.emplace_back( std::move( pkg ) );
  std::sort( this->resolvedPackages.begin(),
             this->resolvedPackages.end(),
             []( const ResolvedPackage & lhs, const ResolvedPackage & rhs )
             { return lhs.name < rhs.name; } );
}


void
PackageState::addCustomPackage( CustomPackage pkg )
{
  this->evict( pkg.name );
  this->customPackages.emplace_back( std::move( pkg ) );
  std::sort( this->customPackages.begin(),
             this->customPackages.end(),
             []( const CustomPackage & lhs, const CustomPackage & rhs )
             { return lhs.name < rhs.name; } );
}


/* -------------------------------------------------------------------------- */

bool
PackageState::removePackage( std::string_view name )
{
  if ( ! this->hasPackage( name ) ) { return false; }
  this->evict( name );
  return true;
}


bool
PackageState::hasPackage( std::string_view name ) const
{
  return this->isLegacyPackage( name )
         || std::any_of( this->resolvedPackages.begin(),
                         this->resolvedPackages.end(),
                         [&]( const ResolvedPackage & pkg )
                         { return pkg.name == name; } )
         || std::any_of( this->customPackages.begin(),
                         this->customPackages.end(),
                         [&]( const CustomPackage & pkg )
                         { return pkg.name == name; } );
}


bool
PackageState::isLegacyPackage( std::string_view name ) const
{
  return std::find( this->packages.begin(), this->packages.end(), name )
         != this->packages.end();
}


std::optional<ResolvedPackage>
PackageState::getResolvedPackage( std::string_view name ) const
{
  for ( const auto & pkg : this->resolvedPackages )
    {
      if ( pkg.name == name ) { return pkg; }
    }
  return std::nullopt;
}


std::vector<std::string>
PackageState::allPackageNames() const
{
  std::vector<std::string> names = this->packages;
  for ( const auto & pkg : this->resolvedPackages )
    {
      names.emplace_back( pkg.name );
    }
  for ( const auto & pkg : this->customPackages )
    {
      names.emplace_back( pkg.name );
    }
  std::sort( names.begin(), names.end() );
  return names;
}


/* -------------------------------------------------------------------------- */

std::filesystem::path
getStatePath( const std::filesystem::path & profileDir )
{
  return profileDir / "packages.json";
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
