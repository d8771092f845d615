/* ========================================================================== *
 *
 * @file nixy-config.cc
 *
 * @brief The multi-profile store kept in `nixy.json`.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nixy/core/exceptions.hh"
#include "nixy/core/util.hh"
#include "nixy/nixy-config.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

void
validateProfileName( std::string_view name )
{
  static const std::regex profileNameRE( "^[a-zA-Z0-9_-]+$" );
  if ( ! std::regex_match( name.begin(), name.end(), profileNameRE ) )
    {
      throw InvalidProfileNameException(
        "'" + std::string( name ) + "'",
        "profile names may only contain letters, digits, '-' and '_'" );
    }
}


/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, NixyConfig & config )
{
  assertIsJSONObject<StateFileException>( jfrom, "nixy config" );
  config.profiles.clear();
  for ( const auto & [key, value] : jfrom.items() )
    {
      try
        {
          if ( key == "version" ) { value.get_to( config.version ); }
          else if ( key == "active_profile" )
            {
              value.get_to( config.activeProfile );
            }
          else if ( key == "profiles" )
            {
              assertIsJSONObject<StateFileException>( value, "profiles" );
              for ( const auto & [name, profile] : value.items() )
                {
                  ProfileConfig pconf;
                  from_json( profile, pconf );
                  config.profiles.emplace( name, std::move( pconf ) );
                }
            }
          else
            {
              throw StateFileException( "encountered unexpected field '" + key
                                        + "' while parsing nixy config" );
            }
        }
      catch ( nlohmann::json::exception & err )
        {
          throw StateFileException( "couldn't parse nixy config field '" + key
                                      + "'",
                                    extract_json_errmsg( err ) );
        }
    }
}


void
to_json( nlohmann::json & jto, const NixyConfig & config )
{
  nlohmann::json profiles = nlohmann::json::object();
  for ( const auto & [name, profile] : config.profiles )
    {
      nlohmann::json jprofile = profile;
      /* Profile entries are versioned by the enclosing store. */
      jprofile.erase( "version" );
      profiles[name] = std::move( jprofile );
    }
  jto = { { "version", config.version },
          { "active_profile", config.activeProfile },
          { "profiles", std::move( profiles ) } };
}


/* -------------------------------------------------------------------------- */

NixyConfig
NixyConfig::load( const std::filesystem::path & path )
{
  if ( ! std::filesystem::exists( path ) ) { return NixyConfig {}; }

  NixyConfig config;
  try
    {
      nlohmann::json::parse( readTextFile( path ) ).get_to( config );
    }
  catch ( nlohmann::json::exception & err )
    {
      throw StateFileException( "failed to parse '" + path.string() + "'",
                                extract_json_errmsg( err ) );
    }

  if ( config.version < NIXY_CONFIG_VERSION )
    {
      debugLog( nix::fmt( "upgrading '%s' from version %d in memory",
                          path.string(),
                          config.version ) );
      config.version = NIXY_CONFIG_VERSION;
    }
  for ( auto & [name, profile] : config.profiles )
    {
      profile.version = PACKAGE_STATE_VERSION;
    }
  config.normalize();
  return config;
}


/* -------------------------------------------------------------------------- */

void
NixyConfig::save( const std::filesystem::path & path ) const
{
  writeFileAtomically<StateFileException>(
    path,
    nlohmann::json( *this ).dump( 2 ) + "\n" );
}


/* -------------------------------------------------------------------------- */

void
NixyConfig::normalize()
{
  if ( ! this->profileExists( DEFAULT_PROFILE ) )
    {
      this->profiles.emplace( DEFAULT_PROFILE, ProfileConfig {} );
    }
  if ( ! this->profileExists( this->activeProfile ) )
    {
      debugLog( "active profile '" + this->activeProfile
                + "' does not exist, using '" + DEFAULT_PROFILE + "'" );
      this->activeProfile = DEFAULT_PROFILE;
    }
}


/* -------------------------------------------------------------------------- */

const ProfileConfig &
NixyConfig::getActiveProfile() const
{
  auto found = this->profiles.find( this->activeProfile );
  if ( found == this->profiles.end() )
    {
      throw ProfileNotFoundException( "'" + this->activeProfile + "'" );
    }
  return found->second;
}


ProfileConfig &
NixyConfig::getActiveProfile()
{
  auto found = this->profiles.find( this->activeProfile );
  if ( found == this->profiles.end() )
    {
      throw ProfileNotFoundException( "'" + this->activeProfile + "'" );
    }
  return found->second;
}


/* -------------------------------------------------------------------------- */

void
NixyConfig::setActiveProfile( const std::string & name )
{
  if ( ! this->profileExists( name ) )
    {
      throw ProfileNotFoundException( "'" + name + "'" );
    }
  this->activeProfile = name;
}


void
NixyConfig::createProfile( const std::string & name )
{
  this->profiles.try_emplace( name, ProfileConfig {} );
}


void
NixyConfig::deleteProfile( const std::string & name )
{
  if ( name == this->activeProfile )
    {
      throw CannotDeleteActiveProfileException(
        "'" + name + "'",
        "switch to another profile first" );
    }
  if ( this->profiles.erase( name ) == 0 )
    {
      throw ProfileNotFoundException( "'" + name + "'" );
    }
}


std::vector<std::string>
NixyConfig::listProfiles() const
{
  /* `std::map' keeps keys sorted. */
  std::vector<std::string> names;
  names.reserve( this->profiles.size() );
  for ( const auto & [name, _] : this->profiles ) { names.emplace_back( name ); }
  return names;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
