/* ========================================================================== *
 *
 * @file nixy/nixy-config.hh
 *
 * @brief The multi-profile store kept in `nixy.json`.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "nixy/core/exceptions.hh"
#include "nixy/paths.hh"
#include "nixy/state.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/** @brief Current schema version of `nixy.json`. */
constexpr unsigned NIXY_CONFIG_VERSION = 3;


/* -------------------------------------------------------------------------- */

/**
 * @class nixy::InvalidProfileNameException
 * @brief An exception thrown when a profile name contains characters other
 *        than ASCII letters, digits, `-` and `_`.
 * @{
 */
NIXY_DEFINE_EXCEPTION( InvalidProfileNameException,
                       EC_INVALID_PROFILE_NAME,
                       "invalid profile name" )
/** @} */

/**
 * @class nixy::ProfileNotFoundException
 * @brief An exception thrown when a named profile does not exist.
 * @{
 */
NIXY_DEFINE_EXCEPTION( ProfileNotFoundException,
                       EC_PROFILE_NOT_FOUND,
                       "profile not found" )
/** @} */

/**
 * @class nixy::CannotDeleteActiveProfileException
 * @brief An exception thrown when attempting to delete the active profile.
 * @{
 */
NIXY_DEFINE_EXCEPTION( CannotDeleteActiveProfileException,
                       EC_CANNOT_DELETE_ACTIVE_PROFILE,
                       "cannot delete the active profile" )
/** @} */


/** @brief Throw an @a InvalidProfileNameException unless @a name is valid. */
void
validateProfileName( std::string_view name );


/* -------------------------------------------------------------------------- */

/**
 * @brief All profiles and the name of the active one.
 *
 * After @a load or @a normalize a `default` profile always exists and
 * @a activeProfile always names an existing profile.
 */
struct NixyConfig
{

  unsigned                             version       = NIXY_CONFIG_VERSION;
  std::string                          activeProfile = DEFAULT_PROFILE;
  std::map<std::string, ProfileConfig> profiles
    = { { DEFAULT_PROFILE, ProfileConfig {} } };


  /**
   * @brief Load `nixy.json`.
   *
   * A missing file yields a store with a single empty `default` profile.
   * @throws StateFileException if the file cannot be read or parsed.
   */
  [[nodiscard]] static NixyConfig
  load( const std::filesystem::path & path );

  /** @brief Atomically write the store to @a path. */
  void
  save( const std::filesystem::path & path ) const;

  /** @brief Re-establish the `default` and @a activeProfile invariants. */
  void
  normalize();

  [[nodiscard]] const ProfileConfig &
  getActiveProfile() const;

  [[nodiscard]] ProfileConfig &
  getActiveProfile();

  /** @throws ProfileNotFoundException if @a name does not exist. */
  void
  setActiveProfile( const std::string & name );

  /** @brief Create an empty profile, doing nothing if it exists. */
  void
  createProfile( const std::string & name );

  /**
   * @throws CannotDeleteActiveProfileException if @a name is active.
   * @throws ProfileNotFoundException if @a name does not exist.
   */
  void
  deleteProfile( const std::string & name );

  [[nodiscard]] std::vector<std::string>
  listProfiles() const;

  [[nodiscard]] bool
  profileExists( const std::string & name ) const
  {
    return this->profiles.find( name ) != this->profiles.end();
  }

  [[nodiscard]] bool
  operator==( const NixyConfig & other ) const
    = default;


}; /* End struct `NixyConfig' */


void
from_json( const nlohmann::json & jfrom, NixyConfig & config );

void
to_json( nlohmann::json & jto, const NixyConfig & config );


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
