/* ========================================================================== *
 *
 * @file nixy/paths.hh
 *
 * @brief Filesystem locations used by `nixy`.
 *
 * Layout:
 *   <config>/nixy.json                    all profiles and the active pointer
 *   <config>/packages/                    local package definitions
 *   <state>/profiles/<name>/flake.nix     generated per profile
 *   <state>/env                           link to the active build
 *
 * Legacy ( pre `nixy.json` ) layout, only read during migration:
 *   <config>/active
 *   <config>/profiles/<name>/{flake.nix,flake.lock,packages.json,packages/}
 *   <config>/flake.nix
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <string>


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/** @brief Name of the profile which always exists. */
inline constexpr const char * DEFAULT_PROFILE = "default";


/* -------------------------------------------------------------------------- */

/** @brief Resolved filesystem locations. */
struct Paths
{

  std::filesystem::path configDir;
  std::filesystem::path stateDir;
  std::filesystem::path envLink;

  /**
   * @brief Resolve locations from the environment.
   *
   * `NIXY_CONFIG_DIR`, `NIXY_STATE_DIR` and `NIXY_ENV` override the
   * defaults `$HOME/.config/nixy`, `$HOME/.local/state/nixy` and
   * `<state>/env` respectively.
   */
  [[nodiscard]] static Paths
  fromEnv();

  /** @brief Use explicit directories, mostly useful for tests. */
  [[nodiscard]] static Paths
  fromDirs( const std::filesystem::path & configDir,
            const std::filesystem::path & stateDir );


  [[nodiscard]] std::filesystem::path
  getNixyJson() const
  {
    return this->configDir / "nixy.json";
  }

  [[nodiscard]] std::filesystem::path
  getPackagesDir() const
  {
    return this->configDir / "packages";
  }

  [[nodiscard]] std::filesystem::path
  getProfilesStateDir() const
  {
    return this->stateDir / "profiles";
  }

  /** @brief Directory holding the generated flake of profile @a name. */
  [[nodiscard]] std::filesystem::path
  getProfileDir( const std::string & name ) const
  {
    return this->getProfilesStateDir() / name;
  }

  [[nodiscard]] std::filesystem::path
  getLegacyProfilesDir() const
  {
    return this->configDir / "profiles";
  }

  [[nodiscard]] std::filesystem::path
  getLegacyActiveFile() const
  {
    return this->configDir / "active";
  }

  [[nodiscard]] std::filesystem::path
  getLegacyFlake() const
  {
    return this->configDir / "flake.nix";
  }


}; /* End struct `Paths' */


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
