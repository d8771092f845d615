/* ========================================================================== *
 *
 * @file paths.cc
 *
 * @brief Filesystem locations used by `nixy`.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <string>

#include <nix/users.hh>
#include <nix/util.hh>

#include "nixy/core/util.hh"
#include "nixy/paths.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

Paths
Paths::fromEnv()
{
  std::filesystem::path home( nix::getHome() );

  Paths paths;
  paths.configDir = nix::getEnv( "NIXY_CONFIG_DIR" )
                      .value_or( ( home / ".config" / "nixy" ).string() );
  paths.stateDir  = nix::getEnv( "NIXY_STATE_DIR" )
                     .value_or( ( home / ".local" / "state" / "nixy" ).string() );
  paths.envLink
    = nix::getEnv( "NIXY_ENV" ).value_or( ( paths.stateDir / "env" ).string() );

  debugLog( "config directory: " + paths.configDir.string() );
  debugLog( "state directory: " + paths.stateDir.string() );
  return paths;
}


/* -------------------------------------------------------------------------- */

Paths
Paths::fromDirs( const std::filesystem::path & configDir,
                 const std::filesystem::path & stateDir )
{
  Paths paths;
  paths.configDir = configDir;
  paths.stateDir  = stateDir;
  paths.envLink   = stateDir / "env";
  return paths;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
