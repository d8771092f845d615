/* ========================================================================== *
 *
 * @file platform.cc
 *
 * @brief Platform restrictions for packages.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "nixy/core/exceptions.hh"
#include "nixy/core/util.hh"
#include "nixy/platform.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/** @brief Recognized names and the systems they stand for. */
static const std::map<std::string, std::vector<std::string>> &
getPlatformAliases()
{
  static const std::map<std::string, std::vector<std::string>> aliases = {
    { "darwin", { "aarch64-darwin", "x86_64-darwin" } },
    { "macos", { "aarch64-darwin", "x86_64-darwin" } },
    { "linux", { "aarch64-linux", "x86_64-linux" } },
    { "x86_64-linux", { "x86_64-linux" } },
    { "aarch64-linux", { "aarch64-linux" } },
    { "x86_64-darwin", { "x86_64-darwin" } },
    { "aarch64-darwin", { "aarch64-darwin" } },
  };
  return aliases;
}


/* -------------------------------------------------------------------------- */

Platforms
normalizePlatforms( const std::vector<std::string> & platforms )
{
  const auto & aliases = getPlatformAliases();
  Platforms    rsl;
  for ( const auto & platform : platforms )
    {
      auto found = aliases.find( toLower( trim_copy( platform ) ) );
      if ( found == aliases.end() )
        {
          throw InvalidPlatformException(
            "unknown platform '" + platform + "'",
            "supported platforms are: darwin, linux, "
              + concatStringsSep( ", ", getDefaultSystems() ) );
        }
      rsl.insert( rsl.end(), found->second.begin(), found->second.end() );
    }
  std::sort( rsl.begin(), rsl.end() );
  rsl.erase( std::unique( rsl.begin(), rsl.end() ), rsl.end() );
  return rsl;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
