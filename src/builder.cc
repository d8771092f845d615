/* ========================================================================== *
 *
 * @file builder.cc
 *
 * @brief Build profiles and query flakes with the `nix` CLI.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <list>
#include <optional>
#include <string>
#include <vector>

#include <nix/util.hh>
#include <nlohmann/json.hpp>

#include "nixy/builder.hh"
#include "nixy/core/nix-state.hh"
#include "nixy/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

void
NixBuilder::build( const std::filesystem::path & flakeDir,
                   const std::string &           output,
                   const std::filesystem::path & outLink )
{
  std::string ref = encodeFlakePath( flakeDir ) + "#" + output;
  verboseLog( "building " + ref );

  auto result
    = runNix( { "build", ref, "--out-link", outLink.string(), "--impure" },
              { { "NIXPKGS_ALLOW_UNFREE", "1" } } );
  if ( ! nix::statusOk( result.status ) )
    {
      throw BuildFailureException( "building '" + ref + "' failed",
                                   "see output above for details" );
    }
}


/* -------------------------------------------------------------------------- */

const std::string &
currentSystem()
{
  static std::optional<std::string> system;
  if ( system.has_value() ) { return *system; }

  auto result = runNix(
    { "eval", "--impure", "--expr", "builtins.currentSystem", "--raw" },
    {},
    true );
  if ( ! nix::statusOk( result.status ) )
    {
      throw NixCommandException( "failed to get current system",
                                 trim_copy( result.out ) );
    }
  system = trim_copy( result.out );
  return *system;
}


/* -------------------------------------------------------------------------- */

std::optional<std::string>
validateFlakePackage( const std::string & url, const std::string & pkg )
{
  const std::string & system = currentSystem();
  for ( const char * output : { "packages", "legacyPackages" } )
    {
      std::string attr = url + "#" + output + "." + system + "." + pkg + ".type";
      auto        result = runNix( { "eval", attr }, {}, true );
      if ( nix::statusOk( result.status )
           && ( result.out.find( "derivation" ) != std::string::npos ) )
        {
          debugLog( "found '" + pkg + "' in '" + url + "' under " + output );
          return std::string( output );
        }
    }
  return std::nullopt;
}


/* -------------------------------------------------------------------------- */

std::vector<std::string>
listFlakePackages( const std::string &                url,
                   const std::optional<std::string> & output )
{
  const std::string &      system = currentSystem();
  std::vector<std::string> candidates;
  if ( output.has_value() ) { candidates.emplace_back( *output + "." + system ); }
  else
    {
      candidates.emplace_back( "packages." + system );
      candidates.emplace_back( "legacyPackages." + system );
    }

  for ( const auto & attrPath : candidates )
    {
      auto result = runNix(
        { "eval",
          url + "#" + attrPath,
          "--apply",
          R"(pkgs: builtins.concatStringsSep "\n" (builtins.attrNames pkgs))",
          "--raw" } );
      if ( nix::statusOk( result.status ) ) { return splitLines( result.out ); }
    }
  return {};
}


/* -------------------------------------------------------------------------- */

std::filesystem::path
flakePrefetch( const std::string & url )
{
  auto result = runNix( { "flake", "prefetch", "--json", url } );
  if ( ! nix::statusOk( result.status ) )
    {
      throw NixCommandException( "failed to prefetch flake '" + url + "'",
                                 "see output above for details" );
    }

  try
    {
      nlohmann::json info = nlohmann::json::parse( result.out );
      return info.at( "storePath" ).get<std::string>();
    }
  catch ( nlohmann::json::exception & err )
    {
      throw NixCommandException( "failed to read store path of '" + url + "'",
                                 extract_json_errmsg( err ) );
    }
}


/* -------------------------------------------------------------------------- */

std::filesystem::path
getPackageSourcePath( const std::string & rev,
                      const std::string & attr,
                      const std::string & system )
{
  std::string ref = "github:NixOS/nixpkgs/" + rev + "#legacyPackages." + system
                    + "." + attr + ".meta.position";
  auto result = runNix( { "eval", "--raw", ref } );
  if ( ! nix::statusOk( result.status ) )
    {
      throw NixCommandException( "failed to get source path for '" + attr
                                   + "'",
                                 "see output above for details" );
    }

  /* `<path>:<line>' */
  std::string position = trim_copy( result.out );
  if ( auto colon = position.rfind( ':' ); colon != std::string::npos )
    {
      position.erase( colon );
    }
  return position;
}


/* -------------------------------------------------------------------------- */

void
flakeUpdate( const std::filesystem::path &    flakeDir,
             const std::vector<std::string> & inputs )
{
  std::list<std::string> args = { "flake", "update" };
  args.insert( args.end(), inputs.begin(), inputs.end() );
  args.emplace_back( "--flake" );
  args.emplace_back( flakeDir.string() );

  auto result = runNix( args );
  if ( ! nix::statusOk( result.status ) )
    {
      throw NixCommandException( "failed to update flake",
                                 "see output above for details" );
    }
}


/* -------------------------------------------------------------------------- */

std::vector<std::string>
getFlakeInputs( const std::filesystem::path & lockFile )
{
  if ( ! std::filesystem::exists( lockFile ) )
    {
      throw NoFlakeLockException( "'" + lockFile.string() + "' does not exist",
                                  "run 'nixy sync' first" );
    }

  std::vector<std::string> names;
  try
    {
      nlohmann::json lock = nlohmann::json::parse( readTextFile( lockFile ) );
      const auto &   root = lock.at( "root" ).get<std::string>();
      for ( const auto & [name, _] :
            lock.at( "nodes" ).at( root ).at( "inputs" ).items() )
        {
          names.emplace_back( name );
        }
    }
  catch ( nlohmann::json::exception & err )
    {
      throw NixCommandException( "failed to read '" + lockFile.string() + "'",
                                 extract_json_errmsg( err ) );
    }
  return names;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
