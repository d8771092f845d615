/* ========================================================================== *
 *
 * @file flake/generator.cc
 *
 * @brief Render a profile's `flake.nix` from its package state.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nix/logging.hh>

#include "nixy/core/exceptions.hh"
#include "nixy/core/util.hh"
#include "nixy/flake/generator.hh"
#include "nixy/flake/local-packages.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::flake {

/* -------------------------------------------------------------------------- */

bool
isManagedFlake( std::string_view text )
{
  return text.find( MANAGED_HEADER ) != std::string_view::npos;
}


bool
isNixpkgsUrl( std::string_view url )
{
  return ( url == "nixpkgs" ) || hasPrefix( "flake:nixpkgs", url )
         || hasPrefix( "github:NixOS/nixpkgs", url )
         || hasPrefix( "github:nixos/nixpkgs", url );
}


/* -------------------------------------------------------------------------- */

namespace {

/** @brief Indentation of package bindings inside `packages`. */
constexpr const char * ENTRY_INDENT = "          ";

/** @brief Indentation of names inside `buildEnv`'s `paths`. */
constexpr const char * PATH_INDENT = "              ";


/** @brief A name in the `buildEnv` manifest. */
struct PathEntry
{
  std::string              name;
  std::optional<Platforms> platforms;
}; /* End struct `PathEntry' */


/**
 * @brief Accumulates the sections of a flake before assembling them in
 *        @a FlakeBuilder::build.
 */
class FlakeBuilder
{

private:

  /** Declared inputs in declaration order, `nixpkgs` excluded. */
  std::vector<std::pair<std::string, std::string>> inputs;

  std::string overlays;
  std::string standardEntries;
  std::string resolvedEntries;
  std::string localEntries;
  std::string customEntries;

  std::vector<PathEntry> paths;


  /**
   * @brief Declare an input unless one with the same name exists.
   *
   * The first declaration of a name wins.
   * `nixpkgs` is always bound to @a DEFAULT_NIXPKGS_URL.
   */
  void
  addInput( const std::string & name, const std::string & url )
  {
    if ( name == "nixpkgs" )
      {
        if ( ! isNixpkgsUrl( url ) )
          {
            nix::warn( "input 'nixpkgs' is already bound to '%s', ignoring "
                       "'%s'",
                       std::string( DEFAULT_NIXPKGS_URL ),
                       url );
          }
        return;
      }
    for ( const auto & [seenName, seenUrl] : this->inputs )
      {
        if ( seenName != name ) { continue; }
        if ( seenUrl != url )
          {
            nix::warn( "input '%s' is already bound to '%s', ignoring '%s'",
                       name,
                       seenUrl,
                       url );
          }
        return;
      }
    this->inputs.emplace_back( name, url );
  }


  void
  addEntry( std::string &                    section,
            const std::string &              name,
            const std::string &              expr,
            const std::optional<Platforms> & platforms = std::nullopt )
  {
    section += std::string( ENTRY_INDENT ) + name + " = " + expr + ";\n";
    this->paths.emplace_back( PathEntry { name, platforms } );
  }


public:

  void
  addStandardPackages( const std::vector<std::string> & names )
  {
    for ( const auto & name : names )
      {
        this->addEntry( this->standardEntries, name, "pkgs." + name );
      }
  }


  /** Packages are grouped by commit, groups ordered by commit. */
  void
  addResolvedPackages( const std::vector<ResolvedPackage> & packages )
  {
    std::map<std::string, std::vector<const ResolvedPackage *>> byCommit;
    for ( const auto & pkg : packages )
      {
        byCommit[pkg.commitHash].emplace_back( &pkg );
      }

    for ( const auto & [commit, group] : byCommit )
      {
        std::string inputName = "nixpkgs-" + commit.substr( 0, 8 );
        this->addInput( inputName, "github:NixOS/nixpkgs/" + commit );
        for ( const auto * pkg : group )
          {
            this->addEntry( this->resolvedEntries,
                            pkg->name,
                            "inputs." + inputName + ".legacyPackages.${system}."
                              + pkg->attributePath,
                            pkg->platforms );
          }
      }
  }


  void
  addLocalFlakes( const std::vector<LocalFlake> &   flakes,
                  const std::filesystem::path &     packagesDir )
  {
    for ( const auto & flake : flakes )
      {
        auto dir = std::filesystem::absolute( packagesDir / flake.name )
                     .lexically_normal();
        this->addInput( flake.name, "path:" + encodeFlakePath( dir ) );
        this->addEntry( this->localEntries,
                        flake.name,
                        "inputs." + flake.name + ".packages.${system}.default" );
      }
  }


  void
  addLocalPackages( const std::vector<LocalPackage> & packages )
  {
    for ( const auto & pkg : packages )
      {
        if ( pkg.inputName.has_value() && pkg.inputUrl.has_value() )
          {
            this->addInput( *pkg.inputName, *pkg.inputUrl );
          }
        if ( pkg.overlay.has_value() )
          {
            this->overlays += std::string( ENTRY_INDENT ) + *pkg.overlay + "\n";
          }
        this->addEntry( this->localEntries, pkg.name, pkg.packageExpr );
      }
  }


  void
  addCustomPackages( const std::vector<CustomPackage> & packages )
  {
    for ( const auto & pkg : packages )
      {
        this->addInput( pkg.inputName, pkg.inputUrl );
        this->addEntry( this->customEntries,
                        pkg.name,
                        "inputs." + pkg.inputName + "." + pkg.packageOutput
                          + ".${system}." + pkg.getSourceName(),
                        pkg.platforms );
      }
  }


  /** @brief Render the `paths` list of the `buildEnv` call. */
  [[nodiscard]] std::string
  buildPaths() const
  {
    std::string                                   rsl;
    std::map<Platforms, std::vector<std::string>> byPlatforms;
    for ( const auto & entry : this->paths )
      {
        if ( entry.platforms.has_value() )
          {
            Platforms key = *entry.platforms;
            std::sort( key.begin(), key.end() );
            byPlatforms[key].emplace_back( entry.name );
          }
        else { rsl += std::string( PATH_INDENT ) + entry.name + "\n"; }
      }

    for ( const auto & [platforms, names] : byPlatforms )
      {
        rsl += "            ] ++ pkgs.lib.optionals (builtins.elem system [";
        for ( const auto & platform : platforms )
          {
            rsl += " \"" + platform + "\"";
          }
        rsl += " ]) [";
        for ( const auto & name : names ) { rsl += "\n                " + name; }
        rsl += "\n";
      }
    return rsl;
  }


  [[nodiscard]] std::string
  build() const
  {
    std::vector<std::string> inputNames;
    std::string              inputLines;
    for ( const auto & [name, url] : this->inputs )
      {
        inputNames.emplace_back( name );
        inputLines += "    " + name + ".url = \"" + url + "\";\n";
      }
    std::sort( inputNames.begin(), inputNames.end() );

    std::string params = "self, nixpkgs";
    for ( const auto & name : inputNames ) { params += ", " + name; }

    std::string pkgsDef;
    std::string pkgsBinding = "let pkgs = nixpkgs.legacyPackages.${system};";
    if ( ! this->overlays.empty() )
      {
        pkgsDef = "pkgsFor = system: import nixpkgs {\n"
                  "        inherit system;\n"
                  "        overlays = [\n"
                  + this->overlays
                  + "        ];\n"
                    "      };\n";
        pkgsBinding = "let pkgs = pkgsFor system;";
      }

    std::stringstream oss;
    oss << "{\n"
        << "  " << MANAGED_HEADER << "\n"
        << "\n"
        << "  inputs = {\n"
        << "    nixpkgs.url = \"" << DEFAULT_NIXPKGS_URL << "\";\n"
        << inputLines << "  };\n"
        << "\n"
        << "  outputs = { " << params << " }@inputs:\n"
        << "    let\n"
        << "      systems = [";
    for ( const auto & system : getDefaultSystems() )
      {
        oss << " \"" << system << "\"";
      }
    oss << " ];\n"
        << "      forAllSystems = f: nixpkgs.lib.genAttrs systems (system: f "
           "system);\n"
        << "      " << pkgsDef << "\n"
        << "    in {\n"
        << "      packages = forAllSystems (system:\n"
        << "        " << pkgsBinding << "\n"
        << "        in rec {\n"
        << this->standardEntries << this->resolvedEntries << this->localEntries
        << this->customEntries << "\n"
        << "          default = pkgs.buildEnv {\n"
        << "            name = \"nixy-env\";\n"
        << "            paths = [\n"
        << this->buildPaths() << "            ];\n"
        << "            extraOutputsToInstall = [ \"man\" \"doc\" \"info\" ];\n"
        << "          };\n"
        << "        });\n"
        << "    };\n"
        << "}\n";
    return oss.str();
  }


}; /* End class `FlakeBuilder' */

}  // namespace


/* -------------------------------------------------------------------------- */

std::string
renderFlake( const PackageState &                         state,
             const std::optional<std::filesystem::path> & packagesDir )
{
  LocalScan local;
  if ( packagesDir.has_value() ) { local = scanLocalPackages( *packagesDir ); }

  std::vector<std::string> standard;
  for ( const auto & name : state.packages )
    {
      if ( ! local.provides( name ) ) { standard.emplace_back( name ); }
    }

  std::vector<ResolvedPackage> resolved;
  for ( const auto & pkg : state.resolvedPackages )
    {
      if ( ! local.provides( pkg.name ) ) { resolved.emplace_back( pkg ); }
    }

  std::vector<CustomPackage> custom;
  for ( const auto & pkg : state.customPackages )
    {
      if ( local.provides( pkg.name ) )
        {
          debugLog( "custom package '" + pkg.name
                    + "' is shadowed by a local definition" );
          continue;
        }
      custom.emplace_back( pkg );
    }

  FlakeBuilder builder;
  builder.addStandardPackages( standard );
  builder.addResolvedPackages( resolved );
  if ( packagesDir.has_value() )
    {
      builder.addLocalFlakes( local.flakes, *packagesDir );
    }
  builder.addLocalPackages( local.packages );
  builder.addCustomPackages( custom );
  return builder.build();
}


/* -------------------------------------------------------------------------- */

void
regenerateFlake( const std::filesystem::path &                flakeDir,
                 const PackageState &                         state,
                 const std::optional<std::filesystem::path> & packagesDir )
{
  auto flakePath = flakeDir / "flake.nix";
  debugLog( "regenerating '" + flakePath.string() + "'" );
  writeFileAtomically( flakePath, renderFlake( state, packagesDir ) );
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::flake


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
