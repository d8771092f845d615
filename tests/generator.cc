/* ========================================================================== *
 *
 * @file generator.cc
 *
 * @brief Tests for rendering `flake.nix` from package state.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "nixy/core/util.hh"
#include "nixy/flake/generator.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace nixy;
using namespace nixy::flake;

/* -------------------------------------------------------------------------- */

static bool
contains( const std::string & haystack, const std::string & needle )
{
  return haystack.find( needle ) != std::string::npos;
}


static std::size_t
count( const std::string & haystack, const std::string & needle )
{
  std::size_t rsl = 0;
  for ( auto pos = haystack.find( needle ); pos != std::string::npos;
        pos      = haystack.find( needle, pos + needle.size() ) )
    {
      ++rsl;
    }
  return rsl;
}


static ResolvedPackage
makeResolved( const std::string & name, const std::string & commit )
{
  return ResolvedPackage { name,
                           std::nullopt,
                           "1.0.0",
                           name + "_attr",
                           commit,
                           std::nullopt };
}


/* -------------------------------------------------------------------------- */

bool
test_isNixpkgsUrl0()
{
  EXPECT( isNixpkgsUrl( "nixpkgs" ) );
  EXPECT( isNixpkgsUrl( "github:NixOS/nixpkgs/nixos-24.05" ) );
  EXPECT( isNixpkgsUrl( "github:nixos/nixpkgs" ) );
  EXPECT( isNixpkgsUrl( "flake:nixpkgs" ) );
  EXPECT( ! isNixpkgsUrl( "github:someone/nixpkgs-fork" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief An empty state still yields a buildable, managed flake. */
bool
test_renderEmpty0()
{
  std::string text = renderFlake( PackageState {} );
  EXPECT( isManagedFlake( text ) );
  EXPECT( contains( text,
                    "    nixpkgs.url = \"github:NixOS/nixpkgs/"
                    "nixos-unstable\";\n  };\n" ) );
  EXPECT( contains( text, "outputs = { self, nixpkgs }@inputs:" ) );
  EXPECT( contains( text, "            paths = [\n            ];\n" ) );
  EXPECT( contains( text,
                    "extraOutputsToInstall = [ \"man\" \"doc\" \"info\" ];" ) );
  EXPECT( ! isManagedFlake( "{ description = \"mine\"; }" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_renderDeterministic0()
{
  PackageState state;
  state.addLegacyPackage( "ripgrep" );
  state.addLegacyPackage( "bat" );
  state.addResolvedPackage( makeResolved( "go", testCommit ) );
  std::string first = renderFlake( state );
  EXPECT_EQ( first, renderFlake( state ) );

  EXPECT( contains( first, "          bat = pkgs.bat;\n" ) );
  EXPECT( contains( first, "          ripgrep = pkgs.ripgrep;\n" ) );
  EXPECT( first.find( "bat = pkgs.bat" ) < first.find( "ripgrep = pkgs" ) );
  EXPECT( contains( first, "              bat\n              ripgrep\n" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Resolved packages share one pinned input per commit. */
bool
test_renderResolved0()
{
  const std::string otherCommit = "aaaaaaaa11112222333344445555666677778888";

  PackageState state;
  state.addResolvedPackage( makeResolved( "python", testCommit ) );
  state.addResolvedPackage( makeResolved( "nodejs", testCommit ) );
  state.addResolvedPackage( makeResolved( "go", otherCommit ) );
  std::string text = renderFlake( state );

  std::string input = "nixpkgs-" + testCommit.substr( 0, 8 );
  EXPECT_EQ( count( text, "    " + input + ".url = \"github:NixOS/nixpkgs/"
                            + testCommit + "\";\n" ),
             std::size_t( 1 ) );
  EXPECT( contains( text,
                    "    nixpkgs-aaaaaaaa.url = \"github:NixOS/nixpkgs/"
                      + otherCommit + "\";\n" ) );
  EXPECT( contains( text,
                    "          python = inputs." + input
                      + ".legacyPackages.${system}.python_attr;\n" ) );
  EXPECT( contains( text,
                    "outputs = { self, nixpkgs, nixpkgs-0d7fbd9b, "
                    "nixpkgs-aaaaaaaa }@inputs:" ) );
  /* Groups are ordered by commit. */
  EXPECT( text.find( "nixpkgs-0d7fbd9b.url" )
          < text.find( "nixpkgs-aaaaaaaa.url" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_renderPlatforms0()
{
  PackageState    state;
  ResolvedPackage mac = makeResolved( "coreutils-mac", testCommit );
  mac.platforms       = Platforms { "x86_64-darwin", "aarch64-darwin" };
  state.addResolvedPackage( mac );
  state.addLegacyPackage( "bat" );

  CustomPackage linuxOnly { "tool",
                            "owner-tool",
                            "github:owner/tool",
                            "packages",
                            std::nullopt,
                            Platforms { "x86_64-linux" } };
  state.addCustomPackage( linuxOnly );

  std::string text = renderFlake( state );
  EXPECT( contains( text,
                    "            ] ++ pkgs.lib.optionals (builtins.elem system "
                    "[ \"aarch64-darwin\" \"x86_64-darwin\" ]) [\n"
                    "                coreutils-mac\n" ) );
  EXPECT( contains( text,
                    "            ] ++ pkgs.lib.optionals (builtins.elem system "
                    "[ \"x86_64-linux\" ]) [\n                tool\n" ) );
  EXPECT( contains( text, "            paths = [\n              bat\n" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_renderCustom0()
{
  PackageState  state;
  CustomPackage pkg { "hx",
                      "helix-editor-helix",
                      "github:helix-editor/helix",
                      "packages",
                      std::string( "helix" ),
                      std::nullopt };
  state.addCustomPackage( pkg );
  /* An input named `nixpkgs` always keeps the default URL. */
  state.addCustomPackage( CustomPackage { "hello",
                                          "nixpkgs",
                                          "github:NixOS/nixpkgs/nixos-24.05",
                                          "legacyPackages",
                                          std::nullopt,
                                          std::nullopt } );

  std::string text = renderFlake( state );
  EXPECT( contains(
    text,
    "    helix-editor-helix.url = \"github:helix-editor/helix\";\n" ) );
  EXPECT( contains(
    text,
    "          hx = inputs.helix-editor-helix.packages.${system}.helix;\n" ) );
  EXPECT( contains(
    text,
    "          hello = inputs.nixpkgs.legacyPackages.${system}.hello;\n" ) );
  EXPECT_EQ( count( text, "nixpkgs.url = " ), std::size_t( 1 ) );
  EXPECT( ! contains( text, "nixos-24.05" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Packages sharing an input declare it once. */
bool
test_renderCustom1()
{
  PackageState state;
  state.addCustomPackage( CustomPackage { "neovim",
                                          "neovim-nightly",
                                          "github:nix-community/neovim-nightly",
                                          "packages",
                                          std::nullopt,
                                          std::nullopt } );
  state.addCustomPackage( CustomPackage { "neovim-debug",
                                          "neovim-nightly",
                                          "github:nix-community/neovim-nightly",
                                          "packages",
                                          std::string( "debug" ),
                                          std::nullopt } );

  std::string text = renderFlake( state );
  EXPECT_EQ( count( text, "neovim-nightly.url = " ), std::size_t( 1 ) );
  EXPECT( contains(
    text,
    "          neovim = inputs.neovim-nightly.packages.${system}.neovim;
" ) );
  EXPECT( contains( text,
                    "          neovim-debug = "
                    "inputs.neovim-nightly.packages.${system}.debug;
" ) );
  EXPECT( contains( text, "              neovim\n" ) );
  EXPECT( contains( text, "              neovim-debug\n" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Local definitions shadow packages recorded in state. */
bool
test_renderLocal0()
{
  TempDir tmp;
  auto    packagesDir = tmp / "packages";
  writeFileAtomically( packagesDir / "bat.nix", "{ pname = \"bat\"; }" );
  writeFileAtomically( packagesDir / "mine.nix",
                       R"({
  pname = "mine";
  inputs = { mine-src.url = "github:me/mine"; };
  overlay = "(final: prev: { })";
})" );
  writeFileAtomically( packagesDir / "localflake" / "flake.nix",
                       "{ outputs = _: {}; }" );

  PackageState state;
  state.addLegacyPackage( "bat" );
  state.addLegacyPackage( "jq" );
  std::string text = renderFlake( state, packagesDir );

  EXPECT( ! contains( text, "bat = pkgs.bat;" ) );
  EXPECT( contains( text, "          jq = pkgs.jq;\n" ) );
  EXPECT( contains( text, "          bat = pkgs.callPackage " ) );
  EXPECT( contains( text, "    mine-src.url = \"github:me/mine\";\n" ) );
  EXPECT( contains( text, "          (final: prev: { })\n" ) );
  EXPECT( contains( text, "let pkgs = pkgsFor system;" ) );
  EXPECT( contains( text,
                    "          localflake = inputs.localflake.packages."
                    "${system}.default;\n" ) );
  EXPECT( contains( text, "    localflake.url = \"path:/" ) );
  EXPECT( contains( text,
                    "outputs = { self, nixpkgs, localflake, mine-src }@inputs:" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_regenerateFlake0()
{
  TempDir      tmp;
  PackageState state;
  state.addLegacyPackage( "hello" );
  auto dir = tmp / "profiles" / "default";
  regenerateFlake( dir, state );
  EXPECT_EQ( readTextFile( dir / "flake.nix" ), renderFlake( state ) );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int ec = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( ec, __VA_ARGS__ )

  nix::verbosity = nix::lvlError;

  RUN_TEST( isNixpkgsUrl0 );
  RUN_TEST( renderEmpty0 );
  RUN_TEST( renderDeterministic0 );
  RUN_TEST( renderResolved0 );
  RUN_TEST( renderPlatforms0 );
  RUN_TEST( renderCustom0 );
  RUN_TEST( renderCustom1 );
  RUN_TEST( renderLocal0 );
  RUN_TEST( regenerateFlake0 );

  return ec;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
