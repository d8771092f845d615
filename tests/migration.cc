/* ========================================================================== *
 *
 * @file migration.cc
 *
 * @brief Tests for moving legacy per-profile files into `nixy.json`.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nix/logging.hh>

#include "nixy/core/util.hh"
#include "nixy/migration.hh"
#include "nixy/paths.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace nixy;

/* -------------------------------------------------------------------------- */

static const std::string markedFlake = R"({
  inputs = {
    nixpkgs.url = "github:NixOS/nixpkgs/nixos-unstable";
    # [nixy:custom-inputs]
    zls.url = "github:zigtools/zls";
    # [/nixy:custom-inputs]
  };
  outputs = { self, nixpkgs, zls }@inputs: {
    # [nixy:packages]
    jq = pkgs.jq;
    # [/nixy:packages]
    # [nixy:custom-packages]
    zls = inputs.zls.packages.${system}.default;
    # [/nixy:custom-packages]
  };
}
)";


/* -------------------------------------------------------------------------- */

bool
test_needsMigration0()
{
  TempDir tmp;
  Paths   paths = Paths::fromDirs( tmp / "config", tmp / "state" );
  EXPECT( ! needsMigration( paths ) );

  std::filesystem::create_directories( paths.getLegacyProfilesDir() );
  EXPECT( ! needsMigration( paths ) );

  std::filesystem::create_directories( paths.getLegacyProfilesDir()
                                       / "default" );
  EXPECT( needsMigration( paths ) );

  NixyConfig {}.save( paths.getNixyJson() );
  EXPECT( ! needsMigration( paths ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_needsMigration1()
{
  TempDir tmp;
  Paths   paths = Paths::fromDirs( tmp / "config", tmp / "state" );
  writeFileAtomically( paths.getLegacyFlake(), "{ }" );
  EXPECT( needsMigration( paths ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Every legacy profile becomes an entry of `nixy.json`. */
bool
test_migrate0()
{
  TempDir tmp;
  Paths   paths  = Paths::fromDirs( tmp / "config", tmp / "state" );
  auto    legacy = paths.getLegacyProfilesDir();

  writeFileAtomically( paths.getLegacyActiveFile(), "work\n" );

  PackageState defaultState;
  defaultState.addLegacyPackage( "bat" );
  defaultState.save( getStatePath( legacy / "default" ) );
  writeFileAtomically( legacy / "default" / "flake.nix", "default flake" );
  writeFileAtomically( legacy / "default" / "flake.lock", "{}" );

  /* No state file, recovered from markers. */
  writeFileAtomically( legacy / "work" / "flake.nix", markedFlake );
  writeFileAtomically( legacy / "work" / "packages" / "tool.nix",
                       "{ pname = \"tool\"; }" );

  /* Neither state nor markers. */
  writeFileAtomically( legacy / "scratch" / "flake.nix", "{ }" );

  NixyConfig config = migrateToNixyJson( paths );
  EXPECT_EQ( config.activeProfile, "work" );
  EXPECT( config.listProfiles()
          == ( std::vector<std::string> { "default", "scratch", "work" } ) );
  EXPECT( config.profiles.at( "default" ).packages
          == ( std::vector<std::string> { "bat" } ) );

  const ProfileConfig & work = config.profiles.at( "work" );
  EXPECT( work.packages == ( std::vector<std::string> { "jq" } ) );
  EXPECT_EQ( work.customPackages.size(), std::size_t( 1 ) );
  EXPECT_EQ( work.customPackages[0].inputUrl, "github:zigtools/zls" );
  EXPECT( config.profiles.at( "scratch" ).empty() );

  EXPECT_EQ( readTextFile( paths.getProfileDir( "default" ) / "flake.nix" ),
             "default flake" );
  EXPECT( std::filesystem::exists( paths.getProfileDir( "default" )
                                   / "flake.lock" ) );
  EXPECT_EQ( readTextFile( paths.getProfileDir( "work" ) / "flake.nix" ),
             markedFlake );
  EXPECT( std::filesystem::exists( paths.getPackagesDir() / "tool.nix" ) );

  /* Legacy files are left in place. */
  EXPECT( std::filesystem::exists( legacy / "default" / "flake.nix" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Shared local packages are never overwritten. */
bool
test_migrate1()
{
  TempDir tmp;
  Paths   paths  = Paths::fromDirs( tmp / "config", tmp / "state" );
  auto    legacy = paths.getLegacyProfilesDir();

  writeFileAtomically( paths.getPackagesDir() / "tool.nix", "shared" );
  writeFileAtomically( legacy / "a" / "packages" / "tool.nix", "from a" );
  writeFileAtomically( legacy / "a" / "packages" / "sub" / "flake.nix",
                       "nested" );

  NixyConfig config = migrateToNixyJson( paths );
  EXPECT_EQ( readTextFile( paths.getPackagesDir() / "tool.nix" ), "shared" );
  EXPECT_EQ( readTextFile( paths.getPackagesDir() / "sub" / "flake.nix" ),
             "nested" );
  /* The active file is missing and `a` is not `default`. */
  EXPECT_EQ( config.activeProfile, DEFAULT_PROFILE );
  EXPECT( config.profileExists( "a" ) );
  EXPECT( config.profileExists( DEFAULT_PROFILE ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief A single flake in the config directory becomes `default`. */
bool
test_migrate2()
{
  TempDir tmp;
  Paths   paths = Paths::fromDirs( tmp / "config", tmp / "state" );
  writeFileAtomically( paths.getLegacyFlake(), "legacy flake" );
  writeFileAtomically( paths.configDir / "flake.lock", "lock" );

  runMigrationIfNeeded( paths );

  EXPECT( std::filesystem::exists( paths.getNixyJson() ) );
  EXPECT_EQ( readTextFile( paths.getProfileDir( DEFAULT_PROFILE )
                           / "flake.nix" ),
             "legacy flake" );
  EXPECT_EQ( readTextFile( paths.getProfileDir( DEFAULT_PROFILE )
                           / "flake.lock" ),
             "lock" );
  EXPECT( ! needsMigration( paths ) );

  NixyConfig config = NixyConfig::load( paths.getNixyJson() );
  EXPECT( config.getActiveProfile().empty() );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Packages of a single config directory flake are kept. */
bool
test_migrate3()
{
  TempDir tmp;
  Paths   paths = Paths::fromDirs( tmp / "config", tmp / "state" );
  writeFileAtomically( paths.getLegacyFlake(), markedFlake );

  NixyConfig config = migrateToNixyJson( paths );
  const ProfileConfig & profile = config.profiles.at( DEFAULT_PROFILE );
  EXPECT( profile.packages == ( std::vector<std::string> { "jq" } ) );
  EXPECT_EQ( profile.customPackages.size(), std::size_t( 1 ) );
  EXPECT_EQ( profile.customPackages[0].inputName, "zls" );

  /* A state file beside the flake wins over the markers. */
  PackageState state;
  state.addLegacyPackage( "bat" );
  state.save( getStatePath( paths.configDir ) );

  config = migrateToNixyJson( paths );
  EXPECT( config.profiles.at( DEFAULT_PROFILE ).packages
          == ( std::vector<std::string> { "bat" } ) );
  EXPECT( config.profiles.at( DEFAULT_PROFILE ).customPackages.empty() );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int ec = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( ec, __VA_ARGS__ )

  nix::verbosity = nix::lvlError;

  RUN_TEST( needsMigration0 );
  RUN_TEST( needsMigration1 );
  RUN_TEST( migrate0 );
  RUN_TEST( migrate1 );
  RUN_TEST( migrate2 );
  RUN_TEST( migrate3 );

  return ec;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
