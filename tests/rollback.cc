/* ========================================================================== *
 *
 * @file rollback.cc
 *
 * @brief Tests for restoring state after failed or interrupted commands.
 *
 *
 * -------------------------------------------------------------------------- */

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <nix/logging.hh>

#include "nixy/core/util.hh"
#include "nixy/flake/generator.hh"
#include "nixy/nixy-config.hh"
#include "nixy/rollback.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace nixy;

/* -------------------------------------------------------------------------- */

/** Deliberately not what the generator would write. */
static const std::string handWrittenFlake
  = "{\n  outputs = _: { };  # keep   this spacing\n}\n";


/* -------------------------------------------------------------------------- */

/** @brief A committed transaction keeps its changes. */
bool
test_commit0()
{
  TempDir tmp;
  auto    nixyJson = tmp / "nixy.json";
  auto    flakeDir = tmp / "profiles" / "default";

  NixyConfig original;
  original.save( nixyJson );
  flake::regenerateFlake( flakeDir, original.getActiveProfile() );

  NixyConfig updated = original;
  updated.getActiveProfile().addLegacyPackage( "hello" );
  {
    Transaction txn( RollbackContext::captureProfile( flakeDir,
                                                      nixyJson,
                                                      original,
                                                      DEFAULT_PROFILE,
                                                      std::nullopt ) );
    updated.save( nixyJson );
    flake::regenerateFlake( flakeDir, updated.getActiveProfile() );
    txn.commit();
  }

  EXPECT( NixyConfig::load( nixyJson ) == updated );
  EXPECT( isCompleted() );
  EXPECT( ! takeContext().has_value() );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief A failure restores the exact bytes of both files. */
bool
test_failure0()
{
  TempDir tmp;
  auto    nixyJson = tmp / "nixy.json";
  auto    flakeDir = tmp / "profiles" / "default";

  /* Formatting nixy would not produce itself. */
  const std::string originalJson
    = "{\"version\":3,\"active_profile\":\"default\",\"profiles\":"
      "{\"default\":{\"packages\":[\"bat\"]}}}";
  writeFileAtomically( nixyJson, originalJson );
  writeFileAtomically( flakeDir / "flake.nix", handWrittenFlake );

  NixyConfig original = NixyConfig::load( nixyJson );
  NixyConfig updated  = original;
  updated.getActiveProfile().addLegacyPackage( "hello" );

  try
    {
      Transaction txn( RollbackContext::captureProfile( flakeDir,
                                                        nixyJson,
                                                        original,
                                                        DEFAULT_PROFILE,
                                                        std::nullopt ) );
      updated.save( nixyJson );
      flake::regenerateFlake( flakeDir, updated.getActiveProfile() );
      throw std::runtime_error( "build failed" );
    }
  catch ( const std::runtime_error & )
    {}

  EXPECT_EQ( readTextFile( nixyJson ), originalJson );
  EXPECT_EQ( readTextFile( flakeDir / "flake.nix" ), handWrittenFlake );
  EXPECT( ! isCompleted() );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Files and directories which did not exist are removed again. */
bool
test_failure1()
{
  TempDir tmp;
  auto    nixyJson = tmp / "nixy.json";
  auto    flakeDir = tmp / "profiles" / "work";

  NixyConfig original;
  NixyConfig updated = original;
  updated.createProfile( "work" );
  updated.setActiveProfile( "work" );

  try
    {
      Transaction txn( RollbackContext::captureProfile( flakeDir,
                                                        nixyJson,
                                                        original,
                                                        "work",
                                                        std::nullopt ) );
      updated.save( nixyJson );
      flake::regenerateFlake( flakeDir, updated.getActiveProfile() );
      throw std::runtime_error( "build failed" );
    }
  catch ( const std::runtime_error & )
    {}

  EXPECT( ! std::filesystem::exists( nixyJson ) );
  EXPECT( ! std::filesystem::exists( flakeDir ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief A missing flake in an existing directory is regenerated. */
bool
test_failure2()
{
  TempDir tmp;
  auto    nixyJson = tmp / "nixy.json";
  auto    flakeDir = tmp / "profiles" / "default";
  std::filesystem::create_directories( flakeDir );

  NixyConfig original;
  original.getActiveProfile().addLegacyPackage( "bat" );
  original.save( nixyJson );

  RollbackContext ctx = RollbackContext::captureProfile( flakeDir,
                                                         nixyJson,
                                                         original,
                                                         DEFAULT_PROFILE,
                                                         std::nullopt );
  EXPECT( ! ctx.createdDir.has_value() );
  EXPECT( ! ctx.originalFlake.has_value() );

  writeFileAtomically( flakeDir / "flake.nix", "broken" );
  performRollback( ctx );

  EXPECT_EQ( readTextFile( flakeDir / "flake.nix" ),
             flake::renderFlake( original.getActiveProfile() ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_legacy0()
{
  TempDir tmp;
  auto    flakeDir  = tmp / "profile";
  auto    statePath = getStatePath( flakeDir );

  PackageState state;
  state.addLegacyPackage( "bat" );
  state.save( statePath );
  std::string savedState = readTextFile( statePath );
  writeFileAtomically( flakeDir / "flake.nix", handWrittenFlake );

  RollbackContext ctx = RollbackContext::captureLegacy( flakeDir, statePath );
  EXPECT( std::holds_alternative<LegacySnapshot>( ctx.original ) );

  PackageState changed = state;
  changed.addLegacyPackage( "hello" );
  changed.save( statePath );
  flake::regenerateFlake( flakeDir, changed );

  performRollback( ctx );
  EXPECT_EQ( readTextFile( statePath ), savedState );
  EXPECT_EQ( readTextFile( flakeDir / "flake.nix" ), handWrittenFlake );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Interrupts after completion leave everything in place. */
bool
test_handleInterrupt0()
{
  TempDir tmp;
  auto    nixyJson = tmp / "nixy.json";
  auto    flakeDir = tmp / "profiles" / "default";

  NixyConfig original;
  setContext( RollbackContext::captureProfile( flakeDir,
                                               nixyJson,
                                               original,
                                               DEFAULT_PROFILE,
                                               std::nullopt ) );
  original.save( nixyJson );
  markCompleted();

  EXPECT( ! handleInterrupt() );
  EXPECT( std::filesystem::exists( nixyJson ) );
  clearContext();
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_handleInterrupt1()
{
  TempDir tmp;
  auto    nixyJson = tmp / "nixy.json";
  auto    flakeDir = tmp / "profiles" / "default";

  NixyConfig original;
  setContext( RollbackContext::captureProfile( flakeDir,
                                               nixyJson,
                                               original,
                                               DEFAULT_PROFILE,
                                               std::nullopt ) );
  original.save( nixyJson );
  flake::regenerateFlake( flakeDir, original.getActiveProfile() );

  EXPECT( handleInterrupt() );
  EXPECT( ! std::filesystem::exists( nixyJson ) );
  EXPECT( ! std::filesystem::exists( flakeDir ) );

  /* The context is consumed. */
  EXPECT( ! handleInterrupt() );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief An interrupt during a write restores only after the write ends. */
bool
test_handleInterrupt2()
{
  TempDir tmp;
  auto    nixyJson = tmp / "nixy.json";
  auto    flakeDir = tmp / "profiles" / "default";

  NixyConfig original;
  original.getActiveProfile().addLegacyPackage( "bat" );
  original.save( nixyJson );
  const std::string originalJson = readTextFile( nixyJson );

  NixyConfig updated = original;
  updated.getActiveProfile().addLegacyPackage( "hello" );

  std::atomic<bool> interrupted( false );
  bool              restoredEarly = true;
  std::thread       interrupter;
  {
    Transaction txn( RollbackContext::captureProfile( flakeDir,
                                                      nixyJson,
                                                      original,
                                                      DEFAULT_PROFILE,
                                                      std::nullopt ) );
    txn.write(
      [&]()
      {
        interrupter
          = std::thread( [&]() { interrupted.store( handleInterrupt() ); } );
        std::this_thread::sleep_for( std::chrono::milliseconds( 50 ) );
        restoredEarly = interrupted.load();
        updated.save( nixyJson );
        flake::regenerateFlake( flakeDir, updated.getActiveProfile() );
      } );
    interrupter.join();
    txn.commit();
  }

  EXPECT( ! restoredEarly );
  EXPECT( interrupted.load() );
  EXPECT_EQ( readTextFile( nixyJson ), originalJson );
  EXPECT( ! std::filesystem::exists( flakeDir ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Stashed paths come back on failure and are deleted on commit. */
bool
test_stash0()
{
  TempDir tmp;
  auto    nixyJson = tmp / "nixy.json";
  auto    flakeDir = tmp / "profiles" / "default";
  auto    file     = tmp / "packages" / "mytool.nix";
  auto    backup   = tmp / ".nixy-stash" / "mytool.nix";

  NixyConfig original;
  original.save( nixyJson );
  writeFileAtomically( file, "{ pname = \"mytool\"; }" );

  try
    {
      Transaction txn( RollbackContext::captureProfile( flakeDir,
                                                        nixyJson,
                                                        original,
                                                        DEFAULT_PROFILE,
                                                        tmp / "packages" ) );
      txn.stash( file, backup );
      EXPECT( ! std::filesystem::exists( file ) );
      EXPECT( std::filesystem::exists( backup ) );
      throw std::runtime_error( "build failed" );
    }
  catch ( const std::runtime_error & )
    {}
  EXPECT_EQ( readTextFile( file ), "{ pname = \"mytool\"; }" );
  EXPECT( ! std::filesystem::exists( tmp / ".nixy-stash" ) );

  {
    Transaction txn( RollbackContext::captureProfile( flakeDir,
                                                      nixyJson,
                                                      original,
                                                      DEFAULT_PROFILE,
                                                      tmp / "packages" ) );
    txn.stash( file, backup );
    txn.commit();
  }
  EXPECT( ! std::filesystem::exists( file ) );
  EXPECT( ! std::filesystem::exists( tmp / ".nixy-stash" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main( int argc, char * argv[] )
{
  int ec = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( ec, __VA_ARGS__ )

  nix::verbosity = nix::lvlError;
  if ( ( 1 < argc ) && ( std::string_view( argv[1] ) == "-v" ) )
    {
      nix::verbosity = nix::lvlDebug;
    }

  RUN_TEST( commit0 );
  RUN_TEST( failure0 );
  RUN_TEST( failure1 );
  RUN_TEST( failure2 );
  RUN_TEST( legacy0 );
  RUN_TEST( handleInterrupt0 );
  RUN_TEST( handleInterrupt1 );
  RUN_TEST( handleInterrupt2 );
  RUN_TEST( stash0 );

  return ec;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
