/* ========================================================================== *
 *
 * @file util.cc
 *
 * @brief Tests for `nixy` utility interfaces.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

#include <nix/logging.hh>

#include "nixy/core/exceptions.hh"
#include "nixy/core/nix-state.hh"
#include "nixy/core/util.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

bool
test_trim0()
{
  std::string str( "  foo \n" );
  EXPECT_EQ( nixy::trim( str ), "foo" );
  EXPECT_EQ( str, "foo" );
  EXPECT_EQ( nixy::trim_copy( "\t bar  " ), "bar" );
  EXPECT_EQ( nixy::trim_copy( "   " ), "" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_hasPrefix0()
{
  EXPECT( nixy::hasPrefix( "foo", "foobar" ) );
  EXPECT( ! nixy::hasPrefix( "bar", "foobar" ) );
  EXPECT( nixy::hasPrefix( "", "foobar" ) );
  EXPECT( ! nixy::hasPrefix( "foobarbaz", "foobar" ) );
  EXPECT( nixy::hasSuffix( "bar", "foobar" ) );
  EXPECT( ! nixy::hasSuffix( "foo", "foobar" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_toLower0()
{
  EXPECT_EQ( nixy::toLower( "Darwin" ), "darwin" );
  EXPECT_EQ( nixy::toLower( "X86_64-Linux" ), "x86_64-linux" );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief A trailing newline does not produce an empty last line. */
bool
test_splitLines0()
{
  EXPECT( nixy::splitLines( "a\nb\n" )
          == ( std::vector<std::string> { "a", "b" } ) );
  EXPECT( nixy::splitLines( "a\n\nb" )
          == ( std::vector<std::string> { "a", "", "b" } ) );
  EXPECT( nixy::splitLines( "" ).empty() );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_encodeFlakePath0()
{
  EXPECT_EQ( nixy::encodeFlakePath( "/home/user/.config/nixy" ),
             "/home/user/.config/nixy" );
  EXPECT_EQ( nixy::encodeFlakePath( "/home/some user/nixy" ),
             "/home/some%20user/nixy" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_concatStringsSep0()
{
  std::vector<std::string> strs = { "a", "b", "c" };
  EXPECT_EQ( nixy::concatStringsSep( ", ", strs ), "a, b, c" );
  EXPECT_EQ( nixy::concatStringsSep( ", ", std::vector<std::string> {} ), "" );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Writes replace the target in one step and leave no temp file. */
bool
test_writeFileAtomically0()
{
  TempDir tmp;
  auto    path = tmp / "sub" / "file.json";

  nixy::writeFileAtomically( path, "first" );
  EXPECT_EQ( nixy::readTextFile( path ), "first" );

  nixy::writeFileAtomically( path, "second\n" );
  EXPECT_EQ( nixy::readTextFile( path ), "second\n" );

  auto tmpPath = path;
  tmpPath += ".tmp";
  EXPECT( ! std::filesystem::exists( tmpPath ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_writeFileAtomically1()
{
  TempDir tmp;
  /* A directory stands where the file should go. */
  std::filesystem::create_directories( tmp / "taken" / "child" );
  EXPECT_THROWS(
    nixy::writeFileAtomically<nixy::StateFileException>( tmp / "taken", "x" ),
    nixy::StateFileException );
  auto tmpPath = tmp / "taken.tmp";
  EXPECT( ! std::filesystem::exists( tmpPath ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_readTextFile0()
{
  TempDir tmp;
  EXPECT_THROWS( nixy::readTextFile( tmp / "missing" ), std::exception );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Warnings from `nix` reach the terminal unchanged. */
bool
test_loggerWarn0()
{
  TempDir tmp;
  auto    captured = tmp / "stderr";

  std::unique_ptr<nix::Logger> logger( nixy::makeFilteredLogger( false ) );

  int saved = ::dup( STDERR_FILENO );
  int fd    = ::open( captured.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644 );
  if ( ( saved < 0 ) || ( fd < 0 ) ) { return false; }
  ::dup2( fd, STDERR_FILENO );
  ::close( fd );

  logger->warn( "Git tree '/home/me/.local/state/nixy' is dirty" );
  logger->result( 0, nix::resBuildLogLine, { nix::Logger::Field( "hidden" ) } );

  ::dup2( saved, STDERR_FILENO );
  ::close( saved );

  std::string text = nixy::readTextFile( captured );
  EXPECT( text.find( "Git tree '/home/me/.local/state/nixy' is dirty" )
          != std::string::npos );
  EXPECT( text.find( "hidden" ) == std::string::npos );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int ec = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( ec, __VA_ARGS__ )

  RUN_TEST( trim0 );
  RUN_TEST( hasPrefix0 );
  RUN_TEST( toLower0 );
  RUN_TEST( splitLines0 );
  RUN_TEST( encodeFlakePath0 );
  RUN_TEST( concatStringsSep0 );
  RUN_TEST( writeFileAtomically0 );
  RUN_TEST( writeFileAtomically1 );
  RUN_TEST( readTextFile0 );
  RUN_TEST( loggerWarn0 );

  return ec;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
