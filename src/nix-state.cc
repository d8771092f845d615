/* ========================================================================== *
 *
 * @file nix-state.cc
 *
 * @brief One time `nix` runtime setup and helpers for running the `nix` CLI.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <list>
#include <map>
#include <string>

#include <nix/error.hh>
#include <nix/globals.hh>
#include <nix/logging.hh>
#include <nix/shared.hh>
#include <nix/util.hh>

#include "nixy/core/nix-state.hh"
#include "nixy/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

void
initNix()
{
  static bool didNixInit = false;
  if ( didNixInit ) { return; }

  /* Suppress benign warnings about `nix.conf'. */
  nix::Verbosity oldVerbosity = nix::verbosity;
  nix::verbosity              = nix::lvlError;
  nix::initNix();
  /* Restore verbosity to `nix' global setting */
  nix::verbosity = oldVerbosity;

  /* Use custom logger */
  bool printBuildLogs = nix::logger->isVerbose();
  delete nix::logger;
  nix::logger = makeFilteredLogger( printBuildLogs );

  didNixInit = true;
}


/* -------------------------------------------------------------------------- */

void
setVerbosityFromEnv()
{
  auto * valueChars = std::getenv( "NIXY_VERBOSITY" );
  if ( valueChars == nullptr ) { return; }
  std::string value( valueChars );
  if ( value == std::string( "0" ) ) { nix::verbosity = nix::lvlError; }
  else if ( value == std::string( "1" ) ) { nix::verbosity = nix::lvlInfo; }
  else if ( value == std::string( "2" ) ) { nix::verbosity = nix::lvlDebug; }
  else if ( value == std::string( "3" ) ) { nix::verbosity = nix::lvlChatty; }
  else if ( value == std::string( "4" ) ) { nix::verbosity = nix::lvlVomit; }
  // Put this at the end so that if we *want* logging it will show up
  traceLog( "found NIXY_VERBOSITY=" + value );
}


/* -------------------------------------------------------------------------- */

const std::list<std::string> &
getNixFlags()
{
  static const std::list<std::string> flags
    = { "--extra-experimental-features",
        "nix-command",
        "--extra-experimental-features",
        "flakes" };
  return flags;
}


/* -------------------------------------------------------------------------- */

NixCommandResult
runNix( const std::list<std::string> &             args,
        const std::map<std::string, std::string> & extraEnv,
        bool                                       mergeStderr )
{
  static const std::string nixProg
    = nix::getEnv( "NIXY_NIX_BIN" ).value_or( "nix" );

  std::list<std::string> fullArgs = getNixFlags();
  fullArgs.insert( fullArgs.end(), args.begin(), args.end() );

  std::map<std::string, std::string> env = nix::getEnv();
  for ( const auto & [key, value] : extraEnv ) { env[key] = value; }

  debugLog( "running: " + nixProg + " " + concatStringsSep( " ", fullArgs ) );

  auto [status, out]
    = nix::runProgram( nix::RunOptions { .program             = nixProg,
                                         .searchPath          = true,
                                         .args                = fullArgs,
                                         .uid                 = std::nullopt,
                                         .gid                 = std::nullopt,
                                         .chdir               = std::nullopt,
                                         .environment         = env,
                                         .input               = std::nullopt,
                                         .standardIn          = nullptr,
                                         .standardOut         = nullptr,
                                         .mergeStderrToStdout = mergeStderr } );
  return NixCommandResult { .status = status, .out = std::move( out ) };
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
