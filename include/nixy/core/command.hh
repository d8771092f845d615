/* ========================================================================== *
 *
 * @file nixy/core/command.hh
 *
 * @brief Verbosity flags and command line parsing shared by every
 *        `nixy` subcommand.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>

#include <argparse/argparse.hpp>

#include "nixy/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

/** @brief Command line plumbing. */
namespace nixy::command {

/* -------------------------------------------------------------------------- */

/**
 * @brief Add verbosity flags to any parser and modify the global verbosity.
 *
 * Nix verbosity levels for reference:
 *   typedef enum {
 *     lvlError = 0   ( --quiet --quiet --quiet )
 *   , lvlWarn        ( --quiet --quiet )
 *   , lvlNotice      ( --quiet )
 *   , lvlInfo        ( **Default** )
 *   , lvlTalkative   ( -v )
 *   , lvlChatty      ( -vv )
 *   , lvlDebug       ( -vvv )
 *   , lvlVomit       ( -vvvv )
 *   } Verbosity;
 */
struct VerboseParser : public argparse::ArgumentParser
{
  explicit VerboseParser( const std::string & name,
                          const std::string & version = NIXY_VERSION );
}; /* End struct `VerboseParser' */


/**
 * @class nixy::command::InvalidArgException
 * @brief An exception thrown when a command line argument is invalid or a
 *        command is misused.
 *
 * @{
 */
NIXY_DEFINE_EXCEPTION( InvalidArgException, EC_INVALID_ARG, "invalid argument" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @brief Parse @a argv with @a parser.
 * @throws InvalidArgException for missing, unknown, or malformed arguments.
 */
void
parseCommandLine( argparse::ArgumentParser & parser, int argc, char * argv[] );


/* -------------------------------------------------------------------------- */

}  // namespace nixy::command


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
