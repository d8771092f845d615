/* ========================================================================== *
 *
 * @file logger.cc
 *
 * @brief Custom `nix::Logger` implementation used for `nixy` console output.
 *
 *
 * -------------------------------------------------------------------------- */

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unistd.h>

#include <nix/logging.hh>
#include <nix/util.hh>

#include "nixy/core/nix-state.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/**
 * @brief determine if we should use ANSI escape sequences.
 *
 * Like `nix::shouldANSI` but also honors `NOCOLOR`.
 */
static bool
shouldANSI()
{
  return isatty( STDERR_FILENO )
         && ( nix::getEnv( "TERM" ).value_or( "dumb" ) != "dumb" )
         && ( ! ( nix::getEnv( "NO_COLOR" ).has_value()
                  || nix::getEnv( "NOCOLOR" ).has_value() ) );
}


/* -------------------------------------------------------------------------- */

/**
 * @brief Custom `nix::Logger` implementation used to filter build output.
 *
 * Messages are written to `stderr` line by line, the same way
 * `nix::SimpleLogger` does, with a colored prefix for warnings.
 */
class FilteredLogger : public nix::Logger
{

protected:

  /**
   * @brief Color the `==>` arrow of progress lines, and strip escapes from
   *        everything when colors are disabled.
   */
  std::string
  highlight( std::string_view str ) const
  {
    if ( ! this->color ) { return nix::filterANSIEscapes( str, true ); }
    if ( str.substr( 0, 4 ) == "==> " )
      {
        return "\033[34;1m==>\033[0m " + std::string( str.substr( 4 ) );
      }
    return std::string( str );
  }


public:

  bool systemd;        /**< Whether we should emit `systemd` style logs. */
  bool color;          /**< Whether we should emit colors in logs. */
  bool printBuildLogs; /**< Whether we should emit build logs. */

  explicit FilteredLogger( bool printBuildLogs )
    : systemd( nix::getEnv( "IN_SYSTEMD" ) == "1" )
    , color( shouldANSI() )
    , printBuildLogs( printBuildLogs )
  {}


  /** @brief Whether the logger prints the whole build log. */
  bool
  isVerbose() override
  {
    return this->printBuildLogs;
  }


  /** @brief Emit a log message with a colored "warning:" prefix. */
  void
  warn( const std::string & msg ) override
  {
    /* `\033' rather than `\e' to keep ISO compilers quiet. */
    this->log( nix::lvlWarn,
               /* ANSI_WARNING */ "\033[35;1m"
                                  "warning:"
                                  /* ANSI_NORMAL */ "\033[0m"
                                  " "
                 + msg );
  }


  /**
   * @brief Emit a log line depending on verbosity setting.
   * @param lvl Minimum required verbosity level to emit the message.
   * @param str The message to emit.
   */
  void
  log( nix::Verbosity lvl, std::string_view str ) override
  {
    if ( nix::verbosity < lvl ) { return; }

    std::string prefix;
    if ( systemd )
      {
        char levelChar;
        switch ( lvl )
          {
            case nix::lvlError: levelChar = '3'; break;

            case nix::lvlWarn: levelChar = '4'; break;

            case nix::lvlNotice:
            case nix::lvlInfo: levelChar = '5'; break;

            case nix::lvlTalkative:
            case nix::lvlChatty: levelChar = '6'; break;

            case nix::lvlDebug:
            case nix::lvlVomit: levelChar = '7'; break;

            default: levelChar = '7'; break;
          }
        prefix = std::string( "<" ) + levelChar + ">";
      }

    nix::writeToStderr( prefix + this->highlight( str ) + "\n" );
  }


  /** @brief Emit error information. */
  void
  logEI( const nix::ErrorInfo & einfo ) override
  {
    std::stringstream oss;
    showErrorInfo( oss, einfo, nix::loggerSettings.showTrace.get() );
    this->log( einfo.level, oss.str() );
  }


  /** @brief Begin an activity block. */
  void
  startActivity( nix::ActivityId /* act ( unused ) */,
                 nix::Verbosity      lvl,
                 nix::ActivityType /* type ( unused ) */,
                 const std::string & str,
                 const Fields & /* fields ( unused ) */,
                 nix::ActivityId /* parent ( unused ) */ ) override
  {
    if ( ( lvl <= nix::verbosity ) && ( ! str.empty() ) )
      {
        this->log( lvl, str + "..." );
      }
  }


  /** @brief Only build log lines are of interest to us. */
  void
  result( nix::ActivityId /* act ( unused ) */,
          nix::ResultType type,
          const Fields &  fields ) override
  {
    if ( ! this->printBuildLogs ) { return; }
    if ( type == nix::resBuildLogLine ) { this->log( nix::lvlError, fields[0].s ); }
  }


}; /* End class `FilteredLogger' */


/* -------------------------------------------------------------------------- */

nix::Logger *
makeFilteredLogger( bool printBuildLogs )
{
  return new FilteredLogger( printBuildLogs );
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
