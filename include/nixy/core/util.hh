/* ========================================================================== *
 *
 * @file nixy/core/util.hh
 *
 * @brief Miscellaneous helper functions.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>  // For `std::string' and `std::string_view'
#include <string_view>
#include <vector>

#include <nix/error.hh>
#include <nix/logging.hh>
#include <nlohmann/json.hpp>

#include "nixy/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/** @brief Systems that generated flakes provide outputs for. */
[[nodiscard]] inline static const std::vector<std::string> &
getDefaultSystems()
{
  static const std::vector<std::string> defaultSystems
    = { "x86_64-linux", "aarch64-linux", "x86_64-darwin", "aarch64-darwin" };
  return defaultSystems;
}


/* -------------------------------------------------------------------------- */

/**
 * @brief Does the string @a str have the prefix @a prefix?
 * @param prefix The prefix to check for.
 * @param str String to test.
 * @return `true` iff @a str has the prefix @a prefix.
 */
[[nodiscard]] bool
hasPrefix( std::string_view prefix, std::string_view str );

/** @brief Does the string @a str end with @a suffix? */
[[nodiscard]] bool
hasSuffix( std::string_view suffix, std::string_view str );


/* -------------------------------------------------------------------------- */

/** @brief trim from start ( in place ). */
std::string &
ltrim( std::string & str );

/** @brief trim from end ( in place ). */
std::string &
rtrim( std::string & str );

/** @brief trim from both ends ( in place ). */
std::string &
trim( std::string & str );


/** @brief trim from both ends ( copying ). */
[[nodiscard]] std::string
trim_copy( std::string_view str );

/** @brief ASCII lowercase copy of @a str. */
[[nodiscard]] std::string
toLower( std::string_view str );


/* -------------------------------------------------------------------------- */

/**
 * @brief Split text into lines, dropping the `\n` separators.
 *
 * A trailing newline does not produce an empty final line, which matches
 * how the marker editor walks files.
 */
[[nodiscard]] std::vector<std::string>
splitLines( std::string_view text );


/* -------------------------------------------------------------------------- */

/**
 * @brief Escape a filesystem path for use inside a flake reference.
 *
 * Spaces are written as `%20`; everything else is left alone.
 */
[[nodiscard]] std::string
encodeFlakePath( const std::filesystem::path & path );


/* -------------------------------------------------------------------------- */

/** @brief Read a whole file into a string. */
[[nodiscard]] std::string
readTextFile( const std::filesystem::path & path );

/**
 * @brief Write @a content to @a path atomically.
 *
 * The content is written to `<path>.tmp` which is then renamed over @a path.
 * Parent directories are created as needed.
 * If any step fails the temporary file is removed and the error is rethrown
 * as an @a Exception.
 */
template<typename Exception = NixyException>
void
writeFileAtomically( const std::filesystem::path & path,
                     std::string_view              content );


/* -------------------------------------------------------------------------- */

/**
 * @brief Extract the user-friendly portion of a @a nlohmann::json::exception.
 */
[[nodiscard]] std::string
extract_json_errmsg( nlohmann::json::exception & err );

/* -------------------------------------------------------------------------- */

/**
 * @brief Assert that a JSON value is an object, or throw an exception.
 *
 * The type of exception and an optional _path_ for messages can be provided.
 */
template<typename Exception = NixyException>
static void
assertIsJSONObject( const nlohmann::json & value,
                    const std::string &    who = "JSON value" )
{
  if ( ! value.is_object() )
    {
      std::stringstream oss;
      oss << "expected " << who << " to be an object, but found "
          << ( value.is_array() ? "an" : "a" ) << ' ' << value.type_name()
          << '.';
      throw Exception( oss.str() );
    }
}


/* -------------------------------------------------------------------------- */

/**
 * @brief Concatenate the given strings with a separator between
 *        the elements.
 */
template<class Container>
[[nodiscard]] std::string
concatStringsSep( const std::string_view sep, const Container & strings )
{
  size_t size = 0;
  for ( const auto & str : strings )
    {
      size += sep.size() + std::string_view( str ).size();
    }
  std::string rsl;
  rsl.reserve( size );
  for ( auto & idx : strings )
    {
      if ( ! rsl.empty() ) { rsl += sep; }
      rsl += idx;
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

/** @brief Print a log message with the provided log level.
 *
 * This is a macro so that any allocations needed for msg can be optimized out.
 */
#define printLog( lvl, msg ) \
  if ( ! ( ( lvl ) > nix::verbosity ) ) { nix::logger->log( lvl, msg ); }

/** @brief Prints a log message to `stderr` when called with `-vvvv`. */
#define traceLog( msg ) printLog( nix::Verbosity::lvlVomit, msg )

/**
 * @brief Prints a log message to `stderr` when called with `-vvv`.
 */
#define debugLog( msg ) printLog( nix::Verbosity::lvlDebug, msg )

/**
 * @brief Prints a log message to `stderr` when called with `--verbose` or `-v`.
 */
#define verboseLog( msg ) printLog( nix::Verbosity::lvlTalkative, msg )

/** @brief Prints a log message to `stderr` at default verbosity. */
#define infoLog( msg ) printLog( nix::Verbosity::lvlInfo, msg )

/** @brief Prints a log message to `stderr` when verbosity is at least `-q`. */
#define warningLog( msg ) printLog( nix::Verbosity::lvlWarn, msg )

/** @brief Prints a log message to `stderr` when verbosity is at least `-qq`. */
#define errorLog( msg ) printLog( nix::Verbosity::lvlError, msg )

/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- */

/* Template definitions. */

#include <cerrno>
#include <fstream>
#include <system_error>

namespace nixy {

template<typename Exception>
void
writeFileAtomically( const std::filesystem::path & path,
                     std::string_view              content )
{
  std::filesystem::path tmpPath = path;
  tmpPath += ".tmp";
  try
    {
      if ( path.has_parent_path() )
        {
          std::filesystem::create_directories( path.parent_path() );
        }
      {
        std::ofstream out( tmpPath, std::ios::binary | std::ios::trunc );
        if ( ! out.is_open() )
          {
            throw std::system_error( errno,
                                     std::generic_category(),
                                     "opening " + tmpPath.string() );
          }
        out.write( content.data(),
                   static_cast<std::streamsize>( content.size() ) );
        out.close();
        if ( out.fail() )
          {
            throw std::system_error( errno,
                                     std::generic_category(),
                                     "writing " + tmpPath.string() );
          }
      }
      std::filesystem::rename( tmpPath, path );
    }
  catch ( const std::exception & err )
    {
      std::error_code ec;
      std::filesystem::remove( tmpPath, ec );
      throw Exception( "failed to write '" + path.string() + "'", err.what() );
    }
}

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
