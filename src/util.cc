/* ========================================================================== *
 *
 * @file util.cc
 *
 * @brief Miscellaneous helper functions.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "nixy/core/exceptions.hh"
#include "nixy/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

bool
hasPrefix( std::string_view prefix, std::string_view str )
{
  if ( str.size() < prefix.size() ) { return false; }
  return str.find( prefix ) == 0;
}


bool
hasSuffix( std::string_view suffix, std::string_view str )
{
  if ( str.size() < suffix.size() ) { return false; }
  return str.compare( str.size() - suffix.size(), suffix.size(), suffix ) == 0;
}


/* -------------------------------------------------------------------------- */

std::string &
ltrim( std::string & str )
{
  str.erase( str.begin(),
             std::find_if( str.begin(),
                           str.end(),
                           []( unsigned char chr )
                           { return ! std::isspace( chr ); } ) );
  return str;
}

std::string &
rtrim( std::string & str )
{
  str.erase( std::find_if( str.rbegin(),
                           str.rend(),
                           []( unsigned char chr )
                           { return ! std::isspace( chr ); } )
               .base(),
             str.end() );
  return str;
}

std::string &
trim( std::string & str )
{
  rtrim( str );
  ltrim( str );
  return str;
}


std::string
trim_copy( std::string_view str )
{
  std::string rsl( str );
  trim( rsl );
  return rsl;
}


std::string
toLower( std::string_view str )
{
  std::string rsl( str );
  std::transform( rsl.begin(),
                  rsl.end(),
                  rsl.begin(),
                  []( unsigned char chr )
                  { return static_cast<char>( std::tolower( chr ) ); } );
  return rsl;
}


/* -------------------------------------------------------------------------- */

std::vector<std::string>
splitLines( std::string_view text )
{
  std::vector<std::string> lines;
  size_t                   start = 0;
  while ( start < text.size() )
    {
      size_t end = text.find( '\n', start );
      if ( end == std::string_view::npos )
        {
          lines.emplace_back( text.substr( start ) );
          break;
        }
      lines.emplace_back( text.substr( start, end - start ) );
      start = end + 1;
    }
  return lines;
}


/* -------------------------------------------------------------------------- */

std::string
encodeFlakePath( const std::filesystem::path & path )
{
  std::string rsl;
  for ( char chr : path.string() )
    {
      if ( chr == ' ' ) { rsl += "%20"; }
      else { rsl.push_back( chr ); }
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

std::string
readTextFile( const std::filesystem::path & path )
{
  std::ifstream input( path, std::ios::binary );
  if ( ! input.is_open() )
    {
      throw NixyException( "unable to open file '" + path.string() + "'" );
    }
  std::stringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}


/* -------------------------------------------------------------------------- */

std::string
extract_json_errmsg( nlohmann::json::exception & err )
{
  /* All of the nlohmann::json::exception messages are formatted like so:
   * [something] actually useful message. */
  std::string            full( err.what() );
  std::string::size_type idx = full.find( "]" );
  idx += 1; /* Don't include the leading space */
  std::string userFriendly = full.substr( idx, full.size() );
  return userFriendly;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
