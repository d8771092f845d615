/* ========================================================================== *
 *
 * @file packages/flake-ref.cc
 *
 * @brief Naming packages and inputs installed from flake URLs.
 *
 *
 * -------------------------------------------------------------------------- */

#include <string>
#include <string_view>
#include <vector>

#include "nixy/core/util.hh"
#include "nixy/packages/flake-ref.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

namespace {

std::string_view
stripGitSuffix( std::string_view str )
{
  while ( hasSuffix( ".git", str ) ) { str.remove_suffix( 4 ); }
  return str;
}

}  // namespace


/* -------------------------------------------------------------------------- */

std::string
sanitizeInputName( std::string_view str )
{
  std::string rsl;
  rsl.reserve( str.size() );
  for ( char chr : str )
    {
      bool keep = ( ( 'a' <= chr ) && ( chr <= 'z' ) )
                  || ( ( 'A' <= chr ) && ( chr <= 'Z' ) )
                  || ( ( '0' <= chr ) && ( chr <= '9' ) ) || ( chr == '-' );
      rsl.push_back( keep ? chr : '-' );
    }

  auto first = rsl.find_first_not_of( '-' );
  if ( first == std::string::npos ) { return ""; }
  auto last = rsl.find_last_not_of( '-' );
  return rsl.substr( first, last - first + 1 );
}


/* -------------------------------------------------------------------------- */

std::string
derivePackageNameFromUrl( std::string_view url )
{
  std::string_view path = url;
  if ( auto colon = path.find( ':' ); colon != std::string_view::npos )
    {
      path = path.substr( colon + 1 );
    }
  while ( hasSuffix( "/", path ) ) { path.remove_suffix( 1 ); }

  if ( auto slash = path.rfind( '/' ); slash != std::string_view::npos )
    {
      path = path.substr( slash + 1 );
    }
  path = stripGitSuffix( path );

  if ( path.empty() ) { return "default"; }
  return sanitizeInputName( path );
}


/* -------------------------------------------------------------------------- */

std::string
deriveInputNameFromUrl( std::string_view url )
{
  auto slash = url.rfind( '/' );
  if ( slash == std::string_view::npos ) { return "custom-flake"; }

  std::string_view repo  = stripGitSuffix( url.substr( slash + 1 ) );
  std::string_view owner = url.substr( 0, slash );
  if ( auto prev = owner.rfind( '/' ); prev != std::string_view::npos )
    {
      owner = owner.substr( prev + 1 );
    }
  return sanitizeInputName( std::string( owner ) + "-" + std::string( repo ) );
}


/* -------------------------------------------------------------------------- */

FlakeInstallable
parseFlakeInstallable( std::string_view spec )
{
  if ( auto hash = spec.find( '#' ); hash != std::string_view::npos )
    {
      return FlakeInstallable { std::string( spec.substr( 0, hash ) ),
                                std::string( spec.substr( hash + 1 ) ) };
    }
  return FlakeInstallable { std::string( spec ),
                            derivePackageNameFromUrl( spec ) };
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::packages


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
