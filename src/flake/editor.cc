/* ========================================================================== *
 *
 * @file flake/editor.cc
 *
 * @brief Line oriented edits of `flake.nix` files containing marker comments.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "nixy/core/exceptions.hh"
#include "nixy/core/util.hh"
#include "nixy/flake/editor.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::flake {

/* -------------------------------------------------------------------------- */

std::string
openMarker( std::string_view name )
{
  return "# [" + std::string( name ) + "]";
}


std::string
closeMarker( std::string_view name )
{
  return "# [/" + std::string( name ) + "]";
}


/* -------------------------------------------------------------------------- */

/** @brief Escape characters with special meaning in ECMAScript regexes. */
static std::string
escapeRegex( std::string_view str )
{
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string              rsl;
  for ( char chr : str )
    {
      if ( special.find( chr ) != std::string::npos ) { rsl += '\\'; }
      rsl += chr;
    }
  return rsl;
}


/** @brief Join @a lines, ending with a newline iff @a original did. */
static std::string
joinLines( const std::vector<std::string> & lines, std::string_view original )
{
  std::string rsl;
  for ( const auto & line : lines )
    {
      rsl += line;
      rsl += '\n';
    }
  if ( ( ! hasSuffix( "\n", original ) ) && ( ! rsl.empty() ) )
    {
      rsl.pop_back();
    }
  return rsl;
}


static bool
contains( std::string_view haystack, std::string_view needle )
{
  return haystack.find( needle ) != std::string_view::npos;
}


/* -------------------------------------------------------------------------- */

bool
hasMarker( std::string_view text, std::string_view name )
{
  return contains( text, openMarker( name ) );
}


bool
hasAnyMarker( std::string_view text )
{
  return contains( text, "# [nixy:" );
}


/* -------------------------------------------------------------------------- */

std::string
insertAfterMarker( std::string_view text,
                   std::string_view name,
                   std::string_view newLine )
{
  std::string              token = openMarker( name );
  std::vector<std::string> lines;
  for ( auto & line : splitLines( text ) )
    {
      bool isMarker = contains( line, token );
      lines.emplace_back( std::move( line ) );
      if ( isMarker ) { lines.emplace_back( newLine ); }
    }
  return joinLines( lines, text );
}


/* -------------------------------------------------------------------------- */

std::string
removeFromSection( std::string_view   text,
                   std::string_view   startToken,
                   std::string_view   endToken,
                   const std::regex & pattern )
{
  std::vector<std::string> lines;
  bool                     inside = false;
  for ( auto & line : splitLines( text ) )
    {
      bool isStart = contains( line, startToken );
      bool isEnd   = contains( line, endToken );
      if ( isStart ) { inside = true; }
      if ( isEnd ) { inside = false; }
      if ( inside && ( ! isStart ) && std::regex_search( line, pattern ) )
        {
          continue;
        }
      lines.emplace_back( std::move( line ) );
    }
  return joinLines( lines, text );
}


/* -------------------------------------------------------------------------- */

std::vector<std::string>
extractSectionContent( std::string_view text, std::string_view name )
{
  std::string              start = openMarker( name );
  std::string              end   = closeMarker( name );
  std::vector<std::string> rsl;
  bool                     inside = false;
  for ( auto & line : splitLines( text ) )
    {
      if ( contains( line, end ) )
        {
          inside = false;
          continue;
        }
      if ( inside ) { rsl.emplace_back( line ); }
      if ( contains( line, start ) ) { inside = true; }
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

bool
isValidNixIdentifier( std::string_view str )
{
  if ( str.empty() ) { return false; }
  auto isAlpha = []( char chr )
  {
    return ( ( 'a' <= chr ) && ( chr <= 'z' ) )
           || ( ( 'A' <= chr ) && ( chr <= 'Z' ) );
  };
  auto isDigit = []( char chr ) { return ( '0' <= chr ) && ( chr <= '9' ); };

  if ( ! ( isAlpha( str.front() ) || ( str.front() == '_' ) ) )
    {
      return false;
    }
  return std::all_of( str.begin() + 1,
                      str.end(),
                      [&]( char chr ) {
                        return isAlpha( chr ) || isDigit( chr ) || ( chr == '_' )
                               || ( chr == '-' );
                      } );
}


/* -------------------------------------------------------------------------- */

std::vector<std::string>
extractPackagesFromFlake( std::string_view text )
{
  std::vector<std::string> rsl;
  for ( std::string_view section : { sections::PACKAGES,
                                     sections::LOCAL_PACKAGES,
                                     sections::CUSTOM_PACKAGES } )
    {
      for ( const auto & line : extractSectionContent( text, section ) )
        {
          auto eq = line.find( '=' );
          if ( eq == std::string::npos ) { continue; }
          std::string name = trim_copy( std::string_view( line ).substr( 0, eq ) );
          if ( isValidNixIdentifier( name ) ) { rsl.emplace_back( name ); }
        }
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

/** @brief Look up `<input>.url = "<url>";` inside region @a section. */
static std::optional<std::string>
findInputUrl( std::string_view   text,
              std::string_view   section,
              const std::string & inputName )
{
  const std::regex urlRE( "^\\s*" + escapeRegex( inputName )
                          + R"re(\.url\s*=\s*"([^"]*)"\s*;)re" );
  for ( const auto & line : extractSectionContent( text, section ) )
    {
      std::smatch match;
      if ( std::regex_search( line, match, urlRE ) ) { return match[1].str(); }
    }
  return std::nullopt;
}


RecoveredState
recoverStateFromMarkedFlake( std::string_view text )
{
  static const std::regex plainRE(
    R"re(^\s*([A-Za-z_][A-Za-z0-9_'-]*)\s*=\s*pkgs\.([A-Za-z0-9_'-]+)\s*;\s*$)re" );
  static const std::regex customRE(
    R"re(^\s*([A-Za-z_][A-Za-z0-9_'-]*)\s*=\s*inputs\.([A-Za-z_][A-Za-z0-9_'-]*)\.([A-Za-z]+)\.\$\{system\}\.([A-Za-z0-9_'.-]+)\s*;\s*$)re" );

  RecoveredState rsl;

  for ( const auto & line : extractSectionContent( text, sections::PACKAGES ) )
    {
      std::smatch match;
      if ( std::regex_match( line, match, plainRE )
           && ( match[1].str() == match[2].str() ) )
        {
          rsl.state.addLegacyPackage( match[1].str() );
        }
      else if ( ! trim_copy( line ).empty() )
        {
          debugLog( "not recovering package line '" + trim_copy( line ) + "'" );
        }
    }

  for ( const auto & line :
        extractSectionContent( text, sections::CUSTOM_PACKAGES ) )
    {
      std::smatch match;
      if ( ! std::regex_match( line, match, customRE ) ) { continue; }

      CustomPackage pkg;
      pkg.name          = match[1].str();
      pkg.inputName     = match[2].str();
      pkg.packageOutput = match[3].str();
      std::string source = match[4].str();

      auto url = findInputUrl( text, sections::CUSTOM_INPUTS, pkg.inputName );
      if ( ! url.has_value() )
        {
          url = findInputUrl( text, sections::LOCAL_INPUTS, pkg.inputName );
        }
      if ( ! url.has_value() )
        {
          rsl.warnings.emplace_back( "skipping custom package '" + pkg.name
                                     + "': no URL found for input '"
                                     + pkg.inputName + "'" );
          continue;
        }
      pkg.inputUrl = std::move( *url );

      if ( source != pkg.name )
        {
          rsl.warnings.emplace_back( "custom package '" + pkg.name
                                     + "' is an alias of '" + source
                                     + "' in input '" + pkg.inputName + "'" );
          pkg.sourceName = std::move( source );
        }
      rsl.state.addCustomPackage( std::move( pkg ) );
    }

  return rsl;
}


/* -------------------------------------------------------------------------- */

/** @brief Leading whitespace of @a line. */
static std::string
indentOf( const std::string & line )
{
  return line.substr( 0, line.find_first_not_of( " \t" ) );
}


std::string
ensureMarkers( std::string_view text )
{
  static const std::regex defaultRE( R"re(^\s*default\s*=)re" );
  static const std::regex inputsRE( R"re(^\s*inputs\s*=\s*\{)re" );
  static const std::regex closeRE( R"re(^\s*\};)re" );

  std::vector<std::string> lines = splitLines( text );

  auto pair = []( const std::string & indent, std::string_view name )
  {
    return std::vector<std::string> { indent + openMarker( name ),
                                      indent + closeMarker( name ) };
  };

  /* Package regions go right before `default = ...'. */
  for ( std::string_view name : { sections::PACKAGES,
                                  sections::LOCAL_PACKAGES,
                                  sections::CUSTOM_PACKAGES } )
    {
      if ( hasMarker( text, name ) ) { continue; }
      auto anchor = std::find_if( lines.begin(),
                                  lines.end(),
                                  []( const std::string & line )
                                  { return std::regex_search( line, defaultRE ); } );
      if ( anchor == lines.end() ) { continue; }
      auto region = pair( indentOf( *anchor ), name );
      lines.insert( anchor, region.begin(), region.end() );
    }

  /* Input regions go right before the end of `inputs = { ... };'. */
  for ( std::string_view name : { sections::CUSTOM_INPUTS,
                                  sections::LOCAL_INPUTS } )
    {
      if ( hasMarker( text, name ) ) { continue; }
      auto open = std::find_if( lines.begin(),
                                lines.end(),
                                []( const std::string & line )
                                { return std::regex_search( line, inputsRE ); } );
      if ( open == lines.end() ) { continue; }
      auto close = std::find_if( open + 1,
                                 lines.end(),
                                 []( const std::string & line )
                                 { return std::regex_search( line, closeRE ); } );
      if ( close == lines.end() ) { continue; }
      auto region = pair( indentOf( *open ) + "  ", name );
      lines.insert( close, region.begin(), region.end() );
    }

  /* Path regions open the `paths' list. */
  for ( std::string_view name : { sections::ENV_PATHS, sections::CUSTOM_PATHS } )
    {
      if ( hasMarker( text, name ) ) { continue; }
      auto anchor = std::find_if( lines.begin(),
                                  lines.end(),
                                  []( const std::string & line )
                                  { return contains( line, "paths = [" ); } );
      if ( anchor == lines.end() ) { continue; }
      auto region = pair( indentOf( *anchor ) + "  ", name );
      lines.insert( anchor + 1, region.begin(), region.end() );
    }

  return joinLines( lines, text );
}


/* -------------------------------------------------------------------------- */

std::string
widenOutputsSignature( std::string_view text, std::string_view inputName )
{
  static const std::regex outputsRE(
    R"re(outputs\s*=\s*\{([^}]*)\}(\s*@\s*([A-Za-z_][A-Za-z0-9_'-]*))?\s*:)re" );

  std::string str( text );
  std::smatch match;
  if ( ! std::regex_search( str, match, outputsRE ) ) { return str; }

  std::vector<std::string> params;
  bool                     variadic = false;
  std::string              raw      = match[1].str();
  size_t                   start    = 0;
  while ( start <= raw.size() )
    {
      size_t      end   = raw.find( ',', start );
      std::string param = trim_copy(
        std::string_view( raw ).substr( start,
                                        end == std::string::npos
                                          ? std::string::npos
                                          : end - start ) );
      if ( param == "..." ) { variadic = true; }
      else if ( ! param.empty() ) { params.emplace_back( std::move( param ) ); }
      if ( end == std::string::npos ) { break; }
      start = end + 1;
    }

  if ( std::find( params.begin(), params.end(), inputName ) != params.end() )
    {
      return str;
    }
  params.emplace_back( inputName );
  if ( variadic ) { params.emplace_back( "..." ); }

  std::string binding = match[3].matched ? match[3].str() : "inputs";
  std::string replacement
    = "outputs = { " + concatStringsSep( ", ", params ) + " }@" + binding + ":";
  return match.prefix().str() + replacement + match.suffix().str();
}


/* -------------------------------------------------------------------------- */

/** @brief Throw unless region @a name exists in @a text. */
static void
requireMarker( std::string_view text, std::string_view name )
{
  if ( ! hasMarker( text, name ) )
    {
      throw UnmanagedConfigException(
        "flake has no `" + std::string( name ) + "' region",
        "use --force to replace it with a generated flake" );
    }
}


std::string
addPackageIncrementally( std::string_view text, std::string_view name )
{
  std::string rsl = ensureMarkers( text );
  requireMarker( rsl, sections::PACKAGES );
  requireMarker( rsl, sections::ENV_PATHS );

  auto bound = extractPackagesFromFlake( rsl );
  if ( std::find( bound.begin(), bound.end(), name ) != bound.end() )
    {
      return rsl;
    }

  std::string str( name );
  rsl = insertAfterMarker( rsl,
                           sections::PACKAGES,
                           "          " + str + " = pkgs." + str + ";" );
  return insertAfterMarker( rsl, sections::ENV_PATHS, "              " + str );
}


std::string
addPackageIncrementally( std::string_view text, const CustomPackage & pkg )
{
  std::string rsl = ensureMarkers( text );
  requireMarker( rsl, sections::CUSTOM_PACKAGES );
  requireMarker( rsl, sections::CUSTOM_INPUTS );
  requireMarker( rsl, sections::CUSTOM_PATHS );

  auto bound = extractPackagesFromFlake( rsl );
  if ( std::find( bound.begin(), bound.end(), pkg.name ) != bound.end() )
    {
      return rsl;
    }

  bool declared
    = ( pkg.inputName == "nixpkgs" )
      || findInputUrl( rsl, sections::CUSTOM_INPUTS, pkg.inputName ).has_value()
      || findInputUrl( rsl, sections::LOCAL_INPUTS, pkg.inputName ).has_value();
  if ( ! declared )
    {
      rsl = insertAfterMarker( rsl,
                               sections::CUSTOM_INPUTS,
                               "    " + pkg.inputName + ".url = \"" + pkg.inputUrl
                                 + "\";" );
      rsl = widenOutputsSignature( rsl, pkg.inputName );
    }

  rsl = insertAfterMarker( rsl,
                           sections::CUSTOM_PACKAGES,
                           "          " + pkg.name + " = inputs." + pkg.inputName
                             + "." + pkg.packageOutput + ".${system}."
                             + pkg.getSourceName() + ";" );
  return insertAfterMarker( rsl,
                            sections::CUSTOM_PATHS,
                            "              " + pkg.name );
}


/* -------------------------------------------------------------------------- */

std::string
removePackageIncrementally( std::string_view text, std::string_view name )
{
  const std::string escaped = escapeRegex( name );
  const std::regex  bindingRE( "^\\s*" + escaped + "\\s*=" );
  const std::regex  pathRE( "^\\s*" + escaped + "\\s*$" );

  std::string rsl( text );
  for ( std::string_view section : { sections::PACKAGES,
                                     sections::LOCAL_PACKAGES,
                                     sections::CUSTOM_PACKAGES } )
    {
      rsl = removeFromSection( rsl,
                               openMarker( section ),
                               closeMarker( section ),
                               bindingRE );
    }
  for ( std::string_view section : { sections::ENV_PATHS, sections::CUSTOM_PATHS } )
    {
      rsl = removeFromSection( rsl,
                               openMarker( section ),
                               closeMarker( section ),
                               pathRE );
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::flake


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
