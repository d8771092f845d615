/* ========================================================================== *
 *
 * @file flake/local-packages.cc
 *
 * @brief Discover package definitions kept in the local packages directory.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "nixy/core/util.hh"
#include "nixy/flake/local-packages.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::flake {

/* -------------------------------------------------------------------------- */

bool
LocalScan::provides( std::string_view name ) const
{
  return std::any_of( this->packages.begin(),
                      this->packages.end(),
                      [&]( const LocalPackage & pkg )
                      { return pkg.name == name; } )
         || std::any_of( this->flakes.begin(),
                         this->flakes.end(),
                         [&]( const LocalFlake & flake )
                         { return flake.name == name; } );
}


/* -------------------------------------------------------------------------- */

/** Matches a double quoted string or a bare identifier/literal. */
static const char * const valuePattern
  = R"re(("(?:[^"\\]|\\.)*"|[A-Za-z0-9_.'/:+-]+))re";

/** Characters which may not precede an attribute name we look for. */
static const char * const boundaryPattern = R"re((?:^|[^A-Za-z0-9_'.-]))re";


/**
 * @brief Turn a matched value into its static contents.
 * @return `std::nullopt` for interpolated strings.
 */
static std::optional<std::string>
staticValue( const std::string & raw )
{
  if ( raw.empty() || raw.front() != '"' ) { return raw; }

  std::string_view body( raw );
  body.remove_prefix( 1 );
  body.remove_suffix( 1 );

  std::string rsl;
  for ( size_t idx = 0; idx < body.size(); ++idx )
    {
      char chr = body[idx];
      if ( ( chr == '$' ) && ( ( idx + 1 ) < body.size() )
           && ( body[idx + 1] == '{' ) )
        {
          return std::nullopt;
        }
      if ( ( chr == '\\' ) && ( ( idx + 1 ) < body.size() ) )
        {
          char next = body[++idx];
          switch ( next )
            {
              case 'n': rsl += '\n'; break;
              case 't': rsl += '\t'; break;
              case 'r': rsl += '\r'; break;
              default: rsl += next; break;
            }
          continue;
        }
      rsl += chr;
    }
  return rsl;
}


/* -------------------------------------------------------------------------- */

std::optional<std::string>
parseStaticAttr( std::string_view content, std::string_view attr )
{
  const std::regex attrRE( std::string( boundaryPattern ) + std::string( attr )
                             + R"re(\s*=\s*)re" + valuePattern + R"re(\s*;)re" );

  std::match_results<std::string_view::const_iterator> match;
  if ( ! std::regex_search( content.begin(), content.end(), match, attrRE ) )
    {
      return std::nullopt;
    }
  return staticValue( match[1].str() );
}


/* -------------------------------------------------------------------------- */

std::optional<std::pair<std::string, std::string>>
parseInputUrl( std::string_view content )
{
  static const std::regex urlRE(
    std::string( boundaryPattern )
      + R"re(([A-Za-z_][A-Za-z0-9_'-]*)\.url\s*=\s*)re" + valuePattern
      + R"re(\s*;)re" );

  std::match_results<std::string_view::const_iterator> match;
  if ( ! std::regex_search( content.begin(), content.end(), match, urlRE ) )
    {
      return std::nullopt;
    }
  auto url = staticValue( match[2].str() );
  if ( ! url.has_value() ) { return std::nullopt; }
  return std::make_pair( match[1].str(), *url );
}


/* -------------------------------------------------------------------------- */

/** @brief The default expression used to build a local package file. */
static std::string
defaultPackageExpr( const std::filesystem::path & file )
{
  std::string abs
    = std::filesystem::absolute( file ).lexically_normal().string();
  if ( abs.find( ' ' ) != std::string::npos )
    {
      return "pkgs.callPackage /. + \"" + abs + "\" {}";
    }
  return "pkgs.callPackage " + abs + " {}";
}


std::optional<LocalPackage>
parseLocalPackageFile( const std::filesystem::path & file )
{
  std::string content = readTextFile( file );

  auto name = parseStaticAttr( content, "pname" );
  if ( ! name.has_value() ) { name = parseStaticAttr( content, "name" ); }
  if ( ! name.has_value() )
    {
      debugLog( "skipping '" + file.string()
                + "': no static `pname' or `name' binding" );
      return std::nullopt;
    }

  LocalPackage pkg;
  pkg.name = std::move( *name );
  if ( auto input = parseInputUrl( content ); input.has_value() )
    {
      pkg.inputName = std::move( input->first );
      pkg.inputUrl  = std::move( input->second );
    }
  pkg.overlay     = parseStaticAttr( content, "overlay" );
  pkg.packageExpr = parseStaticAttr( content, "packageExpr" )
                      .value_or( defaultPackageExpr( file ) );
  return pkg;
}


/* -------------------------------------------------------------------------- */

LocalScan
scanLocalPackages( const std::filesystem::path & packagesDir )
{
  LocalScan scan;
  if ( ! std::filesystem::is_directory( packagesDir ) ) { return scan; }

  for ( const auto & entry :
        std::filesystem::directory_iterator( packagesDir ) )
    {
      const auto & path = entry.path();
      if ( entry.is_directory() )
        {
          if ( std::filesystem::exists( path / "flake.nix" ) )
            {
              scan.flakes.emplace_back(
                LocalFlake { path.filename().string() } );
            }
        }
      else if ( entry.is_regular_file() && ( path.extension() == ".nix" ) )
        {
          if ( auto pkg = parseLocalPackageFile( path ); pkg.has_value() )
            {
              scan.packages.emplace_back( std::move( *pkg ) );
            }
        }
    }

  std::sort( scan.packages.begin(),
             scan.packages.end(),
             []( const LocalPackage & lhs, const LocalPackage & rhs )
             { return lhs.name < rhs.name; } );
  std::sort( scan.flakes.begin(),
             scan.flakes.end(),
             []( const LocalFlake & lhs, const LocalFlake & rhs )
             { return lhs.name < rhs.name; } );
  return scan;
}


/* -------------------------------------------------------------------------- */

std::optional<std::filesystem::path>
findLocalDefinition( const std::filesystem::path & packagesDir,
                     const std::string &           name )
{
  auto file = packagesDir / ( name + ".nix" );
  if ( std::filesystem::is_regular_file( file ) ) { return file; }
  auto dir = packagesDir / name;
  if ( std::filesystem::exists( dir / "flake.nix" ) ) { return dir; }
  return std::nullopt;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::flake


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
