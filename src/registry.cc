/* ========================================================================== *
 *
 * @file registry.cc
 *
 * @brief Look up packages and pin versions through a package index.
 *
 *
 * -------------------------------------------------------------------------- */

#include <string>
#include <string_view>
#include <vector>

#include <nix/filetransfer.hh>
#include <nix/url.hh>
#include <nlohmann/json.hpp>

#include "nixy/builder.hh"
#include "nixy/core/command.hh"
#include "nixy/core/util.hh"
#include "nixy/registry.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

PackageSpec
parsePackageSpec( std::string_view spec )
{
  auto pos = spec.find( '@' );
  if ( pos == std::string_view::npos )
    {
      return PackageSpec { std::string( spec ), std::nullopt };
    }
  return PackageSpec { std::string( spec.substr( 0, pos ) ),
                       std::string( spec.substr( pos + 1 ) ) };
}


/* -------------------------------------------------------------------------- */

std::vector<SearchResult>
parseSearchResponse( std::string_view body )
{
  std::vector<SearchResult> results;
  try
    {
      nlohmann::json response = nlohmann::json::parse( body );
      assertIsJSONObject<RegistryApiException>( response, "search response" );

      auto found = response.find( "results" );
      if ( ( found == response.end() ) || found->is_null() ) { return results; }

      for ( const auto & entry : *found )
        {
          results.emplace_back(
            SearchResult { entry.at( "name" ).get<std::string>(),
                           entry.at( "summary" ).get<std::string>(),
                           entry.at( "last_updated" ).get<std::string>() } );
        }
    }
  catch ( nlohmann::json::exception & err )
    {
      throw RegistryApiException( "failed to parse search response",
                                  extract_json_errmsg( err ) );
    }
  return results;
}


/* -------------------------------------------------------------------------- */

ResolvedVersion
parseResolveResponse( std::string_view    body,
                      const std::string & name,
                      const std::string & version,
                      const std::string & system )
{
  nlohmann::json response;
  try
    {
      response = nlohmann::json::parse( body );
      assertIsJSONObject<RegistryApiException>( response, "resolve response" );
    }
  catch ( nlohmann::json::exception & err )
    {
      throw RegistryApiException( "failed to parse resolve response",
                                  extract_json_errmsg( err ) );
    }

  try
    {
      const auto & systems = response.at( "systems" );
      auto         found   = systems.find( system );
      if ( found == systems.end() )
        {
          throw RegistryNotFoundException(
            "failed to resolve '" + name + "@" + version + "'",
            "Package not available for system '" + system + "'" );
        }

      const auto & installable = found->at( "flake_installable" );
      return ResolvedVersion {
        response.at( "name" ).get<std::string>(),
        response.at( "version" ).get<std::string>(),
        installable.at( "attr_path" ).get<std::string>(),
        installable.at( "ref" ).at( "rev" ).get<std::string>() };
    }
  catch ( nlohmann::json::exception & err )
    {
      throw RegistryApiException( "failed to parse resolve response",
                                  extract_json_errmsg( err ) );
    }
}


/* -------------------------------------------------------------------------- */

std::string
NixhubRegistry::fetch( const std::string & url, const std::string & what ) const
{
  debugLog( "fetching " + url );
  try
    {
      nix::FileTransferRequest request( url );
      request.headers.emplace_back( "Accept", "application/json" );
      return nix::getFileTransfer()->download( request ).data;
    }
  catch ( const nix::FileTransferError & err )
    {
      switch ( err.error )
        {
          case nix::FileTransfer::NotFound:
            throw RegistryNotFoundException( "no match for " + what );
          case nix::FileTransfer::Transient:
          case nix::FileTransfer::Interrupted:
            throw RegistryUnreachableException(
              "could not contact '" + this->host + "'",
              nix::filterANSIEscapes( err.what(), true ) );
          default:
            throw RegistryApiException(
              "request for " + what + " failed",
              nix::filterANSIEscapes( err.what(), true ) );
        }
    }
}


/* -------------------------------------------------------------------------- */

std::vector<SearchResult>
NixhubRegistry::search( const std::string & query )
{
  if ( query.empty() )
    {
      throw command::InvalidArgException( "Search query cannot be empty" );
    }

  std::string url = this->host + "/v2/search?q=" + nix::percentEncode( query );
  return parseSearchResponse( this->fetch( url, "'" + query + "'" ) );
}


/* -------------------------------------------------------------------------- */

ResolvedVersion
NixhubRegistry::resolve( const std::string & name, const std::string & version )
{
  std::string url = this->host + "/v2/resolve?name=" + nix::percentEncode( name )
                    + "&version=" + nix::percentEncode( version );
  std::string body = this->fetch( url, "'" + name + "@" + version + "'" );
  return parseResolveResponse( body, name, version, currentSystem() );
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
