/* ========================================================================== *
 *
 * @file nixy/registry.hh
 *
 * @brief Look up packages and pin versions through a package index.
 *
 * The default index is Nixhub, which maps a package name and version
 * constraint to the `nixpkgs` revision and attribute path providing it.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nixy/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/**
 * @class nixy::RegistryNotFoundException
 * @brief An exception thrown when the index has no such package or version.
 * @{
 */
NIXY_DEFINE_EXCEPTION( RegistryNotFoundException,
                       EC_REGISTRY_NOT_FOUND,
                       "package not found" )
/** @} */

/**
 * @class nixy::RegistryUnreachableException
 * @brief An exception thrown when the index cannot be contacted.
 * @{
 */
NIXY_DEFINE_EXCEPTION( RegistryUnreachableException,
                       EC_REGISTRY_UNREACHABLE,
                       "unable to reach package index" )
/** @} */

/**
 * @class nixy::RegistryApiException
 * @brief An exception thrown when the index returns an unusable response.
 * @{
 */
NIXY_DEFINE_EXCEPTION( RegistryApiException,
                       EC_REGISTRY_API,
                       "package index error" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief A package name with an optional version, ex: `nodejs@20`. */
struct PackageSpec
{
  std::string                name;
  std::optional<std::string> version;
}; /* End struct `PackageSpec' */


/**
 * @brief Split @a spec on its first `@`.
 *
 * `pkg@` yields an empty version, `pkg@1.0@x` yields version `1.0@x`.
 */
[[nodiscard]] PackageSpec
parsePackageSpec( std::string_view spec );


/* -------------------------------------------------------------------------- */

struct SearchResult
{
  std::string name;
  std::string summary;
  std::string lastUpdated;
}; /* End struct `SearchResult' */


/** @brief A version pinned to a `nixpkgs` revision for one system. */
struct ResolvedVersion
{
  std::string name;
  std::string version;
  std::string attributePath;
  std::string commitHash;
}; /* End struct `ResolvedVersion' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Parse the body of a Nixhub `/v2/search` response.
 *
 * A `null` result list is treated as empty.
 * @throws RegistryApiException if @a body is not a valid response.
 */
[[nodiscard]] std::vector<SearchResult>
parseSearchResponse( std::string_view body );


/**
 * @brief Parse the body of a Nixhub `/v2/resolve` response and pick out the
 *        entry for @a system.
 *
 * @a name and @a version are the request parameters, used in messages.
 * @throws RegistryNotFoundException if @a system is not provided.
 * @throws RegistryApiException if @a body is not a valid response.
 */
[[nodiscard]] ResolvedVersion
parseResolveResponse( std::string_view    body,
                      const std::string & name,
                      const std::string & version,
                      const std::string & system );


/* -------------------------------------------------------------------------- */

/** @brief A searchable index of packages. */
class Registry
{

public:

  virtual ~Registry() = default;

  /** @throws command::InvalidArgException if @a query is empty. */
  [[nodiscard]] virtual std::vector<SearchResult>
  search( const std::string & query )
    = 0;

  /** @brief Pin @a name at @a version for the current system. */
  [[nodiscard]] virtual ResolvedVersion
  resolve( const std::string & name, const std::string & version )
    = 0;


}; /* End class `Registry' */


/* -------------------------------------------------------------------------- */

/** @brief A @a nixy::Registry backed by the Nixhub search API. */
class NixhubRegistry : public Registry
{

private:

  std::string host;

  /** @brief `GET` @a url and return the body. */
  [[nodiscard]] std::string
  fetch( const std::string & url, const std::string & what ) const;


public:

  static constexpr const char * DEFAULT_HOST = "https://search.devbox.sh";

  explicit NixhubRegistry( std::string host = DEFAULT_HOST )
    : host( std::move( host ) )
  {}

  [[nodiscard]] std::vector<SearchResult>
  search( const std::string & query ) override;

  [[nodiscard]] ResolvedVersion
  resolve( const std::string & name, const std::string & version ) override;


}; /* End class `NixhubRegistry' */


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
