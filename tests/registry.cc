/* ========================================================================== *
 *
 * @file registry.cc
 *
 * @brief Tests for package index queries and response parsing.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <iostream>
#include <string>

#include "nixy/registry.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace nixy;

/* -------------------------------------------------------------------------- */

static const std::string resolveBody = R"({
  "name": "nodejs",
  "version": "20.11.1",
  "summary": "Event-driven I/O framework for the V8 JavaScript engine",
  "systems": {
    "x86_64-linux": {
      "flake_installable": {
        "ref": {
          "type": "github",
          "owner": "NixOS",
          "repo": "nixpkgs",
          "rev": "0d7fbd9b2a4a4ec8e4d0e8f5b3c6a1f2e9d8c7b6"
        },
        "attr_path": "nodejs_20"
      },
      "last_updated": "2024-03-01T00:00:00Z"
    }
  }
})";


/* -------------------------------------------------------------------------- */

bool
test_parsePackageSpec0()
{
  PackageSpec spec = parsePackageSpec( "nodejs@20" );
  EXPECT_EQ( spec.name, "nodejs" );
  EXPECT_EQ( spec.version.value(), "20" );

  spec = parsePackageSpec( "ripgrep" );
  EXPECT_EQ( spec.name, "ripgrep" );
  EXPECT( ! spec.version.has_value() );

  /* Only the first `@` separates. */
  spec = parsePackageSpec( "pkg@1.0@beta" );
  EXPECT_EQ( spec.name, "pkg" );
  EXPECT_EQ( spec.version.value(), "1.0@beta" );

  spec = parsePackageSpec( "@20" );
  EXPECT( spec.name.empty() );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_parseSearchResponse0()
{
  auto results = parseSearchResponse( R"({
  "query": "rip",
  "total_results": 2,
  "results": [
    { "name": "ripgrep", "summary": "A fast grep", "last_updated": "2024-01-01" },
    { "name": "ripgrep-all", "summary": "rg for PDFs", "last_updated": "2024-02-01" }
  ]
})" );
  EXPECT_EQ( results.size(), std::size_t( 2 ) );
  EXPECT_EQ( results[0].name, "ripgrep" );
  EXPECT_EQ( results[1].summary, "rg for PDFs" );
  EXPECT_EQ( results[1].lastUpdated, "2024-02-01" );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief No results is not an error. */
bool
test_parseSearchResponse1()
{
  EXPECT( parseSearchResponse( R"({ "results": null })" ).empty() );
  EXPECT( parseSearchResponse( R"({ "query": "x" })" ).empty() );
  EXPECT( parseSearchResponse( R"({ "results": [] })" ).empty() );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_parseSearchResponse2()
{
  EXPECT_THROWS( parseSearchResponse( "<html>" ), RegistryApiException );
  EXPECT_THROWS( parseSearchResponse( "[]" ), RegistryApiException );
  EXPECT_THROWS( parseSearchResponse( R"({ "results": [ { "name": 1 } ] })" ),
                 RegistryApiException );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_parseResolveResponse0()
{
  ResolvedVersion resolved
    = parseResolveResponse( resolveBody, "nodejs", "20", "x86_64-linux" );
  EXPECT_EQ( resolved.name, "nodejs" );
  EXPECT_EQ( resolved.version, "20.11.1" );
  EXPECT_EQ( resolved.attributePath, "nodejs_20" );
  EXPECT_EQ( resolved.commitHash, testCommit );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_parseResolveResponse1()
{
  try
    {
      (void) parseResolveResponse( resolveBody,
                                   "nodejs",
                                   "20",
                                   "aarch64-darwin" );
      EXPECT_FAIL( "expected RegistryNotFoundException" );
    }
  catch ( const RegistryNotFoundException & err )
    {
      EXPECT_EQ( err.getContextMessage().value(),
                 "failed to resolve 'nodejs@20'" );
      EXPECT_EQ( err.getCaughtMessage().value(),
                 "Package not available for system 'aarch64-darwin'" );
    }
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_parseResolveResponse2()
{
  EXPECT_THROWS( parseResolveResponse( "not json", "a", "1", "x86_64-linux" ),
                 RegistryApiException );
  EXPECT_THROWS( parseResolveResponse( R"({ "name": "a" })",
                                       "a",
                                       "1",
                                       "x86_64-linux" ),
                 RegistryApiException );
  EXPECT_THROWS(
    parseResolveResponse(
      R"({ "name": "a", "version": "1", "systems": { "x86_64-linux": {} } })",
      "a",
      "1",
      "x86_64-linux" ),
    RegistryApiException );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int ec = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( ec, __VA_ARGS__ )

  RUN_TEST( parsePackageSpec0 );
  RUN_TEST( parseSearchResponse0 );
  RUN_TEST( parseSearchResponse1 );
  RUN_TEST( parseSearchResponse2 );
  RUN_TEST( parseResolveResponse0 );
  RUN_TEST( parseResolveResponse1 );
  RUN_TEST( parseResolveResponse2 );

  return ec;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
