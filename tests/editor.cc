/* ========================================================================== *
 *
 * @file editor.cc
 *
 * @brief Tests for marker based edits of hand maintained flakes.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <iostream>
#include <regex>
#include <string>
#include <vector>

#include "nixy/core/exceptions.hh"
#include "nixy/flake/editor.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace nixy;
using namespace nixy::flake;

/* -------------------------------------------------------------------------- */

/** A flake using every region. */
static const std::string markedFlake = R"({
  description = "my packages";

  inputs = {
    nixpkgs.url = "github:NixOS/nixpkgs/nixos-unstable";
    # [nixy:custom-inputs]
    helix.url = "github:helix-editor/helix";
    # [/nixy:custom-inputs]
    # [nixy:local-inputs]
    # [/nixy:local-inputs]
  };

  outputs = { self, nixpkgs, helix }@inputs:
    let
      pkgs = nixpkgs.legacyPackages.x86_64-linux;
      system = "x86_64-linux";
    in {
      packages.x86_64-linux = rec {
        # [nixy:packages]
        ripgrep = pkgs.ripgrep;
        bat = pkgs.bat;
        # [/nixy:packages]
        # [nixy:local-packages]
        # [/nixy:local-packages]
        # [nixy:custom-packages]
        hx = inputs.helix.packages.${system}.helix;
        # [/nixy:custom-packages]
        default = pkgs.buildEnv {
          name = "env";
          paths = [
            # [nixy:env-paths]
            ripgrep
            bat
            # [/nixy:env-paths]
            # [nixy:custom-paths]
            hx
            # [/nixy:custom-paths]
          ];
        };
      };
    };
}
)";


static bool
contains( const std::string & haystack, const std::string & needle )
{
  return haystack.find( needle ) != std::string::npos;
}


/* -------------------------------------------------------------------------- */

bool
test_markers0()
{
  EXPECT_EQ( openMarker( sections::PACKAGES ), "# [nixy:packages]" );
  EXPECT_EQ( closeMarker( sections::PACKAGES ), "# [/nixy:packages]" );
  EXPECT( hasMarker( markedFlake, sections::LOCAL_INPUTS ) );
  EXPECT( hasAnyMarker( markedFlake ) );
  EXPECT( ! hasAnyMarker( "{ outputs = _: {}; }" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_insertAfterMarker0()
{
  std::string text = "a\n# [nixy:packages]\n# [/nixy:packages]\nb\n";
  EXPECT_EQ( insertAfterMarker( text, sections::PACKAGES, "  x = pkgs.x;" ),
             "a\n# [nixy:packages]\n  x = pkgs.x;\n# [/nixy:packages]\nb\n" );
  /* No trailing newline is added where there was none. */
  EXPECT_EQ( insertAfterMarker( "# [nixy:packages]", sections::PACKAGES, "x" ),
             "# [nixy:packages]\nx" );
  /* Missing markers leave the text untouched. */
  EXPECT_EQ( insertAfterMarker( "a\nb\n", sections::PACKAGES, "x" ), "a\nb\n" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_removeFromSection0()
{
  std::string text = "x = 1;\n"
                     "# [nixy:packages]\n"
                     "x = 2;\n"
                     "y = 3;\n"
                     "# [/nixy:packages]\n"
                     "x = 4;\n";
  std::string rsl  = removeFromSection( text,
                                       "# [nixy:packages]",
                                       "# [/nixy:packages]",
                                       std::regex( "^x =" ) );
  EXPECT_EQ( rsl,
             "x = 1;\n"
             "# [nixy:packages]\n"
             "y = 3;\n"
             "# [/nixy:packages]\n"
             "x = 4;\n" );

  /* The start line itself is never dropped. */
  rsl = removeFromSection( "# [nixy:packages] x\nx\n# [/nixy:packages]\n",
                           "# [nixy:packages]",
                           "# [/nixy:packages]",
                           std::regex( "x" ) );
  EXPECT_EQ( rsl, "# [nixy:packages] x\n# [/nixy:packages]\n" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_extractSectionContent0()
{
  auto lines = extractSectionContent( markedFlake, sections::ENV_PATHS );
  EXPECT( lines
          == ( std::vector<std::string> { "            ripgrep",
                                          "            bat" } ) );
  EXPECT( extractSectionContent( markedFlake, sections::LOCAL_PACKAGES )
            .empty() );
  /* An unclosed region runs to the end. */
  EXPECT( extractSectionContent( "# [nixy:packages]\na\nb", sections::PACKAGES )
          == ( std::vector<std::string> { "a", "b" } ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_isValidNixIdentifier0()
{
  EXPECT( isValidNixIdentifier( "hello" ) );
  EXPECT( isValidNixIdentifier( "_private" ) );
  EXPECT( isValidNixIdentifier( "python3-full_2" ) );
  EXPECT( ! isValidNixIdentifier( "" ) );
  EXPECT( ! isValidNixIdentifier( "3d" ) );
  EXPECT( ! isValidNixIdentifier( "-x" ) );
  EXPECT( ! isValidNixIdentifier( "a.b" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_extractPackagesFromFlake0()
{
  EXPECT( extractPackagesFromFlake( markedFlake )
          == ( std::vector<std::string> { "ripgrep", "bat", "hx" } ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_recoverState0()
{
  RecoveredState recovered = recoverStateFromMarkedFlake( markedFlake );
  EXPECT( recovered.state.packages
          == ( std::vector<std::string> { "bat", "ripgrep" } ) );
  EXPECT_EQ( recovered.state.customPackages.size(), std::size_t( 1 ) );

  const CustomPackage & hx = recovered.state.customPackages.front();
  EXPECT_EQ( hx.name, "hx" );
  EXPECT_EQ( hx.inputName, "helix" );
  EXPECT_EQ( hx.inputUrl, "github:helix-editor/helix" );
  EXPECT_EQ( hx.packageOutput, "packages" );
  EXPECT_EQ( hx.getSourceName(), "helix" );

  EXPECT_EQ( recovered.warnings.size(), std::size_t( 1 ) );
  EXPECT_EQ( recovered.warnings.front(),
             "custom package 'hx' is an alias of 'helix' in input 'helix'" );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Lines that do not match a known form are not recovered. */
bool
test_recoverState1()
{
  std::string text = R"(
# [nixy:packages]
  hello = pkgs.hello;
  py = pkgs.python3;
  weird = pkgs.callPackage ./weird.nix {};
# [/nixy:packages]
# [nixy:custom-packages]
  tool = inputs.unknown.packages.${system}.tool;
# [/nixy:custom-packages]
)";
  RecoveredState recovered = recoverStateFromMarkedFlake( text );
  EXPECT( recovered.state.packages
          == ( std::vector<std::string> { "hello" } ) );
  EXPECT( recovered.state.customPackages.empty() );
  EXPECT_EQ( recovered.warnings.size(), std::size_t( 1 ) );
  EXPECT_EQ( recovered.warnings.front(),
             "skipping custom package 'tool': no URL found for input "
             "'unknown'" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_ensureMarkers0()
{
  std::string plain = R"({
  inputs = {
    nixpkgs.url = "github:NixOS/nixpkgs/nixos-unstable";
  };
  outputs = { self, nixpkgs }: {
    packages.x86_64-linux = rec {
      default = buildEnv {
        paths = [
        ];
      };
    };
  };
}
)";
  std::string marked = ensureMarkers( plain );
  for ( std::string_view name : { sections::PACKAGES,
                                  sections::LOCAL_PACKAGES,
                                  sections::CUSTOM_PACKAGES,
                                  sections::CUSTOM_INPUTS,
                                  sections::LOCAL_INPUTS,
                                  sections::ENV_PATHS,
                                  sections::CUSTOM_PATHS } )
    {
      EXPECT( hasMarker( marked, name ) );
      EXPECT( contains( marked, closeMarker( name ) ) );
    }
  EXPECT( contains( marked,
                    "      # [nixy:packages]\n      # [/nixy:packages]\n" ) );
  EXPECT( contains( marked, "    # [/nixy:local-inputs]\n  };\n" ) );
  EXPECT( marked.find( "# [nixy:env-paths]" )
          > marked.find( "paths = [" ) );

  /* Already marked text is left alone. */
  EXPECT_EQ( ensureMarkers( marked ), marked );
  EXPECT_EQ( ensureMarkers( markedFlake ), markedFlake );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_widenOutputsSignature0()
{
  EXPECT_EQ(
    widenOutputsSignature( "outputs = { self, nixpkgs }@inputs: x", "tool" ),
    "outputs = { self, nixpkgs, tool }@inputs: x" );
  EXPECT_EQ( widenOutputsSignature( "outputs = { self, nixpkgs, ... }: x",
                                    "tool" ),
             "outputs = { self, nixpkgs, tool, ... }@inputs: x" );
  EXPECT_EQ( widenOutputsSignature( "outputs = {self,tool}@all: x", "tool" ),
             "outputs = {self,tool}@all: x" );
  EXPECT_EQ( widenOutputsSignature( "outputs = inputs: x", "tool" ),
             "outputs = inputs: x" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_addPackageIncrementally0()
{
  std::string rsl = addPackageIncrementally( markedFlake, "jq" );
  EXPECT( contains( rsl, "# [nixy:packages]\n          jq = pkgs.jq;\n" ) );
  EXPECT( contains( rsl, "# [nixy:env-paths]\n              jq\n" ) );
  EXPECT( contains( rsl, "description = \"my packages\";" ) );

  /* Present packages are not duplicated. */
  EXPECT_EQ( addPackageIncrementally( rsl, "jq" ), rsl );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_addPackageIncrementally1()
{
  CustomPackage pkg { "zls",
                      "zigtools-zls",
                      "github:zigtools/zls",
                      "packages",
                      std::nullopt,
                      std::nullopt };
  std::string rsl = addPackageIncrementally( markedFlake, pkg );
  EXPECT( contains( rsl,
                    "# [nixy:custom-inputs]\n"
                    "    zigtools-zls.url = \"github:zigtools/zls\";\n" ) );
  EXPECT( contains( rsl,
                    "outputs = { self, nixpkgs, helix, zigtools-zls }@inputs:" ) );
  EXPECT( contains(
    rsl,
    "          zls = inputs.zigtools-zls.packages.${system}.zls;\n" ) );
  EXPECT( contains( rsl, "# [nixy:custom-paths]\n              zls\n" ) );

  /* A declared input is reused. */
  CustomPackage other { "helix-term",
                        "helix",
                        "github:helix-editor/helix",
                        "packages",
                        std::nullopt,
                        std::nullopt };
  std::string again = addPackageIncrementally( markedFlake, other );
  EXPECT( ! contains( again, "    helix.url = \"github:helix-editor/helix\";\n"
                             "    helix.url" ) );
  EXPECT( contains( again, "outputs = { self, nixpkgs, helix }@inputs:" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_addPackageIncrementally2()
{
  EXPECT_THROWS( addPackageIncrementally( "{ outputs = _: {}; }", "jq" ),
                 UnmanagedConfigException );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_removePackageIncrementally0()
{
  std::string rsl = removePackageIncrementally( markedFlake, "bat" );
  EXPECT( ! contains( rsl, "bat = pkgs.bat;" ) );
  EXPECT( ! contains( rsl, "            bat\n" ) );
  EXPECT( contains( rsl, "ripgrep = pkgs.ripgrep;" ) );
  EXPECT( contains( rsl, "            ripgrep\n" ) );

  rsl = removePackageIncrementally( markedFlake, "hx" );
  EXPECT( ! contains( rsl, "hx = inputs" ) );
  EXPECT( ! contains( rsl, "            hx\n" ) );
  /* Inputs are kept. */
  EXPECT( contains( rsl, "helix.url" ) );

  EXPECT_EQ( removePackageIncrementally( markedFlake, "missing" ),
             markedFlake );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int ec = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( ec, __VA_ARGS__ )

  RUN_TEST( markers0 );
  RUN_TEST( insertAfterMarker0 );
  RUN_TEST( removeFromSection0 );
  RUN_TEST( extractSectionContent0 );
  RUN_TEST( isValidNixIdentifier0 );
  RUN_TEST( extractPackagesFromFlake0 );
  RUN_TEST( recoverState0 );
  RUN_TEST( recoverState1 );
  RUN_TEST( ensureMarkers0 );
  RUN_TEST( widenOutputsSignature0 );
  RUN_TEST( addPackageIncrementally0 );
  RUN_TEST( addPackageIncrementally1 );
  RUN_TEST( addPackageIncrementally2 );
  RUN_TEST( removePackageIncrementally0 );

  return ec;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
