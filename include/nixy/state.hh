/* ========================================================================== *
 *
 * @file nixy/state.hh
 *
 * @brief The set of packages requested for a single profile.
 *
 * Packages come in three categories:
 *   - plain names bound to the default `nixpkgs` input ( legacy ),
 *   - packages resolved to a pinned `nixpkgs` revision by the registry,
 *   - packages taken from an arbitrary flake input.
 *
 * A name belongs to at most one category at any time.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "nixy/platform.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/** @brief Current schema version of a @a nixy::PackageState. */
constexpr unsigned PACKAGE_STATE_VERSION = 2;


/* -------------------------------------------------------------------------- */

/** @brief A package pinned to a `nixpkgs` revision and attribute path. */
struct ResolvedPackage
{

  std::string                name;
  /** The version the user asked for, ex: `20` from `nodejs@20`. */
  std::optional<std::string> versionSpec;
  std::string                resolvedVersion;
  std::string                attributePath;
  std::string                commitHash;
  std::optional<Platforms>   platforms;

  [[nodiscard]] bool
  operator==( const ResolvedPackage & other ) const
    = default;


}; /* End struct `ResolvedPackage' */


void
from_json( const nlohmann::json & jfrom, ResolvedPackage & pkg );

void
to_json( nlohmann::json & jto, const ResolvedPackage & pkg );


/* -------------------------------------------------------------------------- */

/** @brief A package provided by a flake other than `nixpkgs`. */
struct CustomPackage
{

  std::string                name;
  std::string                inputName;
  std::string                inputUrl;
  /** Either `packages` or `legacyPackages`. */
  std::string                packageOutput;
  /** Attribute name in the source flake when it differs from @a name. */
  std::optional<std::string> sourceName;
  std::optional<Platforms>   platforms;

  /** @brief The attribute name to look up in the input. */
  [[nodiscard]] const std::string &
  getSourceName() const
  {
    return this->sourceName.has_value() ? *this->sourceName : this->name;
  }

  [[nodiscard]] bool
  operator==( const CustomPackage & other ) const
    = default;


}; /* End struct `CustomPackage' */


void
from_json( const nlohmann::json & jfrom, CustomPackage & pkg );

void
to_json( nlohmann::json & jto, const CustomPackage & pkg );


/* -------------------------------------------------------------------------- */

/**
 * @brief Package list for one profile.
 *
 * This is the contents of a legacy `packages.json` file, and of each entry
 * in `nixy.json`'s `profiles` object.
 */
struct PackageState
{

  unsigned                     version = PACKAGE_STATE_VERSION;
  std::vector<std::string>     packages;
  std::vector<ResolvedPackage> resolvedPackages;
  std::vector<CustomPackage>   customPackages;


  /**
   * @brief Load a state file.
   *
   * A missing file yields an empty state.
   * Files from older schema versions are upgraded in memory only.
   * @throws StateFileException if the file cannot be read or parsed.
   */
  [[nodiscard]] static PackageState
  load( const std::filesystem::path & path );

  /** @brief Atomically write the state to @a path. */
  void
  save( const std::filesystem::path & path ) const;

  /** @brief Add a plain `nixpkgs` package, evicting other categories. */
  void
  addLegacyPackage( const std::string & name );

  /** @brief Add or replace a resolved package, evicting other categories. */
  void
  addResolvedPackage( ResolvedPackage pkg );

  /** @brief Add or replace a custom package, evicting other categories. */
  void
  addCustomPackage( CustomPackage pkg );

  /**
   * @brief Remove @a name from every category.
   * @return `true` iff anything was removed.
   */
  bool
  removePackage( std::string_view name );

  [[nodiscard]] bool
  hasPackage( std::string_view name ) const;

  [[nodiscard]] bool
  isLegacyPackage( std::string_view name ) const;

  [[nodiscard]] std::optional<ResolvedPackage>
  getResolvedPackage( std::string_view name ) const;

  /** @brief Names from all three categories, sorted. */
  [[nodiscard]] std::vector<std::string>
  allPackageNames() const;

  [[nodiscard]] bool
  empty() const
  {
    return this->packages.empty() && this->resolvedPackages.empty()
           && this->customPackages.empty();
  }

  [[nodiscard]] bool
  operator==( const PackageState & other ) const
    = default;


private:

  /** @brief Remove @a name from all categories without reporting. */
  void
  evict( std::string_view name );


}; /* End struct `PackageState' */

/** @brief Profile entries of `nixy.json` share the state schema. */
using ProfileConfig = PackageState;


void
from_json( const nlohmann::json & jfrom, PackageState & state );

void
to_json( nlohmann::json & jto, const PackageState & state );


/* -------------------------------------------------------------------------- */

/** @brief Location of `packages.json` inside a legacy profile directory. */
[[nodiscard]] std::filesystem::path
getStatePath( const std::filesystem::path & profileDir );


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
