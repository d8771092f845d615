/* ========================================================================== *
 *
 * @file nixy/packages/command.hh
 *
 * @brief Commands which change or inspect the packages of the active
 *        profile.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nixy/core/command.hh"
#include "nixy/mixins.hh"
#include "nixy/platform.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::packages {

/* -------------------------------------------------------------------------- */

/**
 * @class nixy::packages::InvalidFlakeInputsException
 * @brief An exception thrown when `upgrade` names inputs that do not exist.
 * @{
 */
NIXY_DEFINE_EXCEPTION( InvalidFlakeInputsException,
                       EC_INVALID_FLAKE_INPUTS,
                       "invalid flake inputs" )
/** @} */

/**
 * @class nixy::packages::PackageNotInstalledException
 * @brief An exception thrown when the active profile lacks a package.
 * @{
 */
NIXY_DEFINE_EXCEPTION( PackageNotInstalledException,
                       EC_PACKAGE_NOT_INSTALLED,
                       "package not installed" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @brief Add a package to the active profile.
 *
 * `nixy install <pkg>[@version]` pins a `nixpkgs` package through the
 * registry, `nixy install <flake-url>[#pkg]` adds a package from any flake.
 */
class InstallCommand : public EnvironmentMixin
{

private:

  command::VerboseParser   parser;
  command::VerboseParser   aliasParser; /**< `add` */
  std::string              spec;
  std::vector<std::string> platforms;
  bool                     force = false;

  void
  addArguments( argparse::ArgumentParser & parser );

  /** @brief Install from the registry. */
  int
  runResolved( const std::optional<Platforms> & platforms );

  /** @brief Install from a flake URL. */
  int
  runFlake( const std::optional<Platforms> & platforms );


public:

  InstallCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  [[nodiscard]] command::VerboseParser &
  getAliasParser()
  {
    return this->aliasParser;
  }

  /**
   * @brief Execute the `install` routine.
   * @return `EXIT_SUCCESS` or `EXIT_FAILURE`.
   */
  int
  run();


}; /* End class `InstallCommand' */


/* -------------------------------------------------------------------------- */

/** @brief Remove a package, and its local definition, from the profile. */
class UninstallCommand : public EnvironmentMixin
{

private:

  command::VerboseParser parser;
  command::VerboseParser aliasParser; /**< `remove` */
  std::string            package;
  bool                   force = false;

  void
  addArguments( argparse::ArgumentParser & parser );


public:

  UninstallCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  [[nodiscard]] command::VerboseParser &
  getAliasParser()
  {
    return this->aliasParser;
  }

  int
  run();


}; /* End class `UninstallCommand' */


/* -------------------------------------------------------------------------- */

/** @brief Print the packages of the active profile, local ones included. */
class ListCommand : public EnvironmentMixin
{

private:

  command::VerboseParser parser;
  command::VerboseParser aliasParser; /**< `ls` */


public:

  ListCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  [[nodiscard]] command::VerboseParser &
  getAliasParser()
  {
    return this->aliasParser;
  }

  /** @brief Sorted names of every package the active profile provides. */
  [[nodiscard]] std::vector<std::string>
  getPackageNames() const;

  int
  run();


}; /* End class `ListCommand' */


/* -------------------------------------------------------------------------- */

/** @brief Search the registry for packages. */
class SearchCommand : public EnvironmentMixin
{

private:

  command::VerboseParser parser;
  std::string            query;


public:

  SearchCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  int
  run();


}; /* End class `SearchCommand' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Re-resolve pinned packages and update flake inputs.
 *
 * Without arguments every pinned package is re-resolved and every input is
 * updated. Arguments naming pinned packages re-resolve those packages, any
 * other argument must be an input of the profile's `flake.lock`.
 */
class UpgradeCommand : public EnvironmentMixin
{

private:

  command::VerboseParser   parser;
  std::vector<std::string> inputs;

  /**
   * @brief Re-resolve @a names in @a state.
   *
   * Registry failures are reported as warnings.
   * @return `true` iff any package changed.
   */
  bool
  reresolve( PackageState & state, const std::vector<std::string> & names );


public:

  UpgradeCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  int
  run();


}; /* End class `UpgradeCommand' */


/* -------------------------------------------------------------------------- */

/** @brief Regenerate a missing flake and build the active profile. */
class SyncCommand : public EnvironmentMixin
{

private:

  command::VerboseParser parser;


public:

  SyncCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  int
  run();


}; /* End class `SyncCommand' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Print the file defining a package of the active profile.
 *
 * Local definitions are reported first since they shadow everything else.
 * Flake packages report the `flake.nix` of their input and `nixpkgs`
 * packages the file named by `meta.position`.
 */
class FileCommand : public EnvironmentMixin
{

private:

  command::VerboseParser parser;
  std::string            package;


public:

  FileCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  /** @throws PackageNotInstalledException if nothing provides the package. */
  [[nodiscard]] std::filesystem::path
  getSourcePath() const;

  int
  run();


}; /* End class `FileCommand' */


/* -------------------------------------------------------------------------- */

}  // namespace nixy::packages


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
