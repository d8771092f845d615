/* ========================================================================== *
 *
 * @file nixy/profile/command.hh
 *
 * @brief Create, switch between, list, and delete profiles.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>

#include "nixy/core/command.hh"
#include "nixy/mixins.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::profile {

/* -------------------------------------------------------------------------- */

/**
 * @brief Manage profiles.
 *
 * This command has additional subcommands:
 * - `nixy profile`
 *   + Print the active profile.
 * - `nixy profile switch [-c] NAME` ( alias `use` )
 *   + Activate and build a profile, creating it with `-c`.
 * - `nixy profile list` ( alias `ls` )
 *   + Print every profile, marking the active one.
 * - `nixy profile delete [--force] NAME` ( alias `rm` )
 *   + Delete an inactive profile and its generated files.
 */
class ProfileCommand : public EnvironmentMixin
{

private:

  command::VerboseParser parser;   /**< `profile`        parser */
  command::VerboseParser pSwitch;  /**< `profile switch` parser */
  command::VerboseParser pUse;     /**< `profile use`    parser */
  command::VerboseParser pList;    /**< `profile list`   parser */
  command::VerboseParser pLs;      /**< `profile ls`     parser */
  command::VerboseParser pDelete;  /**< `profile delete` parser */
  command::VerboseParser pRm;      /**< `profile rm`     parser */
  std::string            name;
  bool                   create = false;
  bool                   force  = false;

  void
  addSwitchArguments( argparse::ArgumentParser & parser );

  void
  addDeleteArguments( argparse::ArgumentParser & parser );

  /**
   * @brief Execute the `profile switch` routine.
   * @return `EXIT_SUCCESS` or `EXIT_FAILURE`.
   */
  int
  runSwitch();

  /**
   * @brief Execute the `profile list` routine.
   * @return `EXIT_SUCCESS` or `EXIT_FAILURE`.
   */
  int
  runList();

  /**
   * @brief Execute the `profile delete` routine.
   * @return `EXIT_SUCCESS` or `EXIT_FAILURE`.
   */
  int
  runDelete();


public:

  ProfileCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  /**
   * @brief Execute the `profile` routine.
   * @return `EXIT_SUCCESS` or `EXIT_FAILURE`.
   */
  int
  run();


}; /* End class `ProfileCommand' */


/* -------------------------------------------------------------------------- */

}  // namespace nixy::profile


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
