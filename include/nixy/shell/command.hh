/* ========================================================================== *
 *
 * @file nixy/shell/command.hh
 *
 * @brief Print shell snippets which put the environment on `PATH`.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "nixy/core/command.hh"
#include "nixy/paths.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::shell {

/* -------------------------------------------------------------------------- */

/**
 * @brief The snippet for @a shell, one of `bash`, `zsh`, `sh`, or `fish`,
 *        adding `<envLink>/bin` to `PATH`.
 *
 * A leading @a home is written as `$HOME`.
 * @throws command::InvalidArgException for any other shell.
 */
[[nodiscard]] std::string
getShellConfig( std::string_view              shell,
                const std::filesystem::path & envLink,
                const std::string &           home );


/* -------------------------------------------------------------------------- */

/** @brief `nixy config <shell>` */
class ConfigCommand
{

private:

  command::VerboseParser parser;
  std::string            shell;


public:

  Paths paths = Paths::fromEnv();

  ConfigCommand();

  [[nodiscard]] command::VerboseParser &
  getParser()
  {
    return this->parser;
  }

  int
  run();


}; /* End class `ConfigCommand' */


/* -------------------------------------------------------------------------- */

}  // namespace nixy::shell


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
