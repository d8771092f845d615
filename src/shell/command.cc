/* ========================================================================== *
 *
 * @file shell/command.cc
 *
 * @brief Print shell snippets which put the environment on `PATH`.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include <nix/users.hh>

#include "nixy/core/util.hh"
#include "nixy/shell/command.hh"


/* -------------------------------------------------------------------------- */

namespace nixy::shell {

/* -------------------------------------------------------------------------- */

std::string
getShellConfig( std::string_view              shell,
                const std::filesystem::path & envLink,
                const std::string &           home )
{
  std::string bin = ( envLink / "bin" ).string();
  if ( ( ! home.empty() ) && hasPrefix( home + "/", bin ) )
    {
      bin = "$HOME" + bin.substr( home.size() );
    }

  if ( ( shell == "bash" ) || ( shell == "zsh" ) || ( shell == "sh" ) )
    {
      return "# nixy shell configuration\n"
             "export PATH=\"" + bin + ":$PATH\"\n";
    }
  if ( shell == "fish" )
    {
      return "# nixy shell configuration\n"
             "set -gx PATH " + bin + " $PATH\n";
    }
  throw command::InvalidArgException(
    "Unknown shell: " + std::string( shell )
    + "\nSupported shells: bash, zsh, sh, fish" );
}


/* -------------------------------------------------------------------------- */

ConfigCommand::ConfigCommand() : parser( "config" )
{
  this->parser.add_description( "Print shell configuration for nixy" );
  this->parser.add_epilog( "Add to your shell config:\n"
                           "  bash/zsh: eval \"$(nixy config zsh)\"\n"
                           "  fish:     nixy config fish | source" );
  this->parser.add_argument( "shell" )
    .help( "one of `bash', `zsh', `sh', or `fish'" )
    .metavar( "SHELL" )
    .action( [&]( const std::string & shell ) { this->shell = shell; } );
}


int
ConfigCommand::run()
{
  std::cout << getShellConfig( this->shell,
                               this->paths.envLink,
                               nix::getHome() );
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy::shell


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
