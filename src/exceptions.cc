/* ========================================================================== *
 *
 * @file exceptions.cc
 *
 * @brief Definitions of various `std::exception` children used for throwing
 *        errors with nice messages and typed discrimination.
 *
 *
 * -------------------------------------------------------------------------- */

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "nixy/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

void
to_json( nlohmann::json & jto, const NixyException & err )
{
  jto = {
    { "exit_code", err.getErrorCode() },
    { "category_message", err.getCategoryMessage() },
  };
  auto contextMsg = err.getContextMessage();
  auto caughtMsg  = err.getCaughtMessage();
  if ( contextMsg.has_value() ) { jto["context_message"] = *contextMsg; }
  if ( caughtMsg.has_value() ) { jto["caught_message"] = *caughtMsg; }
}


/* -------------------------------------------------------------------------- */

std::string
formatException( const NixyException & err )
{
  /* Usage errors read like the usage line they usually are. */
  if ( err.getErrorCode() == EC_INVALID_ARG )
    {
      std::string msg = err.getContextMessage().value_or( err.what() );
      if ( auto caught = err.getCaughtMessage(); caught.has_value() )
        {
          msg += "\n" + *caught;
        }
      return msg;
    }
  return "error: " + std::string( err.what() );
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
