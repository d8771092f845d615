/* ========================================================================== *
 *
 * @file nixy/core/exceptions.hh
 *
 * @brief Definitions of various `std::exception` children used for throwing
 *        errors with nice messages and typed discrimination.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

enum error_category {
  /** Indicates success or _not an error_. */
  EC_OKAY = 0,
  /**
   * Returned for any exception that doesn't have `getErrorCode()`, i.e.
   * exceptions we haven't wrapped in a custom exception.
   */
  EC_FAILURE = 1,
  /** Generic exception emitted by `nixy` routines. */
  EC_NIXY_EXCEPTION = 100,
  /** A command line argument is invalid, or a command was misused. */
  EC_INVALID_ARG,
  /** A profile name contains forbidden characters. */
  EC_INVALID_PROFILE_NAME,
  /** A named profile does not exist. */
  EC_PROFILE_NOT_FOUND,
  /** Attempted to delete the profile which is currently active. */
  EC_CANNOT_DELETE_ACTIVE_PROFILE,
  /** A platform restriction names an unsupported system. */
  EC_INVALID_PLATFORM,
  /** A `packages.json' or `nixy.json' file could not be read or written. */
  EC_STATE_FILE,
  /**
   * A `flake.nix' exists but was not generated by `nixy', or would lose
   * user edits if it were overwritten.
   */
  EC_UNMANAGED_CONFIG,
  /**
   * `nix::Error` that doesn't fall under a more specific `EC_NIX_*` category.
   */
  EC_NIX,
  /** Running a `nix' subprocess failed. */
  EC_NIX_COMMAND,
  /** Building a profile's environment failed. */
  EC_BUILD_FAILURE,
  /** The package registry has no match for a query or version. */
  EC_REGISTRY_NOT_FOUND,
  /** The package registry could not be reached. */
  EC_REGISTRY_UNREACHABLE,
  /** The package registry returned an unexpected response. */
  EC_REGISTRY_API,
  /** A flake does not provide the requested package. */
  EC_FLAKE_PACKAGE_NOT_FOUND,
  /** `nixy upgrade' was asked to update inputs that do not exist. */
  EC_INVALID_FLAKE_INPUTS,
  /** A profile has not been locked yet. */
  EC_NO_FLAKE_LOCK,
  /** Converting a legacy layout to `nixy.json' failed. */
  EC_MIGRATION,
  /** A command names a package the active profile does not have. */
  EC_PACKAGE_NOT_INSTALLED,
}; /* End enum `error_category' */


/* -------------------------------------------------------------------------- */

/** Typed exception wrapper used for misc errors. */
class NixyException : public std::exception
{

private:

  /** Additional context added when the error is thrown. */
  std::optional<std::string> contextMsg;

  /**
   * If some other exception was caught before throwing this one, @a caughtMsg
   * contains what() of that exception.
   */
  std::optional<std::string> caughtMsg;

  /** The final what() message. */
  std::string whatMsg;


public:

  /**
   * @brief Create a generic exception with a custom message.
   *
   * This constructor is NOT suitable for use by _child classes_.
   */
  explicit NixyException( std::string_view contextMsg )
    : contextMsg( contextMsg )
    , whatMsg( "general error: " + std::string( contextMsg ) )
  {}

  /**
   * @brief Create a generic exception with a custom message and information
   *        from a child error.
   *
   * This constructor is NOT suitable for use by _child classes_.
   */
  explicit NixyException( std::string_view contextMsg,
                          std::string_view caughtMsg )
    : contextMsg( contextMsg )
    , caughtMsg( caughtMsg )
    , whatMsg( "general error: " + std::string( contextMsg ) + ": "
               + std::string( caughtMsg ) )
  {}

  /**
   * @brief Directly initialize a NixyException with a custom category message,
   *        (optional) _context_, and (optional) information from a child error.
   *
   * This form is recommended for use by _child classes_ which
   * extend @a nixy::NixyException.
   *
   * @see NIXY_DEFINE_EXCEPTION
   */
  explicit NixyException( std::string_view           categoryMsg,
                          std::optional<std::string> contextMsg,
                          std::optional<std::string> caughtMsg )
    : contextMsg( contextMsg ), caughtMsg( caughtMsg ), whatMsg( categoryMsg )
  {
    if ( contextMsg.has_value() ) { this->whatMsg += ": " + ( *contextMsg ); }
    if ( caughtMsg.has_value() ) { this->whatMsg += ": " + ( *caughtMsg ); }
  }


  [[nodiscard]] virtual error_category
  getErrorCode() const noexcept
  {
    return EC_NIXY_EXCEPTION;
  }

  [[nodiscard]] std::optional<std::string>
  getContextMessage() const noexcept
  {
    return this->contextMsg;
  }

  [[nodiscard]] std::optional<std::string>
  getCaughtMessage() const noexcept
  {
    return this->caughtMsg;
  }

  [[nodiscard]] virtual std::string_view
  getCategoryMessage() const noexcept
  {
    return "general error";
  }

  /** @brief Produces an explanatory string about an exception. */
  [[nodiscard]] const char *
  what() const noexcept override
  {
    return this->whatMsg.c_str();
  }


}; /* End class `NixyException' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Convert a @a nixy::NixyException to a JSON object.
 *
 * Used for errors reported to programs rather than people.
 */
void
to_json( nlohmann::json & jto, const NixyException & err );

/**
 * @brief The message printed for @a err on a terminal.
 *
 * Usage errors show only their context, anything else is prefixed with
 * `error: `.
 */
[[nodiscard]] std::string
formatException( const NixyException & err );


/* -------------------------------------------------------------------------- */

// NOLINTBEGIN(bugprone-macro-parentheses)
//  Disable macro parentheses lint so we can use `NAME' symbol directly.

/**
 * @brief Generate a class definition with an error code and
 *        _category message_.
 *
 * The resulting class will have `NAME()`, `NAME( contextMsg )`,
 * and `NAME( contextMsg, caughtMsg )` constructors available.
 */
#define NIXY_DEFINE_EXCEPTION( NAME, ERROR_CODE, CATEGORY_MSG )              \
  class NAME : public NixyException                                          \
  {                                                                          \
  public:                                                                    \
                                                                             \
    NAME() : NixyException( CATEGORY_MSG, std::nullopt, std::nullopt ) {}    \
                                                                             \
    explicit NAME( std::string_view contextMsg )                             \
      : NixyException( ( CATEGORY_MSG ),                                     \
                       std::string( contextMsg ),                            \
                       std::nullopt )                                        \
    {}                                                                       \
                                                                             \
    explicit NAME( std::string_view contextMsg, std::string_view caughtMsg ) \
      : NixyException( ( CATEGORY_MSG ),                                     \
                       std::string( contextMsg ),                            \
                       std::string( caughtMsg ) )                            \
    {}                                                                       \
                                                                             \
    [[nodiscard]] error_category                                             \
    getErrorCode() const noexcept override                                   \
    {                                                                        \
      return ( ERROR_CODE );                                                 \
    }                                                                        \
                                                                             \
    [[nodiscard]] std::string_view                                           \
    getCategoryMessage() const noexcept override                             \
    {                                                                        \
      return ( CATEGORY_MSG );                                               \
    }                                                                        \
  };
// NOLINTEND(bugprone-macro-parentheses)


/* -------------------------------------------------------------------------- */

/**
 * @class nixy::StateFileException
 * @brief An exception thrown when `packages.json' or `nixy.json' cannot be
 *        parsed or persisted.
 * @{
 */
NIXY_DEFINE_EXCEPTION( StateFileException, EC_STATE_FILE, "state file error" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @class nixy::InvalidPlatformException
 * @brief An exception thrown when a platform restriction is not a
 *        supported system or alias.
 * @{
 */
NIXY_DEFINE_EXCEPTION( InvalidPlatformException,
                       EC_INVALID_PLATFORM,
                       "invalid platform" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @class nixy::UnmanagedConfigException
 * @brief An exception thrown when refusing to overwrite a `flake.nix' which
 *        `nixy' does not fully own.
 * @{
 */
NIXY_DEFINE_EXCEPTION( UnmanagedConfigException,
                       EC_UNMANAGED_CONFIG,
                       "refusing to modify flake" )
/** @} */


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
