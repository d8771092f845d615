/* ========================================================================== *
 *
 * @file nixy/rollback.hh
 *
 * @brief Undo partially applied changes when a command fails or is
 *        interrupted.
 *
 * A mutating command snapshots everything it may touch into a
 * @a nixy::RollbackContext and arms a @a nixy::Transaction with it.
 * At most one context is registered at a time; it is shared with the
 * `SIGINT` handler installed by @a nixy::installSignalHandler.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nixy/nixy-config.hh"
#include "nixy/state.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/** @brief Snapshot of a legacy `packages.json`. */
struct LegacySnapshot
{
  std::filesystem::path statePath;
  PackageState          state;
}; /* End struct `LegacySnapshot' */


/** @brief Snapshot of `nixy.json` and the profile being changed. */
struct ProfileSnapshot
{
  std::filesystem::path                nixyJson;
  NixyConfig                           config;
  std::string                          profile;
  std::optional<std::filesystem::path> packagesDir;
}; /* End struct `ProfileSnapshot' */


/** @brief A path moved aside by @a nixy::Transaction::stash. */
struct StashedPath
{
  std::filesystem::path original;
  std::filesystem::path backup;
}; /* End struct `StashedPath' */


/* -------------------------------------------------------------------------- */

/** @brief Everything needed to restore the files a command may modify. */
struct RollbackContext
{

  /** Directory holding the affected `flake.nix`. */
  std::filesystem::path                         flakeDir;
  std::variant<LegacySnapshot, ProfileSnapshot> original;

  /** Exact contents of the state file, empty if it did not exist. */
  std::optional<std::string> originalStateText;

  /** Exact contents of `flake.nix`, empty if it did not exist. */
  std::optional<std::string> originalFlake;

  /** A directory created by the command, removed on restore. */
  std::optional<std::filesystem::path> createdDir;

  /** Paths removed by the command, moved back on restore. */
  std::vector<StashedPath> stashed;


  /** @brief Snapshot a legacy profile directory. */
  [[nodiscard]] static RollbackContext
  captureLegacy( const std::filesystem::path & flakeDir,
                 const std::filesystem::path & statePath );

  /** @brief Snapshot `nixy.json` and the flake of @a profile. */
  [[nodiscard]] static RollbackContext
  captureProfile( const std::filesystem::path &                flakeDir,
                  const std::filesystem::path &                nixyJson,
                  const NixyConfig &                           config,
                  const std::string &                          profile,
                  const std::optional<std::filesystem::path> & packagesDir );


}; /* End struct `RollbackContext' */


/* -------------------------------------------------------------------------- */

/** @brief Register @a ctx as the shared context and clear the done flag. */
void
setContext( RollbackContext ctx );

/** @brief Drop the shared context without applying it. */
void
clearContext();

/** @brief Remove and return the shared context. */
[[nodiscard]] std::optional<RollbackContext>
takeContext();

/** @brief Record that the current operation finished successfully. */
void
markCompleted();

[[nodiscard]] bool
isCompleted();


/**
 * @brief Restore the files described by @a ctx.
 *
 * Errors are reported as warnings; every step is attempted.
 */
void
performRollback( const RollbackContext & ctx ) noexcept;


/**
 * @brief Respond to an interrupt without terminating the process.
 *
 * Does nothing once the current operation has completed. Otherwise the
 * shared context, if any, is taken and applied.
 * Waits for a write in progress under @a nixy::Transaction::write to finish
 * first, so the restore is never overwritten by it.
 * @return `true` iff a rollback was performed.
 */
bool
handleInterrupt();


/**
 * @brief Roll back on `SIGINT` and exit with status 130.
 *
 * The shared context stays locked from the restore until the process exits.
 * Must be called after @a nixy::initNix.
 */
void
installSignalHandler();


/* -------------------------------------------------------------------------- */

/**
 * @brief Scope guard around a mutating operation.
 *
 * Construction registers the context. @a commit clears it and marks the
 * operation complete. Destroying an uncommitted transaction restores the
 * snapshot and prints a notice.
 *
 * Writes to snapshotted files should be made inside @a write so that an
 * interrupt can not restore them halfway through.
 */
class Transaction
{

private:

  bool committed = false;


public:

  explicit Transaction( RollbackContext ctx );

  Transaction( const Transaction & )            = delete;
  Transaction( Transaction && )                 = delete;
  Transaction & operator=( const Transaction & ) = delete;
  Transaction & operator=( Transaction && )      = delete;

  ~Transaction();

  /** @brief Run @a step with the shared context locked. */
  void
  write( const std::function<void()> & step );

  /**
   * @brief Move @a path to @a backup, recording it for restore.
   *
   * Committing deletes @a backup; rolling back moves it to @a path again.
   */
  void
  stash( const std::filesystem::path & path,
         const std::filesystem::path & backup );

  void
  commit();


}; /* End class `Transaction' */


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
