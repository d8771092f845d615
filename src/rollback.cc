/* ========================================================================== *
 *
 * @file rollback.cc
 *
 * @brief Undo partially applied changes when a command fails or is
 *        interrupted.
 *
 *
 * -------------------------------------------------------------------------- */

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <unistd.h>
#include <variant>

#include <nix/logging.hh>
#include <nix/signals.hh>
#include <nix/util.hh>

#include "nixy/core/util.hh"
#include "nixy/flake/generator.hh"
#include "nixy/rollback.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

namespace {

std::mutex                     contextMutex;
std::optional<RollbackContext> sharedContext;
std::atomic<bool>              completed( false );


std::optional<std::string>
readIfExists( const std::filesystem::path & path )
{
  if ( ! std::filesystem::exists( path ) ) { return std::nullopt; }
  return readTextFile( path );
}


/** @brief Put @a path back to @a original, deleting it if it was absent. */
void
restoreFile( const std::filesystem::path &      path,
             const std::optional<std::string> & original )
{
  if ( original.has_value() ) { writeFileAtomically( path, *original ); }
  else { std::filesystem::remove( path ); }
}

}  // namespace


/* -------------------------------------------------------------------------- */

RollbackContext
RollbackContext::captureLegacy( const std::filesystem::path & flakeDir,
                                const std::filesystem::path & statePath )
{
  RollbackContext ctx;
  ctx.flakeDir          = flakeDir;
  ctx.original
    = LegacySnapshot { statePath, PackageState::load( statePath ) };
  ctx.originalStateText = readIfExists( statePath );
  ctx.originalFlake     = readIfExists( flakeDir / "flake.nix" );
  if ( ! std::filesystem::exists( flakeDir ) ) { ctx.createdDir = flakeDir; }
  return ctx;
}


RollbackContext
RollbackContext::captureProfile(
  const std::filesystem::path &                flakeDir,
  const std::filesystem::path &                nixyJson,
  const NixyConfig &                           config,
  const std::string &                          profile,
  const std::optional<std::filesystem::path> & packagesDir )
{
  RollbackContext ctx;
  ctx.flakeDir = flakeDir;
  ctx.original = ProfileSnapshot { nixyJson, config, profile, packagesDir };
  ctx.originalStateText = readIfExists( nixyJson );
  ctx.originalFlake     = readIfExists( flakeDir / "flake.nix" );
  if ( ! std::filesystem::exists( flakeDir ) ) { ctx.createdDir = flakeDir; }
  return ctx;
}


/* -------------------------------------------------------------------------- */

void
setContext( RollbackContext ctx )
{
  std::lock_guard<std::mutex> lock( contextMutex );
  sharedContext = std::move( ctx );
  completed.store( false );
}


void
clearContext()
{
  std::lock_guard<std::mutex> lock( contextMutex );
  sharedContext = std::nullopt;
}


std::optional<RollbackContext>
takeContext()
{
  std::lock_guard<std::mutex>    lock( contextMutex );
  std::optional<RollbackContext> ctx = std::move( sharedContext );
  sharedContext                      = std::nullopt;
  return ctx;
}


void
markCompleted()
{
  completed.store( true );
}


bool
isCompleted()
{
  return completed.load();
}


/* -------------------------------------------------------------------------- */

void
performRollback( const RollbackContext & ctx ) noexcept
{
  /* Persisted state. */
  try
    {
      std::visit(
        [&]( const auto & snapshot )
        {
          using T = std::decay_t<decltype( snapshot )>;
          if constexpr ( std::is_same_v<T, LegacySnapshot> )
            {
              restoreFile( snapshot.statePath, ctx.originalStateText );
            }
          else { restoreFile( snapshot.nixyJson, ctx.originalStateText ); }
        },
        ctx.original );
    }
  catch ( const std::exception & err )
    {
      nix::warn( "failed to restore package state: %s", err.what() );
    }

  /* Removed local definitions, before the flake is regenerated from them. */
  for ( auto it = ctx.stashed.rbegin(); it != ctx.stashed.rend(); ++it )
    {
      try
        {
          if ( ! std::filesystem::exists( it->backup ) ) { continue; }
          std::filesystem::remove_all( it->original );
          std::filesystem::rename( it->backup, it->original );
          std::error_code ec;
          if ( std::filesystem::is_empty( it->backup.parent_path(), ec ) )
            {
              std::filesystem::remove( it->backup.parent_path(), ec );
            }
        }
      catch ( const std::exception & err )
        {
          nix::warn( "failed to restore '%s': %s",
                     it->original.string(),
                     err.what() );
        }
    }

  /* Generated flake. */
  try
    {
      if ( ctx.originalFlake.has_value() )
        {
          writeFileAtomically( ctx.flakeDir / "flake.nix", *ctx.originalFlake );
        }
      else if ( ! ctx.createdDir.has_value() )
        {
          std::visit(
            [&]( const auto & snapshot )
            {
              using T = std::decay_t<decltype( snapshot )>;
              if constexpr ( std::is_same_v<T, LegacySnapshot> )
                {
                  flake::regenerateFlake( ctx.flakeDir,
                                          snapshot.state,
                                          ctx.flakeDir / "packages" );
                }
              else
                {
                  auto found = snapshot.config.profiles.find( snapshot.profile );
                  if ( found != snapshot.config.profiles.end() )
                    {
                      flake::regenerateFlake( ctx.flakeDir,
                                              found->second,
                                              snapshot.packagesDir );
                    }
                }
            },
            ctx.original );
        }
    }
  catch ( const std::exception & err )
    {
      nix::warn( "failed to restore flake.nix: %s", err.what() );
    }

  if ( ctx.createdDir.has_value() )
    {
      std::error_code ec;
      std::filesystem::remove_all( *ctx.createdDir, ec );
      if ( ec )
        {
          nix::warn( "failed to remove '%s': %s",
                     ctx.createdDir->string(),
                     ec.message() );
        }
    }
}


/* -------------------------------------------------------------------------- */

/** @brief Apply the shared context. The caller holds @a contextMutex. */
static bool
rollbackSharedContext()
{
  if ( isCompleted() || ( ! sharedContext.has_value() ) ) { return false; }
  RollbackContext ctx = std::move( *sharedContext );
  sharedContext       = std::nullopt;

  errorLog( "Interrupted. Rolling back changes..." );
  performRollback( ctx );
  errorLog( "Rollback complete." );
  return true;
}


bool
handleInterrupt()
{
  if ( isCompleted() ) { return false; }
  std::lock_guard<std::mutex> lock( contextMutex );
  return rollbackSharedContext();
}


/* -------------------------------------------------------------------------- */

void
installSignalHandler()
{
  /* `nix' handles SIGINT on a dedicated thread and runs these callbacks.
   * The lock is never released so the main thread can not write again
   * before `_exit'. */
  static std::unique_ptr<nix::InterruptCallback> callback
    = nix::createInterruptCallback(
      []()
      {
        if ( ! isCompleted() )
          {
            contextMutex.lock();
            rollbackSharedContext();
          }
        ::_exit( 130 );
      } );
}


/* -------------------------------------------------------------------------- */

Transaction::Transaction( RollbackContext ctx )
{
  setContext( std::move( ctx ) );
}


Transaction::~Transaction()
{
  if ( this->committed ) { return; }
  std::lock_guard<std::mutex> lock( contextMutex );
  if ( ! sharedContext.has_value() ) { return; }
  RollbackContext ctx = std::move( *sharedContext );
  sharedContext       = std::nullopt;
  performRollback( ctx );
  nix::warn( "Sync failed. Reverted changes." );
}


void
Transaction::write( const std::function<void()> & step )
{
  std::lock_guard<std::mutex> lock( contextMutex );
  step();
}


void
Transaction::stash( const std::filesystem::path & path,
                    const std::filesystem::path & backup )
{
  std::lock_guard<std::mutex> lock( contextMutex );
  if ( backup.has_parent_path() )
    {
      std::filesystem::create_directories( backup.parent_path() );
    }
  std::filesystem::remove_all( backup );
  std::filesystem::rename( path, backup );
  if ( sharedContext.has_value() )
    {
      sharedContext->stashed.emplace_back( StashedPath { path, backup } );
    }
}


void
Transaction::commit()
{
  std::optional<RollbackContext> ctx;
  {
    std::lock_guard<std::mutex> lock( contextMutex );
    ctx           = std::move( sharedContext );
    sharedContext = std::nullopt;
    markCompleted();
  }
  this->committed = true;

  if ( ! ctx.has_value() ) { return; }
  for ( const auto & stashed : ctx->stashed )
    {
      std::error_code ec;
      std::filesystem::remove_all( stashed.backup, ec );
      if ( ec )
        {
          nix::warn( "failed to remove '%s': %s",
                     stashed.backup.string(),
                     ec.message() );
        }
      else if ( stashed.backup.has_parent_path()
                && std::filesystem::is_empty( stashed.backup.parent_path(),
                                              ec ) )
        {
          std::filesystem::remove( stashed.backup.parent_path(), ec );
        }
    }
}


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
