/* ========================================================================== *
 *
 * @file nixy/mixins.hh
 *
 * @brief State blobs shared by commands which operate on profiles.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "nixy/builder.hh"
#include "nixy/nixy-config.hh"
#include "nixy/paths.hh"
#include "nixy/registry.hh"


/* -------------------------------------------------------------------------- */

namespace nixy {

/* -------------------------------------------------------------------------- */

/**
 * @brief Rewrites the text of a marker based `flake.nix` in place of a full
 *        regeneration.
 */
using IncrementalEdit = std::function<std::string( std::string_view )>;


/** @brief How an existing `flake.nix` is brought up to date. */
enum class FlakeUpdateKind {
  /** Render the whole file from state. */
  Regenerate,
  /** Apply an @a IncrementalEdit to the existing file. */
  Incremental
}; /* End enum `FlakeUpdateKind' */


/**
 * @brief Decide how to update @a flakeText, the current contents of a
 *        profile's `flake.nix` if it exists.
 *
 * Missing and generated files are regenerated. Marker based files are
 * edited when @a canEditIncrementally, and may only be regenerated with
 * @a force. Any other file is only regenerated with @a force.
 * @throws UnmanagedConfigException otherwise.
 */
[[nodiscard]] FlakeUpdateKind
planFlakeUpdate( const std::optional<std::string> & flakeText,
                 bool                               canEditIncrementally,
                 bool                               force );


/* -------------------------------------------------------------------------- */

/**
 * @brief Locations, the @a nixy::Builder, and the @a nixy::Registry used by
 *        a command.
 *
 * Defaults talk to `nix` and Nixhub; tests replace them.
 */
struct EnvironmentMixin
{

  Paths                     paths    = Paths::fromEnv();
  std::shared_ptr<Builder>  builder  = std::make_shared<NixBuilder>();
  std::shared_ptr<Registry> registry = std::make_shared<NixhubRegistry>();


  /** @brief Load `nixy.json`, defaulting to a single empty profile. */
  [[nodiscard]] NixyConfig
  loadConfig() const;

  /** @brief Directory holding the generated flake of profile @a name. */
  [[nodiscard]] std::filesystem::path
  getFlakeDir( const std::string & name ) const
  {
    return this->paths.getProfileDir( name );
  }

  /** @brief The global local packages directory, if it exists. */
  [[nodiscard]] std::optional<std::filesystem::path>
  getPackagesDir() const;

  /** @brief Build @a flakeDir's `default` output and link it as the env. */
  void
  buildEnvironment( const std::filesystem::path & flakeDir );

  /**
   * @brief Persist @a updated, update the flake of @a profile, and build it.
   *
   * Runs inside a @a nixy::Transaction armed with @a original: any failure,
   * including a failed build, restores `nixy.json`, `flake.nix`, and
   * @a removeLocal before the error propagates.
   *
   * @param original The store as loaded, before any modification.
   * @param updated The store to persist.
   * @param profile The profile whose flake is updated and built.
   * @param edit Used for marker based files instead of regeneration.
   * @param force Allow regenerating files which are not fully generated.
   * @param beforeBuild Run on the flake directory after it is written.
   * @param removeLocal A local definition to delete along with the change.
   *                    It is moved aside first and put back on failure.
   */
  void
  applyProfileChange(
    const NixyConfig &      original,
    const NixyConfig &      updated,
    const std::string &     profile,
    const IncrementalEdit & edit  = nullptr,
    bool                    force = false,
    const std::function<void( const std::filesystem::path & )> & beforeBuild
    = nullptr,
    const std::optional<std::filesystem::path> & removeLocal = std::nullopt );


}; /* End struct `EnvironmentMixin' */


/* -------------------------------------------------------------------------- */

}  // namespace nixy


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
