#pragma once

#include "skitter/fwd.hh"
#include "skitter/runtime_options.hh"

#include <caf/actor_system_config.hpp>

#include <string>
#include <vector>

namespace skitter {

struct skip_init_t {};

constexpr skip_init_t skip_init = skip_init_t{};

/// Configures a @ref runtime.
///
/// The configuration draws user-provided options from three sources (in order):
/// 1. The file `skitter.conf` or the file passed via `--config-file=`.
///    Contents of this file override hard-coded defaults.
/// 2. Environment variables. Skitter currently recognizes the following
///    environment variables:
///    - `SKITTER_ROLE`: overrides `skitter.role`.
///    - `SKITTER_HOST`: overrides `skitter.host`.
///    - `SKITTER_PORT`: overrides `skitter.port`.
///    - `SKITTER_MASTER`: overrides `skitter.master` (`host:port`).
///    - `SKITTER_WORKERS`: overrides `skitter.workers` (comma-separated list
///      of `host:port` entries).
///    - `SKITTER_TAGS`: overrides `skitter.tags` (comma-separated list).
///    - `SKITTER_SHUTDOWN_WITH_MASTER` and `SKITTER_SHUTDOWN_WITH_WORKERS`:
///      override the shutdown policies. Valid values are `true` and `false`.
///    - `SKITTER_CONSOLE_VERBOSITY`: enables console output by overriding
///      `skitter.console-verbosity`. Valid values are `quiet`, `critical`,
///      `error`, `warning`, `info`, `verbose` and `debug`.
/// 3. Command line arguments (if provided).
class configuration : public caf::actor_system_config {
public:
  // --- member types ----------------------------------------------------------

  using super = caf::actor_system_config;

  // --- construction and destruction ------------------------------------------

  /// Constructs the configuration without calling `init` implicitly. Requires
  /// the user to call `init` manually.
  explicit configuration(skip_init_t);

  configuration();

  /// Constructs a configuration from command line arguments.
  configuration(int argc, char** argv);

  // --- initialization --------------------------------------------------------

  /// Reads the configuration file, environment variables and `argv`.
  /// @throws std::invalid_argument if an environment variable has an illegal
  ///         value.
  /// @throws std::runtime_error if parsing the file or `argv` fails.
  void init(int argc, char** argv);

  /// Registers the runtime type information for all message types. Safe to
  /// call multiple times.
  static void init_global_state();

  // -- properties -------------------------------------------------------------

  /// Returns the configured console verbosity, `quiet` if disabled.
  std::string console_verbosity() const;

  caf::settings dump_content() const override;
};

/// Extracts the runtime settings from `cfg`.
/// @throws std::invalid_argument if `skitter.master` or `skitter.workers`
///         contain a malformed endpoint.
runtime_options to_runtime_options(const configuration& cfg);

} // namespace skitter
