#pragma once

#include "skitter/defaults.hh"
#include "skitter/endpoint.hh"
#include "skitter/fwd.hh"
#include "skitter/role.hh"

#include <optional>
#include <vector>

namespace skitter {

/// Plain settings for a @ref runtime, usually extracted from a
/// @ref configuration via `to_runtime_options`.
struct runtime_options {
  /// The declared role of the local runtime.
  role local_role;

  /// The endpoint other runtimes use for reaching this runtime.
  endpoint local;

  /// The port for publishing the runtime. A value of 0 means that the runtime
  /// does not accept incoming connections on its own.
  uint16_t port = defaults::port;

  /// A master a worker connects to when starting.
  std::optional<endpoint> master;

  /// Workers a master connects to when starting.
  std::vector<endpoint> workers;

  /// Tags that a worker announces to its master.
  tag_set tags;

  /// Causes a worker to stop after losing its master.
  bool shutdown_with_master = defaults::shutdown_with_master;

  /// Causes a master to stop after losing any of its workers.
  bool shutdown_with_workers = defaults::shutdown_with_workers;
};

} // namespace skitter
