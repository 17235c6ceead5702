#pragma once

#include "skitter/endpoint.hh"
#include "skitter/fwd.hh"

#include <caf/actor.hpp>
#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/stateful_actor.hpp>

#include <optional>
#include <set>

namespace skitter::internal {

/// Mirrors the worker listing of the master into the registry of a worker.
///
/// After receiving `(up, endpoint)` for a new master, the manager subscribes
/// to the join and leave events of the master and then fetches its current
/// worker listing. On `(down, endpoint)`, the manager cancels its
/// subscriptions and drops all mirrored records. Records that the manager did
/// not create, e.g., the record for a new master, remain untouched.
/// `(publish, endpoint)` updates the local endpoint after the runtime
/// published itself on a random port.
struct registry_manager_state {
  // -- initialization ---------------------------------------------------------

  registry_manager_state(caf::event_based_actor* self, endpoint local,
                         registry_ptr reg, caf::actor resolver);

  caf::behavior make_behavior();

  // -- message handlers -------------------------------------------------------

  void master_up(const endpoint& node);

  void master_down(const endpoint& node);

  void sync_workers(const caf::actor& hdl);

  void worker_up(const endpoint_up& ev);

  void worker_down(const endpoint_down& ev);

  // -- constants --------------------------------------------------------------

  static inline const char* name = "skitter.registry-manager";

  // -- member variables -------------------------------------------------------

  caf::event_based_actor* self;

  /// The endpoint of the local worker. The mirror never contains this entry.
  endpoint local;

  /// The registry of the local runtime.
  registry_ptr reg;

  /// Maps endpoints to remote dispatchers.
  caf::actor resolver;

  /// The current master, if any.
  std::optional<endpoint> master;

  /// The dispatcher of the current master.
  caf::actor master_dispatcher;

  /// All records this manager added to the registry.
  std::set<endpoint> mirrored;
};

using registry_manager_actor = caf::stateful_actor<registry_manager_state>;

} // namespace skitter::internal
