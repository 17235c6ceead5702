#pragma once

#include "skitter/endpoint.hh"

#include <caf/actor.hpp>
#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/stateful_actor.hpp>

#include <map>

namespace skitter::internal {

/// Maps endpoints to remote dispatchers by connecting to them via the CAF
/// middleman. Answers `(resolve, endpoint)` with a `caf::actor` or an error.
caf::behavior middleman_resolver(caf::event_based_actor* self);

/// Maps endpoints to dispatchers of runtimes in the same actor system. Each
/// runtime registers its dispatcher with `(publish, endpoint, caf::actor)`.
/// Entries disappear once the dispatcher terminates.
struct local_resolver_state {
  explicit local_resolver_state(caf::event_based_actor* self);

  caf::behavior make_behavior();

  static inline const char* name = "skitter.local-resolver";

  caf::event_based_actor* self;

  std::map<endpoint, caf::actor> dispatchers;
};

using local_resolver_actor = caf::stateful_actor<local_resolver_state>;

} // namespace skitter::internal
