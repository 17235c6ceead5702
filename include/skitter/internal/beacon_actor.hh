#pragma once

#include "skitter/internal/handshake.hh"

#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/stateful_actor.hpp>

namespace skitter::internal {

/// Answers probes with the declared role, the protocol version and the tags
/// of the local runtime. Probing never changes any state.
struct beacon_state {
  beacon_state(caf::event_based_actor* self, beacon_info info);

  caf::behavior make_behavior();

  static inline const char* name = "skitter.beacon";

  caf::event_based_actor* self;

  beacon_info info;
};

using beacon_actor = caf::stateful_actor<beacon_state>;

} // namespace skitter::internal
