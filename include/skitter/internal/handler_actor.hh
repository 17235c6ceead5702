#pragma once

#include "skitter/endpoint.hh"
#include "skitter/fwd.hh"
#include "skitter/handler.hh"
#include "skitter/role.hh"

#include <caf/actor.hpp>
#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/stateful_actor.hpp>

#include <map>

namespace skitter::internal {

/// Owns a @ref handler and serializes all calls to it. Also installs the
/// liveness monitors for accepted connections.
struct handler_state {
  // -- initialization ---------------------------------------------------------

  handler_state(caf::event_based_actor* self, role bound_role,
                handler_ptr impl);

  caf::behavior make_behavior();

  // -- message handlers -------------------------------------------------------

  caf::error accept(peer_handshake& hs);

  void remove(const endpoint& node);

  void down(const caf::down_msg& msg);

  // -- constants --------------------------------------------------------------

  static inline const char* name = "skitter.handler";

  // -- member variables -------------------------------------------------------

  /// Points to the actor that owns this state object.
  caf::event_based_actor* self;

  /// The role this handler is responsible for.
  role bound_role;

  /// The connection policy.
  handler_ptr impl;

  /// Stores the monitored dispatcher of each accepted endpoint.
  std::map<endpoint, caf::actor> peers;
};

using handler_actor = caf::stateful_actor<handler_state>;

} // namespace skitter::internal
