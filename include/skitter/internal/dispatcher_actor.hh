#pragma once

#include "skitter/fwd.hh"
#include "skitter/role.hh"

#include <caf/actor.hpp>
#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/stateful_actor.hpp>

#include <unordered_map>

namespace skitter::internal {

/// Routes role-addressed messages to the bound handlers of a runtime. The
/// dispatcher is also the actor a runtime publishes: remote runtimes reach the
/// beacon, the notifier and the registry exclusively through it. Terminating
/// the dispatcher is therefore equivalent to the runtime leaving the cluster.
struct dispatcher_state {
  // -- initialization ---------------------------------------------------------

  dispatcher_state(caf::event_based_actor* self, caf::actor beacon,
                   caf::actor notifier, registry_ptr reg);

  caf::behavior make_behavior();

  // -- binding ----------------------------------------------------------------

  void bind(const role& key, caf::actor hdl);

  void default_bind(caf::actor hdl);

  /// Returns the handler for `key`, falling back to the default handler.
  caf::actor handler_for(const role& key) const;

  // -- forwarding -------------------------------------------------------------

  /// Returns the handler for `key` or delivers `unknown_mode` to `rp` if no
  /// handler exists.
  caf::actor route(const role& key, caf::response_promise& rp);

  /// Relays `xs` to `dst` and fulfills `rp` once `dst` has responded with an
  /// empty message or an error.
  template <class... Ts>
  void relay(caf::response_promise& rp, const caf::actor& dst, Ts&&... xs);

  // -- constants --------------------------------------------------------------

  static inline const char* name = "skitter.dispatcher";

  // -- member variables -------------------------------------------------------

  /// Points to the actor that owns this state object.
  caf::event_based_actor* self;

  /// Answers probes from initiators.
  caf::actor beacon;

  /// Broadcasts join and leave events of the local runtime.
  caf::actor notifier;

  /// Source for the worker listing that remote runtimes may request.
  registry_ptr reg;

  /// Maps roles to their handlers.
  std::unordered_map<role, caf::actor> handlers;

  /// Receives messages for roles without a specific binding.
  caf::actor default_handler;
};

using dispatcher_actor = caf::stateful_actor<dispatcher_state>;

} // namespace skitter::internal
