#pragma once

#include "skitter/endpoint_event.hh"
#include "skitter/fwd.hh"

#include <caf/actor.hpp>
#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/stateful_actor.hpp>

#include <set>

namespace skitter::internal {

/// Broadcasts join and leave events to subscribed actors. Subscribers receive
/// events only for announcements after subscribing. The notifier drops all
/// subscriptions of an actor when it terminates.
struct notifier_state {
  // -- initialization ---------------------------------------------------------

  explicit notifier_state(caf::event_based_actor* self);

  caf::behavior make_behavior();

  // -- subscription management ------------------------------------------------

  void subscribe(std::set<caf::actor>& subs, caf::actor subscriber);

  void unsubscribe(std::set<caf::actor>& subs, const caf::actor& subscriber);

  /// Checks whether `subscriber` appears in any subscription set.
  bool subscribed(const caf::actor& subscriber) const;

  // -- broadcasting -----------------------------------------------------------

  void broadcast(const endpoint_up& ev);

  void broadcast(const endpoint_down& ev);

  // -- constants --------------------------------------------------------------

  static inline const char* name = "skitter.notifier";

  // -- member variables -------------------------------------------------------

  /// Points to the actor that owns this state object.
  caf::event_based_actor* self;

  /// Receivers of `endpoint_up` events.
  std::set<caf::actor> up_subscribers;

  /// Receivers of `endpoint_down` events.
  std::set<caf::actor> down_subscribers;
};

using notifier_actor = caf::stateful_actor<notifier_state>;

} // namespace skitter::internal
