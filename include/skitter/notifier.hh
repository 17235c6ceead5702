#pragma once

#include "skitter/endpoint.hh"
#include "skitter/endpoint_event.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"

#include <caf/actor.hpp>
#include <caf/fwd.hpp>

namespace skitter {

/// Publishes join and leave events of the local runtime. Subscribers receive
/// @ref endpoint_up and @ref endpoint_down messages. There is no backlog: a
/// subscriber only receives events announced after its subscription took
/// effect.
class notifier {
public:
  notifier(caf::actor_system& sys, caf::actor hdl);

  // -- subscriptions ----------------------------------------------------------

  /// Subscribes `subscriber` to `endpoint_up` events. Blocks until the
  /// subscription took effect.
  error subscribe_up(const caf::actor& subscriber) const;

  /// Subscribes `subscriber` to `endpoint_down` events. Blocks until the
  /// subscription took effect.
  error subscribe_down(const caf::actor& subscriber) const;

  void unsubscribe_up(const caf::actor& subscriber) const;

  void unsubscribe_down(const caf::actor& subscriber) const;

  // -- broadcasting -----------------------------------------------------------

  /// Announces that `node` joined the cluster.
  void notify_up(const endpoint& node, tag_set tags) const;

  /// Announces that `node` left the cluster.
  void notify_down(const endpoint& node) const;

  // -- properties -------------------------------------------------------------

  const caf::actor& handle() const noexcept {
    return hdl_;
  }

private:
  caf::actor_system* sys_;
  caf::actor hdl_;
};

} // namespace skitter
