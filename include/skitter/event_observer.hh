#pragma once

#include "skitter/event.hh"
#include "skitter/fwd.hh"

#include <memory>

namespace skitter {

/// An interface for observing internal events of a runtime.
class event_observer {
public:
  virtual ~event_observer();

  /// Called whenever a notifier announces that `node` joined the cluster.
  virtual void on_endpoint_up(const endpoint& node, const tag_set& tags);

  /// Called whenever a notifier announces that `node` left the cluster, either
  /// because of an explicit disconnect or because it became unreachable.
  virtual void on_endpoint_down(const endpoint& node);

  /// Called to notify the observer about a new event.
  /// @note This member function is called from multiple threads and thus must
  ///       be thread-safe.
  virtual void observe(event_ptr what) = 0;

  /// Returns true if the observer is interested in events of the given severity
  /// and component type. Returning false causes Skitter to not generate
  /// filtered events.
  virtual bool accepts(event::severity_level severity,
                       event::component_type component) const = 0;
};

/// A smart pointer holding an ::event_observer.
using event_observer_ptr = std::shared_ptr<event_observer>;

} // namespace skitter
