#pragma once

#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"
#include "skitter/handler.hh"
#include "skitter/notifier.hh"

#include <caf/actor.hpp>

#include <optional>

namespace skitter {

/// Connects a worker to its master. A worker belongs to at most one master at
/// a time.
class master_connection {
public:
  /// The handler a worker binds for the role `master`.
  class policy : public handler {
  public:
    policy(registry_ptr reg, skitter::notifier notify,
           caf::actor registry_manager, bool shutdown_with_master,
           shutdown_callback on_shutdown);

    error accept_connection(const endpoint& remote, const role& remote_role,
                            const tag_set& tags) override;

    void remove_connection(const endpoint& remote) override;

    void remote_down(const endpoint& remote) override;

    const std::optional<endpoint>& master() const noexcept {
      return master_;
    }

  private:
    void drop(const endpoint& remote);

    registry_ptr reg_;
    skitter::notifier notify_;
    caf::actor registry_manager_;
    bool shutdown_with_master_;
    shutdown_callback on_shutdown_;
    std::optional<endpoint> master_;
  };

  explicit master_connection(runtime& rt);

  /// Connects to `master`. Does nothing if `master` is `std::nullopt`.
  error connect(const std::optional<endpoint>& master);

private:
  runtime* rt_;
};

} // namespace skitter
