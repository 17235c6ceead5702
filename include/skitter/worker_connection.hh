#pragma once

#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"
#include "skitter/handler.hh"
#include "skitter/notifier.hh"

#include <vector>

namespace skitter {

/// Connects a master to its workers.
class worker_connection {
public:
  /// The handler a master binds for the role `worker`. Records accepted
  /// workers in the registry and announces joins and leaves via the notifier.
  class policy : public handler {
  public:
    policy(endpoint local, registry_ptr reg, skitter::notifier notify,
           bool shutdown_with_workers, shutdown_callback on_shutdown);

    /// Records the local runtime as master in the registry.
    void init() override;

    error accept_connection(const endpoint& remote, const role& remote_role,
                            const tag_set& tags) override;

    void remove_connection(const endpoint& remote) override;

    void remote_down(const endpoint& remote) override;

  private:
    /// Drops `remote` from the registry and announces its departure.
    void drop(const endpoint& remote);

    endpoint local_;
    registry_ptr reg_;
    skitter::notifier notify_;
    bool shutdown_with_workers_;
    shutdown_callback on_shutdown_;
  };

  explicit worker_connection(runtime& rt);

  /// Connects to all `workers` concurrently. Skips workers that are already
  /// connected. Blocks until every attempt either succeeded or failed.
  /// @returns a list with one entry per failed attempt.
  failure_list connect(const std::vector<endpoint>& workers);

  /// Connects to a single worker.
  error connect(const endpoint& worker);

private:
  runtime* rt_;
};

} // namespace skitter
