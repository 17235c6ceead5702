#include "skitter/worker_connection.hh"

#include "skitter/connect_failure.hh"
#include "skitter/exit_codes.hh"
#include "skitter/registry.hh"
#include "skitter/runtime.hh"
#include "skitter/tag_index.hh"
#include "skitter/internal/logger.hh"

#include <utility>

namespace skitter {

namespace log = internal::log;

// -- policy -------------------------------------------------------------------

worker_connection::policy::policy(endpoint local, registry_ptr reg,
                                  skitter::notifier notify,
                                  bool shutdown_with_workers,
                                  shutdown_callback on_shutdown)
  : local_(std::move(local)),
    reg_(std::move(reg)),
    notify_(std::move(notify)),
    shutdown_with_workers_(shutdown_with_workers),
    on_shutdown_(std::move(on_shutdown)) {
  // nop
}

void worker_connection::policy::init() {
  reg_->add(local_, role::master());
}

error worker_connection::policy::accept_connection(const endpoint& remote,
                                                   const role& remote_role,
                                                   const tag_set& tags) {
  if (!remote_role.is_worker())
    return make_error(ec::mode_mismatch,
                      to_string(remote) + " is not a worker");
  if (!reg_->add(remote, remote_role, tags))
    return make_error(ec::already_connected, to_string(remote));
  log::connection::info("worker-up", "connected to worker {} with tags {}",
                        remote, to_string(tags));
  notify_.notify_up(remote, tags);
  return {};
}

void worker_connection::policy::remove_connection(const endpoint& remote) {
  log::connection::info("worker-removed", "disconnected from worker {}",
                        remote);
  drop(remote);
}

void worker_connection::policy::remote_down(const endpoint& remote) {
  log::connection::warning("worker-down", "lost worker {}", remote);
  drop(remote);
  if (shutdown_with_workers_ && on_shutdown_) {
    log::connection::critical("shutdown-with-workers",
                              "shutting down after losing worker {}", remote);
    on_shutdown_(exit_codes::remote_shutdown);
  }
}

void worker_connection::policy::drop(const endpoint& remote) {
  if (reg_->remove(remote))
    notify_.notify_down(remote);
}

// -- connection management ----------------------------------------------------

worker_connection::worker_connection(runtime& rt) : rt_(&rt) {
  // nop
}

failure_list worker_connection::connect(const std::vector<endpoint>& workers) {
  std::vector<endpoint> pending;
  auto& reg = rt_->registry();
  for (const auto& node : workers) {
    if (reg.role_of(node) == role::worker())
      log::connection::debug("skip-worker", "already connected to {}", node);
    else
      pending.emplace_back(node);
  }
  if (pending.empty())
    return {};
  auto failures = rt_->connect(std::move(pending), role::worker());
  for (const auto& failure : failures)
    log::connection::warning("connect-worker-failed",
                             "failed to connect to worker {}: {}",
                             failure.node, failure.reason);
  return failures;
}

error worker_connection::connect(const endpoint& worker) {
  auto failures = connect(std::vector<endpoint>{worker});
  if (failures.empty())
    return {};
  return std::move(failures.front().reason);
}

} // namespace skitter
