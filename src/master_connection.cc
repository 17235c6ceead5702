#include "skitter/master_connection.hh"

#include "skitter/exit_codes.hh"
#include "skitter/registry.hh"
#include "skitter/runtime.hh"
#include "skitter/tag_index.hh"
#include "skitter/internal/logger.hh"
#include "skitter/internal/type_id.hh"

#include <caf/send.hpp>

#include <utility>

namespace skitter {

namespace atom = internal::atom;

namespace log = internal::log;

// -- policy -------------------------------------------------------------------

master_connection::policy::policy(registry_ptr reg, skitter::notifier notify,
                                  caf::actor registry_manager,
                                  bool shutdown_with_master,
                                  shutdown_callback on_shutdown)
  : reg_(std::move(reg)),
    notify_(std::move(notify)),
    registry_manager_(std::move(registry_manager)),
    shutdown_with_master_(shutdown_with_master),
    on_shutdown_(std::move(on_shutdown)) {
  // nop
}

error master_connection::policy::accept_connection(const endpoint& remote,
                                                   const role& remote_role,
                                                   const tag_set& tags) {
  if (master_) {
    if (*master_ == remote)
      return make_error(ec::already_connected, to_string(remote));
    return make_error(ec::has_master, "already connected to master "
                                        + to_string(*master_));
  }
  if (!remote_role.is_master())
    return make_error(ec::mode_mismatch,
                      to_string(remote) + " is not a master");
  if (!reg_->add(remote, remote_role, tags))
    return make_error(ec::already_connected, to_string(remote));
  master_ = remote;
  log::connection::info("master-up", "connected to master {}", remote);
  notify_.notify_up(remote, tags);
  if (registry_manager_)
    caf::anon_send(registry_manager_, atom::up_v, remote);
  return {};
}

void master_connection::policy::remove_connection(const endpoint& remote) {
  log::connection::info("master-removed", "disconnected from master {}",
                        remote);
  drop(remote);
}

void master_connection::policy::remote_down(const endpoint& remote) {
  log::connection::warning("master-down", "lost master {}", remote);
  drop(remote);
  if (shutdown_with_master_ && on_shutdown_) {
    log::connection::critical("shutdown-with-master",
                              "shutting down after losing master {}", remote);
    on_shutdown_(exit_codes::remote_shutdown);
  }
}

void master_connection::policy::drop(const endpoint& remote) {
  if (master_ != remote)
    return;
  master_.reset();
  if (reg_->remove(remote))
    notify_.notify_down(remote);
  if (registry_manager_)
    caf::anon_send(registry_manager_, atom::down_v, remote);
}

// -- connection management ----------------------------------------------------

master_connection::master_connection(runtime& rt) : rt_(&rt) {
  // nop
}

error master_connection::connect(const std::optional<endpoint>& master) {
  if (!master)
    return {};
  if (auto current = rt_->registry().master()) {
    if (*current == *master)
      return make_error(ec::already_connected, to_string(*master));
    return make_error(ec::has_master,
                      "already connected to master " + to_string(*current));
  }
  auto res = rt_->connect(*master, role::master());
  if (!res) {
    log::connection::warning("connect-master-failed",
                             "failed to connect to master {}: {}", *master,
                             res.error());
    return std::move(res.error());
  }
  return {};
}

} // namespace skitter
