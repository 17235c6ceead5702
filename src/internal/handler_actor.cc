#include "skitter/internal/handler_actor.hh"

#include "skitter/internal/logger.hh"
#include "skitter/internal/type_id.hh"

#include <caf/down_msg.hpp>

#include <utility>

namespace skitter::internal {

handler_state::handler_state(caf::event_based_actor* self, role bound_role,
                             handler_ptr impl)
  : self(self), bound_role(std::move(bound_role)), impl(std::move(impl)) {
  // nop
}

caf::behavior handler_state::make_behavior() {
  if (!impl) {
    log::handler::error("no-policy",
                        "spawned a handler for role {} without policy",
                        bound_role);
    return {};
  }
  impl->init();
  self->set_down_handler([this](const caf::down_msg& msg) { down(msg); });
  return {
    [this](atom::accept, peer_handshake& hs) -> caf::result<void> {
      if (auto err = accept(hs))
        return err;
      return caf::unit;
    },
    [this](atom::remove, const endpoint& node) { remove(node); },
    [this](atom::request, const caf::message& msg)
      -> caf::result<caf::ok_atom, caf::message> {
      auto res = impl->handle_request(msg);
      if (!res)
        return std::move(res.error());
      return {caf::ok_atom_v, std::move(*res)};
    },
  };
}

caf::error handler_state::accept(peer_handshake& hs) {
  if (auto err = impl->accept_connection(hs.node, hs.node_role, hs.tags)) {
    log::handler::debug("reject", "{} handler rejected {}: {}", bound_role,
                        hs.node, err);
    return err;
  }
  log::handler::debug("accept", "{} handler accepted {}", bound_role, hs.node);
  if (hs.dispatcher) {
    // Replace a stale monitor if the handler accepted the same endpoint again.
    if (auto i = peers.find(hs.node); i != peers.end()) {
      self->demonitor(i->second);
      peers.erase(i);
    }
    self->monitor(hs.dispatcher);
    peers.emplace(hs.node, std::move(hs.dispatcher));
  }
  return {};
}

void handler_state::remove(const endpoint& node) {
  auto i = peers.find(node);
  if (i == peers.end()) {
    log::handler::debug("remove-unknown",
                        "{} handler ignores remove for unknown endpoint {}",
                        bound_role, node);
    return;
  }
  self->demonitor(i->second);
  peers.erase(i);
  impl->remove_connection(node);
}

void handler_state::down(const caf::down_msg& msg) {
  for (auto i = peers.begin(); i != peers.end(); ++i) {
    if (msg.source == i->second) {
      auto node = i->first;
      peers.erase(i);
      log::handler::debug("remote-down", "{} handler lost {}: {}", bound_role,
                          node, msg.reason);
      impl->remote_down(node);
      return;
    }
  }
}

} // namespace skitter::internal
