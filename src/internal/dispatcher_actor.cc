#include "skitter/internal/dispatcher_actor.hh"

#include "skitter/registry.hh"
#include "skitter/tag_index.hh"
#include "skitter/internal/logger.hh"
#include "skitter/internal/type_id.hh"

#include <caf/down_msg.hpp>
#include <caf/response_promise.hpp>

#include <utility>

namespace skitter::internal {

dispatcher_state::dispatcher_state(caf::event_based_actor* self,
                                   caf::actor beacon, caf::actor notifier,
                                   registry_ptr reg)
  : self(self),
    beacon(std::move(beacon)),
    notifier(std::move(notifier)),
    reg(std::move(reg)) {
  // nop
}

void dispatcher_state::bind(const role& key, caf::actor hdl) {
  log::dispatcher::debug("bind", "bind handler for role {}", key);
  if (auto i = handlers.find(key); i != handlers.end()) {
    if (i->second == hdl)
      return;
    // Last writer wins. The previous handler keeps running until its owner
    // terminates it.
    self->demonitor(i->second);
    i->second = hdl;
  } else {
    handlers.emplace(key, hdl);
  }
  self->monitor(hdl);
}

void dispatcher_state::default_bind(caf::actor hdl) {
  log::dispatcher::debug("default-bind", "bind default handler");
  if (default_handler)
    self->demonitor(default_handler);
  default_handler = std::move(hdl);
  self->monitor(default_handler);
}

caf::actor dispatcher_state::handler_for(const role& key) const {
  if (auto i = handlers.find(key); i != handlers.end())
    return i->second;
  return default_handler;
}

caf::actor dispatcher_state::route(const role& key,
                                   caf::response_promise& rp) {
  auto hdl = handler_for(key);
  if (!hdl) {
    log::dispatcher::debug("unknown-mode", "no handler for role {}", key);
    rp.deliver(make_error(ec::unknown_mode, "no handler for role "
                                              + to_string(key)));
  }
  return hdl;
}

template <class... Ts>
void dispatcher_state::relay(caf::response_promise& rp, const caf::actor& dst,
                             Ts&&... xs) {
  self->request(dst, caf::infinite, std::forward<Ts>(xs)...)
    .then([rp]() mutable { rp.deliver(); },
          [rp](caf::error& err) mutable { rp.deliver(std::move(err)); });
}

caf::behavior dispatcher_state::make_behavior() {
  self->set_down_handler([this](const caf::down_msg& msg) {
    for (auto i = handlers.begin(); i != handlers.end();) {
      if (msg.source == i->second) {
        log::dispatcher::debug("handler-down", "lost handler for role {}",
                               i->first);
        i = handlers.erase(i);
      } else {
        ++i;
      }
    }
    if (msg.source == default_handler) {
      log::dispatcher::debug("handler-down", "lost default handler");
      default_handler = nullptr;
    }
  });
  return {
    // -- binding --------------------------------------------------------------
    [this](atom::bind, const role& key, caf::actor& hdl) {
      bind(key, std::move(hdl));
    },
    [this](atom::bind, atom::default_, caf::actor& hdl) {
      default_bind(std::move(hdl));
    },
    [this](atom::get, const role& key) { return handler_for(key); },
    // -- role-addressed messages ----------------------------------------------
    [this](atom::accept, const role& key, peer_handshake& hs) {
      auto rp = self->make_response_promise();
      if (auto hdl = route(key, rp))
        relay(rp, hdl, atom::accept_v, std::move(hs));
      return rp;
    },
    [this](atom::remove, const role& key, const endpoint& node) {
      auto rp = self->make_response_promise();
      if (auto hdl = route(key, rp))
        relay(rp, hdl, atom::remove_v, node);
      return rp;
    },
    [this](atom::request, const role& key, caf::message& msg) {
      auto rp = self->make_response_promise();
      if (auto hdl = route(key, rp))
        self->request(hdl, caf::infinite, atom::request_v, std::move(msg))
          .then(
            [rp](caf::ok_atom, caf::message& reply) mutable {
              rp.deliver(caf::ok_atom_v, std::move(reply));
            },
            [rp](caf::error& err) mutable { rp.deliver(std::move(err)); });
      return rp;
    },
    // -- services of the runtime ----------------------------------------------
    [this](atom::probe) {
      auto rp = self->make_response_promise();
      self->request(beacon, caf::infinite, atom::probe_v)
        .then([rp](beacon_info& info) mutable { rp.deliver(std::move(info)); },
              [rp](caf::error& err) mutable { rp.deliver(std::move(err)); });
      return rp;
    },
    [this](atom::subscribe, atom::up, caf::actor& subscriber) {
      auto rp = self->make_response_promise();
      relay(rp, notifier, atom::subscribe_v, atom::up_v, std::move(subscriber));
      return rp;
    },
    [this](atom::subscribe, atom::down, caf::actor& subscriber) {
      auto rp = self->make_response_promise();
      relay(rp, notifier, atom::subscribe_v, atom::down_v,
            std::move(subscriber));
      return rp;
    },
    [this](atom::unsubscribe, atom::up, caf::actor& subscriber) {
      self->send(notifier, atom::unsubscribe_v, atom::up_v,
                 std::move(subscriber));
    },
    [this](atom::unsubscribe, atom::down, caf::actor& subscriber) {
      self->send(notifier, atom::unsubscribe_v, atom::down_v,
                 std::move(subscriber));
    },
    [this](atom::get, atom::workers) {
      std::vector<endpoint_up> result;
      for (auto& [node, tags] : tag_index{reg}.of_all_workers())
        result.emplace_back(endpoint_up{node, std::move(tags)});
      return result;
    },
  };
}

} // namespace skitter::internal
