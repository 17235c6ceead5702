#include "skitter/internal/resolver.hh"

#include "skitter/error.hh"
#include "skitter/internal/logger.hh"
#include "skitter/internal/type_id.hh"

#include <caf/actor_cast.hpp>
#include <caf/actor_system.hpp>
#include <caf/down_msg.hpp>
#include <caf/io/middleman.hpp>
#include <caf/node_id.hpp>

#include <set>
#include <string>
#include <utility>

namespace skitter::internal {

caf::behavior middleman_resolver(caf::event_based_actor* self) {
  return {
    [self](atom::resolve, const endpoint& node) {
      auto rp = self->make_response_promise();
      log::connection::debug("resolve", "connect to {} via middleman", node);
      auto mm = self->system().middleman().actor_handle();
      self
        ->request(mm, caf::infinite, atom::connect_v, node.host, node.port)
        .then(
          [rp, node](const caf::node_id&, caf::strong_actor_ptr& ptr,
                     const std::set<std::string>&) mutable {
            if (!ptr) {
              rp.deliver(make_error(ec::unreachable,
                                    to_string(node)
                                      + " did not publish a dispatcher"));
              return;
            }
            rp.deliver(caf::actor_cast<caf::actor>(std::move(ptr)));
          },
          [rp, node](caf::error& err) mutable {
            log::connection::debug("resolve-failed", "cannot reach {}: {}",
                                   node, err);
            rp.deliver(make_error(ec::unreachable,
                                  to_string(node) + ": " + to_string(err)));
          });
      return rp;
    },
  };
}

local_resolver_state::local_resolver_state(caf::event_based_actor* self)
  : self(self) {
  // nop
}

caf::behavior local_resolver_state::make_behavior() {
  self->set_down_handler([this](const caf::down_msg& msg) {
    for (auto i = dispatchers.begin(); i != dispatchers.end();) {
      if (msg.source == i->second)
        i = dispatchers.erase(i);
      else
        ++i;
    }
  });
  return {
    [this](atom::publish, const endpoint& node, caf::actor& hdl) {
      if (auto i = dispatchers.find(node); i != dispatchers.end()) {
        self->demonitor(i->second);
        dispatchers.erase(i);
      }
      self->monitor(hdl);
      dispatchers.emplace(node, std::move(hdl));
    },
    [this](atom::resolve, const endpoint& node) -> caf::result<caf::actor> {
      if (auto i = dispatchers.find(node); i != dispatchers.end())
        return i->second;
      return make_error(ec::unreachable, "no runtime at " + to_string(node));
    },
  };
}

} // namespace skitter::internal
