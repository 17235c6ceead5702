#include "skitter/internal/registry_manager.hh"

#include "skitter/endpoint_event.hh"
#include "skitter/registry.hh"
#include "skitter/internal/connector.hh"
#include "skitter/internal/logger.hh"
#include "skitter/internal/type_id.hh"

#include <caf/actor_cast.hpp>

#include <utility>
#include <vector>

namespace skitter::internal {

registry_manager_state::registry_manager_state(caf::event_based_actor* self,
                                               endpoint local,
                                               registry_ptr reg,
                                               caf::actor resolver)
  : self(self),
    local(std::move(local)),
    reg(std::move(reg)),
    resolver(std::move(resolver)) {
  // nop
}

void registry_manager_state::master_up(const endpoint& node) {
  if (master == node)
    return;
  if (master)
    master_down(*master);
  master = node;
  self->request(resolver, caf::infinite, atom::resolve_v, node)
    .then(
      [this, node](caf::actor& hdl) {
        if (master != node)
          return;
        master_dispatcher = hdl;
        auto me = caf::actor_cast<caf::actor>(self);
        self->request(hdl, caf::infinite, atom::subscribe_v, atom::up_v, me)
          .then(
            [this, node, hdl, me] {
              self
                ->request(hdl, caf::infinite, atom::subscribe_v, atom::down_v,
                          me)
                .then(
                  [this, node, hdl] {
                    if (master == node)
                      sync_workers(hdl);
                  },
                  [node](const caf::error& err) {
                    log::registry::warning("subscribe-failed",
                                           "cannot subscribe to {}: {}", node,
                                           err);
                  });
            },
            [node](const caf::error& err) {
              log::registry::warning("subscribe-failed",
                                     "cannot subscribe to {}: {}", node, err);
            });
      },
      [node](const caf::error& err) {
        log::registry::warning("resolve-failed", "cannot reach master {}: {}",
                               node, err);
      });
}

void registry_manager_state::master_down(const endpoint& node) {
  if (master != node)
    return;
  log::registry::debug("master-down", "drop mirrored workers of {}", node);
  if (master_dispatcher) {
    auto me = caf::actor_cast<caf::actor>(self);
    self->send(master_dispatcher, atom::unsubscribe_v, atom::up_v, me);
    self->send(master_dispatcher, atom::unsubscribe_v, atom::down_v, me);
    master_dispatcher = nullptr;
  }
  master.reset();
  for (const auto& node : mirrored)
    reg->remove(node);
  mirrored.clear();
}

void registry_manager_state::sync_workers(const caf::actor& hdl) {
  self->request(hdl, caf::infinite, atom::get_v, atom::workers_v)
    .then(
      [this, hdl](std::vector<endpoint_up>& workers) {
        if (hdl != master_dispatcher)
          return;
        log::registry::debug("sync", "received {} workers from master",
                             workers.size());
        for (auto& ev : workers)
          worker_up(ev);
      },
      [](const caf::error& err) {
        log::registry::warning("sync-failed",
                               "cannot fetch worker listing: {}", err);
      });
}

void registry_manager_state::worker_up(const endpoint_up& ev) {
  if (ev.node == local || !master || ev.node == *master)
    return;
  if (reg->add(ev.node, role::worker(), ev.tags))
    mirrored.emplace(ev.node);
}

void registry_manager_state::worker_down(const endpoint_down& ev) {
  if (ev.node == local || !master || ev.node == *master)
    return;
  if (mirrored.erase(ev.node) != 0)
    reg->remove(ev.node);
}

caf::behavior registry_manager_state::make_behavior() {
  return {
    [this](atom::publish, endpoint& addr) { local = std::move(addr); },
    [this](atom::up, const endpoint& node) { master_up(node); },
    [this](atom::down, const endpoint& node) { master_down(node); },
    [this](const endpoint_up& ev) { worker_up(ev); },
    [this](const endpoint_down& ev) { worker_down(ev); },
  };
}

} // namespace skitter::internal
