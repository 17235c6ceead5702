#include "skitter/internal/notifier_actor.hh"

#include "skitter/internal/logger.hh"
#include "skitter/internal/type_id.hh"

#include <caf/down_msg.hpp>

#include <utility>

namespace skitter::internal {

notifier_state::notifier_state(caf::event_based_actor* self) : self(self) {
  // nop
}

caf::behavior notifier_state::make_behavior() {
  self->set_down_handler([this](const caf::down_msg& msg) {
    auto pred = [&msg](const caf::actor& hdl) { return msg.source == hdl; };
    auto drop = [&pred](std::set<caf::actor>& subs) {
      for (auto i = subs.begin(); i != subs.end();) {
        if (pred(*i))
          i = subs.erase(i);
        else
          ++i;
      }
    };
    drop(up_subscribers);
    drop(down_subscribers);
    log::notifier::debug("subscriber-down",
                         "dropped all subscriptions of a terminated actor");
  });
  return {
    [this](atom::subscribe, atom::up, caf::actor& subscriber) {
      subscribe(up_subscribers, std::move(subscriber));
    },
    [this](atom::subscribe, atom::down, caf::actor& subscriber) {
      subscribe(down_subscribers, std::move(subscriber));
    },
    [this](atom::unsubscribe, atom::up, const caf::actor& subscriber) {
      unsubscribe(up_subscribers, subscriber);
    },
    [this](atom::unsubscribe, atom::down, const caf::actor& subscriber) {
      unsubscribe(down_subscribers, subscriber);
    },
    [this](atom::publish, const endpoint_up& ev) { broadcast(ev); },
    [this](atom::publish, const endpoint_down& ev) { broadcast(ev); },
  };
}

void notifier_state::subscribe(std::set<caf::actor>& subs,
                               caf::actor subscriber) {
  if (!subscriber)
    return;
  if (!subscribed(subscriber))
    self->monitor(subscriber);
  subs.emplace(std::move(subscriber));
}

void notifier_state::unsubscribe(std::set<caf::actor>& subs,
                                 const caf::actor& subscriber) {
  if (subs.erase(subscriber) != 0 && !subscribed(subscriber))
    self->demonitor(subscriber);
}

bool notifier_state::subscribed(const caf::actor& subscriber) const {
  return up_subscribers.count(subscriber) != 0
         || down_subscribers.count(subscriber) != 0;
}

void notifier_state::broadcast(const endpoint_up& ev) {
  log::notifier::info("endpoint-up", "{} joined ({} subscribers)", ev.node,
                      up_subscribers.size());
  if (auto lptr = logger())
    lptr->on_endpoint_up(ev.node, ev.tags);
  for (const auto& subscriber : up_subscribers)
    self->send(subscriber, ev);
}

void notifier_state::broadcast(const endpoint_down& ev) {
  log::notifier::info("endpoint-down", "{} left ({} subscribers)", ev.node,
                      down_subscribers.size());
  if (auto lptr = logger())
    lptr->on_endpoint_down(ev.node);
  for (const auto& subscriber : down_subscribers)
    self->send(subscriber, ev);
}

} // namespace skitter::internal
