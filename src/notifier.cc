#include "skitter/notifier.hh"

#include "skitter/internal/type_id.hh"

#include <caf/actor_system.hpp>
#include <caf/scoped_actor.hpp>
#include <caf/send.hpp>

#include <utility>

namespace skitter {

namespace atom = internal::atom;

namespace {

template <class Topic>
error blocking_subscribe(caf::actor_system& sys, const caf::actor& hdl,
                         Topic topic, const caf::actor& subscriber) {
  error result;
  caf::scoped_actor self{sys};
  self->request(hdl, caf::infinite, atom::subscribe_v, topic, subscriber)
    .receive([] {}, [&result](caf::error& err) { result = std::move(err); });
  return result;
}

} // namespace

notifier::notifier(caf::actor_system& sys, caf::actor hdl)
  : sys_(&sys), hdl_(std::move(hdl)) {
  // nop
}

error notifier::subscribe_up(const caf::actor& subscriber) const {
  return blocking_subscribe(*sys_, hdl_, atom::up_v, subscriber);
}

error notifier::subscribe_down(const caf::actor& subscriber) const {
  return blocking_subscribe(*sys_, hdl_, atom::down_v, subscriber);
}

void notifier::unsubscribe_up(const caf::actor& subscriber) const {
  caf::anon_send(hdl_, atom::unsubscribe_v, atom::up_v, subscriber);
}

void notifier::unsubscribe_down(const caf::actor& subscriber) const {
  caf::anon_send(hdl_, atom::unsubscribe_v, atom::down_v, subscriber);
}

void notifier::notify_up(const endpoint& node, tag_set tags) const {
  caf::anon_send(hdl_, atom::publish_v, endpoint_up{node, std::move(tags)});
}

void notifier::notify_down(const endpoint& node) const {
  caf::anon_send(hdl_, atom::publish_v, endpoint_down{node});
}

} // namespace skitter
