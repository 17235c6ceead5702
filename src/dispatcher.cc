#include "skitter/dispatcher.hh"

#include "skitter/registry.hh"
#include "skitter/tag_index.hh"
#include "skitter/internal/connector.hh"
#include "skitter/internal/logger.hh"
#include "skitter/internal/type_id.hh"

#include <caf/actor_system.hpp>
#include <caf/scoped_actor.hpp>

#include <algorithm>
#include <utility>

namespace skitter {

namespace atom = internal::atom;

namespace {

expected<caf::message> blocking_dispatch(caf::scoped_actor& self,
                                         const caf::actor& hdl,
                                         const role& key,
                                         caf::message request) {
  expected<caf::message> result{caf::message{}};
  self->request(hdl, caf::infinite, atom::request_v, key, std::move(request))
    .receive(
      [&result](caf::ok_atom, caf::message& reply) {
        result = std::move(reply);
      },
      [&result](caf::error& err) { result = std::move(err); });
  return result;
}

} // namespace

dispatcher::dispatcher(caf::actor_system& sys, caf::actor hdl,
                       caf::actor resolver, caf::actor connector,
                       registry_ptr reg)
  : sys_(&sys),
    hdl_(std::move(hdl)),
    resolver_(std::move(resolver)),
    connector_(std::move(connector)),
    reg_(std::move(reg)) {
  // nop
}

error dispatcher::bind(const role& key, const caf::actor& handler) const {
  caf::scoped_actor self{*sys_};
  self->send(hdl_, atom::bind_v, key, handler);
  // The dispatcher processes messages in order. Hence, an answer to the
  // subsequent request implies that the binding took effect.
  error result;
  self->request(hdl_, caf::infinite, atom::get_v, key)
    .receive([](const caf::actor&) {},
             [&result](caf::error& err) { result = std::move(err); });
  return result;
}

error dispatcher::default_bind(const caf::actor& handler) const {
  caf::scoped_actor self{*sys_};
  self->send(hdl_, atom::bind_v, atom::default__v, handler);
  error result;
  self->request(hdl_, caf::infinite, atom::get_v, role{})
    .receive([](const caf::actor&) {},
             [&result](caf::error& err) { result = std::move(err); });
  return result;
}

caf::actor dispatcher::get_handler(const role& key) const {
  caf::actor result;
  caf::scoped_actor self{*sys_};
  self->request(hdl_, caf::infinite, atom::get_v, key)
    .receive([&result](caf::actor& hdl) { result = std::move(hdl); },
             [](const caf::error& err) {
               internal::log::dispatcher::error("get-handler-failed",
                                                "failed to query handler: {}",
                                                err);
             });
  return result;
}

expected<caf::message> dispatcher::dispatch(const role& key,
                                            caf::message request) const {
  caf::scoped_actor self{*sys_};
  return blocking_dispatch(self, hdl_, key, std::move(request));
}

expected<caf::message> dispatcher::dispatch(const endpoint& remote,
                                            const role& key,
                                            caf::message request) const {
  caf::scoped_actor self{*sys_};
  caf::actor remote_hdl;
  error err;
  self->request(resolver_, caf::infinite, atom::resolve_v, remote)
    .receive([&remote_hdl](caf::actor& hdl) { remote_hdl = std::move(hdl); },
             [&err](caf::error& x) { err = std::move(x); });
  if (err)
    return internal::normalize(remote, std::move(err));
  auto result = blocking_dispatch(self, remote_hdl, key, std::move(request));
  if (!result)
    return internal::normalize(remote, std::move(result.error()));
  return result;
}

dispatch_results dispatcher::dispatch_many(std::vector<endpoint> remotes,
                                           const role& key,
                                           caf::message request) const {
  dispatch_results result;
  caf::scoped_actor self{*sys_};
  self
    ->request(connector_, caf::infinite, atom::dispatch_v, remotes, key,
              std::move(request))
    .receive([&result](dispatch_results& xs) { result = std::move(xs); },
             [&result, &remotes](caf::error& err) {
               internal::log::dispatcher::error("dispatch-many-failed",
                                                "failed to dispatch: {}", err);
               std::sort(remotes.begin(), remotes.end());
               remotes.erase(std::unique(remotes.begin(), remotes.end()),
                             remotes.end());
               for (auto& remote : remotes)
                 result.emplace_back(
                   dispatch_result{std::move(remote), caf::message{}, err});
             });
  return result;
}

dispatch_results dispatcher::dispatch_workers(const role& key,
                                              caf::message request) const {
  return dispatch_many(reg_->workers(), key, std::move(request));
}

dispatch_results dispatcher::dispatch_tagged(const tag& what, const role& key,
                                             caf::message request) const {
  auto nodes = tag_index{reg_}.workers_with(what);
  return dispatch_many(std::vector<endpoint>(nodes.begin(), nodes.end()), key,
                       std::move(request));
}

} // namespace skitter
