#include "skitter/internal/connector.hh"

#include "skitter/connect_failure.hh"
#include "skitter/dispatch_result.hh"
#include "skitter/version.hh"
#include "skitter/internal/logger.hh"
#include "skitter/internal/type_id.hh"

#include <caf/response_promise.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace skitter::internal {

error normalize(const endpoint& remote, error err) {
  if (!err || err.category() == caf::type_id_v<ec>)
    return err;
  return make_error(ec::unreachable, to_string(remote) + ": " + to_string(err));
}

connector_state::connector_state(caf::event_based_actor* self, endpoint local,
                                 role local_role, tag_set local_tags,
                                 caf::actor dispatcher, caf::actor resolver)
  : self(self),
    local(std::move(local)),
    local_role(std::move(local_role)),
    local_tags(std::move(local_tags)),
    dispatcher(std::move(dispatcher)),
    resolver(std::move(resolver)) {
  // nop
}

void connector_state::attempt(const endpoint& remote,
                              std::optional<role> expected_role, callback f) {
  if (local_role.empty()) {
    f(make_error(ec::no_mode, "the local runtime has no role"));
    return;
  }
  if (remote.empty()) {
    f(make_error(ec::invalid_endpoint, to_string(remote)));
    return;
  }
  if (remote == local) {
    f(make_error(ec::rejected, "cannot connect to itself"));
    return;
  }
  log::connection::debug("attempt", "try connecting to {}", remote);
  self->request(resolver, caf::infinite, atom::resolve_v, remote)
    .then(
      [this, remote, expected_role, f](caf::actor& hdl) mutable {
        probe(remote, std::move(hdl), std::move(expected_role), std::move(f));
      },
      [remote, f](caf::error& err) { f(normalize(remote, std::move(err))); });
}

void connector_state::forward(const endpoint& remote, const role& key,
                              caf::message request, dispatch_callback f) {
  self->request(resolver, caf::infinite, atom::resolve_v, remote)
    .then(
      [this, remote, key, request, f](caf::actor& hdl) mutable {
        self
          ->request(hdl, caf::infinite, atom::request_v, key,
                    std::move(request))
          .then(
            [remote, f](caf::ok_atom, caf::message& reply) {
              f(dispatch_result{remote, std::move(reply), error{}});
            },
            [remote, f](caf::error& err) {
              f(dispatch_result{remote, caf::message{},
                                normalize(remote, std::move(err))});
            });
      },
      [remote, f](caf::error& err) {
        f(dispatch_result{remote, caf::message{},
                          normalize(remote, std::move(err))});
      });
}

void connector_state::probe(const endpoint& remote, caf::actor hdl,
                            std::optional<role> expected_role, callback f) {
  self->request(hdl, caf::infinite, atom::probe_v)
    .then(
      [this, remote, hdl, expected_role, f](beacon_info& info) mutable {
        if (!version::compatible(info.protocol_version)) {
          f(make_error(ec::incompatible,
                       to_string(remote) + " speaks protocol version "
                         + std::to_string(info.protocol_version)));
          return;
        }
        if (info.node_role.empty()) {
          f(make_error(ec::no_mode, to_string(remote) + " has no role"));
          return;
        }
        if (expected_role && *expected_role != info.node_role) {
          f(make_error(ec::mode_mismatch,
                       to_string(remote) + " has role "
                         + to_string(info.node_role) + ", expected "
                         + to_string(*expected_role)));
          return;
        }
        accept_remotely(remote, std::move(hdl), std::move(info), std::move(f));
      },
      [remote, f](caf::error& err) { f(normalize(remote, std::move(err))); });
}

void connector_state::accept_remotely(const endpoint& remote, caf::actor hdl,
                                      beacon_info info, callback f) {
  auto hs = peer_handshake{local, dispatcher, local_role, local_tags};
  self
    ->request(hdl, caf::infinite, atom::accept_v, local_role, std::move(hs))
    .then(
      [this, remote, hdl, info, f]() mutable {
        accept_locally(remote, std::move(hdl), std::move(info), std::move(f));
      },
      [remote, f](caf::error& err) {
        log::connection::debug("rejected", "{} rejected the connection: {}",
                               remote, err);
        f(normalize(remote, std::move(err)));
      });
}

void connector_state::accept_locally(const endpoint& remote, caf::actor hdl,
                                     beacon_info info, callback f) {
  auto remote_role = info.node_role;
  auto hs = peer_handshake{remote, hdl, info.node_role, std::move(info.tags)};
  self
    ->request(dispatcher, caf::infinite, atom::accept_v, remote_role,
              std::move(hs))
    .then(
      [remote, remote_role, f]() {
        log::connection::verbose("connected", "connected to {} as {}", remote,
                                 remote_role);
        f(remote_role);
      },
      [this, remote, hdl, f](caf::error& err) {
        log::connection::debug("rejected-locally",
                               "local handler rejected {}: {}", remote, err);
        rollback(remote, hdl);
        f(std::move(err));
      });
}

void connector_state::rollback(const endpoint& remote, const caf::actor& hdl) {
  self->request(hdl, caf::infinite, atom::remove_v, local_role, local)
    .then([] {},
          [remote](caf::error& err) {
            log::connection::warning("rollback-failed",
                                     "failed to roll back {}: {}", remote, err);
          });
}

caf::behavior connector_state::make_behavior() {
  return {
    [this](atom::publish, endpoint& addr) { local = std::move(addr); },
    [this](atom::connect, const endpoint& remote,
           std::optional<role>& expected_role) {
      auto rp = self->make_response_promise();
      attempt(remote, std::move(expected_role),
              [rp](expected<role> res) mutable {
                if (res)
                  rp.deliver(std::move(*res));
                else
                  rp.deliver(std::move(res.error()));
              });
      return rp;
    },
    [this](atom::connect, std::vector<endpoint>& remotes,
           const role& expected_role) {
      struct bulk_state {
        caf::response_promise rp;
        size_t pending = 0;
        failure_list failures;
      };
      auto rp = self->make_response_promise();
      std::sort(remotes.begin(), remotes.end());
      remotes.erase(std::unique(remotes.begin(), remotes.end()),
                    remotes.end());
      if (remotes.empty()) {
        rp.deliver(failure_list{});
        return rp;
      }
      auto st = std::make_shared<bulk_state>();
      st->rp = rp;
      st->pending = remotes.size();
      for (auto& remote : remotes) {
        attempt(remote, expected_role, [st, remote](expected<role> res) {
          if (!res)
            st->failures.emplace_back(
              connect_failure{remote, std::move(res.error())});
          if (--st->pending == 0)
            st->rp.deliver(std::move(st->failures));
        });
      }
      return rp;
    },
    [this](atom::dispatch, std::vector<endpoint>& remotes, const role& key,
           const caf::message& request) {
      struct fan_out_state {
        caf::response_promise rp;
        size_t pending = 0;
        dispatch_results results;
      };
      auto rp = self->make_response_promise();
      std::sort(remotes.begin(), remotes.end());
      remotes.erase(std::unique(remotes.begin(), remotes.end()),
                    remotes.end());
      if (remotes.empty()) {
        rp.deliver(dispatch_results{});
        return rp;
      }
      auto st = std::make_shared<fan_out_state>();
      st->rp = rp;
      st->pending = remotes.size();
      for (auto& remote : remotes) {
        forward(remote, key, request, [st](dispatch_result res) {
          st->results.emplace_back(std::move(res));
          if (--st->pending == 0) {
            std::sort(st->results.begin(), st->results.end(),
                      [](const auto& x, const auto& y) {
                        return x.node < y.node;
                      });
            st->rp.deliver(std::move(st->results));
          }
        });
      }
      return rp;
    },
    [this](atom::remove, const endpoint& remote, const role& remote_role) {
      auto rp = self->make_response_promise();
      self
        ->request(dispatcher, caf::infinite, atom::remove_v, remote_role,
                  remote)
        .then(
          [this, rp, remote]() mutable {
            self->request(resolver, caf::infinite, atom::resolve_v, remote)
              .then(
                [this, rp, remote](caf::actor& hdl) mutable {
                  self
                    ->request(hdl, caf::infinite, atom::remove_v, local_role,
                              local)
                    .then([rp]() mutable { rp.deliver(); },
                          [rp, remote](caf::error& err) mutable {
                            rp.deliver(normalize(remote, std::move(err)));
                          });
                },
                [rp, remote](caf::error& err) mutable {
                  rp.deliver(normalize(remote, std::move(err)));
                });
          },
          [rp](caf::error& err) mutable { rp.deliver(std::move(err)); });
      return rp;
    },
  };
}

} // namespace skitter::internal
