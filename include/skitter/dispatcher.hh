#pragma once

#include "skitter/dispatch_result.hh"
#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"
#include "skitter/role.hh"

#include <caf/actor.hpp>
#include <caf/fwd.hpp>
#include <caf/message.hpp>

#include <vector>

namespace skitter {

/// Blocking interface to the dispatcher of a runtime. The dispatcher routes
/// role-addressed messages to the bound handlers, falling back to the default
/// handler for roles without a specific binding.
class dispatcher {
public:
  dispatcher(caf::actor_system& sys, caf::actor hdl, caf::actor resolver,
             caf::actor connector, registry_ptr reg);

  // -- binding ----------------------------------------------------------------

  /// Binds `handler` to `key`, replacing any previous binding.
  error bind(const role& key, const caf::actor& handler) const;

  /// Binds `handler` for all roles without a specific binding.
  error default_bind(const caf::actor& handler) const;

  /// Returns the actor that receives messages for `key`, an invalid handle if
  /// neither a specific nor a default handler exists.
  caf::actor get_handler(const role& key) const;

  // -- dispatching ------------------------------------------------------------

  /// Sends `request` to the local handler for `key` and waits for its answer.
  expected<caf::message> dispatch(const role& key, caf::message request) const;

  /// Sends `request` to the handler for `key` at the runtime listening on
  /// `remote` and waits for its answer.
  expected<caf::message> dispatch(const endpoint& remote, const role& key,
                                  caf::message request) const;

  /// Sends `request` to the handlers for `key` at all `remotes` concurrently
  /// and waits for all answers.
  /// @returns one result per distinct endpoint, ordered by endpoint.
  dispatch_results dispatch_many(std::vector<endpoint> remotes,
                                 const role& key, caf::message request) const;

  /// Sends `request` to the handlers for `key` at all connected workers.
  dispatch_results dispatch_workers(const role& key,
                                    caf::message request) const;

  /// Sends `request` to the handlers for `key` at all connected workers that
  /// carry the tag `what`.
  dispatch_results dispatch_tagged(const tag& what, const role& key,
                                   caf::message request) const;

  // -- properties -------------------------------------------------------------

  const caf::actor& handle() const noexcept {
    return hdl_;
  }

private:
  caf::actor_system* sys_;
  caf::actor hdl_;
  caf::actor resolver_;
  caf::actor connector_;
  registry_ptr reg_;
};

} // namespace skitter
