#pragma once

#include "skitter/dispatch_result.hh"
#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"
#include "skitter/internal/handshake.hh"
#include "skitter/role.hh"

#include <caf/actor.hpp>
#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/message.hpp>
#include <caf/stateful_actor.hpp>

#include <functional>
#include <optional>

namespace skitter::internal {

/// Maps errors of the transport layer to `ec::unreachable` and passes errors
/// from the `ec` category through unchanged.
error normalize(const endpoint& remote, error err);

/// Runs the initiator side of the connection protocol for a single runtime.
///
/// Each attempt resolves the dispatcher of the candidate, probes its beacon,
/// asks the remote handler for the local role to accept the local runtime and
/// finally asks the local handler for the remote role to accept the candidate.
/// If the local handler rejects, the connector rolls back the remote side.
///
/// Accepted messages:
/// - `(publish, endpoint)` changes the endpoint announced to remote runtimes.
/// - `(connect, endpoint, std::optional<role>) -> role`
/// - `(connect, std::vector<endpoint>, role) -> std::vector<connect_failure>`
/// - `(dispatch, std::vector<endpoint>, role, caf::message)
///   -> std::vector<dispatch_result>` sends a request to the handlers for the
///   role on all endpoints concurrently.
/// - `(remove, endpoint, role)` disconnects from a connected endpoint.
struct connector_state {
  // -- member types -----------------------------------------------------------

  using callback = std::function<void(expected<role>)>;

  using dispatch_callback = std::function<void(dispatch_result)>;

  // -- initialization ---------------------------------------------------------

  connector_state(caf::event_based_actor* self, endpoint local,
                  role local_role, tag_set local_tags, caf::actor dispatcher,
                  caf::actor resolver);

  caf::behavior make_behavior();

  // -- connection protocol ----------------------------------------------------

  /// Starts a new connection attempt. Calls `f` exactly once.
  void attempt(const endpoint& remote, std::optional<role> expected_role,
               callback f);

  void probe(const endpoint& remote, caf::actor hdl,
             std::optional<role> expected_role, callback f);

  void accept_remotely(const endpoint& remote, caf::actor hdl,
                       beacon_info info, callback f);

  void accept_locally(const endpoint& remote, caf::actor hdl,
                      beacon_info info, callback f);

  /// Asks the remote handler to forget the local runtime.
  void rollback(const endpoint& remote, const caf::actor& hdl);

  // -- remote execution -------------------------------------------------------

  /// Sends `request` to the handler for `key` at `remote`. Calls `f` exactly
  /// once.
  void forward(const endpoint& remote, const role& key, caf::message request,
               dispatch_callback f);

  // -- constants --------------------------------------------------------------

  static inline const char* name = "skitter.connector";

  // -- member variables -------------------------------------------------------

  caf::event_based_actor* self;

  /// The endpoint we announce to remote runtimes.
  endpoint local;

  /// The declared role of the local runtime.
  role local_role;

  /// The tags of the local runtime.
  tag_set local_tags;

  /// The dispatcher of the local runtime.
  caf::actor dispatcher;

  /// Maps endpoints to remote dispatchers.
  caf::actor resolver;
};

using connector_actor = caf::stateful_actor<connector_state>;

} // namespace skitter::internal
