#pragma once

#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"
#include "skitter/role.hh"

#include <caf/message.hpp>

#include <memory>

namespace skitter {

/// A connection policy for endpoints of a single role.
///
/// A runtime binds at most one handler per role. The runtime wraps each bound
/// handler into its own actor. Hence, all member functions run sequentially
/// and implementations may keep their state in plain member variables without
/// any synchronization. The actor invokes `remove_connection` and
/// `remote_down` only for endpoints the handler has previously accepted.
class handler {
public:
  virtual ~handler();

  /// Called exactly once after binding the handler, before processing any
  /// connection.
  virtual void init();

  /// Decides whether to allow a relationship to `remote`. The runtime calls
  /// this function for inbound accept requests as well as for connections
  /// initiated by the local runtime.
  /// @returns a default-constructed error to accept the connection or the
  ///          reason for rejecting it.
  virtual error accept_connection(const endpoint& remote,
                                  const role& remote_role, const tag_set& tags)
    = 0;

  /// Cleans up after an explicit disconnect.
  virtual void remove_connection(const endpoint& remote) = 0;

  /// Cleans up after `remote` became unreachable.
  virtual void remote_down(const endpoint& remote) = 0;

  /// Answers a custom request dispatched to this handler. The default
  /// implementation rejects all requests with `ec::unexpected_request`.
  virtual expected<caf::message> handle_request(const caf::message& request);
};

} // namespace skitter
