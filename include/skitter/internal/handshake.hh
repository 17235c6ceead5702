#pragma once

#include "skitter/endpoint.hh"
#include "skitter/fwd.hh"
#include "skitter/role.hh"
#include "skitter/version.hh"

#include <caf/actor.hpp>

namespace skitter {

/// The answer of a beacon: everything an initiator needs to know about a
/// candidate before sending an accept request.
struct beacon_info {
  role node_role;
  version::type protocol_version = 0;
  tag_set tags;
};

/// @relates beacon_info
template <class Inspector>
bool inspect(Inspector& f, beacon_info& x) {
  return f.object(x).fields(f.field("role", x.node_role),
                            f.field("version", x.protocol_version),
                            f.field("tags", x.tags));
}

/// Identifies the counterpart of a connection to a handler.
struct peer_handshake {
  /// The endpoint of the counterpart.
  endpoint node;

  /// The dispatcher of the counterpart. Handlers monitor this handle for
  /// detecting that the counterpart became unreachable.
  caf::actor dispatcher;

  /// The declared role of the counterpart.
  role node_role;

  /// The tags of the counterpart.
  tag_set tags;
};

/// @relates peer_handshake
template <class Inspector>
bool inspect(Inspector& f, peer_handshake& x) {
  return f.object(x).fields(f.field("node", x.node),
                            f.field("dispatcher", x.dispatcher),
                            f.field("role", x.node_role),
                            f.field("tags", x.tags));
}

} // namespace skitter
