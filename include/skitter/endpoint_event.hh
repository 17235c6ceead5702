#pragma once

#include "skitter/endpoint.hh"
#include "skitter/fwd.hh"

#include <string>

namespace skitter {

/// Announces that an endpoint joined the cluster.
struct endpoint_up {
  endpoint node;
  tag_set tags;
};

/// @relates endpoint_up
template <class Inspector>
bool inspect(Inspector& f, endpoint_up& x) {
  return f.object(x).fields(f.field("node", x.node), f.field("tags", x.tags));
}

/// Announces that an endpoint left the cluster.
struct endpoint_down {
  endpoint node;
};

/// @relates endpoint_down
template <class Inspector>
bool inspect(Inspector& f, endpoint_down& x) {
  return f.object(x).fields(f.field("node", x.node));
}

/// @relates endpoint_up
inline bool operator==(const endpoint_up& x, const endpoint_up& y) {
  return x.node == y.node && x.tags == y.tags;
}

/// @relates endpoint_down
inline bool operator==(const endpoint_down& x, const endpoint_down& y) {
  return x.node == y.node;
}

} // namespace skitter
