#pragma once

#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"

#include <string>
#include <vector>

namespace skitter {

/// Describes a single failed attempt of a bulk connect.
struct connect_failure {
  endpoint node;
  error reason;
};

/// @relates connect_failure
template <class Inspector>
bool inspect(Inspector& f, connect_failure& x) {
  return f.object(x).fields(f.field("node", x.node),
                            f.field("reason", x.reason));
}

/// @relates connect_failure
std::string to_string(const connect_failure& x);

/// @relates connect_failure
std::string to_string(const failure_list& xs);

} // namespace skitter
