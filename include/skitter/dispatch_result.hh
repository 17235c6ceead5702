#pragma once

#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"

#include <caf/message.hpp>

namespace skitter {

/// The answer of a single endpoint to a request that the dispatcher sent to
/// many endpoints at once. Either `reason` is set or `reply` holds the answer
/// of the remote handler.
struct dispatch_result {
  endpoint node;
  caf::message reply;
  error reason;
};

/// @relates dispatch_result
template <class Inspector>
bool inspect(Inspector& f, dispatch_result& x) {
  return f.object(x).fields(f.field("node", x.node),
                            f.field("reply", x.reply),
                            f.field("reason", x.reason));
}

} // namespace skitter
