#include "skitter/internal/beacon_actor.hh"

#include "skitter/internal/type_id.hh"

#include <utility>

namespace skitter::internal {

beacon_state::beacon_state(caf::event_based_actor* self, beacon_info info)
  : self(self), info(std::move(info)) {
  // nop
}

caf::behavior beacon_state::make_behavior() {
  return {
    [this](atom::probe) { return info; },
  };
}

} // namespace skitter::internal
