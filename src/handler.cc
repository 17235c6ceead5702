#include "skitter/handler.hh"

#include "skitter/internal/type_id.hh"

namespace skitter {

handler::~handler() {
  // nop
}

void handler::init() {
  // nop
}

expected<caf::message> handler::handle_request(const caf::message& request) {
  return make_error(ec::unexpected_request,
                    "handler does not accept " + to_string(request));
}

} // namespace skitter
