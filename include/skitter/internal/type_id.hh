#pragma once

#include "skitter/connect_failure.hh"
#include "skitter/dispatch_result.hh"
#include "skitter/endpoint.hh"
#include "skitter/endpoint_event.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"
#include "skitter/internal/handshake.hh"
#include "skitter/role.hh"

#include <caf/fwd.hpp>
#include <caf/is_error_code_enum.hpp>
#include <caf/type_id.hpp>

#include <optional>
#include <vector>

// -- imported atoms -----------------------------------------------------------

// NOLINTBEGIN
#define SKITTER_CAF_ATOM_ALIAS(name)                                           \
  using name = caf::name##_atom;                                               \
  constexpr auto name##_v = caf::name##_atom_v;
// NOLINTEND

namespace skitter::internal::atom {

SKITTER_CAF_ATOM_ALIAS(connect)
SKITTER_CAF_ATOM_ALIAS(get)
SKITTER_CAF_ATOM_ALIAS(publish)
SKITTER_CAF_ATOM_ALIAS(subscribe)
SKITTER_CAF_ATOM_ALIAS(unsubscribe)

} // namespace skitter::internal::atom

#undef SKITTER_CAF_ATOM_ALIAS

// -- type announcements and custom atoms --------------------------------------

#define SKITTER_ADD_ATOM(name)                                                 \
  CAF_ADD_ATOM(skitter_internal, skitter::internal::atom, name)

#define SKITTER_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(skitter_internal, type)

CAF_BEGIN_TYPE_ID_BLOCK(skitter_internal, caf::first_custom_type_id)

  // -- atoms for the handshake ------------------------------------------------

  SKITTER_ADD_ATOM(accept)
  SKITTER_ADD_ATOM(probe)
  SKITTER_ADD_ATOM(remove)
  SKITTER_ADD_ATOM(resolve)

  // -- atoms for communication with dispatchers and handlers ------------------

  SKITTER_ADD_ATOM(bind)
  SKITTER_ADD_ATOM(default_)
  SKITTER_ADD_ATOM(dispatch)
  SKITTER_ADD_ATOM(request)

  // -- atoms for communication with notifiers and registry managers -----------

  SKITTER_ADD_ATOM(down)
  SKITTER_ADD_ATOM(up)
  SKITTER_ADD_ATOM(workers)

  // -- Skitter type announcements ---------------------------------------------

  SKITTER_ADD_TYPE_ID((skitter::beacon_info))
  SKITTER_ADD_TYPE_ID((skitter::connect_failure))
  SKITTER_ADD_TYPE_ID((skitter::dispatch_result))
  SKITTER_ADD_TYPE_ID((skitter::ec))
  SKITTER_ADD_TYPE_ID((skitter::endpoint))
  SKITTER_ADD_TYPE_ID((skitter::endpoint_down))
  SKITTER_ADD_TYPE_ID((skitter::endpoint_up))
  SKITTER_ADD_TYPE_ID((skitter::peer_handshake))
  SKITTER_ADD_TYPE_ID((skitter::role))

  // -- STD type announcements -------------------------------------------------

  SKITTER_ADD_TYPE_ID((std::optional<skitter::role>) )
  SKITTER_ADD_TYPE_ID((std::vector<skitter::connect_failure>) )
  SKITTER_ADD_TYPE_ID((std::vector<skitter::dispatch_result>) )
  SKITTER_ADD_TYPE_ID((std::vector<skitter::endpoint>) )
  SKITTER_ADD_TYPE_ID((std::vector<skitter::endpoint_up>) )

CAF_END_TYPE_ID_BLOCK(skitter_internal)

#undef SKITTER_ADD_ATOM
#undef SKITTER_ADD_TYPE_ID

// -- enable opt-in features for Skitter types ---------------------------------

CAF_ERROR_CODE_ENUM(skitter::ec)
