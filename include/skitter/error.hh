#pragma once

#include "skitter/fwd.hh"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace skitter {

using caf::error;

template <class T>
using expected = caf::expected<T>;

/// Skitter's error codes.
enum class ec : uint8_t {
  /// Not-an-error.
  none,
  /// The unspecified default error code.
  unspecified,
  /// The remote endpoint declared a different role than required.
  mode_mismatch,
  /// Both endpoints already maintain this relationship.
  already_connected,
  /// The worker already belongs to a different master.
  has_master,
  /// A connection policy refused the relationship.
  rejected,
  /// The transport failed to reach the remote endpoint.
  unreachable,
  /// No handler is bound for the requested role.
  unknown_mode,
  /// The remote endpoint speaks a different protocol version.
  incompatible,
  /// The remote endpoint has not declared any role.
  no_mode,
  /// The operation requires a connection that does not exist.
  not_connected,
  /// Canceled an operation because the runtime is shutting down.
  shutting_down,
  /// Received a malformed endpoint.
  invalid_endpoint,
  /// A handler received a request it does not support.
  unexpected_request,
};

/// @relates ec
std::string to_string(ec code);

/// @relates ec
bool convert(std::string_view str, ec& code) noexcept;

/// @relates ec
template <class Inspector>
bool inspect(Inspector& f, ec& x) {
  auto get = [&] { return static_cast<uint8_t>(x); };
  auto set = [&](uint8_t val) {
    if (val <= static_cast<uint8_t>(ec::unexpected_request)) {
      x = static_cast<ec>(val);
      return true;
    } else {
      return false;
    }
  };
  return f.apply(get, set);
}

/// Creates a new @ref error from given @ref ec code.
error make_error(ec code);

/// Creates a new @ref error from given @ref ec @p code and @p description.
error make_error(ec code, std::string description);

/// Returns the @ref ec stored in `err`, `ec::unspecified` if `err` belongs to
/// a different category and `ec::none` if `err` is default-constructed.
ec code_of(const error& err) noexcept;

/// Returns the human-readable description attached to `err` or an empty string
/// if `err` carries no description.
std::string description_of(const error& err);

} // namespace skitter
