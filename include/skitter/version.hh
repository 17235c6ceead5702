#pragma once

#include <cstdint>
#include <string>

namespace skitter::version {

/// The type used for version numbers.
using type = uint32_t;

constexpr type major = 0;

constexpr type minor = 3;

constexpr type patch = 0;

/// The version of the handshake protocol. Two runtimes only form a cluster if
/// their protocol versions are equal.
constexpr type protocol = 1;

/// Checks whether two given protocol versions are compatible.
inline bool compatible(type v) {
  return v == protocol;
}

/// Returns a string representation of the library version.
std::string string();

} // namespace skitter::version
