#pragma once

#include "skitter/detail/comparable.hh"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace skitter {

/// Identifies a runtime in the cluster by the host and TCP port it listens on.
struct endpoint : detail::comparable<endpoint> {
  endpoint() = default;

  endpoint(std::string host, uint16_t port);

  std::string host;

  uint16_t port = 0;

  /// Returns whether this endpoint was default-constructed.
  [[nodiscard]] bool empty() const noexcept {
    return host.empty() && port == 0;
  }

  int compare(const endpoint& other) const noexcept;
};

/// @relates endpoint
template <class Inspector>
bool inspect(Inspector& f, endpoint& x) {
  return f.object(x).fields(f.field("host", x.host), f.field("port", x.port));
}

/// Renders `x` as `host:port`.
/// @relates endpoint
std::string to_string(const endpoint& x);

/// @relates endpoint
std::string to_string(const std::optional<endpoint>& x);

/// @relates endpoint
inline void convert(const endpoint& x, std::string& str) {
  str = to_string(x);
}

/// Parses `host:port`. IPv6 hosts must appear in brackets, e.g., `[::1]:8080`.
/// @relates endpoint
bool convert(std::string_view str, endpoint& x);

} // namespace skitter

namespace std {

template <>
struct hash<skitter::endpoint> {
  size_t operator()(const skitter::endpoint& x) const {
    hash<string> f;
    return f(x.host) ^ static_cast<size_t>(x.port);
  }
};

} // namespace std
