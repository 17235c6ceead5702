#include "skitter/endpoint.hh"

#include <charconv>
#include <tuple>
#include <utility>

namespace skitter {

endpoint::endpoint(std::string host, uint16_t port)
  : host(std::move(host)), port(port) {
  // nop
}

int endpoint::compare(const endpoint& other) const noexcept {
  if (auto res = host.compare(other.host); res != 0)
    return res;
  return static_cast<int>(port) - static_cast<int>(other.port);
}

std::string to_string(const endpoint& x) {
  std::string result;
  if (x.host.find(':') != std::string::npos) {
    result += '[';
    result += x.host;
    result += ']';
  } else {
    result += x.host;
  }
  result += ':';
  result += std::to_string(x.port);
  return result;
}

std::string to_string(const std::optional<endpoint>& x) {
  if (x)
    return "*" + to_string(*x);
  return "null";
}

bool convert(std::string_view str, endpoint& x) {
  auto sep = str.rfind(':');
  if (sep == std::string_view::npos || sep == 0 || sep + 1 == str.size())
    return false;
  auto host = str.substr(0, sep);
  auto port_str = str.substr(sep + 1);
  if (host.front() == '[') {
    if (host.size() < 3 || host.back() != ']')
      return false;
    host = host.substr(1, host.size() - 2);
  } else if (host.find(':') != std::string_view::npos) {
    // Unbracketed IPv6 addresses are ambiguous.
    return false;
  }
  uint16_t port = 0;
  auto first = port_str.data();
  auto last = first + port_str.size();
  auto [ptr, err] = std::from_chars(first, last, port);
  if (err != std::errc{} || ptr != last)
    return false;
  x.host.assign(host.begin(), host.end());
  x.port = port;
  return true;
}

} // namespace skitter
