#pragma once

#include "skitter/detail/comparable.hh"

#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace skitter {

/// The declared purpose of a runtime. A role selects the handler that governs
/// connections to endpoints of that role. Besides the two built-in roles,
/// applications and tests may use custom roles.
class role : detail::comparable<role> {
public:
  static constexpr std::string_view master_str = "master";

  static constexpr std::string_view worker_str = "worker";

  /// Returns the role of the runtime that coordinates the cluster.
  static role master();

  /// Returns the role of runtimes that execute work for a master.
  static role worker();

  /// Default-constructs an empty (unset) role.
  role() = default;

  template <class T,
            class = std::enable_if_t<std::is_convertible_v<T, std::string>>>
  role(T&& x) : str_(std::forward<T>(x)) {
    // nop
  }

  [[nodiscard]] const std::string& string() const noexcept {
    return str_;
  }

  /// Returns whether no role has been set.
  [[nodiscard]] bool empty() const noexcept {
    return str_.empty();
  }

  [[nodiscard]] bool is_master() const noexcept {
    return str_ == master_str;
  }

  [[nodiscard]] bool is_worker() const noexcept {
    return str_ == worker_str;
  }

  int compare(const role& other) const noexcept {
    return str_.compare(other.str_);
  }

  template <class Inspector>
  friend bool inspect(Inspector& f, role& x) {
    return f.apply(x.str_);
  }

private:
  std::string str_;
};

/// @relates role
inline std::string to_string(const role& x) {
  return x.empty() ? std::string{"none"} : x.string();
}

/// @relates role
inline void convert(const role& x, std::string& str) {
  str = to_string(x);
}

} // namespace skitter

namespace std {

template <>
struct hash<skitter::role> {
  size_t operator()(const skitter::role& x) const {
    return std::hash<std::string>{}(x.string());
  }
};

} // namespace std
