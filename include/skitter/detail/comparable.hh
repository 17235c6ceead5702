#pragma once

namespace skitter::detail {

/// Barton–Nackman trick implementation. Derives all relational operators from
/// a single `compare` member function.
template <class Derived>
class comparable {
  friend bool operator==(const Derived& lhs, const Derived& rhs) noexcept {
    return lhs.compare(rhs) == 0;
  }

  friend bool operator!=(const Derived& lhs, const Derived& rhs) noexcept {
    return lhs.compare(rhs) != 0;
  }

  friend bool operator<(const Derived& lhs, const Derived& rhs) noexcept {
    return lhs.compare(rhs) < 0;
  }

  friend bool operator<=(const Derived& lhs, const Derived& rhs) noexcept {
    return lhs.compare(rhs) <= 0;
  }

  friend bool operator>(const Derived& lhs, const Derived& rhs) noexcept {
    return lhs.compare(rhs) > 0;
  }

  friend bool operator>=(const Derived& lhs, const Derived& rhs) noexcept {
    return lhs.compare(rhs) >= 0;
  }
};

} // namespace skitter::detail
