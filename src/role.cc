#include "skitter/role.hh"

namespace skitter {

role role::master() {
  return role{std::string{master_str}};
}

role role::worker() {
  return role{std::string{worker_str}};
}

} // namespace skitter
