#include "skitter/version.hh"

namespace skitter::version {

std::string string() {
  using std::to_string;
  return to_string(major) + '.' + to_string(minor) + '.' + to_string(patch);
}

} // namespace skitter::version
