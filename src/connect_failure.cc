#include "skitter/connect_failure.hh"

namespace skitter {

std::string to_string(const connect_failure& x) {
  std::string result = "(";
  result += to_string(x.node);
  result += ", ";
  result += to_string(code_of(x.reason));
  if (auto desc = description_of(x.reason); !desc.empty()) {
    result += ": ";
    result += desc;
  }
  result += ')';
  return result;
}

std::string to_string(const failure_list& xs) {
  std::string result = "[";
  for (const auto& x : xs) {
    if (result.size() > 1)
      result += ", ";
    result += to_string(x);
  }
  result += ']';
  return result;
}

} // namespace skitter
