#include "skitter/error.hh"

#include "skitter/internal/type_id.hh"

#include <caf/const_typed_message_view.hpp>
#include <caf/make_message.hpp>

namespace skitter {

namespace {

constexpr std::string_view ec_names[] = {
  "none",
  "unspecified",
  "mode_mismatch",
  "already_connected",
  "has_master",
  "rejected",
  "unreachable",
  "unknown_mode",
  "incompatible",
  "no_mode",
  "not_connected",
  "shutting_down",
  "invalid_endpoint",
  "unexpected_request",
};

template <class T, size_t N>
constexpr size_t array_size(const T (&)[N]) {
  return N;
}

static_assert(array_size(ec_names)
              == static_cast<size_t>(ec::unexpected_request) + 1);

} // namespace

std::string to_string(ec code) {
  auto index = static_cast<uint8_t>(code);
  if (index < array_size(ec_names))
    return std::string{ec_names[index]};
  return "<unknown>";
}

bool convert(std::string_view str, ec& code) noexcept {
  for (size_t index = 0; index < array_size(ec_names); ++index) {
    if (ec_names[index] == str) {
      code = static_cast<ec>(index);
      return true;
    }
  }
  return false;
}

error make_error(ec code) {
  return error{code};
}

error make_error(ec code, std::string description) {
  return error{code, caf::make_message(std::move(description))};
}

ec code_of(const error& err) noexcept {
  if (!err)
    return ec::none;
  if (err.category() != caf::type_id_v<ec>)
    return ec::unspecified;
  return static_cast<ec>(err.code());
}

std::string description_of(const error& err) {
  if (!err)
    return {};
  if (auto v = caf::make_const_typed_message_view<std::string>(err.context()))
    return get<0>(v);
  return {};
}

} // namespace skitter
