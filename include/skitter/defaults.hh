#pragma once

#include <cstdint>
#include <string_view>

// This header contains hard-coded default values for various Skitter options.

namespace skitter::defaults {

constexpr std::string_view host = "localhost";

constexpr uint16_t port = 0;

constexpr bool shutdown_with_master = true;

constexpr bool shutdown_with_workers = false;

constexpr std::string_view console_verbosity = "quiet";

constexpr std::string_view config_file = "skitter.conf";

} // namespace skitter::defaults
