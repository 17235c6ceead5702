#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

#include "skitter/configuration.hh"
#include "skitter/connect_failure.hh"
#include "skitter/endpoint.hh"
#include "skitter/exit_codes.hh"
#include "skitter/registry.hh"
#include "skitter/role.hh"
#include "skitter/runtime.hh"
#include "skitter/internal/logger.hh"

#include <fmt/color.h>
#include <fmt/core.h>

namespace log = skitter::internal::log;

namespace {

const auto error_style = fg(fmt::color::red);

const auto status_style = fg(fmt::color::blue);

} // namespace

// -- main function ------------------------------------------------------------

int main(int argc, char** argv) try {
  skitter::configuration::init_global_state();
  setvbuf(stdout, nullptr, _IOLBF, 0); // Always line-buffer stdout.
  // Parse CLI parameters, environment variables and the config file.
  skitter::configuration cfg{skitter::skip_init};
  try {
    cfg.init(argc, argv);
  } catch (std::exception& ex) {
    fmt::print(stderr, error_style, "{}\n", ex.what());
    return skitter::exit_codes::startup_failure;
  }
  if (cfg.cli_helptext_printed)
    return EXIT_SUCCESS;
  skitter::runtime rt{cfg};
  if (rt.local_role().empty()) {
    fmt::print(stderr, error_style, "no role specified (skitter.role)\n");
    return skitter::exit_codes::startup_failure;
  }
  if (auto err = rt.start()) {
    fmt::print(stderr, error_style, "failed to start: {}\n", to_string(err));
    return skitter::exit_codes::startup_failure;
  }
  fmt::print(status_style, "{} running as {} with {} connected endpoints\n",
             to_string(rt.local_endpoint()), to_string(rt.local_role()),
             rt.registry().size());
  auto code = rt.await_shutdown();
  log::app::info("exit", "leaving with exit code {}", code);
  rt.stop();
  return code;
} catch (std::exception& ex) {
  fmt::print(stderr, error_style, "{}\n", ex.what());
  return skitter::exit_codes::startup_failure;
}
