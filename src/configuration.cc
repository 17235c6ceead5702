#include "skitter/configuration.hh"

#include "skitter/defaults.hh"
#include "skitter/endpoint.hh"
#include "skitter/event.hh"
#include "skitter/internal/type_id.hh"

#include <caf/config_value.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/io/middleman.hpp>
#include <caf/settings.hpp>
#include <caf/string_algorithms.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace skitter {

namespace {

template <class... Ts>
auto concat(Ts... xs) {
  std::string result;
  ((result += xs), ...);
  return result;
}

constexpr caf::string_view console_verbosity_key = "skitter.console-verbosity";

bool valid_log_level(caf::string_view x) {
  if (x == "quiet")
    return true;
  auto level = event::severity_level::critical;
  return convert(std::string_view{x.data(), x.size()}, level);
}

std::string to_log_level(const char* var, const char* cstr) {
  std::string str = cstr;
  if (valid_log_level(str))
    return str;
  throw std::invalid_argument(concat(
    "illegal value for environment variable ", var, ": '", cstr,
    "' (legal values: 'quiet', 'critical', 'error', 'warning', 'info', "
    "'verbose', 'debug')"));
}

bool to_bool(const char* var, const char* cstr) {
  std::string str = cstr;
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  if (str == "true" || str == "1" || str == "yes")
    return true;
  if (str == "false" || str == "0" || str == "no")
    return false;
  throw std::invalid_argument(concat("illegal value for environment variable ",
                                     var, ": '", cstr,
                                     "' (legal values: 'true', 'false')"));
}

std::vector<std::string> split_and_trim(const char* str, char delim = ',') {
  auto trim = [](std::string& x) {
    auto predicate = [](unsigned char ch) { return !std::isspace(ch); };
    x.erase(x.begin(), std::find_if(x.begin(), x.end(), predicate));
    x.erase(std::find_if(x.rbegin(), x.rend(), predicate).base(), x.end());
  };
  auto is_empty = [](const std::string& x) { return x.empty(); };
  std::vector<std::string> result;
  caf::split(result, caf::string_view{str, strlen(str)}, delim,
             caf::token_compress_on);
  std::for_each(result.begin(), result.end(), trim);
  result.erase(std::remove_if(result.begin(), result.end(), is_empty),
               result.end());
  return result;
}

endpoint to_endpoint(const char* key, const std::string& str) {
  endpoint result;
  if (!convert(str, result))
    throw std::invalid_argument(concat("invalid endpoint in ", key, ": '", str,
                                       "' (expected 'host:port')"));
  return result;
}

} // namespace

configuration::configuration(skip_init_t) {
  using string_list = std::vector<std::string>;
  // Add runtime type information for Skitter types.
  init_global_state();
  // Add custom options to the CAF parser.
  opt_group{custom_options_, "skitter"}
    .add<std::string>("role", "declared role of this runtime (master, worker)")
    .add<std::string>("host", "host name other runtimes use for this runtime")
    .add<uint16_t>("port", "port for accepting connections (0 = disabled)")
    .add<std::string>("master", "master to connect to on startup (host:port)")
    .add<string_list>("workers", "workers to connect to on startup")
    .add<string_list>("tags", "tags that a worker announces to its master")
    .add<bool>("shutdown-with-master",
               "stop a worker after losing its master")
    .add<bool>("shutdown-with-workers",
               "stop a master after losing one of its workers")
    .add<std::string>("console-verbosity",
                      "minimum severity for console output (or quiet)");
  // Override CAF defaults.
  set("caf.logger.file.verbosity", "quiet");
  set("caf.logger.console.verbosity", "error");
}

configuration::configuration() : configuration(skip_init) {
  init(0, nullptr);
}

configuration::configuration(int argc, char** argv) : configuration(skip_init) {
  init(argc, argv);
}

void configuration::init(int argc, char** argv) {
  std::vector<std::string> args;
  if (argc > 1 && argv != nullptr)
    args.assign(argv + 1, argv + argc);
  // Load CAF modules.
  load<caf::io::middleman>();
  // Phase 1: parse skitter.conf or configuration file specified by the user on
  //          the command line (overrides hard-coded defaults).
  config_file_path = std::string{defaults::config_file};
  std::vector<std::string> args_subset;
  auto predicate = [](const std::string& str) {
    return str.compare(0, 14, "--config-file=") != 0;
  };
  auto sep = std::stable_partition(args.begin(), args.end(), predicate);
  if (sep != args.end()) {
    args_subset.assign(std::make_move_iterator(sep),
                       std::make_move_iterator(args.end()));
    args.erase(sep, args.end());
  }
  if (auto err = parse(std::move(args_subset))) {
    auto what = concat("Error while reading configuration file: ",
                       to_string(err));
    throw std::runtime_error(what);
  }
  // Phase 2: parse environment variables (override config file settings).
  if (auto env = getenv("SKITTER_ROLE"))
    set("skitter.role", env);
  if (auto env = getenv("SKITTER_HOST"))
    set("skitter.host", env);
  if (auto env = getenv("SKITTER_PORT")) {
    char* end = nullptr;
    errno = 0;
    auto value = strtol(env, &end, 10);
    if (errno == ERANGE || *end != '\0' || value < 0 || value > 65535) {
      auto what = concat("invalid value for SKITTER_PORT: ", env,
                         " (expected a port number)");
      throw std::invalid_argument(what);
    }
    set("skitter.port", static_cast<uint16_t>(value));
  }
  if (auto env = getenv("SKITTER_MASTER")) {
    to_endpoint("SKITTER_MASTER", env);
    set("skitter.master", env);
  }
  if (auto env = getenv("SKITTER_WORKERS")) {
    auto workers = split_and_trim(env);
    for (const auto& worker : workers)
      to_endpoint("SKITTER_WORKERS", worker);
    set("skitter.workers", std::move(workers));
  }
  if (auto env = getenv("SKITTER_TAGS"))
    set("skitter.tags", split_and_trim(env));
  if (auto env = getenv("SKITTER_SHUTDOWN_WITH_MASTER"))
    set("skitter.shutdown-with-master",
        to_bool("SKITTER_SHUTDOWN_WITH_MASTER", env));
  if (auto env = getenv("SKITTER_SHUTDOWN_WITH_WORKERS"))
    set("skitter.shutdown-with-workers",
        to_bool("SKITTER_SHUTDOWN_WITH_WORKERS", env));
  if (auto env = getenv("SKITTER_CONSOLE_VERBOSITY")) {
    auto level = to_log_level("SKITTER_CONSOLE_VERBOSITY", env);
    set(console_verbosity_key, level);
  }
  // Phase 3: parse command line arguments.
  if (!args.empty()) {
    std::stringstream dummy;
    if (auto err = parse(std::move(args), dummy)) {
      auto what = concat("Error while parsing CLI arguments: ", to_string(err));
      throw std::runtime_error(what);
    }
  }
}

std::string configuration::console_verbosity() const {
  return caf::get_or(content, console_verbosity_key,
                     std::string{defaults::console_verbosity});
}

caf::settings configuration::dump_content() const {
  auto result = super::dump_content();
  auto& grp = result["skitter"].as_dictionary();
  put_missing(grp, "host", std::string{defaults::host});
  put_missing(grp, "port", defaults::port);
  put_missing(grp, "shutdown-with-master", defaults::shutdown_with_master);
  put_missing(grp, "shutdown-with-workers", defaults::shutdown_with_workers);
  put_missing(grp, "console-verbosity",
              std::string{defaults::console_verbosity});
  return result;
}

namespace {

std::once_flag init_global_state_flag;

} // namespace

void configuration::init_global_state() {
  std::call_once(init_global_state_flag, [] {
    caf::init_global_meta_objects<caf::id_block::skitter_internal>();
    caf::io::middleman::init_global_meta_objects();
    caf::core::init_global_meta_objects();
  });
}

runtime_options to_runtime_options(const configuration& cfg) {
  using string_list = std::vector<std::string>;
  const auto& content = cfg.content;
  runtime_options result;
  if (auto str = caf::get_as<std::string>(content, "skitter.role"))
    result.local_role = role{std::move(*str)};
  result.port = caf::get_or(content, "skitter.port", defaults::port);
  result.local.host = caf::get_or(content, "skitter.host",
                                  std::string{defaults::host});
  result.local.port = result.port;
  if (auto str = caf::get_as<std::string>(content, "skitter.master"))
    result.master = to_endpoint("skitter.master", *str);
  if (auto strs = caf::get_as<string_list>(content, "skitter.workers"))
    for (const auto& str : *strs)
      result.workers.emplace_back(to_endpoint("skitter.workers", str));
  if (auto strs = caf::get_as<string_list>(content, "skitter.tags"))
    result.tags.insert(strs->begin(), strs->end());
  result.shutdown_with_master = caf::get_or(content,
                                            "skitter.shutdown-with-master",
                                            defaults::shutdown_with_master);
  result.shutdown_with_workers = caf::get_or(content,
                                             "skitter.shutdown-with-workers",
                                             defaults::shutdown_with_workers);
  return result;
}

} // namespace skitter
