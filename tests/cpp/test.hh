#pragma once

#ifdef SUITE
#  define CAF_SUITE SUITE
#endif

#include <caf/test/unit_test.hpp>

#include <caf/actor_system.hpp>
#include <caf/scoped_actor.hpp>

#include "skitter/configuration.hh"
#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"
#include "skitter/handler.hh"
#include "skitter/registry.hh"
#include "skitter/role.hh"
#include "skitter/runtime.hh"
#include "skitter/internal/type_id.hh"

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// -- test setup macros --------------------------------------------------------

#define TEST CAF_TEST
#define FIXTURE_SCOPE CAF_TEST_FIXTURE_SCOPE
#define FIXTURE_SCOPE_END CAF_TEST_FIXTURE_SCOPE_END

// -- logging macros -----------------------------------------------------------

#define ERROR CAF_TEST_PRINT_ERROR
#define INFO CAF_TEST_PRINT_INFO
#define VERBOSE CAF_TEST_PRINT_VERBOSE
#define MESSAGE CAF_MESSAGE

// -- macros for checking results ---------------------------------------------

#define REQUIRE CAF_REQUIRE
#define REQUIRE_EQUAL CAF_REQUIRE_EQUAL
#define REQUIRE_NOT_EQUAL CAF_REQUIRE_NOT_EQUAL
#define CHECK CAF_CHECK
#define CHECK_EQUAL CAF_CHECK_EQUAL
#define CHECK_NOT_EQUAL CAF_CHECK_NOT_EQUAL
#define CHECK_LESS CAF_CHECK_LESS
#define CHECK_GREATER CAF_CHECK_GREATER
#define CHECK_FAIL CAF_CHECK_FAIL
#define FAIL CAF_FAIL

// -- fixtures -----------------------------------------------------------------

/// Hosts an actor system for runtimes that share one process. All runtimes
/// reach each other through an in-process resolver. Stopping a runtime
/// terminates its dispatcher, which other runtimes observe exactly like a
/// lost network node.
class cluster_fixture {
public:
  cluster_fixture();

  virtual ~cluster_fixture();

  /// Creates and starts a new runtime at `host:port`.
  skitter::runtime& add_node(const skitter::role& local_role,
                             const std::string& host, uint16_t port,
                             skitter::tag_set tags = {});

  /// Creates and starts a new runtime from custom options.
  skitter::runtime& add_node(skitter::runtime_options opts);

  /// Stops the runtime at `node`, i.e., makes it disappear from the cluster.
  void kill(const skitter::endpoint& node);

  /// Returns the runtime at `node`.
  skitter::runtime& node_at(const skitter::endpoint& node);

  /// Polls `predicate` until it returns `true` or the timeout expires.
  /// @returns the last result of `predicate`.
  static bool wait_for(std::function<bool()> predicate,
                       std::chrono::milliseconds timeout
                       = std::chrono::seconds(5));

  static skitter::configuration make_config();

  skitter::configuration cfg;
  caf::actor_system sys;
  caf::scoped_actor self;
  caf::actor resolver;

private:
  std::map<skitter::endpoint, std::unique_ptr<skitter::runtime>> nodes_;
};

/// A handler that accepts every connection and records all calls.
class recording_handler : public skitter::handler {
public:
  struct log_type {
    std::mutex mtx;
    std::vector<std::string> entries;

    std::vector<std::string> snapshot() {
      std::unique_lock<std::mutex> guard{mtx};
      return entries;
    }

    bool contains(const std::string& what) {
      auto xs = snapshot();
      return std::find(xs.begin(), xs.end(), what) != xs.end();
    }
  };

  using log_ptr = std::shared_ptr<log_type>;

  explicit recording_handler(log_ptr log, skitter::error reject_with = {});

  void init() override;

  skitter::error accept_connection(const skitter::endpoint& remote,
                                   const skitter::role& remote_role,
                                   const skitter::tag_set& tags) override;

  void remove_connection(const skitter::endpoint& remote) override;

  void remote_down(const skitter::endpoint& remote) override;

private:
  void add(std::string entry);

  log_ptr log_;
  skitter::error reject_with_;
};

// -- utility ------------------------------------------------------------------

template <class T>
T unbox(skitter::expected<T> x) {
  if (!x)
    FAIL(to_string(x.error()));
  else
    return std::move(*x);
}

inline skitter::endpoint ep(const std::string& host, uint16_t port) {
  return skitter::endpoint{host, port};
}
