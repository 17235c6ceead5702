#define SUITE runtime

#include "skitter/runtime.hh"

#include "test.hh"

#include "skitter/configuration.hh"
#include "skitter/exit_codes.hh"
#include "skitter/master_connection.hh"

#include <atomic>

using namespace skitter;

namespace {

struct fixture : cluster_fixture {
  runtime& earth;

  fixture() : earth(add_node(role::master(), "earth", 1)) {
    // nop
  }
};

} // namespace

FIXTURE_SCOPE(runtime_tests, fixture)

TEST(runtimes expose their options) {
  CHECK_EQUAL(earth.local_endpoint(), ep("earth", 1));
  CHECK_EQUAL(earth.local_role(), role::master());
  CHECK(!earth.stopped());
  CHECK(!earth.exit_code());
}

TEST(binding an empty handler fails) {
  CHECK_EQUAL(code_of(earth.bind(role{"alpha"}, nullptr)), ec::unspecified);
  CHECK_EQUAL(code_of(earth.default_bind(nullptr)), ec::unspecified);
}

TEST(stopped runtimes refuse all operations) {
  earth.stop();
  earth.stop();
  CHECK(earth.stopped());
  CHECK_EQUAL(code_of(earth.listen()), ec::shutting_down);
  CHECK_EQUAL(code_of(earth.start()), ec::shutting_down);
  auto res = earth.connect(ep("mars", 2));
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::shutting_down);
  auto failures = earth.connect(std::vector<endpoint>{ep("mars", 2)},
                                role::worker());
  REQUIRE_EQUAL(failures.size(), 1u);
  CHECK_EQUAL(code_of(failures.front().reason), ec::shutting_down);
}

TEST(disconnecting an unknown endpoint fails with not_connected) {
  CHECK_EQUAL(code_of(earth.disconnect(ep("mars", 2))), ec::not_connected);
}

TEST(disconnect removes a worker on both sides) {
  auto& mars = add_node(role::worker(), "mars", 2);
  REQUIRE(!master_connection{mars}.connect(ep("earth", 1)));
  CHECK(!earth.disconnect(ep("mars", 2)));
  CHECK(!earth.registry().connected(ep("mars", 2)));
  CHECK(wait_for([&] { return !mars.registry().master(); }));
  CHECK(!mars.exit_code());
}

TEST(listening on port 0 announces the published port) {
  configuration node_cfg{skip_init};
  node_cfg.init(0, nullptr);
  node_cfg.set("skitter.role", std::string{"master"});
  runtime node{node_cfg};
  REQUIRE_EQUAL(node.local_endpoint().port, 0u);
  REQUIRE(!node.listen());
  auto local = node.local_endpoint();
  CHECK_EQUAL(local.host, std::string{"localhost"});
  CHECK_NOT_EQUAL(local.port, 0u);
  CHECK_EQUAL(node.registry().master(), local);
  CHECK(!node.registry().connected(ep("localhost", 0)));
}

TEST(the shutdown callback receives the first exit code only) {
  std::atomic<int> calls{0};
  std::atomic<int> last_code{-1};
  earth.on_shutdown([&](int code) {
    ++calls;
    last_code = code;
  });
  earth.request_shutdown(exit_codes::remote_shutdown);
  earth.request_shutdown(exit_codes::success);
  CHECK_EQUAL(calls.load(), 1);
  CHECK_EQUAL(last_code.load(), exit_codes::remote_shutdown);
  CHECK_EQUAL(earth.await_shutdown(), exit_codes::remote_shutdown);
}

FIXTURE_SCOPE_END()
