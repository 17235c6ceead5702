#define SUITE master_connection

#include "skitter/master_connection.hh"

#include "test.hh"

#include "skitter/exit_codes.hh"
#include "skitter/tag_index.hh"
#include "skitter/worker_connection.hh"

using namespace skitter;

namespace {

struct fixture : cluster_fixture {
  endpoint earth_ep = ep("earth", 1);
  endpoint mars_ep = ep("mars", 2);

  runtime& earth;
  runtime& mars;

  fixture()
    : earth(add_node(role::master(), "earth", 1)),
      mars(add_node(role::worker(), "mars", 2, {"gpu"})) {
    // nop
  }

  runtime& add_worker(const std::string& host, uint16_t port,
                      bool shutdown_with_master = true) {
    runtime_options opts;
    opts.local_role = role::worker();
    opts.local = ep(host, port);
    opts.shutdown_with_master = shutdown_with_master;
    return add_node(std::move(opts));
  }
};

} // namespace

FIXTURE_SCOPE(master_connection_tests, fixture)

TEST(a worker connects to its master) {
  REQUIRE(!master_connection{mars}.connect(earth_ep));
  CHECK_EQUAL(mars.registry().master(), earth_ep);
  CHECK(earth.registry().connected(mars_ep));
  CHECK_EQUAL(earth.tags().of_worker(mars_ep), tag_set{"gpu"});
}

TEST(connecting without master is a no-op) {
  CHECK(!master_connection{mars}.connect(std::nullopt));
  CHECK(!mars.registry().master());
}

TEST(connecting to the current master fails with already_connected) {
  REQUIRE(!master_connection{mars}.connect(earth_ep));
  auto err = master_connection{mars}.connect(earth_ep);
  CHECK_EQUAL(code_of(err), ec::already_connected);
}

TEST(a worker refuses a second master) {
  add_node(role::master(), "venus", 3);
  REQUIRE(!master_connection{mars}.connect(earth_ep));
  auto err = master_connection{mars}.connect(ep("venus", 3));
  CHECK_EQUAL(code_of(err), ec::has_master);
  CHECK_EQUAL(mars.registry().master(), earth_ep);
}

TEST(a master cannot claim a worker that has a master) {
  auto& venus = add_node(role::master(), "venus", 3);
  REQUIRE(!master_connection{mars}.connect(earth_ep));
  auto err = worker_connection{venus}.connect(mars_ep);
  CHECK_EQUAL(code_of(err), ec::has_master);
  CHECK(!venus.registry().connected(mars_ep));
  CHECK_EQUAL(mars.registry().master(), earth_ep);
}

TEST(connecting to a non-master fails with mode_mismatch) {
  add_worker("venus", 3);
  auto err = master_connection{mars}.connect(ep("venus", 3));
  CHECK_EQUAL(code_of(err), ec::mode_mismatch);
  CHECK(!mars.registry().master());
}

TEST(start connects to the configured master) {
  runtime_options opts;
  opts.local_role = role::worker();
  opts.local = ep("venus", 3);
  opts.master = earth_ep;
  auto& venus = add_node(std::move(opts));
  CHECK(!venus.start());
  CHECK_EQUAL(venus.registry().master(), earth_ep);
}

TEST(start keeps a worker running if its master is unreachable) {
  runtime_options opts;
  opts.local_role = role::worker();
  opts.local = ep("venus", 3);
  opts.master = ep("pluto", 9);
  auto& venus = add_node(std::move(opts));
  CHECK(!venus.start());
  CHECK(!venus.registry().master());
}

TEST(losing the master stops the worker with exit code 4) {
  REQUIRE(!master_connection{mars}.connect(earth_ep));
  kill(earth_ep);
  CHECK(wait_for([&] { return mars.exit_code().has_value(); }));
  CHECK_EQUAL(mars.exit_code(), exit_codes::remote_shutdown);
  CHECK(wait_for([&] { return mars.registry().size() == 0; }));
}

TEST(workers may outlive their master if configured) {
  auto& venus = add_worker("venus", 3, false);
  REQUIRE(!master_connection{venus}.connect(earth_ep));
  kill(earth_ep);
  CHECK(wait_for([&] { return !venus.registry().master(); }));
  CHECK(!venus.exit_code());
}

TEST(a new master may claim a worker after the old master is gone) {
  auto& venus = add_worker("venus", 3, false);
  auto& saturn = add_node(role::master(), "saturn", 6);
  REQUIRE(!master_connection{venus}.connect(earth_ep));
  kill(earth_ep);
  CHECK(wait_for([&] { return !venus.registry().master(); }));
  CHECK(!worker_connection{saturn}.connect(ep("venus", 3)));
  CHECK_EQUAL(venus.registry().master(), ep("saturn", 6));
}

TEST(workers mirror the worker listing of their master) {
  REQUIRE(!worker_connection{earth}.connect(mars_ep));
  auto& venus = add_worker("venus", 3);
  REQUIRE(!master_connection{venus}.connect(earth_ep));
  MESSAGE("venus receives the current listing");
  CHECK(wait_for([&] { return venus.registry().connected(mars_ep); }));
  CHECK_EQUAL(venus.registry().role_of(mars_ep), role::worker());
  CHECK_EQUAL(venus.tags().workers_with("gpu"), std::set<endpoint>{mars_ep});
  CHECK(!venus.registry().connected(ep("venus", 3)));
  MESSAGE("venus learns about new workers");
  add_worker("pluto", 4);
  REQUIRE(!worker_connection{earth}.connect(ep("pluto", 4)));
  CHECK(wait_for([&] { return venus.registry().connected(ep("pluto", 4)); }));
  MESSAGE("venus forgets lost workers");
  kill(mars_ep);
  CHECK(wait_for([&] { return !venus.registry().connected(mars_ep); }));
  MESSAGE("venus drops the mirror after losing its master");
  kill(earth_ep);
  CHECK(wait_for([&] { return venus.registry().size() == 0; }));
}

FIXTURE_SCOPE_END()
