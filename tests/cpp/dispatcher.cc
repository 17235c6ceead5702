#define SUITE dispatcher

#include "skitter/dispatcher.hh"

#include "test.hh"

#include "skitter/dispatch_result.hh"
#include "skitter/version.hh"
#include "skitter/worker_connection.hh"

#include <caf/const_typed_message_view.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/exit_reason.hpp>
#include <caf/make_message.hpp>
#include <caf/send.hpp>

#include <string>

using namespace skitter;
using namespace std::string_literals;

namespace {

const auto alpha = role{"alpha"};

const auto beta = role{"beta"};

/// Answers string requests by prefixing them with "echo ".
class echo_handler : public recording_handler {
public:
  using recording_handler::recording_handler;

  expected<caf::message> handle_request(const caf::message& msg) override {
    if (auto v = caf::make_const_typed_message_view<std::string>(msg))
      return caf::make_message("echo " + get<0>(v));
    return make_error(ec::unexpected_request);
  }
};

struct fixture : cluster_fixture {
  using log_ptr = recording_handler::log_ptr;

  endpoint earth_ep = ep("earth", 1);
  endpoint mars_ep = ep("mars", 2);

  runtime& earth;
  runtime& mars;

  log_ptr earth_log = std::make_shared<recording_handler::log_type>();
  log_ptr mars_log = std::make_shared<recording_handler::log_type>();

  fixture()
    : earth(add_node(alpha, "earth", 1)), mars(add_node(beta, "mars", 2)) {
    // nop
  }

  template <class Handler = recording_handler>
  void bind(runtime& rt, const role& key, log_ptr log, error reject = {}) {
    if (auto err = rt.bind(key, std::make_unique<Handler>(log, reject)))
      FAIL("bind failed: " << to_string(err));
  }

  static std::string reply_of(expected<caf::message> res) {
    if (!res)
      FAIL("dispatch failed: " << to_string(res.error()));
    if (auto v = caf::make_const_typed_message_view<std::string>(*res))
      return get<0>(v);
    FAIL("unexpected reply: " << to_string(*res));
  }

  static std::vector<endpoint> nodes_of(const dispatch_results& xs) {
    std::vector<endpoint> result;
    for (auto& x : xs)
      result.emplace_back(x.node);
    return result;
  }

  bool logged(const log_ptr& log, const std::string& what) {
    return wait_for([&] { return log->contains(what); });
  }
};

} // namespace

FIXTURE_SCOPE(dispatcher_tests, fixture)

TEST(bind registers a handler per role) {
  CHECK(!earth.dispatcher().get_handler(beta));
  bind(earth, beta, earth_log);
  CHECK(earth.dispatcher().get_handler(beta));
  CHECK(!earth.dispatcher().get_handler(role{"gamma"}));
  CHECK(logged(earth_log, "init"));
}

TEST(the default handler receives messages for unbound roles) {
  auto log = std::make_shared<recording_handler::log_type>();
  REQUIRE(!earth.default_bind(std::make_unique<echo_handler>(log)));
  CHECK(earth.dispatcher().get_handler(role{"gamma"}));
  CHECK_EQUAL(reply_of(earth.dispatcher().dispatch(role{"gamma"},
                                                   caf::make_message("hi"s))),
              "echo hi"s);
}

TEST(dispatching to an unbound role fails with unknown_mode) {
  auto res = earth.dispatcher().dispatch(beta, caf::make_message("hi"s));
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::unknown_mode);
}

TEST(handlers reject custom requests by default) {
  bind(earth, beta, earth_log);
  auto res = earth.dispatcher().dispatch(beta, caf::make_message("hi"s));
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::unexpected_request);
}

TEST(dispatch reaches handlers of remote runtimes) {
  bind<echo_handler>(mars, alpha, mars_log);
  auto res = earth.dispatcher().dispatch(mars_ep, alpha,
                                         caf::make_message("ping"s));
  CHECK_EQUAL(reply_of(std::move(res)), "echo ping"s);
}

TEST(dispatch to an unknown endpoint fails with unreachable) {
  auto res = earth.dispatcher().dispatch(ep("pluto", 9), alpha,
                                         caf::make_message("ping"s));
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::unreachable);
}

TEST(connect runs the accept protocol on both sides) {
  bind(earth, beta, earth_log);
  bind(mars, alpha, mars_log);
  auto res = earth.connect(mars_ep, beta);
  REQUIRE(res);
  CHECK_EQUAL(*res, beta);
  CHECK(logged(mars_log, "accept earth:1 alpha"));
  CHECK(logged(earth_log, "accept mars:2 beta"));
}

TEST(connect fails with incompatible for other protocol versions) {
  auto venus = sys.spawn([](caf::event_based_actor*) -> caf::behavior {
    return {
      [](internal::atom::probe) {
        return beacon_info{role::worker(), version::protocol + 1, {}};
      },
    };
  });
  self
    ->request(resolver, caf::infinite, internal::atom::publish_v,
              ep("venus", 3), venus)
    .receive([] {},
             [](caf::error& err) {
               FAIL("publish failed: " << to_string(err));
             });
  bind(earth, beta, earth_log);
  auto res = earth.connect(ep("venus", 3));
  caf::anon_send_exit(venus, caf::exit_reason::user_shutdown);
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::incompatible);
  CHECK(!earth.registry().connected(ep("venus", 3)));
  CHECK(!earth_log->contains("accept venus:3 worker"));
}

TEST(rebinding a role replaces the previous handler) {
  auto old_log = std::make_shared<recording_handler::log_type>();
  bind(earth, beta, old_log);
  bind(earth, beta, earth_log);
  bind(mars, alpha, mars_log);
  REQUIRE(earth.connect(mars_ep));
  CHECK(logged(earth_log, "accept mars:2 beta"));
  CHECK(!old_log->contains("accept mars:2 beta"));
}

TEST(connect fails with unknown_mode if the remote has no handler) {
  bind(earth, beta, earth_log);
  auto res = earth.connect(mars_ep);
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::unknown_mode);
  CHECK(!earth_log->contains("accept mars:2 beta"));
}

TEST(connect fails with mode_mismatch for an unexpected role) {
  bind(earth, beta, earth_log);
  bind(mars, alpha, mars_log);
  auto res = earth.connect(mars_ep, role::worker());
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::mode_mismatch);
  CHECK(!mars_log->contains("accept earth:1 alpha"));
}

TEST(connect fails with no_mode if the remote has no role) {
  add_node(role{}, "venus", 3);
  bind(earth, beta, earth_log);
  auto res = earth.connect(ep("venus", 3));
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::no_mode);
}

TEST(connect fails with unreachable for unknown endpoints) {
  auto res = earth.connect(ep("pluto", 9));
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::unreachable);
}

TEST(a remote rejection leaves the local handler untouched) {
  bind(earth, beta, earth_log);
  bind(mars, alpha, mars_log, make_error(ec::rejected, "go away"));
  auto res = earth.connect(mars_ep);
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::rejected);
  CHECK_EQUAL(description_of(res.error()), "go away"s);
  CHECK(!earth_log->contains("accept mars:2 beta"));
}

TEST(a local rejection rolls back the remote side) {
  bind(earth, beta, earth_log, make_error(ec::rejected, "not today"));
  bind(mars, alpha, mars_log);
  auto res = earth.connect(mars_ep);
  REQUIRE(!res);
  CHECK_EQUAL(code_of(res.error()), ec::rejected);
  CHECK(logged(mars_log, "accept earth:1 alpha"));
  CHECK(logged(mars_log, "remove earth:1"));
}

TEST(disconnect removes the connection on both sides) {
  bind(earth, beta, earth_log);
  bind(mars, alpha, mars_log);
  REQUIRE(earth.connect(mars_ep));
  CHECK(!earth.disconnect(mars_ep, beta));
  CHECK(logged(earth_log, "remove mars:2"));
  CHECK(logged(mars_log, "remove earth:1"));
}

TEST(stopping a runtime triggers remote_down exactly once) {
  bind(earth, beta, earth_log);
  bind(mars, alpha, mars_log);
  REQUIRE(earth.connect(mars_ep));
  kill(mars_ep);
  CHECK(logged(earth_log, "down mars:2"));
  auto entries = earth_log->snapshot();
  CHECK_EQUAL(std::count(entries.begin(), entries.end(), "down mars:2"s), 1);
}

TEST(dispatch_many collects one reply per endpoint) {
  add_node(beta, "venus", 3);
  bind<echo_handler>(mars, alpha, mars_log);
  bind<echo_handler>(node_at(ep("venus", 3)), alpha, mars_log);
  auto results = earth.dispatcher().dispatch_many(
    {ep("venus", 3), mars_ep, ep("venus", 3)}, alpha,
    caf::make_message("ping"s));
  REQUIRE_EQUAL(results.size(), 2u);
  CHECK_EQUAL(nodes_of(results),
              (std::vector<endpoint>{mars_ep, ep("venus", 3)}));
  for (auto& x : results) {
    CHECK(!x.reason);
    CHECK_EQUAL(reply_of(x.reply), "echo ping"s);
  }
}

TEST(dispatch_many reports failures per endpoint) {
  bind<echo_handler>(mars, alpha, mars_log);
  auto results = earth.dispatcher().dispatch_many(
    {mars_ep, ep("pluto", 9)}, alpha, caf::make_message("ping"s));
  REQUIRE_EQUAL(results.size(), 2u);
  CHECK_EQUAL(results[0].node, mars_ep);
  CHECK_EQUAL(reply_of(results[0].reply), "echo ping"s);
  CHECK_EQUAL(results[1].node, ep("pluto", 9));
  CHECK_EQUAL(code_of(results[1].reason), ec::unreachable);
}

TEST(dispatch_many without endpoints returns nothing) {
  CHECK(earth.dispatcher()
          .dispatch_many({}, alpha, caf::make_message("ping"s))
          .empty());
}

TEST(the master dispatches to all workers or to tagged workers) {
  auto& master = add_node(role::master(), "saturn", 6);
  auto& venus = add_node(role::worker(), "venus", 3, {"gpu"});
  auto& pluto = add_node(role::worker(), "pluto", 4);
  CHECK(master.dispatcher()
          .dispatch_workers(alpha, caf::make_message("ping"s))
          .empty());
  bind<echo_handler>(venus, alpha, mars_log);
  bind<echo_handler>(pluto, alpha, mars_log);
  REQUIRE(worker_connection{master}
            .connect({ep("venus", 3), ep("pluto", 4)})
            .empty());
  auto all = master.dispatcher().dispatch_workers(alpha,
                                                  caf::make_message("hi"s));
  CHECK_EQUAL(nodes_of(all),
              (std::vector<endpoint>{ep("pluto", 4), ep("venus", 3)}));
  for (auto& x : all)
    CHECK_EQUAL(reply_of(x.reply), "echo hi"s);
  auto tagged = master.dispatcher().dispatch_tagged(
    "gpu", alpha, caf::make_message("hi"s));
  CHECK_EQUAL(nodes_of(tagged), std::vector<endpoint>{ep("venus", 3)});
  CHECK(master.dispatcher()
          .dispatch_tagged("ssd", alpha, caf::make_message("hi"s))
          .empty());
}

FIXTURE_SCOPE_END()
