#define SUITE logger

#include "skitter/logger.hh"

#include "test.hh"

#include <stdexcept>
#include <string>

using namespace skitter;
using namespace std::string_literals;

namespace {

class collecting_observer : public event_observer {
public:
  void observe(event_ptr what) override {
    std::unique_lock<std::mutex> guard{mtx};
    events.emplace_back(std::move(what));
  }

  bool accepts(event::severity_level severity,
               event::component_type component) const override {
    return severity <= event::severity_level::debug
           && component == event::component_type::registry;
  }

  std::mutex mtx;
  std::vector<event_ptr> events;
};

struct fixture {
  std::shared_ptr<collecting_observer> observer;

  fixture() : observer(std::make_shared<collecting_observer>()) {
    logger(observer);
  }

  ~fixture() {
    logger(nullptr);
  }
};

} // namespace

FIXTURE_SCOPE(logger_tests, fixture)

TEST(severity levels are convertible to and from string) {
  auto level = event::severity_level::critical;
  CHECK(convert("verbose", level));
  CHECK(level == event::severity_level::verbose);
  CHECK(!convert("chatty", level));
  CHECK_EQUAL(std::string{to_string(event::severity_level::warning)},
              "warning"s);
  CHECK_EQUAL(std::string{to_string(event::component_type::connection)},
              "connection"s);
}

TEST(make_console_logger rejects unknown severity levels) {
  CHECK(make_console_logger("debug") != nullptr);
  auto threw = false;
  try {
    make_console_logger("chatty");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  CHECK(threw);
}

TEST(observers receive events of accepted components) {
  auto reg = make_registry();
  reg->add(ep("mars", 2), role::worker());
  REQUIRE_EQUAL(observer->events.size(), 1u);
  auto& ev = *observer->events.front();
  CHECK(ev.severity == event::severity_level::debug);
  CHECK(ev.component == event::component_type::registry);
  CHECK_EQUAL(std::string{ev.identifier}, "add"s);
  CHECK_EQUAL(ev.description, "added mars:2 as worker"s);
}

FIXTURE_SCOPE_END()
