#define SUITE registry

#include "skitter/registry.hh"

#include "test.hh"

#include <thread>

using namespace skitter;

namespace {

struct fixture {
  registry_ptr reg = make_registry();

  endpoint earth = ep("earth", 1);
  endpoint mars = ep("mars", 2);
  endpoint venus = ep("venus", 3);
};

} // namespace

FIXTURE_SCOPE(registry_tests, fixture)

TEST(a new registry is empty) {
  CHECK_EQUAL(reg->size(), 0u);
  CHECK(reg->all().empty());
  CHECK(!reg->master());
  CHECK(reg->workers().empty());
}

TEST(add records endpoints with their role) {
  CHECK(reg->add(earth, role::master()));
  CHECK(reg->add(mars, role::worker()));
  CHECK(reg->connected(earth));
  CHECK(reg->connected(mars));
  CHECK(!reg->connected(venus));
  CHECK_EQUAL(reg->role_of(mars), role::worker());
  CHECK_EQUAL(reg->master(), earth);
  CHECK_EQUAL(reg->workers(), std::vector<endpoint>{mars});
  CHECK_EQUAL(reg->size(), 2u);
}

TEST(add refuses duplicates and keeps the first record) {
  CHECK(reg->add(mars, role::worker(), {"gpu"}));
  CHECK(!reg->add(mars, role::master(), {"ssd"}));
  CHECK_EQUAL(reg->role_of(mars), role::worker());
  CHECK_EQUAL(reg->load()->records.at(mars).tags, tag_set{"gpu"});
  CHECK_EQUAL(reg->size(), 1u);
}

TEST(remove drops the record along with its tags) {
  reg->add(mars, role::worker(), {"gpu", "ssd"});
  reg->add(venus, role::worker(), {"gpu"});
  CHECK(reg->remove(mars));
  CHECK(!reg->remove(mars));
  CHECK(!reg->connected(mars));
  auto st = reg->load();
  CHECK_EQUAL(st->tags_of.count(mars), 0u);
  CHECK_EQUAL(st->by_tag.count("ssd"), 0u);
  CHECK_EQUAL(st->by_tag.at("gpu"), std::set<endpoint>{venus});
}

TEST(remove_all clears the registry) {
  reg->add(earth, role::master());
  reg->add(mars, role::worker(), {"gpu"});
  reg->remove_all();
  CHECK_EQUAL(reg->size(), 0u);
  CHECK(reg->load()->by_tag.empty());
}

TEST(snapshots stay valid after mutations) {
  reg->add(mars, role::worker());
  auto before = reg->load();
  reg->remove(mars);
  CHECK_EQUAL(before->records.size(), 1u);
  CHECK_EQUAL(reg->load()->records.size(), 0u);
}

TEST(concurrent writers never lose updates) {
  std::vector<std::thread> threads;
  for (uint16_t i = 0; i < 4; ++i)
    threads.emplace_back([this, i] {
      for (uint16_t j = 0; j < 100; ++j)
        reg->add(ep("node-" + std::to_string(i), j), role::worker());
    });
  for (auto& t : threads)
    t.join();
  CHECK_EQUAL(reg->size(), 400u);
}

FIXTURE_SCOPE_END()
