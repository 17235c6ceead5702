#define SUITE tag_index

#include "skitter/tag_index.hh"

#include "test.hh"

#include <string>

using namespace skitter;
using namespace std::string_literals;

namespace {

struct fixture {
  registry_ptr reg = make_registry();

  tag_index tags{reg};

  endpoint earth = ep("earth", 1);
  endpoint mars = ep("mars", 2);
  endpoint venus = ep("venus", 3);

  fixture() {
    reg->add(earth, role::master());
    reg->add(mars, role::worker(), {"gpu", "ssd"});
    reg->add(venus, role::worker(), {"gpu"});
  }
};

} // namespace

FIXTURE_SCOPE(tag_index_tests, fixture)

TEST(workers_with returns all workers carrying a tag) {
  CHECK_EQUAL(tags.workers_with("gpu"), (std::set<endpoint>{mars, venus}));
  CHECK_EQUAL(tags.workers_with("ssd"), std::set<endpoint>{mars});
  CHECK(tags.workers_with("fpga").empty());
}

TEST(of_worker returns the tags of a single worker) {
  CHECK_EQUAL(tags.of_worker(mars), (tag_set{"gpu", "ssd"}));
  CHECK(tags.of_worker(earth).empty());
}

TEST(of_all_workers lists workers without tags as well) {
  auto untagged = ep("pluto", 4);
  reg->add(untagged, role::worker());
  auto all = tags.of_all_workers();
  CHECK_EQUAL(all.size(), 3u);
  CHECK_EQUAL(all.count(earth), 0u);
  CHECK(all.at(untagged).empty());
  CHECK_EQUAL(all.at(venus), tag_set{"gpu"});
}

TEST(add merges tags) {
  tags.add(venus, {"ssd"});
  CHECK_EQUAL(tags.of_worker(venus), (tag_set{"gpu", "ssd"}));
  CHECK_EQUAL(tags.workers_with("ssd"), (std::set<endpoint>{mars, venus}));
}

TEST(removing a worker from the registry removes its tags) {
  reg->remove(mars);
  CHECK_EQUAL(tags.workers_with("gpu"), std::set<endpoint>{venus});
  CHECK(tags.workers_with("ssd").empty());
  CHECK(tags.of_worker(mars).empty());
}

TEST(tag sets render as lists) {
  CHECK_EQUAL(to_string(tag_set{}), "[]"s);
  CHECK_EQUAL(to_string(tag_set{"ssd", "gpu"}), "[gpu, ssd]"s);
}

FIXTURE_SCOPE_END()
