#define SUITE role

#include "skitter/role.hh"

#include "test.hh"

#include <string>

using namespace skitter;
using namespace std::string_literals;

TEST(the built-in roles are master and worker) {
  CHECK(role::master().is_master());
  CHECK(!role::master().is_worker());
  CHECK(role::worker().is_worker());
  CHECK_EQUAL(role::master().string(), "master"s);
  CHECK_EQUAL(role::worker().string(), "worker"s);
}

TEST(roles compare by name) {
  CHECK_EQUAL(role{"worker"}, role::worker());
  CHECK_NOT_EQUAL(role{"test-role"}, role::worker());
  CHECK_LESS(role::master(), role::worker());
}

TEST(an unset role renders as none) {
  CHECK(role{}.empty());
  CHECK_EQUAL(to_string(role{}), "none"s);
  CHECK_EQUAL(to_string(role{"test-role"}), "test-role"s);
}
