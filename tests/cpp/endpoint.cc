#define SUITE endpoint

#include "skitter/endpoint.hh"

#include "test.hh"

#include <string>
#include <unordered_set>

using namespace skitter;
using namespace std::string_literals;

namespace {

endpoint parse(std::string_view str) {
  endpoint result;
  if (!convert(str, result))
    FAIL("unable to parse " << str);
  return result;
}

bool parses(std::string_view str) {
  endpoint tmp;
  return convert(str, tmp);
}

} // namespace

TEST(endpoints are ordered by host and port) {
  CHECK_LESS(ep("earth", 1), ep("earth", 2));
  CHECK_LESS(ep("earth", 9), ep("mars", 1));
  CHECK_EQUAL(ep("earth", 1), ep("earth", 1));
  CHECK_NOT_EQUAL(ep("earth", 1), ep("earth", 2));
}

TEST(default constructed endpoints are empty) {
  CHECK(endpoint{}.empty());
  CHECK(!ep("earth", 0).empty());
  CHECK(!ep("", 1).empty());
}

TEST(endpoints render as host and port) {
  CHECK_EQUAL(to_string(ep("earth", 8080)), "earth:8080"s);
  CHECK_EQUAL(to_string(ep("10.0.0.1", 1)), "10.0.0.1:1"s);
  CHECK_EQUAL(to_string(ep("::1", 4040)), "[::1]:4040"s);
}

TEST(convert parses host and port) {
  CHECK_EQUAL(parse("earth:8080"), ep("earth", 8080));
  CHECK_EQUAL(parse("[::1]:4040"), ep("::1", 4040));
  CHECK_EQUAL(parse("localhost:0"), ep("localhost", 0));
}

TEST(convert rejects malformed input) {
  CHECK(!parses(""));
  CHECK(!parses("earth"));
  CHECK(!parses("earth:"));
  CHECK(!parses(":8080"));
  CHECK(!parses("earth:http"));
  CHECK(!parses("earth:65536"));
  CHECK(!parses("::1:4040"));
  CHECK(!parses("[]:4040"));
}

TEST(endpoints are hashable) {
  std::unordered_set<endpoint> xs;
  xs.emplace(ep("earth", 1));
  xs.emplace(ep("earth", 1));
  xs.emplace(ep("mars", 1));
  CHECK_EQUAL(xs.size(), 2u);
}
