#include <catch2/catch.hpp>

#include "common/errors.h"
#include "net/hostlist.h"

#include <string>
#include <vector>

using namespace sweepflux;

TEST_CASE("Plain host names pass through in order", "[hostlist]") {
  REQUIRE(ExpandHostList("login1,gpu7, gpu3") ==
          std::vector<std::string>{"login1", "gpu7", "gpu3"});
  REQUIRE(ExpandHostList("").empty());
}

TEST_CASE("Bracket ranges expand and keep zero padding", "[hostlist]") {
  REQUIRE(ExpandHostList("gb200-[01-03,07]") ==
          std::vector<std::string>{"gb200-01", "gb200-02", "gb200-03",
                                   "gb200-07"});
  REQUIRE(ExpandHostList("node[8-10]") ==
          std::vector<std::string>{"node8", "node9", "node10"});
}

TEST_CASE("Ranges mix with plain names and suffixes", "[hostlist]") {
  REQUIRE(ExpandHostList("a-[1-2]-ib,head") ==
          std::vector<std::string>{"a-1-ib", "a-2-ib", "head"});
}

TEST_CASE("Duplicates are dropped keeping first occurrence", "[hostlist]") {
  REQUIRE(ExpandHostList("n[1-3],n2,n1") ==
          std::vector<std::string>{"n1", "n2", "n3"});
}

TEST_CASE("Malformed host lists are configuration errors", "[hostlist]") {
  REQUIRE_THROWS_AS(ExpandHostList("n[1-3"), ConfigurationError);
  REQUIRE_THROWS_AS(ExpandHostList("n1-3]"), ConfigurationError);
  REQUIRE_THROWS_AS(ExpandHostList("n[5-2]"), ConfigurationError);
  REQUIRE_THROWS_AS(ExpandHostList("n[a-b]"), ConfigurationError);
  REQUIRE_THROWS_AS(ExpandHostList("r[1-2]n[1-2]"), ConfigurationError);
}
