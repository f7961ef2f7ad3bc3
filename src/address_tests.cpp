#include "address.h"

#include "doctest/doctest.h"

#include <set>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

TEST_CASE("resource_address parses type.name") {
  auto const a{ strata::resource_address::parse("aws_vpc.main") };
  CHECK(a.type() == "aws_vpc");
  CHECK(a.name() == "main");
  CHECK_FALSE(a.index().has_value());
  CHECK(a.str() == "aws_vpc.main");
}

TEST_CASE("resource_address parses indexed instances") {
  auto const a{ strata::resource_address::parse("aws_subnet.private[12]") };
  CHECK(a.type() == "aws_subnet");
  CHECK(a.name() == "private");
  REQUIRE(a.index().has_value());
  CHECK(*a.index() == 12);
  CHECK(a.str() == "aws_subnet.private[12]");
  CHECK(a.base() == "aws_subnet.private");
  CHECK(a.without_index() == strata::resource_address{ "aws_subnet", "private" });
}

TEST_CASE("resource_address accepts dashes and underscores after the first char") {
  CHECK_NOTHROW(strata::resource_address::parse("_t.my-name_2"));
}

TEST_CASE("resource_address rejects malformed input") {
  CHECK_THROWS_AS(strata::resource_address::parse("nodot"), std::runtime_error);
  CHECK_THROWS_AS(strata::resource_address::parse(".name"), std::runtime_error);
  CHECK_THROWS_AS(strata::resource_address::parse("type."), std::runtime_error);
  CHECK_THROWS_AS(strata::resource_address::parse("t.n[1"), std::runtime_error);
  CHECK_THROWS_AS(strata::resource_address::parse("t.n[]"), std::runtime_error);
  CHECK_THROWS_AS(strata::resource_address::parse("t.n[-1]"), std::runtime_error);
  CHECK_THROWS_AS(strata::resource_address::parse("t.n[x]"), std::runtime_error);
  CHECK_THROWS_AS(strata::resource_address::parse("1t.n"), std::runtime_error);
  CHECK_THROWS_AS(strata::resource_address::parse("t.n.extra"), std::runtime_error);
}

TEST_CASE("resource_address orders by type, name, then index") {
  std::set<strata::resource_address> const sorted{
    { "b", "x" },
    { "a", "y" },
    { "a", "x", 1 },
    { "a", "x" },
    { "a", "x", 0 },
  };

  std::vector<std::string> labels;
  for (auto const &a : sorted) { labels.push_back(a.str()); }
  CHECK(labels == std::vector<std::string>{ "a.x", "a.x[0]", "a.x[1]", "a.y", "b.x" });
}

TEST_CASE("resource_address hashes instances apart") {
  std::unordered_set<strata::resource_address> const set{ { "t", "n" },
                                                          { "t", "n", 0 },
                                                          { "t", "n", 1 } };
  CHECK(set.size() == 3);
  CHECK(set.contains(strata::resource_address::parse("t.n[1]")));
}

TEST_CASE("address_is_identifier") {
  CHECK(strata::address_is_identifier("aws_vpc"));
  CHECK(strata::address_is_identifier("A"));
  CHECK(strata::address_is_identifier("web-1"));
  CHECK_FALSE(strata::address_is_identifier(""));
  CHECK_FALSE(strata::address_is_identifier("-web"));
  CHECK_FALSE(strata::address_is_identifier("9lives"));
  CHECK_FALSE(strata::address_is_identifier("a.b"));
  CHECK_FALSE(strata::address_is_identifier("a b"));
}
