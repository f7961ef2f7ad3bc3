#include "graph.h"

#include "errors.h"

#include "doctest/doctest.h"

#include <algorithm>
#include <string>
#include <vector>

namespace {

strata::dependency_graph make_graph(std::vector<std::string> const &labels) {
  strata::dependency_graph g;
  for (auto const &label : labels) { g.add_node(label); }
  return g;
}

std::size_t position(std::vector<std::size_t> const &order, std::size_t n) {
  return static_cast<std::size_t>(std::ranges::find(order, n) - order.begin());
}

}  // namespace

TEST_CASE("dependency_graph records both directions") {
  auto g{ make_graph({ "vpc", "subnet", "instance" }) };
  CHECK(g.add_edge(1, 0));
  CHECK(g.add_edge(2, 1));
  CHECK_FALSE(g.add_edge(2, 1));

  CHECK(g.size() == 3);
  CHECK(g.dependencies(1) == std::vector<std::size_t>{ 0 });
  CHECK(g.dependents(1) == std::vector<std::size_t>{ 2 });
  CHECK(g.dependents(2).empty());
}

TEST_CASE("topo_order puts dependencies first") {
  auto g{ make_graph({ "instance", "subnet", "vpc", "sg" }) };
  g.add_edge(0, 1);
  g.add_edge(1, 2);
  g.add_edge(0, 3);
  g.add_edge(3, 2);

  auto const order{ g.topo_order() };
  REQUIRE(order.size() == 4);
  CHECK(order.front() == 2);
  CHECK(order.back() == 0);
  CHECK(position(order, 1) < position(order, 0));
  CHECK(position(order, 3) < position(order, 0));
}

TEST_CASE("topo_order is deterministic among independent nodes") {
  auto g{ make_graph({ "a", "b", "c", "d" }) };
  CHECK(g.topo_order() == std::vector<std::size_t>{ 0, 1, 2, 3 });

  g.add_edge(0, 3);
  CHECK(g.topo_order() == std::vector<std::size_t>{ 1, 2, 3, 0 });
}

TEST_CASE("find_cycle returns nullopt for a DAG") {
  auto g{ make_graph({ "a", "b", "c" }) };
  g.add_edge(0, 1);
  g.add_edge(0, 2);
  g.add_edge(1, 2);
  CHECK_FALSE(g.find_cycle().has_value());
}

TEST_CASE("find_cycle reports the path along the back edge") {
  auto g{ make_graph({ "a", "b", "c", "d" }) };
  g.add_edge(0, 1);  // a -> b
  g.add_edge(1, 2);  // b -> c
  g.add_edge(2, 1);  // c -> b
  g.add_edge(3, 0);

  auto const cycle{ g.find_cycle() };
  REQUIRE(cycle.has_value());
  CHECK(*cycle == std::vector<std::string>{ "b", "c", "b" });
}

TEST_CASE("find_cycle detects self loops") {
  auto g{ make_graph({ "a" }) };
  g.add_edge(0, 0);
  auto const cycle{ g.find_cycle() };
  REQUIRE(cycle.has_value());
  CHECK(*cycle == std::vector<std::string>{ "a", "a" });
}

TEST_CASE("topo_order throws cycle_error carrying the path") {
  auto g{ make_graph({ "a", "b" }) };
  g.add_edge(0, 1);
  g.add_edge(1, 0);

  try {
    g.topo_order();
    FAIL("expected cycle_error");
  } catch (strata::cycle_error const &e) {
    CHECK(e.path() == std::vector<std::string>{ "a", "b", "a" });
    CHECK(std::string{ e.what() } == "Dependency cycle: a -> b -> a");
  }
}

TEST_CASE("find_cycle handles deep chains without recursion") {
  strata::dependency_graph g;
  constexpr std::size_t kDepth{ 100000 };
  for (std::size_t i{ 0 }; i < kDepth; ++i) { g.add_node("n" + std::to_string(i)); }
  for (std::size_t i{ 1 }; i < kDepth; ++i) { g.add_edge(i - 1, i); }

  CHECK_FALSE(g.find_cycle().has_value());

  g.add_edge(kDepth - 1, 0);
  auto const cycle{ g.find_cycle() };
  REQUIRE(cycle.has_value());
  CHECK(cycle->size() == kDepth + 1);
  CHECK(cycle->front() == cycle->back());
}

TEST_CASE("reversed flips every edge") {
  auto g{ make_graph({ "vpc", "subnet" }) };
  g.add_edge(1, 0);

  auto const r{ g.reversed() };
  CHECK(r.label(0) == "vpc");
  CHECK(r.dependencies(0) == std::vector<std::size_t>{ 1 });
  CHECK(r.topo_order() == std::vector<std::size_t>{ 1, 0 });
}
