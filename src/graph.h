#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// Directed graph over dense node indices. add_edge(a, b) records that a depends on b,
// so b must be processed before a.
class dependency_graph {
 public:
  std::size_t add_node(std::string label);

  // Duplicate edges are ignored; returns true if the edge was new
  bool add_edge(std::size_t dependent, std::size_t dependency);

  std::size_t size() const { return labels_.size(); }
  std::string const &label(std::size_t n) const { return labels_[n]; }
  std::vector<std::size_t> const &dependencies(std::size_t n) const { return deps_[n]; }
  std::vector<std::size_t> const &dependents(std::size_t n) const { return rdeps_[n]; }

  // Depth-first search with unvisited/in-progress/done marking on an explicit stack.
  // Returns the labels along the first back edge found, the first label repeated at the
  // end ("a -> b -> a"), or nullopt when the graph is acyclic.
  std::optional<std::vector<std::string>> find_cycle() const;

  // Dependencies before dependents; among ready nodes the lowest index goes first, so
  // the order is deterministic. Throws cycle_error.
  std::vector<std::size_t> topo_order() const;

  // Same nodes with every edge flipped; its topo order is a valid teardown order.
  dependency_graph reversed() const;

 private:
  std::vector<std::string> labels_;
  std::vector<std::vector<std::size_t>> deps_;
  std::vector<std::vector<std::size_t>> rdeps_;
};

}  // namespace strata
