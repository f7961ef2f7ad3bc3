#pragma once

#include "address.h"
#include "declaration.h"
#include "errors.h"
#include "graph.h"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata {

// dependent must be applied after dependency (indices into expansion::nodes)
struct resolved_edge {
  std::size_t dependent;
  std::size_t dependency;
  std::string attribute;  // where the reference appears, "depends_on" for explicit edges
  bool explicit_dependency{ false };
};

// Reference whose target exists only in state and is about to be destroyed
struct dangling_candidate {
  std::size_t dependent;
  std::string attribute;
  resource_address target;
};

struct resolution {
  std::vector<resolved_edge> edges;
  std::vector<dangling_candidate> dangling;
  std::vector<diagnostic> diagnostics;
};

// Walks every attribute expression and explicit depends_on entry of the expanded nodes.
// state_addresses lets references to resources that are still recorded in state, but no
// longer declared, be reported as dangling rather than unresolved.
resolution resolve_references(expansion const &exp,
                              std::set<resource_address> const &state_addresses);

struct resource_graph {
  dependency_graph forward;  // node i is exp.nodes[i]; edges point at dependencies
  dependency_graph reverse;  // teardown order
  std::optional<std::vector<std::string>> cycle;
};

// Merges reference edges and explicit edges into one graph and checks it for cycles
resource_graph build_resource_graph(expansion const &exp,
                                    std::vector<resolved_edge> const &edges);

}  // namespace strata
