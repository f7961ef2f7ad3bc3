#pragma once

#include "address.h"
#include "errors.h"
#include "value.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// One declared resource record, as produced by the manifest loader
struct resource_decl {
  std::string type;
  std::string name;
  attribute_map attributes;
  std::vector<std::string> depends_on;  // "type.name" or "type.name[i]"
  std::optional<std::int64_t> count;    // set for collection-producing declarations
};

// Concrete node after expansion; counted declarations yield one node per index
struct resource_node {
  resource_address address;
  attribute_map attributes;
  std::vector<std::string> depends_on;

  std::string const &type() const { return address.type(); }
};

struct expansion {
  std::vector<resource_node> nodes;  // declaration order, instances ascending
  std::map<std::string, std::int64_t> collections;  // "type.name" -> count
  std::vector<diagnostic> diagnostics;

  bool is_collection(std::string const &base) const { return collections.contains(base); }
};

// Expands counted declarations into indexed nodes, substituting count_index() with the
// instance index. Indices are 0..count-1, so the same declarations always produce the
// same addresses.
expansion expand_declarations(std::vector<resource_decl> const &decls);

}  // namespace strata
