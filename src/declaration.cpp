#include "declaration.h"

#include "trace.h"

#include <algorithm>
#include <set>
#include <utility>

namespace strata {

namespace {

void substitute_count_index(value &v, std::int64_t index) {
  if (v.is<count_index>()) {
    v = value{ index };
  } else if (auto *list{ std::get_if<value_list>(&v.data) }) {
    for (auto &item : *list) { substitute_count_index(item, index); }
  } else if (auto *map{ std::get_if<value_map>(&v.data) }) {
    for (auto &[_, item] : *map) { substitute_count_index(item, index); }
  }
}

bool contains_count_index(value const &v) {
  if (v.is<count_index>()) { return true; }
  if (auto const *list{ v.get_if<value_list>() }) {
    for (auto const &item : *list) {
      if (contains_count_index(item)) { return true; }
    }
  } else if (auto const *map{ v.get_if<value_map>() }) {
    for (auto const &[_, item] : *map) {
      if (contains_count_index(item)) { return true; }
    }
  }
  return false;
}

}  // namespace

expansion expand_declarations(std::vector<resource_decl> const &decls) {
  expansion result;
  std::set<std::string> seen;

  for (auto const &decl : decls) {
    std::string const base{ decl.type + "." + decl.name };

    if (!address_is_identifier(decl.type) || !address_is_identifier(decl.name)) {
      result.diagnostics.push_back({ .kind = diagnostic_kind::invalid_declaration,
                                     .address = base,
                                     .message = "type and name must be identifiers" });
      continue;
    }

    if (!seen.insert(base).second) {
      result.diagnostics.push_back({ .kind = diagnostic_kind::duplicate_address,
                                     .address = base,
                                     .message = "resource declared more than once" });
      continue;
    }

    if (!decl.count) {
      auto const bad{ std::ranges::find_if(decl.attributes, [](auto const &entry) {
        return contains_count_index(entry.second);
      }) };
      if (bad != decl.attributes.end()) {
        result.diagnostics.push_back(
            { .kind = diagnostic_kind::invalid_declaration,
              .address = base,
              .attribute = bad->first,
              .message = "count_index() used in a declaration without count" });
        continue;
      }

      resource_node node{ .address = { decl.type, decl.name },
                          .attributes = decl.attributes,
                          .depends_on = decl.depends_on };
      STRATA_TRACE_NODE_REGISTERED(base, decl.type);
      result.nodes.push_back(std::move(node));
      continue;
    }

    if (*decl.count < 0) {
      result.diagnostics.push_back({ .kind = diagnostic_kind::invalid_declaration,
                                     .address = base,
                                     .attribute = "count",
                                     .message = "count must not be negative" });
      continue;
    }

    result.collections[base] = *decl.count;
    for (std::int64_t i{ 0 }; i < *decl.count; ++i) {
      resource_node node{ .address = { decl.type, decl.name, i },
                          .attributes = decl.attributes,
                          .depends_on = decl.depends_on };
      for (auto &[_, v] : node.attributes) { substitute_count_index(v, i); }
      STRATA_TRACE_NODE_REGISTERED(node.address.str(), decl.type);
      result.nodes.push_back(std::move(node));
    }
  }

  return result;
}

}  // namespace strata
