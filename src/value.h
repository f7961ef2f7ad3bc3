#pragma once

#include "address.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata {

// Reference to another resource's attribute, as written in a declaration:
//   "type.name.attr"      direct
//   "type.name[2].attr"   indexed (one instance of a collection)
//   "type.name[*].attr"   all instances of a collection, yields a list
struct reference {
  enum class kind { direct, indexed, all_instances };

  kind k{ kind::direct };
  std::string type;
  std::string name;
  std::optional<std::int64_t> index;
  std::vector<std::string> attribute_path;

  // Throws std::runtime_error on malformed expressions
  static reference parse(std::string_view expr);

  std::string str() const;
  std::string attribute() const;  // dotted attribute path

  // Address of the referenced node; all_instances yields the unindexed base
  resource_address target() const;

  bool operator==(reference const &) const = default;
};

// Placeholder for a value that will only be known once the producing resource has been
// applied. Never equal to anything, including another unknown.
struct unknown_value {
  std::string source;  // reference expression that produced it
};

// Replaced by the instance index when a counted declaration is expanded.
struct count_index {
  bool operator==(count_index const &) const = default;
};

struct value;
using value_list = std::vector<value>;
using value_map = std::map<std::string, value>;

struct value {
  using storage = std::variant<std::monostate,
                               bool,
                               std::int64_t,
                               double,
                               std::string,
                               value_list,
                               value_map,
                               reference,
                               unknown_value,
                               count_index>;

  storage data;

  value() = default;
  value(bool b) : data{ b } {}
  value(int i) : data{ static_cast<std::int64_t>(i) } {}
  value(std::int64_t i) : data{ i } {}
  value(double d) : data{ d } {}
  value(char const *s) : data{ std::string{ s } } {}
  value(std::string s) : data{ std::move(s) } {}
  value(value_list l) : data{ std::move(l) } {}
  value(value_map m) : data{ std::move(m) } {}
  value(reference r) : data{ std::move(r) } {}
  value(unknown_value u) : data{ std::move(u) } {}
  value(count_index c) : data{ c } {}

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(data);
  }

  template <typename T>
  T const *get_if() const {
    return std::get_if<T>(&data);
  }

  bool is_null() const { return is<std::monostate>(); }

  // True when no reference, unknown or count_index appears anywhere inside.
  bool is_known() const;
};

using attribute_map = std::map<std::string, value>;

// Structural equality. Unknown values compare unequal to everything; integers and
// doubles compare numerically.
bool operator==(value const &a, value const &b);

std::string value_to_string(value const &v);

// Follows a dotted attribute path into nested maps. Returns nullopt when a segment is
// missing or the value at that point is not a map.
std::optional<value> value_lookup(attribute_map const &attrs,
                                  std::span<std::string const> path);

std::string attribute_map_to_string(attribute_map const &attrs);

// Rebuilds v with every reference replaced by fn(reference); lists and maps are walked
value value_substitute_references(value const &v,
                                  std::function<value(reference const &)> const &fn);

attribute_map attribute_map_substitute_references(
    attribute_map const &attrs,
    std::function<value(reference const &)> const &fn);

}  // namespace strata
