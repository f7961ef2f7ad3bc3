#include "action.h"

#include <array>

namespace strata {

namespace {

// Order must match action_kind enum in action.h
constinit std::array<std::string_view, 5> const action_kind_name_table{ {
    "noop",     // action_kind::noop (0)
    "create",   // action_kind::create (1)
    "update",   // action_kind::update (2)
    "replace",  // action_kind::replace (3)
    "destroy",  // action_kind::destroy (4)
} };

}  // namespace

std::string_view action_kind_name(action_kind k) {
  auto const idx{ static_cast<std::size_t>(k) };
  if (idx >= action_kind_name_table.size()) { return "unknown"; }
  return action_kind_name_table[idx];
}

std::string_view operation_name(operation op) {
  switch (op) {
    case operation::none: return "none";
    case operation::create: return "create";
    case operation::update: return "update";
    case operation::destroy: return "destroy";
  }
  return "unknown";
}

}  // namespace strata
