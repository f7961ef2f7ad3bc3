#pragma once

#include <string_view>

namespace strata {

// Per-resource classification produced by the planner
enum class action_kind : int {
  noop = 0,
  create = 1,
  update = 2,
  replace = 3,
  destroy = 4,
};

// Provider call a single plan step performs. A replace yields two steps.
enum class operation : int {
  none = 0,
  create = 1,
  update = 2,
  destroy = 3,
};

enum class replace_mode : int {
  none = 0,
  create_before_destroy = 1,
  destroy_before_create = 2,
};

std::string_view action_kind_name(action_kind k);
std::string_view operation_name(operation op);

}  // namespace strata
