#pragma once

#include "action.h"
#include "address.h"
#include "declaration.h"
#include "errors.h"
#include "provider.h"
#include "state.h"
#include "value.h"

#include <cstddef>
#include <string>
#include <vector>

namespace strata {

// One provider call in the plan. A replace contributes two steps (create + destroy),
// ordered by its replace_mode; NoOp steps keep the dependency chain intact so failure
// containment still sees them.
struct action {
  std::size_t index{ 0 };  // position in plan::actions
  resource_address address;
  std::string type;
  action_kind kind{ action_kind::noop };
  operation op{ operation::none };
  replace_mode replace{ replace_mode::none };
  bool deposed{ false };  // destroys a leftover object from an earlier replace

  std::string prior_id;   // object an update/destroy targets
  attribute_map desired;  // create/update: declared attributes, references still unresolved
  std::vector<std::string> changed_attributes;
  std::vector<std::string> dependencies;  // resource addresses recorded into state
  std::vector<std::size_t> depends_on;    // actions that must reach a terminal success first
  std::string reason;

  std::string label() const;
};

struct plan {
  std::vector<action> actions;  // a valid topological order of the action graph
  std::vector<diagnostic> diagnostics;
  state_snapshot prior_state;  // snapshot the plan was computed against

  bool valid() const { return diagnostics.empty(); }
  bool has_changes() const;
};

// Validates declarations, resolves references, builds the dependency graph and
// classifies each resource against the snapshot. Problems are returned as diagnostics;
// a plan with diagnostics has no actions. Never mutates anything.
plan make_plan(std::vector<resource_decl> const &decls,
               state_snapshot const &current,
               provider_registry const &registry);

struct plan_summary {
  std::size_t add{ 0 };
  std::size_t change{ 0 };
  std::size_t replace{ 0 };
  std::size_t destroy{ 0 };
};

plan_summary plan_summarize(plan const &p);

// "Plan: 1 to add, 0 to change, 0 to replace, 2 to destroy."
std::string plan_summary_line(plan_summary const &s);

// One line per changing resource: "+", "~", "-/+" (destroy first), "+/-" (create first),
// "-"; NoOp resources are omitted.
std::vector<std::string> plan_render(plan const &p);

}  // namespace strata
