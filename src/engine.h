#pragma once

#include "declaration.h"
#include "executor.h"
#include "planner.h"
#include "provider.h"
#include "state.h"
#include "util.h"

#include <chrono>
#include <optional>
#include <vector>

namespace strata {

struct engine_cfg {
  executor_cfg exec;
  std::chrono::seconds lock_ttl{ 300 };
  bool refresh{ false };  // read every recorded object before planning
};

struct engine_result {
  plan planned;
  std::optional<apply_report> applied;  // unset for plan-only runs
};

// Ties planner, executor and state store together. Holds the state lock for the whole
// plan/apply cycle; a second engine on the same store fails fast with
// state_conflict_error.
class engine : unmovable {
 public:
  engine(state_store &store, provider_registry const &registry, engine_cfg cfg);

  plan make_plan(std::vector<resource_decl> const &decls,
                 state_snapshot const &current) const;

  // Reads every recorded object back from its provider. Vanished objects are dropped
  // from the snapshot; drifted attributes overwrite the recorded ones so the next plan
  // repairs them. Returns true when the snapshot changed.
  bool refresh(state_snapshot &snapshot) const;

  // Applies a plan computed earlier. Throws state_conflict_error when the stored
  // snapshot no longer matches the one the plan was computed against.
  apply_report apply(plan const &p, cancellation const &cancel);

  // Lock, load, optionally refresh, plan, and apply when apply_changes is set
  engine_result run(std::vector<resource_decl> const &decls,
                    bool apply_changes,
                    cancellation const &cancel);

 private:
  apply_report execute(plan const &p, cancellation const &cancel);

  state_store &store_;
  provider_registry const &registry_;
  engine_cfg cfg_;
};

}  // namespace strata
