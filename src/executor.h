#pragma once

#include "action.h"
#include "address.h"
#include "errors.h"
#include "planner.h"
#include "provider.h"
#include "state.h"
#include "util.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace strata {

enum class node_status {
  pending,
  ready,
  running,
  applied,
  failed,
  skipped,
  cancelled,
};

std::string_view node_status_name(node_status s);

enum class apply_result {
  success,
  partial_failure,
  cancelled,
  failed_validation,
};

std::string_view apply_result_name(apply_result r);

struct action_report {
  std::size_t index{ 0 };
  resource_address address;
  operation op{ operation::none };
  action_kind kind{ action_kind::noop };
  node_status status{ node_status::pending };
  int attempts{ 0 };
  std::string error;  // failed: last provider error; skipped: failed dependency
  std::string id;     // object id after a successful create/update
};

struct apply_report {
  apply_result result{ apply_result::success };
  std::vector<action_report> actions;  // parallel to plan::actions
  std::vector<diagnostic> diagnostics;
  std::int64_t final_serial{ 0 };

  std::size_t count(node_status s) const;
};

struct executor_cfg {
  std::size_t parallelism{ 4 };
  int max_attempts{ 5 };
  std::chrono::milliseconds initial_backoff{ 200 };
  std::chrono::milliseconds max_backoff{ 10000 };
  std::optional<std::chrono::milliseconds> timeout;  // whole apply; unset = unbounded
};

// Shared flag checked by the dispatcher between scheduling decisions. In-flight provider
// calls always run to completion.
class cancellation : unmovable {
 public:
  void request() { requested_.store(true); }
  bool requested() const { return requested_.load(); }

 private:
  std::atomic_bool requested_{ false };
};

// Upper bound on worker threads, whatever the configuration asks for
constexpr std::size_t kMaxParallelism{ 256 };

// Worker threads for a plan: cfg.parallelism clamped to [1, kMaxParallelism] and to the
// number of actions
std::size_t executor_pool_size(executor_cfg const &cfg, std::size_t action_count);

// Retry delay before the given attempt (2 = first retry): initial * 2^(attempt-2),
// capped at max_backoff
std::chrono::milliseconds executor_backoff(executor_cfg const &cfg, int next_attempt);

// Runs a plan against the providers with at most cfg.parallelism concurrent calls.
// The calling thread schedules and is the only writer of the working snapshot; every
// successful action is committed to the store before its dependents start.
class executor : unmovable {
 public:
  executor(provider_registry const &registry, state_store &store, executor_cfg cfg);

  // working must be the snapshot the plan was computed against. On return it holds the
  // last committed state.
  apply_report run(plan const &p, state_snapshot &working, cancellation const &cancel);

 private:
  provider_registry const &registry_;
  state_store &store_;
  executor_cfg cfg_;
};

}  // namespace strata
