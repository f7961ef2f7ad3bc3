#pragma once

#include "action.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace strata {

namespace trace_events {

struct node_registered {
  std::string address;
  std::string type;
};

struct edge_added {
  std::string dependent;
  std::string dependency;
  std::string attribute;  // "depends_on" for explicit edges
};

struct action_planned {
  std::string address;
  action_kind kind;
  operation op;
  std::string reason;
};

struct action_ready {
  std::string address;
  operation op;
};

struct action_start {
  std::string address;
  operation op;
  int attempt;
};

struct action_complete {
  std::string address;
  operation op;
  std::int64_t duration_ms;
};

struct action_retry {
  std::string address;
  operation op;
  int attempt;
  std::int64_t delay_ms;
  std::string reason;
};

struct action_failed {
  std::string address;
  operation op;
  int attempts;
  std::string reason;
};

struct action_skipped {
  std::string address;
  operation op;
  std::string failed_dependency;
};

struct action_cancelled {
  std::string address;
  operation op;
};

struct state_committed {
  std::string address;
  std::int64_t serial;
};

struct lock_acquired {
  std::string holder;
  std::string lock_path;
  std::int64_t ttl_s;
};

struct lock_released {
  std::string holder;
  std::string lock_path;
  std::int64_t hold_duration_ms;
};

struct drift_detected {
  std::string address;
  std::string attribute;
};

struct resource_missing {
  std::string address;
  std::string id;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::node_registered,
                                   trace_events::edge_added,
                                   trace_events::action_planned,
                                   trace_events::action_ready,
                                   trace_events::action_start,
                                   trace_events::action_complete,
                                   trace_events::action_retry,
                                   trace_events::action_failed,
                                   trace_events::action_skipped,
                                   trace_events::action_cancelled,
                                   trace_events::state_committed,
                                   trace_events::lock_acquired,
                                   trace_events::lock_released,
                                   trace_events::drift_detected,
                                   trace_events::resource_missing>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits action_start on construction and action_complete on destruction
struct action_trace_scope {
  std::string address;
  operation op;
  std::chrono::steady_clock::time_point start;

  action_trace_scope(std::string address_value, operation op_value, int attempt);
  ~action_trace_scope();
};

}  // namespace strata

#define STRATA_TRACE_UNLIKELY [[unlikely]]

#define STRATA_TRACE_EMIT(event_expr) \
  do { \
    if (::strata::tui::g_trace_enabled) STRATA_TRACE_UNLIKELY { \
        ::strata::tui::trace event_expr; \
      } \
  } while (0)

#define STRATA_TRACE_NODE_REGISTERED(address_value, type_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::node_registered{ \
      .address = (address_value), \
      .type = (type_value), \
  }))

#define STRATA_TRACE_EDGE_ADDED(dependent_value, dependency_value, attribute_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::edge_added{ \
      .dependent = (dependent_value), \
      .dependency = (dependency_value), \
      .attribute = (attribute_value), \
  }))

#define STRATA_TRACE_ACTION_PLANNED(address_value, kind_value, op_value, reason_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::action_planned{ \
      .address = (address_value), \
      .kind = (kind_value), \
      .op = (op_value), \
      .reason = (reason_value), \
  }))

#define STRATA_TRACE_ACTION_READY(address_value, op_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::action_ready{ \
      .address = (address_value), \
      .op = (op_value), \
  }))

#define STRATA_TRACE_ACTION_START(address_value, op_value, attempt_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::action_start{ \
      .address = (address_value), \
      .op = (op_value), \
      .attempt = (attempt_value), \
  }))

#define STRATA_TRACE_ACTION_COMPLETE(address_value, op_value, duration_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::action_complete{ \
      .address = (address_value), \
      .op = (op_value), \
      .duration_ms = (duration_value), \
  }))

#define STRATA_TRACE_ACTION_RETRY(address_value, \
                                  op_value, \
                                  attempt_value, \
                                  delay_value, \
                                  reason_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::action_retry{ \
      .address = (address_value), \
      .op = (op_value), \
      .attempt = (attempt_value), \
      .delay_ms = (delay_value), \
      .reason = (reason_value), \
  }))

#define STRATA_TRACE_ACTION_FAILED(address_value, op_value, attempts_value, reason_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::action_failed{ \
      .address = (address_value), \
      .op = (op_value), \
      .attempts = (attempts_value), \
      .reason = (reason_value), \
  }))

#define STRATA_TRACE_ACTION_SKIPPED(address_value, op_value, failed_dependency_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::action_skipped{ \
      .address = (address_value), \
      .op = (op_value), \
      .failed_dependency = (failed_dependency_value), \
  }))

#define STRATA_TRACE_ACTION_CANCELLED(address_value, op_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::action_cancelled{ \
      .address = (address_value), \
      .op = (op_value), \
  }))

#define STRATA_TRACE_STATE_COMMITTED(address_value, serial_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::state_committed{ \
      .address = (address_value), \
      .serial = (serial_value), \
  }))

#define STRATA_TRACE_LOCK_ACQUIRED(holder_value, lock_path_value, ttl_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::lock_acquired{ \
      .holder = (holder_value), \
      .lock_path = (lock_path_value), \
      .ttl_s = (ttl_value), \
  }))

#define STRATA_TRACE_LOCK_RELEASED(holder_value, lock_path_value, hold_duration_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::lock_released{ \
      .holder = (holder_value), \
      .lock_path = (lock_path_value), \
      .hold_duration_ms = (hold_duration_value), \
  }))

#define STRATA_TRACE_DRIFT_DETECTED(address_value, attribute_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::drift_detected{ \
      .address = (address_value), \
      .attribute = (attribute_value), \
  }))

#define STRATA_TRACE_RESOURCE_MISSING(address_value, id_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::resource_missing{ \
      .address = (address_value), \
      .id = (id_value), \
  }))
