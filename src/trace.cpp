#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace strata {

namespace {

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_op(std::string &out, operation op) {
  append_kv(out, "op", operation_name(op));
}

}  // namespace

action_trace_scope::action_trace_scope(std::string address_value,
                                       operation op_value,
                                       int attempt)
    : address{ std::move(address_value) },
      op{ op_value },
      start{ std::chrono::steady_clock::now() } {
  STRATA_TRACE_ACTION_START(address, op, attempt);
}

action_trace_scope::~action_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  STRATA_TRACE_ACTION_COMPLETE(address, op, static_cast<std::int64_t>(duration_ms));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(node_registered),
          TRACE_NAME(edge_added),
          TRACE_NAME(action_planned),
          TRACE_NAME(action_ready),
          TRACE_NAME(action_start),
          TRACE_NAME(action_complete),
          TRACE_NAME(action_retry),
          TRACE_NAME(action_failed),
          TRACE_NAME(action_skipped),
          TRACE_NAME(action_cancelled),
          TRACE_NAME(state_committed),
          TRACE_NAME(lock_acquired),
          TRACE_NAME(lock_released),
          TRACE_NAME(drift_detected),
          TRACE_NAME(resource_missing),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::node_registered const &value) {
            std::ostringstream oss;
            oss << "node_registered address=" << value.address << " type=" << value.type;
            return oss.str();
          },
          [](trace_events::edge_added const &value) {
            std::ostringstream oss;
            oss << "edge_added dependent=" << value.dependent
                << " dependency=" << value.dependency << " attribute=" << value.attribute;
            return oss.str();
          },
          [](trace_events::action_planned const &value) {
            std::ostringstream oss;
            oss << "action_planned address=" << value.address
                << " kind=" << action_kind_name(value.kind)
                << " op=" << operation_name(value.op) << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::action_ready const &value) {
            std::ostringstream oss;
            oss << "action_ready address=" << value.address
                << " op=" << operation_name(value.op);
            return oss.str();
          },
          [](trace_events::action_start const &value) {
            std::ostringstream oss;
            oss << "action_start address=" << value.address
                << " op=" << operation_name(value.op) << " attempt=" << value.attempt;
            return oss.str();
          },
          [](trace_events::action_complete const &value) {
            std::ostringstream oss;
            oss << "action_complete address=" << value.address
                << " op=" << operation_name(value.op)
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::action_retry const &value) {
            std::ostringstream oss;
            oss << "action_retry address=" << value.address
                << " op=" << operation_name(value.op) << " attempt=" << value.attempt
                << " delay_ms=" << value.delay_ms << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::action_failed const &value) {
            std::ostringstream oss;
            oss << "action_failed address=" << value.address
                << " op=" << operation_name(value.op) << " attempts=" << value.attempts
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::action_skipped const &value) {
            std::ostringstream oss;
            oss << "action_skipped address=" << value.address
                << " op=" << operation_name(value.op)
                << " failed_dependency=" << value.failed_dependency;
            return oss.str();
          },
          [](trace_events::action_cancelled const &value) {
            std::ostringstream oss;
            oss << "action_cancelled address=" << value.address
                << " op=" << operation_name(value.op);
            return oss.str();
          },
          [](trace_events::state_committed const &value) {
            std::ostringstream oss;
            oss << "state_committed address=" << value.address
                << " serial=" << value.serial;
            return oss.str();
          },
          [](trace_events::lock_acquired const &value) {
            std::ostringstream oss;
            oss << "lock_acquired holder=" << value.holder
                << " lock_path=" << value.lock_path << " ttl_s=" << value.ttl_s;
            return oss.str();
          },
          [](trace_events::lock_released const &value) {
            std::ostringstream oss;
            oss << "lock_released holder=" << value.holder
                << " lock_path=" << value.lock_path
                << " hold_ms=" << value.hold_duration_ms;
            return oss.str();
          },
          [](trace_events::drift_detected const &value) {
            std::ostringstream oss;
            oss << "drift_detected address=" << value.address
                << " attribute=" << value.attribute;
            return oss.str();
          },
          [](trace_events::resource_missing const &value) {
            std::ostringstream oss;
            oss << "resource_missing address=" << value.address << " id=" << value.id;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  auto const append_address{ [&](std::string_view value) {
    append_kv(output, "address", value);
  } };

  std::visit(
      match{
          [&](trace_events::node_registered const &value) {
            append_address(value.address);
            append_kv(output, "type", value.type);
          },
          [&](trace_events::edge_added const &value) {
            append_kv(output, "dependent", value.dependent);
            append_kv(output, "dependency", value.dependency);
            append_kv(output, "attribute", value.attribute);
          },
          [&](trace_events::action_planned const &value) {
            append_address(value.address);
            append_kv(output, "kind", action_kind_name(value.kind));
            append_op(output, value.op);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::action_ready const &value) {
            append_address(value.address);
            append_op(output, value.op);
          },
          [&](trace_events::action_start const &value) {
            append_address(value.address);
            append_op(output, value.op);
            append_kv(output, "attempt", static_cast<std::int64_t>(value.attempt));
          },
          [&](trace_events::action_complete const &value) {
            append_address(value.address);
            append_op(output, value.op);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::action_retry const &value) {
            append_address(value.address);
            append_op(output, value.op);
            append_kv(output, "attempt", static_cast<std::int64_t>(value.attempt));
            append_kv(output, "delay_ms", value.delay_ms);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::action_failed const &value) {
            append_address(value.address);
            append_op(output, value.op);
            append_kv(output, "attempts", static_cast<std::int64_t>(value.attempts));
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::action_skipped const &value) {
            append_address(value.address);
            append_op(output, value.op);
            append_kv(output, "failed_dependency", value.failed_dependency);
          },
          [&](trace_events::action_cancelled const &value) {
            append_address(value.address);
            append_op(output, value.op);
          },
          [&](trace_events::state_committed const &value) {
            append_address(value.address);
            append_kv(output, "serial", value.serial);
          },
          [&](trace_events::lock_acquired const &value) {
            append_kv(output, "holder", value.holder);
            append_kv(output, "lock_path", value.lock_path);
            append_kv(output, "ttl_s", value.ttl_s);
          },
          [&](trace_events::lock_released const &value) {
            append_kv(output, "holder", value.holder);
            append_kv(output, "lock_path", value.lock_path);
            append_kv(output, "hold_duration_ms", value.hold_duration_ms);
          },
          [&](trace_events::drift_detected const &value) {
            append_address(value.address);
            append_kv(output, "attribute", value.attribute);
          },
          [&](trace_events::resource_missing const &value) {
            append_address(value.address);
            append_kv(output, "id", value.id);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace strata
