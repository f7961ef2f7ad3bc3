#pragma once

// Helpers shared by the unit tests; compiled only into strata_unit_tests

#include "action.h"
#include "declaration.h"
#include "planner.h"
#include "provider.h"
#include "state.h"
#include "value.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata::test {

// In-memory provider with scripted failures. Objects are matched to failure rules by
// their "tag" attribute; untagged objects never fail.
class fake_provider : public provider {
 public:
  struct call {
    operation op;
    std::string type;
    std::string id;
    std::string tag;
    attribute_map attrs;  // what create/update received
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point finished;
  };

  create_result create(std::string const &type, attribute_map const &attrs) override;
  attribute_map read(std::string const &type, std::string const &id) override;
  attribute_map update(std::string const &type,
                       std::string const &id,
                       attribute_map const &attrs) override;
  void remove(std::string const &type, std::string const &id) override;

  // The next `times` calls of op on the tagged object throw provider_transient_error
  void fail_transient(std::string const &tag, operation op, int times);

  // Every call of op on the tagged object throws provider_error
  void fail_permanent(std::string const &tag, operation op);

  void clear_failures();

  void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }

  // Simulates out-of-band changes
  void drift(std::string const &id, std::string const &attribute, value v);
  void forget(std::string const &id, std::string const &attribute);
  void vanish(std::string const &id);

  // Reads are logged with operation::none
  std::vector<call> calls() const;
  std::vector<call> calls(operation op) const;
  std::size_t call_count(operation op) const { return calls(op).size(); }
  std::size_t max_concurrency() const { return high_water_.load(); }
  std::size_t object_count() const;
  bool exists(std::string const &id) const;

 private:
  struct object {
    std::string type;
    attribute_map attrs;
  };

  struct rule {
    int transient_remaining{ 0 };
    bool permanent{ false };
  };

  // Enforces latency, failure rules and the concurrency counters around fn
  template <typename fn_t>
  auto guarded(operation op,
               std::string const &type,
               std::string const &id,
               std::string const &tag,
               attribute_map const &attrs,
               fn_t &&fn);

  void check_rule(operation op, std::string const &tag);

  mutable std::mutex mutex_;
  std::map<std::string, object> objects_;  // by id
  std::map<std::pair<std::string, operation>, rule> rules_;
  std::vector<call> calls_;
  std::size_t next_id_{ 1 };
  std::chrono::milliseconds latency_{ 0 };

  std::atomic<std::size_t> in_flight_{ 0 };
  std::atomic<std::size_t> high_water_{ 0 };
};

// Types shared by the planner, executor and engine tests:
//   aws_vpc       tags mutable
//   aws_subnet    tags mutable
//   aws_security_group  tags mutable
//   aws_instance  tags mutable, create_before_destroy
//   aws_eip       instance mutable
void register_test_types(provider_registry &registry, provider &p);

resource_decl make_decl(std::string type,
                        std::string name,
                        attribute_map attrs = {},
                        std::vector<std::string> depends_on = {});

value ref(std::string_view expr);

// Recorded object whose provider attributes are its inputs plus "id"
resource_state make_entry(std::string type,
                          std::string id,
                          attribute_map inputs,
                          std::vector<std::string> dependencies = {});

// Position of the action with the given label ("create aws_vpc.main"); throws if absent
std::size_t action_position(plan const &p, std::string const &label);

bool plan_has_action(plan const &p, std::string const &label);

}  // namespace strata::test
