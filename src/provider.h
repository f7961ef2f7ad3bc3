#pragma once

#include "value.h"

#include <map>
#include <set>
#include <string>
#include <string_view>

namespace strata {

// Per-type schema consulted by the planner
struct resource_type {
  std::string name;
  std::set<std::string> mutable_attributes;  // may change in place via update
  bool create_before_destroy{ false };

  bool is_mutable(std::string const &attribute) const {
    return mutable_attributes.contains(attribute);
  }
};

struct create_result {
  std::string id;
  attribute_map attributes;  // provider-reported, includes computed attributes
};

// Remote API for one or more resource types. Each call is atomic from the engine's view.
// Implementations throw provider_transient_error for retryable failures,
// not_found_error when the object does not exist, and provider_error otherwise.
// Calls may arrive concurrently from several worker threads.
class provider {
 public:
  virtual ~provider() = default;

  virtual create_result create(std::string const &type, attribute_map const &attrs) = 0;
  virtual attribute_map read(std::string const &type, std::string const &id) = 0;
  virtual attribute_map update(std::string const &type,
                               std::string const &id,
                               attribute_map const &attrs) = 0;
  virtual void remove(std::string const &type, std::string const &id) = 0;
};

// Maps type names to their schema and provider. Providers are not owned.
class provider_registry {
 public:
  void add(resource_type type, provider &p);

  resource_type const *find_type(std::string_view name) const;

  // Throws std::runtime_error for unregistered types
  provider &provider_for(std::string_view type) const;

  bool empty() const { return entries_.empty(); }

 private:
  struct entry {
    resource_type type;
    provider *p;
  };

  std::map<std::string, entry, std::less<>> entries_;
};

}  // namespace strata
