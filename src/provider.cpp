#include "provider.h"

#include <stdexcept>
#include <utility>

namespace strata {

void provider_registry::add(resource_type type, provider &p) {
  std::string name{ type.name };
  if (entries_.contains(name)) {
    throw std::runtime_error("Resource type registered twice: " + name);
  }
  entries_.emplace(std::move(name), entry{ .type = std::move(type), .p = &p });
}

resource_type const *provider_registry::find_type(std::string_view name) const {
  auto const it{ entries_.find(name) };
  return it == entries_.end() ? nullptr : &it->second.type;
}

provider &provider_registry::provider_for(std::string_view type) const {
  auto const it{ entries_.find(type) };
  if (it == entries_.end()) {
    throw std::runtime_error("No provider registered for type: " + std::string(type));
  }
  return *it->second.p;
}

}  // namespace strata
