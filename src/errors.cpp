#include "errors.h"

#include "util.h"

#include <utility>

namespace strata {

std::string_view diagnostic_kind_name(diagnostic_kind kind) {
  switch (kind) {
    case diagnostic_kind::unresolved_reference: return "unresolved_reference";
    case diagnostic_kind::duplicate_address: return "duplicate_address";
    case diagnostic_kind::cycle: return "cycle";
    case diagnostic_kind::dangling_reference: return "dangling_reference";
    case diagnostic_kind::unknown_type: return "unknown_type";
    case diagnostic_kind::invalid_declaration: return "invalid_declaration";
  }
  return "unknown";
}

std::string diagnostic_format(diagnostic const &d) {
  std::string out{ diagnostic_kind_name(d.kind) };
  out += ": ";
  out += d.address;
  if (!d.attribute.empty()) { out += " (" + d.attribute + ")"; }
  out += ": ";
  out += d.message;
  if (!d.cycle_path.empty()) { out += " [" + util_join(d.cycle_path, " -> ") + "]"; }
  return out;
}

cycle_error::cycle_error(std::vector<std::string> path)
    : std::runtime_error("Dependency cycle: " + util_join(path, " -> ")),
      path_{ std::move(path) } {}

}  // namespace strata
