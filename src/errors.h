#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class diagnostic_kind {
  unresolved_reference,
  duplicate_address,
  cycle,
  dangling_reference,
  unknown_type,
  invalid_declaration,
};

struct diagnostic {
  diagnostic_kind kind;
  std::string address;
  std::string attribute;  // attribute path, empty when not attribute-specific
  std::string message;
  std::vector<std::string> cycle_path;  // cycle only: first node repeated at the end
};

std::string_view diagnostic_kind_name(diagnostic_kind kind);

// "unresolved_reference: aws_subnet.a (vpc_id): ..."
std::string diagnostic_format(diagnostic const &d);

class cycle_error : public std::runtime_error {
 public:
  explicit cycle_error(std::vector<std::string> path);
  std::vector<std::string> const &path() const { return path_; }

 private:
  std::vector<std::string> path_;
};

// Permanent provider failure; the action is marked failed.
class provider_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Throttling, eventual consistency and similar; retried with backoff.
class provider_transient_error : public provider_error {
 public:
  using provider_error::provider_error;
};

class not_found_error : public provider_error {
 public:
  using provider_error::provider_error;
};

// Lock held elsewhere, or the snapshot moved underneath us.
class state_conflict_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace strata
