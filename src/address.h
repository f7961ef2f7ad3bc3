#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace strata {

// Resource address: "type.name" or "type.name[index]" for expanded collections.
class resource_address {
 public:
  resource_address() = default;
  resource_address(std::string type,
                   std::string name,
                   std::optional<std::int64_t> index = std::nullopt);

  // Throws std::runtime_error on malformed input
  static resource_address parse(std::string_view text);

  std::string const &type() const { return type_; }
  std::string const &name() const { return name_; }
  std::optional<std::int64_t> const &index() const { return index_; }

  std::string str() const;
  std::string base() const;  // "type.name", index stripped
  resource_address without_index() const { return { type_, name_ }; }

  bool operator==(resource_address const &) const = default;
  auto operator<=>(resource_address const &) const = default;

 private:
  std::string type_;
  std::string name_;
  std::optional<std::int64_t> index_;
};

// [A-Za-z_][A-Za-z0-9_-]*
bool address_is_identifier(std::string_view text);

}  // namespace strata

template <>
struct std::hash<strata::resource_address> {
  size_t operator()(strata::resource_address const &a) const {
    size_t h{ std::hash<std::string>{}(a.type()) };
    h = h * 31 + std::hash<std::string>{}(a.name());
    if (a.index()) { h = h * 31 + std::hash<std::int64_t>{}(*a.index()) + 1; }
    return h;
  }
};
