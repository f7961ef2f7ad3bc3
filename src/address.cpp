#include "address.h"

#include <charconv>
#include <stdexcept>
#include <utility>

namespace strata {

namespace {

std::optional<std::int64_t> parse_index(std::string_view text) {
  if (text.empty()) { return std::nullopt; }
  std::int64_t result{ 0 };
  auto const [ptr, ec]{ std::from_chars(text.data(), text.data() + text.size(), result) };
  if (ec != std::errc{} || ptr != text.data() + text.size() || result < 0) {
    return std::nullopt;
  }
  return result;
}

}  // namespace

bool address_is_identifier(std::string_view text) {
  if (text.empty()) { return false; }
  auto const is_alpha{ [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  } };
  if (!is_alpha(text.front())) { return false; }
  for (char const c : text.substr(1)) {
    if (!is_alpha(c) && !(c >= '0' && c <= '9') && c != '-') { return false; }
  }
  return true;
}

resource_address::resource_address(std::string type,
                                   std::string name,
                                   std::optional<std::int64_t> index)
    : type_{ std::move(type) }, name_{ std::move(name) }, index_{ index } {}

resource_address resource_address::parse(std::string_view text) {
  auto const dot{ text.find('.') };
  if (dot == std::string_view::npos) {
    throw std::runtime_error("Invalid resource address (expected type.name): " +
                             std::string(text));
  }

  std::string_view const type{ text.substr(0, dot) };
  std::string_view name{ text.substr(dot + 1) };
  std::optional<std::int64_t> index;

  if (auto const open{ name.find('[') }; open != std::string_view::npos) {
    if (name.back() != ']') {
      throw std::runtime_error("Invalid resource address (unterminated index): " +
                               std::string(text));
    }
    index = parse_index(name.substr(open + 1, name.size() - open - 2));
    if (!index) {
      throw std::runtime_error("Invalid resource address (bad index): " +
                               std::string(text));
    }
    name = name.substr(0, open);
  }

  if (!address_is_identifier(type) || !address_is_identifier(name)) {
    throw std::runtime_error("Invalid resource address: " + std::string(text));
  }

  return { std::string(type), std::string(name), index };
}

std::string resource_address::str() const {
  std::string result{ base() };
  if (index_) {
    result.push_back('[');
    result.append(std::to_string(*index_));
    result.push_back(']');
  }
  return result;
}

std::string resource_address::base() const { return type_ + "." + name_; }

}  // namespace strata
