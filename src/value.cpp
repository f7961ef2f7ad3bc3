#include "value.h"

#include "util.h"

#include <charconv>
#include <cstdio>
#include <stdexcept>
#include <type_traits>

namespace strata {

namespace {

std::vector<std::string> split_path(std::string_view text) {
  std::vector<std::string> parts;
  std::size_t start{ 0 };
  while (start <= text.size()) {
    auto const dot{ text.find('.', start) };
    auto const end{ dot == std::string_view::npos ? text.size() : dot };
    parts.emplace_back(text.substr(start, end - start));
    if (dot == std::string_view::npos) { break; }
    start = dot + 1;
  }
  return parts;
}

std::string quote(std::string_view s) {
  std::string out{ "\"" };
  for (char const c : s) {
    if (c == '"' || c == '\\') { out.push_back('\\'); }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string format_double(double d) {
  char buf[64]{};
  std::snprintf(buf, sizeof buf, "%g", d);
  return buf;
}

}  // namespace

reference reference::parse(std::string_view expr) {
  auto const fail{ [&](char const *why) -> reference {
    throw std::runtime_error("Invalid reference '" + std::string(expr) + "': " + why);
  } };

  auto const first_dot{ expr.find('.') };
  if (first_dot == std::string_view::npos) { return fail("expected type.name.attribute"); }

  reference result;
  result.type = std::string(expr.substr(0, first_dot));

  std::string_view rest{ expr.substr(first_dot + 1) };
  auto const name_end{ rest.find_first_of(".[") };
  if (name_end == std::string_view::npos) { return fail("missing attribute"); }
  result.name = std::string(rest.substr(0, name_end));
  rest = rest.substr(name_end);

  if (rest.front() == '[') {
    auto const close{ rest.find(']') };
    if (close == std::string_view::npos) { return fail("unterminated index"); }
    std::string_view const idx{ rest.substr(1, close - 1) };
    if (idx == "*") {
      result.k = kind::all_instances;
    } else {
      std::int64_t n{ 0 };
      auto const [ptr, ec]{ std::from_chars(idx.data(), idx.data() + idx.size(), n) };
      if (idx.empty() || ec != std::errc{} || ptr != idx.data() + idx.size() || n < 0) {
        return fail("index must be a non-negative integer or *");
      }
      result.k = kind::indexed;
      result.index = n;
    }
    rest = rest.substr(close + 1);
  }

  if (rest.empty() || rest.front() != '.' || rest.size() < 2) {
    return fail("missing attribute");
  }

  result.attribute_path = split_path(rest.substr(1));
  for (auto const &segment : result.attribute_path) {
    if (segment.empty()) { return fail("empty attribute segment"); }
  }

  if (!address_is_identifier(result.type) || !address_is_identifier(result.name)) {
    return fail("type and name must be identifiers");
  }

  return result;
}

std::string reference::attribute() const { return util_join(attribute_path, "."); }

std::string reference::str() const {
  std::string out{ type + "." + name };
  switch (k) {
    case kind::direct: break;
    case kind::indexed: out += "[" + std::to_string(index.value_or(0)) + "]"; break;
    case kind::all_instances: out += "[*]"; break;
  }
  out.push_back('.');
  out.append(attribute());
  return out;
}

resource_address reference::target() const {
  if (k == kind::indexed) { return { type, name, index }; }
  return { type, name };
}

bool value::is_known() const {
  return std::visit(match{
                        [](value_list const &l) {
                          for (auto const &item : l) {
                            if (!item.is_known()) { return false; }
                          }
                          return true;
                        },
                        [](value_map const &m) {
                          for (auto const &[_, item] : m) {
                            if (!item.is_known()) { return false; }
                          }
                          return true;
                        },
                        [](reference const &) { return false; },
                        [](unknown_value const &) { return false; },
                        [](count_index const &) { return false; },
                        [](auto const &) { return true; },
                    },
                    data);
}

bool operator==(value const &a, value const &b) {
  if (a.is<unknown_value>() || b.is<unknown_value>()) { return false; }

  if (auto const *ai{ a.get_if<std::int64_t>() }) {
    if (auto const *bd{ b.get_if<double>() }) { return static_cast<double>(*ai) == *bd; }
  }
  if (auto const *ad{ a.get_if<double>() }) {
    if (auto const *bi{ b.get_if<std::int64_t>() }) {
      return *ad == static_cast<double>(*bi);
    }
  }

  if (a.data.index() != b.data.index()) { return false; }

  return std::visit(
      [&b](auto const &lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        auto const &rhs{ std::get<T>(b.data) };
        if constexpr (std::is_same_v<T, std::monostate>) {
          return true;
        } else if constexpr (std::is_same_v<T, unknown_value>) {
          return false;
        } else if constexpr (std::is_same_v<T, value_list>) {
          if (lhs.size() != rhs.size()) { return false; }
          for (std::size_t i{ 0 }; i < lhs.size(); ++i) {
            if (!(lhs[i] == rhs[i])) { return false; }
          }
          return true;
        } else if constexpr (std::is_same_v<T, value_map>) {
          if (lhs.size() != rhs.size()) { return false; }
          for (auto li{ lhs.begin() }, ri{ rhs.begin() }; li != lhs.end(); ++li, ++ri) {
            if (li->first != ri->first || !(li->second == ri->second)) { return false; }
          }
          return true;
        } else {
          return lhs == rhs;
        }
      },
      a.data);
}

std::string value_to_string(value const &v) {
  return std::visit(match{
                        [](std::monostate) -> std::string { return "null"; },
                        [](bool b) -> std::string { return b ? "true" : "false"; },
                        [](std::int64_t i) { return std::to_string(i); },
                        [](double d) { return format_double(d); },
                        [](std::string const &s) { return quote(s); },
                        [](value_list const &l) {
                          std::vector<std::string> parts;
                          for (auto const &item : l) { parts.push_back(value_to_string(item)); }
                          return "[" + util_join(parts, ", ") + "]";
                        },
                        [](value_map const &m) {
                          std::vector<std::string> parts;
                          for (auto const &[k, item] : m) {
                            parts.push_back(k + " = " + value_to_string(item));
                          }
                          return "{" + util_join(parts, ", ") + "}";
                        },
                        [](reference const &r) { return "ref(" + r.str() + ")"; },
                        [](unknown_value const &) -> std::string {
                          return "(known after apply)";
                        },
                        [](count_index const &) -> std::string { return "count_index()"; },
                    },
                    v.data);
}

std::optional<value> value_lookup(attribute_map const &attrs,
                                  std::span<std::string const> path) {
  if (path.empty()) { return std::nullopt; }

  auto it{ attrs.find(path.front()) };
  if (it == attrs.end()) { return std::nullopt; }

  value const *current{ &it->second };
  for (auto const &segment : path.subspan(1)) {
    auto const *m{ current->get_if<value_map>() };
    if (!m) { return std::nullopt; }
    auto next{ m->find(segment) };
    if (next == m->end()) { return std::nullopt; }
    current = &next->second;
  }
  return *current;
}

std::string attribute_map_to_string(attribute_map const &attrs) {
  std::vector<std::string> parts;
  for (auto const &[k, v] : attrs) { parts.push_back(k + " = " + value_to_string(v)); }
  return "{" + util_join(parts, ", ") + "}";
}

value value_substitute_references(value const &v,
                                  std::function<value(reference const &)> const &fn) {
  if (auto const *ref{ v.get_if<reference>() }) { return fn(*ref); }

  if (auto const *list{ v.get_if<value_list>() }) {
    value_list out;
    out.reserve(list->size());
    for (auto const &item : *list) { out.push_back(value_substitute_references(item, fn)); }
    return out;
  }

  if (auto const *map{ v.get_if<value_map>() }) {
    value_map out;
    for (auto const &[k, item] : *map) { out[k] = value_substitute_references(item, fn); }
    return out;
  }

  return v;
}

attribute_map attribute_map_substitute_references(
    attribute_map const &attrs,
    std::function<value(reference const &)> const &fn) {
  attribute_map out;
  for (auto const &[k, v] : attrs) { out[k] = value_substitute_references(v, fn); }
  return out;
}

}  // namespace strata
