#include "value_json.h"

#include "util.h"

#include <stdexcept>
#include <variant>

namespace strata {

picojson::value value_to_json(value const &v, std::string const &where) {
  return std::visit(
      match{
          [](std::monostate) { return picojson::value{}; },
          [](bool b) { return picojson::value(b); },
          [](std::int64_t i) { return picojson::value(i); },
          [](double d) { return picojson::value(d); },
          [](std::string const &s) { return picojson::value(s); },
          [&where](value_list const &l) {
            picojson::array arr;
            for (auto const &item : l) { arr.push_back(value_to_json(item, where)); }
            return picojson::value(arr);
          },
          [&where](value_map const &m) {
            picojson::object obj;
            for (auto const &[k, item] : m) { obj[k] = value_to_json(item, where); }
            return picojson::value(obj);
          },
          [&where](auto const &) -> picojson::value {
            throw std::runtime_error("Cannot persist unresolved value in " + where);
          },
      },
      v.data);
}

value value_from_json(picojson::value const &j) {
  if (j.is<picojson::null>()) { return {}; }
  if (j.is<bool>()) { return j.get<bool>(); }
  if (j.is<std::int64_t>()) { return j.get<std::int64_t>(); }  // before double
  if (j.is<double>()) { return j.get<double>(); }
  if (j.is<std::string>()) { return j.get<std::string>(); }
  if (j.is<picojson::array>()) {
    value_list list;
    for (auto const &item : j.get<picojson::array>()) {
      list.push_back(value_from_json(item));
    }
    return list;
  }
  return attribute_map_from_json(j.get<picojson::object>());
}

picojson::value attribute_map_to_json(attribute_map const &attrs,
                                      std::string const &where) {
  picojson::object obj;
  for (auto const &[k, v] : attrs) { obj[k] = value_to_json(v, where + "." + k); }
  return picojson::value(obj);
}

attribute_map attribute_map_from_json(picojson::object const &obj) {
  attribute_map result;
  for (auto const &[k, item] : obj) { result[k] = value_from_json(item); }
  return result;
}

}  // namespace strata
