#pragma once

#include "value.h"

#include "picojson.h"

#include <string>

namespace strata {

// JSON rendering of known values. References, unknowns and count placeholders cannot
// be persisted; they throw std::runtime_error naming `where`.
picojson::value value_to_json(value const &v, std::string const &where);
value value_from_json(picojson::value const &j);

picojson::value attribute_map_to_json(attribute_map const &attrs,
                                      std::string const &where);
attribute_map attribute_map_from_json(picojson::object const &obj);

}  // namespace strata
