#include "local_provider.h"

#include "errors.h"
#include "util.h"
#include "value_json.h"

#include "picojson.h"

#include <system_error>
#include <utility>

namespace strata {

local_provider::local_provider(std::filesystem::path root) : root_{ std::move(root) } {}

std::filesystem::path local_provider::object_path(std::string const &type,
                                                  std::string const &id) const {
  return root_ / type / (id + ".json");
}

attribute_map local_provider::write_object(std::string const &type,
                                           std::string const &id,
                                           attribute_map attrs) {
  attrs["id"] = id;
  attrs["arn"] = "arn:local:" + type + ":" + id;

  auto const path{ object_path(type, id) };
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw provider_error("Failed to create " + path.parent_path().string() + ": " +
                         ec.message());
  }

  try {
    util_write_file_atomic(path, attribute_map_to_json(attrs, type).serialize(true));
  } catch (std::runtime_error const &e) {
    throw provider_error(e.what());
  }
  return attrs;
}

create_result local_provider::create(std::string const &type,
                                     attribute_map const &attrs) {
  std::lock_guard const lock{ mutex_ };

  std::string id;
  do {
    id = type + "-" + util_hex64(util_random64()).substr(0, 12);
  } while (std::filesystem::exists(object_path(type, id)));

  auto stored{ write_object(type, id, attrs) };
  return { .id = std::move(id), .attributes = std::move(stored) };
}

attribute_map local_provider::read(std::string const &type, std::string const &id) {
  std::lock_guard const lock{ mutex_ };

  auto const path{ object_path(type, id) };
  if (!std::filesystem::exists(path)) {
    throw not_found_error(type + " " + id + " does not exist");
  }

  picojson::value root;
  std::string const err{ picojson::parse(root, util_load_file(path)) };
  if (!err.empty() || !root.is<picojson::object>()) {
    throw provider_error("Corrupt object " + path.string() + ": " + err);
  }
  return attribute_map_from_json(root.get<picojson::object>());
}

attribute_map local_provider::update(std::string const &type,
                                     std::string const &id,
                                     attribute_map const &attrs) {
  std::lock_guard const lock{ mutex_ };

  if (!std::filesystem::exists(object_path(type, id))) {
    throw not_found_error(type + " " + id + " does not exist");
  }
  return write_object(type, id, attrs);
}

void local_provider::remove(std::string const &type, std::string const &id) {
  std::lock_guard const lock{ mutex_ };

  std::error_code ec;
  if (!std::filesystem::remove(object_path(type, id), ec)) {
    if (ec) { throw provider_error("Failed to delete " + id + ": " + ec.message()); }
    throw not_found_error(type + " " + id + " does not exist");
  }
}

}  // namespace strata
