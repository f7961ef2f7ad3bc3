#pragma once

#include "provider.h"

#include <filesystem>
#include <mutex>
#include <string>

namespace strata {

// Simulated cloud backed by a directory: each object is <root>/<type>/<id>.json.
// Ids are "<type>-<hex>"; every object reports computed "id" and "arn" attributes.
class local_provider : public provider {
 public:
  explicit local_provider(std::filesystem::path root);

  create_result create(std::string const &type, attribute_map const &attrs) override;
  attribute_map read(std::string const &type, std::string const &id) override;
  attribute_map update(std::string const &type,
                       std::string const &id,
                       attribute_map const &attrs) override;
  void remove(std::string const &type, std::string const &id) override;

  std::filesystem::path const &root() const { return root_; }

 private:
  std::filesystem::path object_path(std::string const &type, std::string const &id) const;
  attribute_map write_object(std::string const &type,
                             std::string const &id,
                             attribute_map attrs);

  std::filesystem::path root_;
  std::mutex mutex_;
};

}  // namespace strata
