#pragma once

#include "declaration.h"
#include "provider.h"
#include "util.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace strata {

// Optional CONFIG table; unset fields fall back to command line flags or defaults
struct manifest_cfg {
  std::optional<std::size_t> parallelism;
  std::optional<int> max_attempts;
  std::optional<std::chrono::milliseconds> backoff;
  std::optional<std::chrono::milliseconds> max_backoff;
  std::optional<std::chrono::seconds> timeout;
  std::optional<std::chrono::seconds> lock_ttl;
  std::optional<std::filesystem::path> state_path;  // relative to the manifest
  std::optional<std::filesystem::path> cloud_root;  // local provider root
};

struct manifest : unmovable {
  std::filesystem::path manifest_path;
  std::vector<resource_decl> resources;
  std::vector<resource_type> types;
  manifest_cfg cfg;

  manifest() = default;

  // Find manifest path: use provided path if given, otherwise discover from current
  // directory. Returns absolute path or throws if not found
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Walks up from the current directory looking for strata.lua, stopping at a .git
  // directory or the filesystem root
  static std::optional<std::filesystem::path> discover();

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(char const *script,
                                        std::filesystem::path const &manifest_path);

  // Directory relative CONFIG paths resolve against
  std::filesystem::path base_dir() const { return manifest_path.parent_path(); }
};

}  // namespace strata
