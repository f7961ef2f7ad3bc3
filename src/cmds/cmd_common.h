#pragma once

#include "engine.h"
#include "local_provider.h"
#include "manifest.h"
#include "provider.h"
#include "state.h"
#include "util.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace CLI { class App; }

namespace strata {

// Flags shared by every command that touches a manifest or its state
struct run_opts {
  std::optional<std::filesystem::path> manifest_path;
  std::optional<std::filesystem::path> state_path;
  std::optional<std::size_t> parallelism;
  std::optional<std::int64_t> timeout_s;
  bool refresh{ false };
};

void add_run_options(CLI::App &sub, run_opts &opts, bool planning);

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path);

// --state wins, then CONFIG.state, then strata.state.json beside the manifest
std::filesystem::path resolve_state_path(
    manifest const &m,
    std::optional<std::filesystem::path> const &state_override);

// Manifest, state store, local provider and engine settings for one invocation
struct workspace : unmovable {
  std::unique_ptr<manifest> decls;
  std::unique_ptr<file_state_store> store;
  std::unique_ptr<local_provider> cloud;
  provider_registry registry;
  engine_cfg cfg;

  static std::unique_ptr<workspace> open(run_opts const &opts);
};

void print_diagnostics(std::vector<diagnostic> const &diagnostics);
void print_plan(plan const &p);

}  // namespace strata
