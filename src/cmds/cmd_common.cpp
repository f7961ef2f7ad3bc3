#include "cmd_common.h"

#include "tui.h"

#include "CLI/CLI.hpp"

#include <stdexcept>

namespace strata {

namespace {

constexpr char kDefaultStateFile[]{ "strata.state.json" };
constexpr char kDefaultCloudDir[]{ ".strata/cloud" };

}  // namespace

void add_run_options(CLI::App &sub, run_opts &opts, bool planning) {
  sub.add_option("--manifest", opts.manifest_path, "Path to strata.lua manifest");
  sub.add_option("--state", opts.state_path, "Path to the state file");
  if (!planning) { return; }

  sub.add_option("--parallelism", opts.parallelism, "Maximum concurrent provider calls")
      ->check(CLI::Range(std::size_t{ 1 }, kMaxParallelism));
  sub.add_option("--timeout", opts.timeout_s, "Cancel the apply after this many seconds")
      ->check(CLI::PositiveNumber);
  sub.add_flag("--refresh", opts.refresh, "Read every managed object before planning");
}

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path) {
  auto const path{ manifest::find_manifest_path(manifest_path) };
  auto m{ manifest::load(path) };
  if (!m) { throw std::runtime_error("could not load manifest"); }
  return m;
}

std::filesystem::path resolve_state_path(
    manifest const &m,
    std::optional<std::filesystem::path> const &state_override) {
  if (state_override) { return std::filesystem::absolute(*state_override); }
  return m.base_dir() / m.cfg.state_path.value_or(kDefaultStateFile);
}

std::unique_ptr<workspace> workspace::open(run_opts const &opts) {
  auto ws{ std::make_unique<workspace>() };
  ws->decls = load_manifest_or_throw(opts.manifest_path);

  auto const &mc{ ws->decls->cfg };
  ws->store = std::make_unique<file_state_store>(resolve_state_path(*ws->decls,
                                                                    opts.state_path));
  ws->cloud = std::make_unique<local_provider>(ws->decls->base_dir() /
                                               mc.cloud_root.value_or(kDefaultCloudDir));
  for (auto const &type : ws->decls->types) { ws->registry.add(type, *ws->cloud); }

  auto &exec{ ws->cfg.exec };
  exec.parallelism = opts.parallelism.value_or(mc.parallelism.value_or(exec.parallelism));
  exec.max_attempts = mc.max_attempts.value_or(exec.max_attempts);
  exec.initial_backoff = mc.backoff.value_or(exec.initial_backoff);
  exec.max_backoff = mc.max_backoff.value_or(exec.max_backoff);
  if (opts.timeout_s) {
    exec.timeout = std::chrono::seconds{ *opts.timeout_s };
  } else if (mc.timeout) {
    exec.timeout = *mc.timeout;
  }

  ws->cfg.lock_ttl = mc.lock_ttl.value_or(ws->cfg.lock_ttl);
  ws->cfg.refresh = opts.refresh;

  tui::debug("State: %s, provider root: %s",
             ws->store->describe().c_str(),
             ws->cloud->root().string().c_str());
  return ws;
}

void print_diagnostics(std::vector<diagnostic> const &diagnostics) {
  for (auto const &d : diagnostics) { tui::error("%s", diagnostic_format(d).c_str()); }
  tui::error("Planning failed with %zu error%s",
             diagnostics.size(),
             diagnostics.size() == 1 ? "" : "s");
}

void print_plan(plan const &p) {
  auto const lines{ plan_render(p) };
  if (lines.empty()) {
    tui::print_stdout("No changes. Infrastructure matches the declarations.\n");
    return;
  }
  for (auto const &line : lines) { tui::print_stdout("%s\n", line.c_str()); }
  tui::print_stdout("\n%s\n", plan_summary_line(plan_summarize(p)).c_str());
}

}  // namespace strata
