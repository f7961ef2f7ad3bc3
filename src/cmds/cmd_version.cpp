#include "cmd_version.h"

#include "tui.h"

#include "CLI/CLI.hpp"
#include "sol/sol.hpp"
#include "tbb/version.h"

extern "C" {
#include "lua.h"
}

#include <cstdlib>

#ifndef STRATA_VERSION_STR
#error "STRATA_VERSION_STR must be defined by the build system"
#endif

namespace strata {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

int cmd_version::execute() {
  tui::info("strata version %s", STRATA_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %d.%d", TBB_VERSION_MAJOR, TBB_VERSION_MINOR);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return EXIT_SUCCESS;
}

}  // namespace strata
