#include "cmd_plan.h"

#include "engine.h"
#include "termination.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <cstdlib>
#include <memory>

namespace strata {

void cmd_plan::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("plan", "Show the changes apply would make") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  add_run_options(*sub, cfg_ptr->run, true);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_plan::cmd_plan(cmd_plan::cfg cfg) : cfg_{ std::move(cfg) } {}

int cmd_plan::execute() {
  auto ws{ workspace::open(cfg_.run) };
  engine eng{ *ws->store, ws->registry, ws->cfg };

  auto const result{ eng.run(ws->decls->resources, false, termination_cancellation()) };
  if (!result.planned.valid()) {
    print_diagnostics(result.planned.diagnostics);
    return 2;
  }

  print_plan(result.planned);
  return EXIT_SUCCESS;
}

}  // namespace strata
