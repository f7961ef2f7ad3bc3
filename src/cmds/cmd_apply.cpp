#include "cmd_apply.h"

#include "engine.h"
#include "termination.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <cstdlib>
#include <memory>

namespace strata {

namespace {

void print_report(plan const &p, apply_report const &report) {
  for (auto const &r : report.actions) {
    if (r.op == operation::none) { continue; }
    auto const label{ p.actions[r.index].label() };

    switch (r.status) {
      case node_status::applied:
        tui::print_stdout("  applied    %s%s%s\n",
                          label.c_str(),
                          r.id.empty() ? "" : " -> ",
                          r.id.c_str());
        break;
      case node_status::failed:
        tui::print_stdout("  failed     %s: %s\n", label.c_str(), r.error.c_str());
        break;
      case node_status::skipped:
        tui::print_stdout("  skipped    %s (after %s)\n", label.c_str(), r.error.c_str());
        break;
      default:
        tui::print_stdout("  %-10s %s\n",
                          std::string{ node_status_name(r.status) }.c_str(),
                          label.c_str());
        break;
    }
  }

  tui::print_stdout("\nApply %s: %zu applied, %zu failed, %zu skipped, %zu cancelled "
                    "(state serial %lld).\n",
                    std::string{ apply_result_name(report.result) }.c_str(),
                    report.count(node_status::applied),
                    report.count(node_status::failed),
                    report.count(node_status::skipped),
                    report.count(node_status::cancelled),
                    static_cast<long long>(report.final_serial));
}

}  // namespace

void cmd_apply::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("apply", "Converge infrastructure to the manifest") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  add_run_options(*sub, cfg_ptr->run, true);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_apply::cmd_apply(cmd_apply::cfg cfg) : cfg_{ std::move(cfg) } {}

int cmd_apply::execute() {
  auto ws{ workspace::open(cfg_.run) };
  engine eng{ *ws->store, ws->registry, ws->cfg };

  auto const result{ eng.run(ws->decls->resources, true, termination_cancellation()) };
  if (!result.planned.valid()) {
    print_diagnostics(result.planned.diagnostics);
    return 2;
  }

  print_plan(result.planned);
  if (!result.planned.has_changes()) { return EXIT_SUCCESS; }

  tui::print_stdout("\n");
  print_report(result.planned, *result.applied);
  return result.applied->result == apply_result::success ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace strata
