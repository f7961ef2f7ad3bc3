#include "cmd_state.h"

#include "tui.h"

#include "CLI/CLI.hpp"

#include <cstdlib>
#include <memory>

namespace strata {

namespace {

// The state file is usually found through the manifest; --state skips that
state_snapshot load_state(run_opts const &opts) {
  if (opts.state_path) { return file_state_store{ *opts.state_path }.load(); }
  auto const m{ load_manifest_or_throw(opts.manifest_path) };
  return file_state_store{ resolve_state_path(*m, std::nullopt) }.load();
}

}  // namespace

void cmd_state_register_cli(CLI::App &app,
                            std::function<void(cmd_state_list::cfg)> on_list,
                            std::function<void(cmd_state_show::cfg)> on_show) {
  auto *state{ app.add_subcommand("state", "Inspect recorded state") };
  state->require_subcommand(1);

  auto list_cfg{ std::make_shared<cmd_state_list::cfg>() };
  auto *list{ state->add_subcommand("list", "List managed resources") };
  add_run_options(*list, list_cfg->run, false);
  list->callback([list_cfg, on_list = std::move(on_list)] { on_list(*list_cfg); });

  auto show_cfg{ std::make_shared<cmd_state_show::cfg>() };
  auto *show{ state->add_subcommand("show", "Show one managed resource") };
  show->add_option("address", show_cfg->address, "Resource address (type.name[index])")
      ->required();
  add_run_options(*show, show_cfg->run, false);
  show->callback([show_cfg, on_show = std::move(on_show)] { on_show(*show_cfg); });
}

cmd_state_list::cmd_state_list(cmd_state_list::cfg cfg) : cfg_{ std::move(cfg) } {}

int cmd_state_list::execute() {
  auto const snapshot{ load_state(cfg_.run) };
  for (auto const &[address, entry] : snapshot.resources) {
    tui::print_stdout("%s\t%s%s\n",
                      address.str().c_str(),
                      entry.id.empty() ? "(none)" : entry.id.c_str(),
                      entry.deposed.empty() ? "" : "\t(deposed objects pending)");
  }
  tui::debug("serial %lld, lineage %s",
             static_cast<long long>(snapshot.serial),
             snapshot.lineage.c_str());
  return EXIT_SUCCESS;
}

cmd_state_show::cmd_state_show(cmd_state_show::cfg cfg) : cfg_{ std::move(cfg) } {}

int cmd_state_show::execute() {
  auto const address{ resource_address::parse(cfg_.address) };
  auto const snapshot{ load_state(cfg_.run) };

  auto const *entry{ snapshot.find(address) };
  if (!entry) {
    tui::error("%s is not in the state", address.str().c_str());
    return EXIT_FAILURE;
  }

  tui::print_stdout("# %s\n", address.str().c_str());
  tui::print_stdout("type         = %s\n", entry->type.c_str());
  tui::print_stdout("id           = %s\n", entry->id.c_str());
  tui::print_stdout("inputs       = %s\n", attribute_map_to_string(entry->inputs).c_str());
  tui::print_stdout("attributes   = %s\n",
                    attribute_map_to_string(entry->attributes).c_str());
  tui::print_stdout("dependencies = [%s]\n", util_join(entry->dependencies, ", ").c_str());
  if (!entry->deposed.empty()) {
    tui::print_stdout("deposed      = [%s]\n", util_join(entry->deposed, ", ").c_str());
  }
  return EXIT_SUCCESS;
}

}  // namespace strata
