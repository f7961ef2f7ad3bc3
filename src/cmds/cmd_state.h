#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace strata {

// "state list" and "state show <address>": read-only views of the state file
class cmd_state_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_state_list> {
    run_opts run;
  };

  explicit cmd_state_list(cfg cfg);

  int execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

class cmd_state_show : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_state_show> {
    run_opts run;
    std::string address;
  };

  explicit cmd_state_show(cfg cfg);

  int execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

void cmd_state_register_cli(CLI::App &app,
                            std::function<void(cmd_state_list::cfg)> on_list,
                            std::function<void(cmd_state_show::cfg)> on_show);

}  // namespace strata
