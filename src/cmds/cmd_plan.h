#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>

namespace CLI { class App; }

namespace strata {

// Lock, load, (refresh,) plan and print. Exits 2 when the declarations do not validate.
class cmd_plan : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_plan> {
    run_opts run;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_plan(cfg cfg);

  int execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace strata
