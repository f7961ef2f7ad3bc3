#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>

namespace CLI { class App; }

namespace strata {

class cmd_apply : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_apply> {
    run_opts run;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_apply(cfg cfg);

  int execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace strata
