#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace strata {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_version(cfg cfg);

  int execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace strata
