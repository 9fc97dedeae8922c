#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace rtpack {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_version(cfg cfg, tui::logger &log);

  void execute() override;

 private:
  tui::logger &log_;
};

}  // namespace rtpack
