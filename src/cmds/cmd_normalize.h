#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <string>

namespace CLI { class App; }

namespace rtpack {

class cmd_normalize : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_normalize> {
    std::filesystem::path input;
    std::filesystem::path output;
    std::string metadata_member{ "python/PYTHON.json" };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_normalize(cfg cfg, tui::logger &log);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  tui::logger &log_;
};

}  // namespace rtpack
