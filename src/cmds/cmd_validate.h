#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <string>

namespace CLI { class App; }

namespace rtpack {

class cmd_validate : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_validate> {
    std::filesystem::path catalog_path;
    std::filesystem::path source_root;
    std::string python_version;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_validate(cfg cfg, tui::logger &log);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  tui::logger &log_;
};

}  // namespace rtpack
