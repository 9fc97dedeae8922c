#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace rtpack {

class cmd_setup : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_setup> {
    std::filesystem::path catalog_path;
    std::filesystem::path source_root;
    std::string target_triple;
    std::string python_version;
    std::string options{ "noopt" };
    std::optional<std::filesystem::path> variant_file;
    std::filesystem::path output_dir;
    std::string deps_root{ "/tools/deps" };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_setup(cfg cfg, tui::logger &log);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  tui::logger &log_;
};

}  // namespace rtpack
