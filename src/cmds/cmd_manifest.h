#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace rtpack {

class cmd_manifest : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_manifest> {
    std::filesystem::path artifact_root;  // the distribution's python/ directory
    std::filesystem::path catalog_path;
    std::filesystem::path packages_path;
    std::filesystem::path build_vars_path;
    std::filesystem::path source_root;
    std::string target_triple;
    std::string options{ "noopt" };
    std::optional<std::filesystem::path> variant_file;
    std::string deps_root{ "/tools/deps" };
    std::optional<std::filesystem::path> output;  // stdout when unset
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_manifest(cfg cfg, tui::logger &log);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  tui::logger &log_;
};

}  // namespace rtpack
