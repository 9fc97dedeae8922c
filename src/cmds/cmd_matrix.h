#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace rtpack {

// Validates and synthesizes every (target triple x build options) cell in parallel.
class cmd_matrix : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_matrix> {
    std::filesystem::path catalog_path;
    std::filesystem::path source_root;
    std::string python_version;
    std::vector<std::string> target_triples;
    std::vector<std::string> options{ "noopt" };
    std::optional<std::filesystem::path> variant_file;
    std::string deps_root{ "/tools/deps" };

    // Cell outputs land in <output_dir>/<triple>/<options>/. Dry run when unset.
    std::optional<std::filesystem::path> output_dir;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_matrix(cfg cfg, tui::logger &log);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  tui::logger &log_;
};

}  // namespace rtpack
