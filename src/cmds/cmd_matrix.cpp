#include "cmd_matrix.h"

#include "cmd_common.h"
#include "config_validator.h"
#include "extension_catalog.h"
#include "native_config.h"
#include "setup_synth.h"
#include "tui.h"

#include "CLI11.hpp"
#include "tbb/flow_graph.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace rtpack {
namespace {

struct matrix_cell {
  std::string triple;
  std::string options;
  std::optional<std::string> failure;
};

void run_cell(cmd_matrix::cfg const &cfg,
              std::vector<variant_directive> const &variants,
              matrix_cell &cell,
              tui::logger &log) {
  auto const build{ make_build_cell(cell.triple, cfg.python_version, cell.options) };

  // Each cell owns its catalog and native index; nothing is shared between workers.
  auto const catalog{ extension_catalog::load(cfg.catalog_path) };
  auto const native{ native_extension_index::load(cfg.source_root) };
  validate_native_config(catalog, native, build.python_version, log);

  auto const plan{ synthesize_setup(catalog,
                                    native,
                                    build,
                                    variants,
                                    synthesis_settings{ cfg.deps_root },
                                    log) };

  if (cfg.output_dir) {
    write_setup_outputs(plan, *cfg.output_dir / cell.triple / build.options.str());
  }
}

}  // namespace

void cmd_matrix::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "matrix",
      "Validate and synthesize every target x options cell in parallel") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--catalog", cfg_ptr->catalog_path, "Extension catalog (Lua)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--source-root", cfg_ptr->source_root, "Runtime source tree")
      ->required()
      ->check(CLI::ExistingDirectory);
  sub->add_option("--python-version", cfg_ptr->python_version, "e.g. 3.12.4")
      ->required();
  sub->add_option("--target", cfg_ptr->target_triples, "Target triple (repeatable)")
      ->required();
  sub->add_option("--options", cfg_ptr->options, "Build options (repeatable)")
      ->capture_default_str();
  sub->add_option("--variants", cfg_ptr->variant_file, "Variant directive file")
      ->check(CLI::ExistingFile);
  sub->add_option("--deps-root", cfg_ptr->deps_root, "Root of dependency includes")
      ->capture_default_str();
  sub->add_option("-o,--output-dir", cfg_ptr->output_dir, "Output root directory");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_matrix::cmd_matrix(cmd_matrix::cfg cfg, tui::logger &log)
    : cfg_{ std::move(cfg) }, log_{ log } {}

void cmd_matrix::execute() {
  if (cfg_.target_triples.empty() || cfg_.options.empty()) {
    throw std::runtime_error("matrix: at least one target and one option set required");
  }

  auto const variants{ load_variant_file(cfg_.variant_file) };

  std::vector<matrix_cell> cells;
  for (auto const &triple : cfg_.target_triples) {
    for (auto const &options : cfg_.options) {
      cells.push_back(matrix_cell{ triple, options, std::nullopt });
    }
  }

  tbb::flow::graph g;
  std::vector<std::unique_ptr<tbb::flow::continue_node<tbb::flow::continue_msg>>> nodes;
  nodes.reserve(cells.size());

  for (auto &cell : cells) {
    nodes.push_back(std::make_unique<tbb::flow::continue_node<tbb::flow::continue_msg>>(
        g,
        [this, &variants, &cell](tbb::flow::continue_msg const &) {
          tui::logger cell_log{ log_, cell.triple + "/" + cell.options };
          try {
            run_cell(cfg_, variants, cell, cell_log);
          } catch (std::exception const &ex) {
            cell.failure = ex.what();
            cell_log.error("%s", ex.what());
          }
        }));
  }

  for (auto &node : nodes) { node->try_put(tbb::flow::continue_msg{}); }
  g.wait_for_all();

  std::size_t failed{ 0 };
  for (auto const &cell : cells) {
    if (cell.failure) { ++failed; }
  }

  if (failed) {
    throw std::runtime_error("matrix: " + std::to_string(failed) + " of " +
                             std::to_string(cells.size()) + " cells failed");
  }

  log_.info("matrix: %zu cells OK", cells.size());
}

}  // namespace rtpack
