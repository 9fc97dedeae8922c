#include "cmd_manifest.h"

#include "artifact_tree.h"
#include "build_vars.h"
#include "cmd_common.h"
#include "extension_catalog.h"
#include "manifest_builder.h"
#include "native_config.h"
#include "package_registry.h"
#include "setup_synth.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <memory>

namespace rtpack {

void cmd_manifest::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("manifest",
                                "Build PYTHON.json from a compiled distribution tree") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--artifacts", cfg_ptr->artifact_root, "Distribution python/ dir")
      ->required()
      ->check(CLI::ExistingDirectory);
  sub->add_option("--catalog", cfg_ptr->catalog_path, "Extension catalog (Lua)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--packages", cfg_ptr->packages_path, "Package registry (Lua)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--build-vars", cfg_ptr->build_vars_path, "Build variables (JSON)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--source-root", cfg_ptr->source_root, "Runtime source tree")
      ->required()
      ->check(CLI::ExistingDirectory);
  sub->add_option("--target", cfg_ptr->target_triple, "Target triple")->required();
  sub->add_option("--options", cfg_ptr->options, "Build options, e.g. pgo+lto")
      ->capture_default_str();
  sub->add_option("--variants", cfg_ptr->variant_file, "Variant directive file")
      ->check(CLI::ExistingFile);
  sub->add_option("--deps-root", cfg_ptr->deps_root, "Root of dependency includes")
      ->capture_default_str();
  sub->add_option("-o,--output", cfg_ptr->output, "Output path (default: stdout)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_manifest::cmd_manifest(cmd_manifest::cfg cfg, tui::logger &log)
    : cfg_{ std::move(cfg) }, log_{ log } {}

void cmd_manifest::execute() {
  auto const vars{ build_vars::load(cfg_.build_vars_path) };
  auto const cell{
    make_build_cell(cfg_.target_triple, vars.python_version, cfg_.options)
  };

  auto const catalog{ extension_catalog::load(cfg_.catalog_path) };
  auto const packages{ package_registry::load(cfg_.packages_path) };
  auto const native{ native_extension_index::load(cfg_.source_root) };
  auto const variants{ load_variant_file(cfg_.variant_file) };

  // Same directives the build consumed; only object attribution is needed here.
  tui::logger synth_log{ log_, "setup" };
  auto const plan{ synthesize_setup(catalog,
                                    native,
                                    cell,
                                    variants,
                                    synthesis_settings{ cfg_.deps_root },
                                    synth_log) };

  auto const tree{ artifact_tree::scan(cfg_.artifact_root) };
  log_.debug("Scanned %zu files under %s",
             tree.entries().size(),
             cfg_.artifact_root.string().c_str());

  auto const manifest{ build_manifest(
      manifest_inputs{ tree, plan, vars, packages, native, catalog, cell },
      log_) };
  validate_manifest(manifest, catalog);

  auto const json{ manifest_to_json(manifest) };
  if (!cfg_.output) {
    tui::print_stdout("%s", json.c_str());
    return;
  }

  util_write_file_atomic(*cfg_.output, json);
  log_.info("Wrote manifest for %s (%zu extensions) to %s",
            cell.target_triple.c_str(),
            manifest.extensions.size(),
            cfg_.output->string().c_str());
}

}  // namespace rtpack
