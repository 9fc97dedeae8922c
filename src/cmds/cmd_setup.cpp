#include "cmd_setup.h"

#include "cmd_common.h"
#include "config_validator.h"
#include "extension_catalog.h"
#include "native_config.h"
#include "setup_synth.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace rtpack {

void cmd_setup::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "setup",
      "Synthesize Setup.local, Makefile.extra and variant sidecars for one cell") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--catalog", cfg_ptr->catalog_path, "Extension catalog (Lua)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--source-root", cfg_ptr->source_root, "Runtime source tree")
      ->required()
      ->check(CLI::ExistingDirectory);
  sub->add_option("--target", cfg_ptr->target_triple, "Target triple")->required();
  sub->add_option("--python-version", cfg_ptr->python_version, "e.g. 3.12.4")
      ->required();
  sub->add_option("--options", cfg_ptr->options, "Build options, e.g. pgo+lto")
      ->capture_default_str();
  sub->add_option("--variants", cfg_ptr->variant_file, "Variant directive file")
      ->check(CLI::ExistingFile);
  sub->add_option("--deps-root", cfg_ptr->deps_root, "Root of dependency includes")
      ->capture_default_str();
  sub->add_option("-o,--output-dir", cfg_ptr->output_dir, "Output directory")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_setup::cmd_setup(cmd_setup::cfg cfg, tui::logger &log)
    : cfg_{ std::move(cfg) }, log_{ log } {}

void cmd_setup::execute() {
  auto const cell{
    make_build_cell(cfg_.target_triple, cfg_.python_version, cfg_.options)
  };

  auto const catalog{ extension_catalog::load(cfg_.catalog_path) };
  auto const native{ native_extension_index::load(cfg_.source_root) };
  validate_native_config(catalog, native, cell.python_version, log_);

  auto const variants{ load_variant_file(cfg_.variant_file) };
  auto const plan{ synthesize_setup(catalog,
                                    native,
                                    cell,
                                    variants,
                                    synthesis_settings{ cfg_.deps_root },
                                    log_) };

  write_setup_outputs(plan, cfg_.output_dir);
  log_.info("Wrote Setup.local, Makefile.extra and %zu sidecar(s) to %s",
            plan.sidecars.size(),
            cfg_.output_dir.string().c_str());
}

}  // namespace rtpack
