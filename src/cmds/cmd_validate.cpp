#include "cmd_validate.h"

#include "config_validator.h"
#include "extension_catalog.h"
#include "native_config.h"
#include "target_predicate.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace rtpack {

void cmd_validate::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "validate",
      "Check the extension catalog against the runtime's native configuration") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--catalog", cfg_ptr->catalog_path, "Extension catalog (Lua)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--source-root", cfg_ptr->source_root, "Runtime source tree")
      ->required()
      ->check(CLI::ExistingDirectory);
  sub->add_option("--python-version", cfg_ptr->python_version, "e.g. 3.12.4")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_validate::cmd_validate(cmd_validate::cfg cfg, tui::logger &log)
    : cfg_{ std::move(cfg) }, log_{ log } {}

void cmd_validate::execute() {
  auto const version{ python_version::parse(cfg_.python_version) };

  auto const catalog{ extension_catalog::load(cfg_.catalog_path) };
  auto const native{ native_extension_index::load(cfg_.source_root) };

  validate_native_config(catalog, native, cfg_.python_version, log_);

  log_.info("Catalog consistent with %s native configuration (%zu modules)",
            version.major_minor().c_str(),
            catalog.modules().size());
}

}  // namespace rtpack
