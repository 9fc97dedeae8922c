#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  auto args{ rtpack::cli_parse(argc, argv) };
  rtpack::tui::logger log{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      log.error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    log.info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  try {
    auto cmd{ std::visit(
        [&log](auto const &cfg) { return rtpack::cmd::create(cfg, log); },
        *args.cmd_cfg) };
    cmd->execute();
  } catch (std::exception const &ex) {
    log.error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
