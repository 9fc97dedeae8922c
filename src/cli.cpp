#include "cli.h"

#include "CLI11.hpp"

#include <optional>
#include <string>

namespace rtpack {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "rtpack - reproducible runtime distribution packager" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  bool quiet{ false };
  app.add_flag("-q,--quiet", quiet, "Only log warnings and errors");

  bool version_flag{ false };
  app.add_flag("-v,--version",
               version_flag,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_validate::register_cli(app, on_selected);
  cmd_setup::register_cli(app, on_selected);
  cmd_manifest::register_cli(app, on_selected);
  cmd_normalize::register_cli(app, on_selected);
  cmd_matrix::register_cli(app, on_selected);
  cmd_hash::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else if (quiet) {
    args.verbosity = tui::level::TUI_WARN;
  } else {
    args.verbosity = tui::level::TUI_INFO;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace rtpack
