#pragma once

#include "cmds/cmd_hash.h"
#include "cmds/cmd_manifest.h"
#include "cmds/cmd_matrix.h"
#include "cmds/cmd_normalize.h"
#include "cmds/cmd_setup.h"
#include "cmds/cmd_validate.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace rtpack {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_hash::cfg,
                                 cmd_manifest::cfg,
                                 cmd_matrix::cfg,
                                 cmd_normalize::cfg,
                                 cmd_setup::cfg,
                                 cmd_validate::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace rtpack
