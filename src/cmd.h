#pragma once

#include "util.h"

#include <memory>

namespace rtpack::tui { class logger; }

namespace rtpack {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, tui::logger &log);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, tui::logger &log) {
  return std::make_unique<typename config::cmd_t>(cfg, log);
}

}  // namespace rtpack
