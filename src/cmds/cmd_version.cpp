#include "cmd_version.h"

#include "tui.h"

#include "CLI11.hpp"
#include "archive.h"
#include "mbedtls/version.h"
#include "sol/sol.hpp"
#include "tbb/version.h"

#include <array>

#ifndef RTPACK_VERSION_STR
#error "RTPACK_VERSION_STR must be defined by the build system"
#endif

namespace rtpack {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg /*cfg*/, tui::logger &log) : log_{ log } {}

void cmd_version::execute() {
  log_.info("rtpack version %s", RTPACK_VERSION_STR);
  log_.info("");
  log_.info("Third-party component versions:");

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  log_.info("  mbedTLS: %s", mbedtls_version.data());

  log_.info("  libarchive: %s", archive_version_details());
  log_.info("  Lua: %s", LUA_RELEASE);
  log_.info("  Sol2: %s", SOL_VERSION_STRING);
  log_.info("  oneTBB: %s (runtime %s)", TBB_VERSION_STRING, TBB_runtime_version());
  log_.info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace rtpack
