#include "cmd_normalize.h"

#include "archive_normalize.h"
#include "sha256.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <memory>
#include <string_view>

namespace rtpack {

void cmd_normalize::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "normalize",
      "Rewrite a tar archive into byte-reproducible form and write its .sha256") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("input", cfg_ptr->input, "Uncompressed tar archive")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("output", cfg_ptr->output, "Normalized archive path")->required();
  sub->add_option("--metadata-member",
                  cfg_ptr->metadata_member,
                  "Member placed first in the output")
      ->capture_default_str();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_normalize::cmd_normalize(cmd_normalize::cfg cfg, tui::logger &log)
    : cfg_{ std::move(cfg) }, log_{ log } {}

void cmd_normalize::execute() {
  if (std::filesystem::is_directory(cfg_.input)) {
    throw std::runtime_error("normalize: input is a directory: " + cfg_.input.string());
  }

  auto const in_bytes{ util_load_file(cfg_.input) };
  auto const out_bytes{
    normalize_tar(in_bytes, normalize_options{ cfg_.metadata_member })
  };

  auto const hex{ sha256_hex(sha256(out_bytes)) };
  auto const digest_line{ hex + "\n" };
  auto sidecar{ cfg_.output };
  sidecar += ".sha256";

  util_write_files_atomic(
      { { cfg_.output,
          std::string_view{ reinterpret_cast<char const *>(out_bytes.data()),
                            out_bytes.size() } },
        { sidecar, digest_line } });

  log_.info("Normalized %s -> %s (%zu bytes, sha256 %s)",
            cfg_.input.string().c_str(),
            cfg_.output.string().c_str(),
            out_bytes.size(),
            hex.c_str());
}

}  // namespace rtpack
