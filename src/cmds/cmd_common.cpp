#include "cmd_common.h"

#include "target_predicate.h"
#include "util.h"

#include <stdexcept>

namespace rtpack {

build_cell make_build_cell(std::string const &target_triple,
                           std::string const &version,
                           std::string const &options) {
  if (target_triple.empty()) { throw std::invalid_argument("target triple is required"); }
  static_cast<void>(python_version::parse(version));
  return build_cell{ target_triple, version, build_options::parse(options) };
}

std::vector<variant_directive> load_variant_file(
    std::optional<std::filesystem::path> const &path) {
  if (!path) { return {}; }
  auto const bytes{ util_load_file(*path) };
  return parse_variant_file(
      std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() });
}

void write_setup_outputs(setup_plan const &plan, std::filesystem::path const &out_dir) {
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    throw std::runtime_error("failed to create output directory " + out_dir.string() +
                             ": " + ec.message());
  }

  std::vector<util_file_write> files{ { out_dir / "Setup.local", plan.setup_local },
                                      { out_dir / "Makefile.extra", plan.makefile_extra } };
  for (auto const &[name, content] : plan.sidecars) {
    files.push_back({ out_dir / name, content });
  }
  util_write_files_atomic(files);
}

}  // namespace rtpack
