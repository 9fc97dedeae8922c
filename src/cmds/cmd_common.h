#pragma once

#include "setup_synth.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rtpack {

// Throws std::invalid_argument for a malformed python version or unknown options.
build_cell make_build_cell(std::string const &target_triple,
                           std::string const &version,
                           std::string const &options);

std::vector<variant_directive> load_variant_file(
    std::optional<std::filesystem::path> const &path);

// Setup.local, Makefile.extra and every sidecar. Nothing is replaced unless every
// file could be staged.
void write_setup_outputs(setup_plan const &plan, std::filesystem::path const &out_dir);

}  // namespace rtpack
