#pragma once

#include "build_options.h"
#include "extension_catalog.h"
#include "native_config.h"
#include "setup_grammar.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack::tui { class logger; }

namespace rtpack {

// One (target triple x build options) cell of the build matrix.
struct build_cell {
  std::string target_triple;
  std::string python_version;  // "3.12.4"; only major.minor is significant
  build_options options;
};

enum class directive_origin { SYNTHESIZED, SETUP_ENABLED, CONFIG_C_ONLY, VARIANT };

std::string_view directive_origin_name(directive_origin origin);

struct setup_directive {
  std::string extension;
  std::string variant{ "default" };
  std::string text;  // written to Setup.local; empty unless a primary synthesized line
  std::optional<setup_line> line;  // as emitted, -Dname=value tokens removed
  std::vector<std::string> object_paths;  // relative to the build directory
  build_mode mode{ build_mode::STATIC };
  directive_origin origin{ directive_origin::SYNTHESIZED };
  bool primary{ true };

  // Loadable module produced for this directive, with a literal $(EXT_SUFFIX).
  std::optional<std::string> module_path;
};

// A directive from a variant file, tagged by the "*variant:<tag>*" marker above it.
struct variant_directive {
  std::string tag;
  std::string text;
};

struct synthesis_settings {
  std::string deps_root{ "/tools/deps" };
};

struct setup_plan {
  std::vector<setup_directive> directives;
  std::set<std::string> disabled;
  std::string setup_local;
  std::string makefile_extra;
  std::map<std::string, std::string> sidecars;  // file name -> original directive text

  setup_directive const *find_primary(std::string_view extension) const;
};

// Modules that must not be built in `cell`: version-gated, disabled-targets
// matches, and modules that do not build under debug.
std::set<std::string> compute_disabled_set(extension_catalog const &catalog,
                                           build_cell const &cell);

// Directive for one spec in `cell`. The result holds only the module name when the
// spec has nothing to emit.
setup_line synthesize_line(ext_module_spec const &spec,
                           build_cell const &cell,
                           synthesis_settings const &settings);

// Variant file grammar: Setup directives grouped under "*variant:<tag>*" markers.
// Throws malformed_directive_error for directives outside a variant section.
std::vector<variant_directive> parse_variant_file(std::string_view text);

setup_plan synthesize_setup(extension_catalog const &catalog,
                            native_extension_index const &native,
                            build_cell const &cell,
                            std::vector<variant_directive> const &variants,
                            synthesis_settings const &settings,
                            tui::logger &log);

}  // namespace rtpack
