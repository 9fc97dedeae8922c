#pragma once

#include "build_options.h"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

enum class build_mode { STATIC, SHARED };

std::string_view build_mode_name(build_mode mode);

struct version_gate {
  std::optional<std::string> minimum;
  std::optional<std::string> maximum;

  bool admits(std::string_view version) const;
};

// Predicate shared by every conditional catalog entry.
struct conditional_gate {
  std::optional<std::vector<std::string>> targets;
  version_gate versions;
  std::vector<std::string> required_options;

  bool applies(std::string const &triple,
               std::string_view version,
               build_options const &options) const;
};

struct conditional_sources {
  std::vector<std::string> sources;
  conditional_gate gate;
};

struct conditional_define {
  std::string define;
  conditional_gate gate;
};

struct conditional_includes {
  std::vector<std::string> paths;
  conditional_gate gate;
};

struct conditional_link {
  std::string name;
  std::optional<std::vector<std::string>> targets;
  std::optional<build_mode> mode;  // link only when the module builds this way
};

struct linker_args_entry {
  std::vector<std::string> args;
  std::optional<std::vector<std::string>> targets;
};

struct setup_enabled_condition {
  bool enabled{ false };
  version_gate versions;
};

// One catalog entry. Immutable once the catalog is loaded.
struct ext_module_spec {
  std::string name;
  std::vector<std::string> sources;
  std::vector<conditional_sources> sources_conditional;
  std::vector<std::string> defines;
  std::vector<conditional_define> defines_conditional;
  std::vector<std::string> includes;
  std::vector<conditional_includes> includes_conditional;
  std::vector<std::string> includes_deps;
  std::vector<std::string> links;
  std::vector<conditional_link> links_conditional;
  std::vector<linker_args_entry> linker_args;
  std::vector<std::string> frameworks;
  build_mode mode{ build_mode::STATIC };
  std::vector<std::string> disabled_targets;
  std::vector<std::string> required_targets;
  version_gate versions;
  bool setup_enabled{ false };
  std::vector<setup_enabled_condition> setup_enabled_conditional;
  bool config_c_only{ false };

  // setup-enabled, or any setup-enabled-conditional entry admitting `version`.
  bool wants_setup_enabled(std::string_view version) const;
};

// Declarative per-module capability catalog. The document is Lua assigning a
// global EXTENSION_MODULES table:
//
//   EXTENSION_MODULES = {
//     _bz2 = { sources = { "_bz2module.c" }, links = { "bz2" } },
//     _crypt = {
//       sources = { "_cryptmodule.c" },
//       ["links-conditional"] = { { name = "crypt", targets = { ".*-unknown-linux-.*" } } },
//     },
//   }
//
// Every key is validated at load time; unknown keys throw schema_violation.
class extension_catalog {
 public:
  using module_map_t = std::map<std::string, ext_module_spec, std::less<>>;

  static extension_catalog load(std::string_view script, std::string const &origin);
  static extension_catalog load(std::filesystem::path const &path);

  ext_module_spec const *find(std::string_view name) const;
  module_map_t const &modules() const { return modules_; }
  std::set<std::string> names() const;
  bool contains(std::string_view name) const { return find(name) != nullptr; }

 private:
  module_map_t modules_;
};

}  // namespace rtpack
