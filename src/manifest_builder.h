#pragma once

#include "artifact_tree.h"
#include "build_vars.h"
#include "extension_catalog.h"
#include "native_config.h"
#include "package_registry.h"
#include "setup_synth.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rtpack::tui { class logger; }

namespace rtpack {

inline constexpr char const *kManifestSchemaVersion{ "8" };
inline constexpr char const *kManifestMember{ "python/PYTHON.json" };

enum class link_kind { SYSTEM, FRAMEWORK, PATH_STATIC, PATH_DYNAMIC };

struct link_entry {
  std::string name;
  link_kind kind{ link_kind::SYSTEM };
  std::string path;  // set for PATH_STATIC and PATH_DYNAMIC

  bool is_local() const {
    return kind == link_kind::PATH_STATIC || kind == link_kind::PATH_DYNAMIC;
  }
  bool operator==(link_entry const &) const = default;
};

struct extension_build_record {
  std::vector<std::string> objs;
  std::vector<link_entry> links;
  std::string init_fn;
  bool in_core{ false };
  bool required{ false };
  std::string variant{ "default" };
  std::vector<std::string> licenses;
  std::vector<std::string> license_paths;
  bool license_public_domain{ false };
  std::optional<std::string> shared_lib;
};

struct core_build_info {
  std::vector<std::string> objs;
  std::vector<link_entry> links;
  std::optional<std::string> static_lib;
  std::optional<std::string> shared_lib;
};

struct distribution_manifest {
  std::string version{ kManifestSchemaVersion };
  std::string target_triple;
  std::string build_options;
  std::string python_version;
  std::string python_major_minor_version;
  std::string object_file_format;
  core_build_info core;
  std::map<std::string, std::vector<extension_build_record>> extensions;
  std::vector<std::string> crt_features;
  std::vector<std::string> licenses;
  std::string license_path;
};

struct manifest_inputs {
  artifact_tree const &tree;  // rooted at the distribution's python/ directory
  setup_plan const &plan;
  build_vars const &vars;
  package_registry const &packages;
  native_extension_index const &native;
  extension_catalog const &catalog;
  build_cell const &cell;
};

// Extensions the runtime cannot start without.
bool extension_is_required(std::string_view name);

// Bare link name for a library file: "libz.a" -> "z", "libssl.so.3" -> "ssl".
std::optional<std::string> library_bare_name(std::string_view file_name);

// Throws unattributed_link_error, missing_license_error.
distribution_manifest build_manifest(manifest_inputs const &in, tui::logger &log);

// Structural checks on a finished manifest: every extension is cataloged, every
// local link is licensed, no object is attributed twice.
void validate_manifest(distribution_manifest const &manifest,
                       extension_catalog const &catalog);

// Sorted keys, two-space indent, trailing newline.
std::string manifest_to_json(distribution_manifest const &manifest);

}  // namespace rtpack
