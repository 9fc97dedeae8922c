#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

// Variables the built runtime reports about itself (sysconfig), captured as JSON:
//
//   { "python_version": "3.12.4", "llvm_version": "18",
//     "config_vars": { "LIBS": "-ldl -lpthread", "EXT_SUFFIX": ".cpython-312.so" } }
struct build_vars {
  std::string python_version;
  std::optional<std::string> llvm_version;
  std::map<std::string, std::string, std::less<>> config_vars;

  static build_vars parse(std::string_view json, std::string const &origin);
  static build_vars load(std::filesystem::path const &path);

  std::string var(std::string_view name) const;  // empty when unset
  bool shared_runtime() const;                  // Py_ENABLE_SHARED

  // Bare library names from -l tokens in LIBS and SYSLIBS, in order, deduplicated.
  std::vector<std::string> core_link_libraries() const;

  // -framework names in LIBS and SYSLIBS.
  std::vector<std::string> core_frameworks() const;
};

}  // namespace rtpack
