#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

struct package_info {
  std::string name;
  std::vector<std::string> library_names;  // bare link names this package provides
  std::vector<std::string> licenses;       // SPDX identifiers
  std::optional<std::string> license_file;
  bool license_public_domain{ false };

  bool has_license() const { return !licenses.empty() || license_public_domain; }
};

// Third-party packages the distribution links against. The document is Lua:
//
//   PACKAGES = {
//     zlib = { ["library-names"] = { "z" }, licenses = { "Zlib" },
//              ["license-file"] = "LICENSE.zlib.txt" },
//   }
class package_registry {
 public:
  static package_registry load(std::string_view script, std::string const &origin);
  static package_registry load(std::filesystem::path const &path);

  package_info const *find(std::string_view package) const;

  // Reverse lookup of a bare library name ("z" -> zlib).
  package_info const *find_by_library(std::string_view library) const;

  std::map<std::string, package_info, std::less<>> const &packages() const {
    return packages_;
  }

 private:
  std::map<std::string, package_info, std::less<>> packages_;
  std::map<std::string, std::string, std::less<>> library_owner_;
};

}  // namespace rtpack
