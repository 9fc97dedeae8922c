#pragma once

#include "setup_grammar.h"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

enum class setup_section { STATIC, SHARED, DISABLED };

struct native_setup_entry {
  setup_line line;
  setup_section section{ setup_section::STATIC };
  bool enabled{ false };  // false for commented-out declarations
};

// Read-only view of a runtime's own module configuration: Modules/Setup and the
// init table in Modules/config.c.in.
class native_extension_index {
 public:
  static native_extension_index parse(std::string_view setup_text,
                                      std::string_view config_c_in_text);

  // Reads <source_root>/Modules/Setup and <source_root>/Modules/config.c.in.
  static native_extension_index load(std::filesystem::path const &source_root);

  // Every module named by a declaration line, enabled or commented out.
  std::set<std::string> declared_modules() const;

  // Modules with an uncommented declaration in the static or shared section.
  std::set<std::string> enabled_modules() const;

  // Enabled declaration for `name`, if any.
  native_setup_entry const *find_enabled(std::string_view name) const;

  // extension name -> init function symbol ("NULL" for builtins without one).
  std::map<std::string, std::string, std::less<>> const &init_table() const {
    return init_table_;
  }

  std::vector<native_setup_entry> const &entries() const { return entries_; }

 private:
  std::vector<native_setup_entry> entries_;
  std::map<std::string, std::string, std::less<>> init_table_;
};

// {"name", init_fn}, entries between "struct _inittab" and "/* Sentinel */".
std::map<std::string, std::string, std::less<>> parse_config_c_in(std::string_view text);

}  // namespace rtpack
