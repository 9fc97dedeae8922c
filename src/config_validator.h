#pragma once

#include "extension_catalog.h"
#include "native_config.h"

#include <string>
#include <vector>

namespace rtpack::tui { class logger; }

namespace rtpack {

struct drift_report {
  std::vector<std::string> missing_from_catalog;       // declared natively, not cataloged
  std::vector<std::string> setup_enabled_not_native;   // cataloged enabled, not in Setup
  std::vector<std::string> native_not_setup_enabled;   // enabled in Setup only
  std::vector<std::string> config_c_only_not_inittab;  // cataloged config-c-only only
  std::vector<std::string> inittab_not_config_c_only;  // in the init table only

  bool empty() const;
  std::vector<std::string> offenders() const;  // sorted, unique
};

// Computes every set difference between the catalog and the runtime's native
// configuration for `python_version`. Catalog entries whose version gate
// excludes `python_version` take no part.
drift_report diff_native_config(extension_catalog const &catalog,
                                native_extension_index const &native,
                                std::string const &python_version);

// Throws drift_error naming every offending module when the report is non-empty.
void validate_native_config(extension_catalog const &catalog,
                            native_extension_index const &native,
                            std::string const &python_version,
                            tui::logger &log);

}  // namespace rtpack
