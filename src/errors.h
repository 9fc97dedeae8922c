#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rtpack {

// Catalog failed structural validation.
struct schema_violation : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Catalog and the runtime's native configuration disagree.
struct drift_error : std::runtime_error {
  drift_error(std::string const &what, std::vector<std::string> modules)
      : std::runtime_error(what), modules(std::move(modules)) {}

  std::vector<std::string> modules;  // every offending module, sorted
};

// A directive cannot be expressed in the legacy Setup grammar.
struct malformed_directive_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The core binary links a system library missing from the platform allow-list.
struct unattributed_link_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A locally linked library has no license metadata.
struct missing_license_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Archive bytes could not be decoded as tar.
struct integrity_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace rtpack
