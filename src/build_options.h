#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

// Independent build flags joined with '+', e.g. "pgo+lto" or "debug+freethreaded".
class build_options {
 public:
  build_options() = default;

  // Throws std::invalid_argument on unknown or repeated flags. "noopt" is the
  // canonical spelling of "no flags" and parses to the empty set.
  static build_options parse(std::string_view text);

  bool has(std::string_view flag) const;
  bool has_all(std::vector<std::string> const &flags) const;
  bool empty() const { return flags_.empty(); }

  // Canonical '+'-joined form in a fixed flag order; "noopt" when empty.
  std::string str() const;

  static bool is_known_flag(std::string_view flag);

 private:
  std::set<std::string, std::less<>> flags_;
};

}  // namespace rtpack
