#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

// A runtime version reduced to its (major, minor) pair.
struct python_version {
  int major{ 0 };
  int minor{ 0 };

  // Accepts "3", "3.13", "3.13.1", "3.13.0rc2". Anything after the minor
  // component is ignored. Throws std::invalid_argument on malformed input.
  static python_version parse(std::string_view text);

  std::string major_minor() const;

  auto operator<=>(python_version const &) const = default;
};

bool meets_minimum_version(std::string_view actual, std::string_view wanted);
bool meets_maximum_version(std::string_view actual, std::string_view wanted);

// True iff at least one pattern fully matches the triple. An empty list never
// matches, so callers using it to restrict (disabled-targets, required-targets)
// apply no restriction.
bool matches_any_target(std::string const &triple, std::vector<std::string> const &patterns);

// Entries lacking a `targets` key apply to every triple.
bool target_filter_applies(std::string const &triple,
                           std::optional<std::vector<std::string>> const &patterns);

// Throws std::invalid_argument if the pattern is not a valid regular expression.
void validate_target_pattern(std::string const &pattern);

bool target_is_apple(std::string_view triple);
bool target_is_linux(std::string_view triple);
bool target_is_musl(std::string_view triple);

// Fully static targets cannot produce dynamically loadable extension modules.
bool target_is_fully_static(std::string_view triple);

}  // namespace rtpack
