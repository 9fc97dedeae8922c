#include "target_predicate.h"

#include <charconv>
#include <regex>
#include <stdexcept>

namespace rtpack {

namespace {

int parse_component(std::string_view text, std::string_view full) {
  int value{ 0 };
  auto const [ptr, ec]{ std::from_chars(text.data(), text.data() + text.size(), value) };
  if (ec != std::errc{} || ptr == text.data()) {
    throw std::invalid_argument("invalid version: '" + std::string{ full } + "'");
  }
  return value;
}

}  // namespace

python_version python_version::parse(std::string_view text) {
  if (text.empty()) { throw std::invalid_argument("invalid version: empty string"); }

  python_version v;
  auto const dot{ text.find('.') };
  v.major = parse_component(text.substr(0, dot), text);
  if (dot == std::string_view::npos) { return v; }

  auto const rest{ text.substr(dot + 1) };
  v.minor = parse_component(rest.substr(0, rest.find('.')), text);
  return v;
}

std::string python_version::major_minor() const {
  return std::to_string(major) + "." + std::to_string(minor);
}

bool meets_minimum_version(std::string_view actual, std::string_view wanted) {
  return python_version::parse(actual) >= python_version::parse(wanted);
}

bool meets_maximum_version(std::string_view actual, std::string_view wanted) {
  return python_version::parse(actual) <= python_version::parse(wanted);
}

bool matches_any_target(std::string const &triple,
                        std::vector<std::string> const &patterns) {
  for (auto const &pattern : patterns) {
    if (std::regex_match(triple, std::regex{ pattern })) { return true; }
  }
  return false;
}

bool target_filter_applies(std::string const &triple,
                           std::optional<std::vector<std::string>> const &patterns) {
  return !patterns || matches_any_target(triple, *patterns);
}

void validate_target_pattern(std::string const &pattern) {
  try {
    std::regex const re{ pattern };
  } catch (std::regex_error const &e) {
    throw std::invalid_argument("invalid target pattern '" + pattern + "': " + e.what());
  }
}

bool target_is_apple(std::string_view triple) {
  return triple.find("-apple-") != std::string_view::npos;
}

bool target_is_linux(std::string_view triple) {
  return triple.find("-linux-") != std::string_view::npos;
}

bool target_is_musl(std::string_view triple) { return triple.ends_with("-musl"); }

bool target_is_fully_static(std::string_view triple) { return target_is_musl(triple); }

}  // namespace rtpack
