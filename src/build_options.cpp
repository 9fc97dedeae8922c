#include "build_options.h"

#include <array>
#include <stdexcept>

namespace rtpack {

namespace {

constexpr std::array<std::string_view, 5> kKnownFlags{
  "debug", "pgo", "lto", "freethreaded", "static"
};

}  // namespace

bool build_options::is_known_flag(std::string_view flag) {
  for (auto const known : kKnownFlags) {
    if (known == flag) { return true; }
  }
  return false;
}

build_options build_options::parse(std::string_view text) {
  build_options opts;
  if (text.empty() || text == "noopt") { return opts; }
  if (text.back() == '+') {
    throw std::invalid_argument("build options contain an empty flag: '" +
                                std::string{ text } + "'");
  }

  for (std::string_view sv{ text }; !sv.empty();) {
    auto const pos{ sv.find('+') };
    auto const flag{ sv.substr(0, pos) };

    if (flag.empty()) {
      throw std::invalid_argument("build options contain an empty flag: '" +
                                  std::string{ text } + "'");
    }
    if (!is_known_flag(flag)) {
      throw std::invalid_argument("unknown build option '" + std::string{ flag } + "'");
    }
    if (!opts.flags_.emplace(flag).second) {
      throw std::invalid_argument("build option repeated: '" + std::string{ flag } + "'");
    }

    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }

  return opts;
}

bool build_options::has(std::string_view flag) const { return flags_.contains(flag); }

bool build_options::has_all(std::vector<std::string> const &flags) const {
  for (auto const &flag : flags) {
    if (!has(flag)) { return false; }
  }
  return true;
}

std::string build_options::str() const {
  std::string out;
  for (auto const flag : kKnownFlags) {
    if (!has(flag)) { continue; }
    if (!out.empty()) { out += '+'; }
    out += flag;
  }
  return out.empty() ? "noopt" : out;
}

}  // namespace rtpack
