#include "build_vars.h"

#include "util.h"

#include "picojson.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <stdexcept>

namespace rtpack {

namespace {

std::string value_to_string(picojson::value const &v) {
  if (v.is<std::string>()) { return v.get<std::string>(); }
  if (v.is<bool>()) { return v.get<bool>() ? "1" : "0"; }
  if (v.is<double>()) {
    // Integral values inside the long long range print without a fraction.
    constexpr double kTwoPow63{ 9223372036854775808.0 };
    auto const d{ v.get<double>() };
    if (d >= -kTwoPow63 && d < kTwoPow63 && std::trunc(d) == d) {
      return std::to_string(static_cast<long long>(d));
    }
  }
  if (v.is<picojson::null>()) { return {}; }
  return v.to_str();
}

}  // namespace

build_vars build_vars::parse(std::string_view json, std::string const &origin) {
  picojson::value root;
  std::string const json_str{ json };
  if (auto const err{ picojson::parse(root, json_str) }; !err.empty()) {
    throw std::runtime_error(origin + ": invalid JSON: " + err);
  }
  if (!root.is<picojson::object>()) {
    throw std::runtime_error(origin + ": build vars must be a JSON object");
  }

  auto const &obj{ root.get<picojson::object>() };
  build_vars vars;

  auto const version{ obj.find("python_version") };
  if (version == obj.end() || !version->second.is<std::string>()) {
    throw std::runtime_error(origin + ": python_version must be a string");
  }
  vars.python_version = version->second.get<std::string>();

  if (auto const llvm{ obj.find("llvm_version") };
      llvm != obj.end() && !llvm->second.is<picojson::null>()) {
    vars.llvm_version = value_to_string(llvm->second);
  }

  if (auto const cv{ obj.find("config_vars") }; cv != obj.end()) {
    if (!cv->second.is<picojson::object>()) {
      throw std::runtime_error(origin + ": config_vars must be an object");
    }
    for (auto const &[name, value] : cv->second.get<picojson::object>()) {
      vars.config_vars.emplace(name, value_to_string(value));
    }
  }

  return vars;
}

build_vars build_vars::load(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return parse(std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() },
               path.string());
}

std::string build_vars::var(std::string_view name) const {
  auto const it{ config_vars.find(name) };
  return it == config_vars.end() ? std::string{} : it->second;
}

bool build_vars::shared_runtime() const {
  auto const v{ var("Py_ENABLE_SHARED") };
  return !v.empty() && v != "0";
}

std::vector<std::string> build_vars::core_link_libraries() const {
  std::vector<std::string> out;
  for (auto const *name : { "LIBS", "SYSLIBS" }) {
    for (auto const &word : util_split_whitespace(var(name))) {
      if (word.size() <= 2 || !word.starts_with("-l")) { continue; }
      auto lib{ word.substr(2) };
      if (std::ranges::find(out, lib) == out.end()) { out.push_back(std::move(lib)); }
    }
  }
  return out;
}

std::vector<std::string> build_vars::core_frameworks() const {
  std::vector<std::string> out;
  for (auto const *name : { "LIBS", "SYSLIBS" }) {
    auto const words{ util_split_whitespace(var(name)) };
    for (std::size_t i{ 0 }; i + 1 < words.size(); ++i) {
      if (words[i] == "-framework" && std::ranges::find(out, words[i + 1]) == out.end()) {
        out.push_back(words[i + 1]);
      }
    }
  }
  return out;
}

}  // namespace rtpack
