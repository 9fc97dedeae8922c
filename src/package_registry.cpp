#include "package_registry.h"

#include "errors.h"
#include "sol_util.h"
#include "util.h"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace rtpack {

namespace {

constexpr std::array<std::string_view, 4> kPackageKeys{ "library-names",
                                                        "licenses",
                                                        "license-file",
                                                        "license-public-domain" };

std::vector<std::string> string_list(sol::table const &entry,
                                     std::string_view key,
                                     std::string const &ctx) {
  auto const table{ sol_util_get_optional<sol::table>(entry, key, ctx) };
  if (!table) { return {}; }
  if (!sol_util_is_array(*table)) {
    throw schema_violation(ctx + ": " + std::string{ key } + " must be a list");
  }

  std::vector<std::string> out;
  for (std::size_t i{ 1 }, n{ table->size() }; i <= n; ++i) {
    sol::object item{ (*table)[i] };
    if (item.get_type() != sol::type::string) {
      throw schema_violation(ctx + ": " + std::string{ key } + " entries must be strings");
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

package_info parse_package(std::string const &name, sol::table const &entry) {
  std::string const ctx{ "PACKAGES." + name };

  for (auto const &[key, value] : entry) {
    if (key.get_type() != sol::type::string) {
      throw schema_violation(ctx + ": keys must be strings");
    }
    auto const k{ key.as<std::string>() };
    if (std::ranges::find(kPackageKeys, k) == kPackageKeys.end()) {
      throw schema_violation(ctx + ": unknown key '" + k + "'");
    }
  }

  package_info info{ .name = name };
  try {
    info.library_names = string_list(entry, "library-names", ctx);
    info.licenses = string_list(entry, "licenses", ctx);
    info.license_file = sol_util_get_optional<std::string>(entry, "license-file", ctx);
    info.license_public_domain =
        sol_util_get_or_default<bool>(entry, "license-public-domain", false, ctx);
  } catch (schema_violation const &) {
    throw;
  } catch (std::runtime_error const &e) { throw schema_violation(e.what()); }

  return info;
}

}  // namespace

package_registry package_registry::load(std::string_view script, std::string const &origin) {
  auto lua{ sol_util_make_lua_state() };

  sol::table packages;
  try {
    packages = sol_util_eval_document(*lua, script, origin, "PACKAGES");
  } catch (std::runtime_error const &e) { throw schema_violation(e.what()); }

  if (sol_util_contains_function(packages)) {
    throw schema_violation(origin + ": PACKAGES must be declarative (found a function)");
  }

  package_registry registry;
  for (auto const &[key, value] : packages) {
    if (key.get_type() != sol::type::string || value.get_type() != sol::type::table) {
      throw schema_violation(origin + ": PACKAGES must map package names to tables");
    }

    auto const name{ key.as<std::string>() };
    auto info{ parse_package(name, value.as<sol::table>()) };

    for (auto const &lib : info.library_names) {
      auto const [it, inserted]{ registry.library_owner_.emplace(lib, name) };
      if (!inserted) {
        throw schema_violation(origin + ": library '" + lib + "' claimed by both " +
                               it->second + " and " + name);
      }
    }
    registry.packages_.emplace(name, std::move(info));
  }

  return registry;
}

package_registry package_registry::load(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return load(std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() },
              path.string());
}

package_info const *package_registry::find(std::string_view package) const {
  auto const it{ packages_.find(package) };
  return it == packages_.end() ? nullptr : &it->second;
}

package_info const *package_registry::find_by_library(std::string_view library) const {
  auto const it{ library_owner_.find(library) };
  return it == library_owner_.end() ? nullptr : find(it->second);
}

}  // namespace rtpack
