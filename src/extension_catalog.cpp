#include "extension_catalog.h"

#include "errors.h"
#include "sol_util.h"
#include "target_predicate.h"
#include "util.h"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace rtpack {

namespace {

constexpr std::array<std::string_view, 19> kEntryKeys{ "sources",
                                                       "sources-conditional",
                                                       "defines",
                                                       "defines-conditional",
                                                       "includes",
                                                       "includes-conditional",
                                                       "includes-deps",
                                                       "links",
                                                       "links-conditional",
                                                       "linker-args",
                                                       "frameworks",
                                                       "build-mode",
                                                       "disabled-targets",
                                                       "required-targets",
                                                       "minimum-python-version",
                                                       "maximum-python-version",
                                                       "setup-enabled",
                                                       "setup-enabled-conditional",
                                                       "config-c-only" };

// Lowercase identifier. Digits are allowed after the first character (_md5, _sha3).
bool is_module_name(std::string_view name) {
  if (name.empty() || (name[0] >= '0' && name[0] <= '9')) { return false; }
  return std::ranges::all_of(name, [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
  });
}

// Iterate a table's string keys, rejecting any key outside `allowed`.
template <typename Keys>
void check_keys(sol::table const &table, Keys const &allowed, std::string const &context) {
  for (auto const &[key, value] : table) {
    if (key.get_type() != sol::type::string) {
      throw schema_violation(context + ": keys must be strings");
    }
    std::string const k{ key.as<std::string>() };
    if (std::ranges::find(allowed, k) == std::ranges::end(allowed)) {
      throw schema_violation(context + ": unknown key '" + k + "'");
    }
  }
}

sol::optional<sol::object> field(sol::table const &table, std::string_view key) {
  sol::object obj{ table[key] };
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return sol::nullopt; }
  return obj;
}

sol::table as_table(sol::object const &obj, std::string const &context) {
  if (obj.get_type() != sol::type::table) {
    throw schema_violation(context + " must be a table");
  }
  return obj.as<sol::table>();
}

std::string as_string(sol::object const &obj, std::string const &context) {
  if (obj.get_type() != sol::type::string) {
    throw schema_violation(context + " must be a string");
  }
  return obj.as<std::string>();
}

bool as_bool(sol::object const &obj, std::string const &context) {
  if (obj.get_type() != sol::type::boolean) {
    throw schema_violation(context + " must be a boolean");
  }
  return obj.as<bool>();
}

std::vector<std::string> as_string_list(sol::object const &obj, std::string const &context) {
  sol::table const table{ as_table(obj, context) };
  if (!sol_util_is_array(table)) { throw schema_violation(context + " must be a list"); }

  std::vector<std::string> out;
  out.reserve(table.size());
  for (std::size_t i{ 1 }, n{ table.size() }; i <= n; ++i) {
    sol::object item{ table[i] };
    out.push_back(as_string(item, context + "[" + std::to_string(i) + "]"));
  }
  return out;
}

std::vector<sol::table> as_table_list(sol::object const &obj, std::string const &context) {
  sol::table const table{ as_table(obj, context) };
  if (!sol_util_is_array(table)) { throw schema_violation(context + " must be a list"); }

  std::vector<sol::table> out;
  out.reserve(table.size());
  for (std::size_t i{ 1 }, n{ table.size() }; i <= n; ++i) {
    sol::object item{ table[i] };
    out.push_back(as_table(item, context + "[" + std::to_string(i) + "]"));
  }
  return out;
}

std::string as_version(sol::object const &obj, std::string const &context) {
  auto value{ as_string(obj, context) };
  try {
    python_version::parse(value);
  } catch (std::invalid_argument const &e) {
    throw schema_violation(context + ": " + e.what());
  }
  return value;
}

std::vector<std::string> as_target_patterns(sol::object const &obj,
                                            std::string const &context) {
  auto patterns{ as_string_list(obj, context) };
  for (auto const &pattern : patterns) {
    try {
      validate_target_pattern(pattern);
    } catch (std::invalid_argument const &e) {
      throw schema_violation(context + ": " + e.what());
    }
  }
  return patterns;
}

build_mode as_build_mode(sol::object const &obj, std::string const &context) {
  auto const value{ as_string(obj, context) };
  if (value == "static") { return build_mode::STATIC; }
  if (value == "shared") { return build_mode::SHARED; }
  throw schema_violation(context + ": unsupported build-mode '" + value +
                         "' (expected 'static' or 'shared')");
}

version_gate parse_version_gate(sol::table const &table, std::string const &context) {
  version_gate gate;
  if (auto v{ field(table, "minimum-python-version") }) {
    gate.minimum = as_version(*v, context + ".minimum-python-version");
  }
  if (auto v{ field(table, "maximum-python-version") }) {
    gate.maximum = as_version(*v, context + ".maximum-python-version");
  }
  return gate;
}

conditional_gate parse_gate(sol::table const &table, std::string const &context) {
  conditional_gate gate;
  if (auto v{ field(table, "targets") }) {
    gate.targets = as_target_patterns(*v, context + ".targets");
  }
  gate.versions = parse_version_gate(table, context);
  if (auto v{ field(table, "build-options") }) {
    gate.required_options = as_string_list(*v, context + ".build-options");
    for (auto const &flag : gate.required_options) {
      if (!build_options::is_known_flag(flag)) {
        throw schema_violation(context + ".build-options: unknown build option '" + flag +
                               "'");
      }
    }
  }
  return gate;
}

std::vector<std::string> parse_one_or_many(sol::table const &table,
                                           char const *one,
                                           char const *many,
                                           std::string const &context) {
  auto single{ field(table, one) };
  auto multiple{ field(table, many) };
  if (single && multiple) {
    throw schema_violation(context + ": '" + one + "' and '" + many +
                           "' are mutually exclusive");
  }
  if (single) { return { as_string(*single, context + "." + one) }; }
  if (multiple) { return as_string_list(*multiple, context + "." + many); }
  throw schema_violation(context + ": requires '" + one + "' or '" + many + "'");
}

ext_module_spec parse_entry(std::string const &name, sol::table const &table) {
  std::string const ctx{ "EXTENSION_MODULES." + name };
  check_keys(table, kEntryKeys, ctx);

  ext_module_spec spec;
  spec.name = name;

  auto list{ [&](char const *key) -> std::vector<std::string> {
    if (auto v{ field(table, key) }) { return as_string_list(*v, ctx + "." + key); }
    return {};
  } };

  spec.sources = list("sources");
  spec.defines = list("defines");
  spec.includes = list("includes");
  spec.includes_deps = list("includes-deps");
  spec.links = list("links");
  spec.frameworks = list("frameworks");

  if (auto v{ field(table, "disabled-targets") }) {
    spec.disabled_targets = as_target_patterns(*v, ctx + ".disabled-targets");
  }
  if (auto v{ field(table, "required-targets") }) {
    spec.required_targets = as_target_patterns(*v, ctx + ".required-targets");
  }
  if (auto v{ field(table, "build-mode") }) {
    spec.mode = as_build_mode(*v, ctx + ".build-mode");
  }
  if (auto v{ field(table, "setup-enabled") }) {
    spec.setup_enabled = as_bool(*v, ctx + ".setup-enabled");
  }
  if (auto v{ field(table, "config-c-only") }) {
    spec.config_c_only = as_bool(*v, ctx + ".config-c-only");
  }
  spec.versions = parse_version_gate(table, ctx);

  if (auto v{ field(table, "sources-conditional") }) {
    std::size_t i{ 0 };
    for (auto const &entry : as_table_list(*v, ctx + ".sources-conditional")) {
      std::string const ectx{ ctx + ".sources-conditional[" + std::to_string(++i) + "]" };
      static constexpr std::array<std::string_view, 6> kKeys{ "source",
                                                              "sources",
                                                              "targets",
                                                              "minimum-python-version",
                                                              "maximum-python-version",
                                                              "build-options" };
      check_keys(entry, kKeys, ectx);
      spec.sources_conditional.push_back(
          { .sources = parse_one_or_many(entry, "source", "sources", ectx),
            .gate = parse_gate(entry, ectx) });
    }
  }

  if (auto v{ field(table, "defines-conditional") }) {
    std::size_t i{ 0 };
    for (auto const &entry : as_table_list(*v, ctx + ".defines-conditional")) {
      std::string const ectx{ ctx + ".defines-conditional[" + std::to_string(++i) + "]" };
      static constexpr std::array<std::string_view, 5> kKeys{ "define",
                                                              "targets",
                                                              "minimum-python-version",
                                                              "maximum-python-version",
                                                              "build-options" };
      check_keys(entry, kKeys, ectx);
      auto define_obj{ field(entry, "define") };
      if (!define_obj) { throw schema_violation(ectx + ": 'define' is required"); }
      spec.defines_conditional.push_back(
          { .define = as_string(*define_obj, ectx + ".define"),
            .gate = parse_gate(entry, ectx) });
    }
  }

  if (auto v{ field(table, "includes-conditional") }) {
    std::size_t i{ 0 };
    for (auto const &entry : as_table_list(*v, ctx + ".includes-conditional")) {
      std::string const ectx{ ctx + ".includes-conditional[" + std::to_string(++i) + "]" };
      static constexpr std::array<std::string_view, 5> kKeys{ "path",
                                                              "paths",
                                                              "targets",
                                                              "minimum-python-version",
                                                              "maximum-python-version" };
      check_keys(entry, kKeys, ectx);
      spec.includes_conditional.push_back(
          { .paths = parse_one_or_many(entry, "path", "paths", ectx),
            .gate = parse_gate(entry, ectx) });
    }
  }

  if (auto v{ field(table, "links-conditional") }) {
    std::size_t i{ 0 };
    for (auto const &entry : as_table_list(*v, ctx + ".links-conditional")) {
      std::string const ectx{ ctx + ".links-conditional[" + std::to_string(++i) + "]" };
      static constexpr std::array<std::string_view, 3> kKeys{ "name",
                                                              "targets",
                                                              "build-mode" };
      check_keys(entry, kKeys, ectx);

      auto name_obj{ field(entry, "name") };
      if (!name_obj) { throw schema_violation(ectx + ": 'name' is required"); }

      conditional_link link{ .name = as_string(*name_obj, ectx + ".name") };
      if (auto t{ field(entry, "targets") }) {
        link.targets = as_target_patterns(*t, ectx + ".targets");
      }
      if (auto m{ field(entry, "build-mode") }) {
        link.mode = as_build_mode(*m, ectx + ".build-mode");
      }
      spec.links_conditional.push_back(std::move(link));
    }
  }

  if (auto v{ field(table, "linker-args") }) {
    std::size_t i{ 0 };
    for (auto const &entry : as_table_list(*v, ctx + ".linker-args")) {
      std::string const ectx{ ctx + ".linker-args[" + std::to_string(++i) + "]" };
      static constexpr std::array<std::string_view, 2> kKeys{ "args", "targets" };
      check_keys(entry, kKeys, ectx);

      auto args_obj{ field(entry, "args") };
      if (!args_obj) { throw schema_violation(ectx + ": 'args' is required"); }

      linker_args_entry args{ .args = as_string_list(*args_obj, ectx + ".args") };
      if (auto t{ field(entry, "targets") }) {
        args.targets = as_target_patterns(*t, ectx + ".targets");
      }
      spec.linker_args.push_back(std::move(args));
    }
  }

  if (auto v{ field(table, "setup-enabled-conditional") }) {
    std::size_t i{ 0 };
    for (auto const &entry : as_table_list(*v, ctx + ".setup-enabled-conditional")) {
      std::string const ectx{ ctx + ".setup-enabled-conditional[" + std::to_string(++i) +
                              "]" };
      static constexpr std::array<std::string_view, 3> kKeys{ "enabled",
                                                              "minimum-python-version",
                                                              "maximum-python-version" };
      check_keys(entry, kKeys, ectx);

      auto enabled_obj{ field(entry, "enabled") };
      if (!enabled_obj) { throw schema_violation(ectx + ": 'enabled' is required"); }

      spec.setup_enabled_conditional.push_back(
          { .enabled = as_bool(*enabled_obj, ectx + ".enabled"),
            .versions = parse_version_gate(entry, ectx) });
    }
  }

  if (spec.config_c_only && (spec.setup_enabled || !spec.sources.empty())) {
    throw schema_violation(ctx + ": config-c-only modules cannot declare sources or "
                                 "setup-enabled");
  }

  return spec;
}

}  // namespace

std::string_view build_mode_name(build_mode mode) {
  switch (mode) {
    case build_mode::STATIC: return "static";
    case build_mode::SHARED: return "shared";
  }
  return "static";
}

bool version_gate::admits(std::string_view version) const {
  if (minimum && !meets_minimum_version(version, *minimum)) { return false; }
  if (maximum && !meets_maximum_version(version, *maximum)) { return false; }
  return true;
}

bool conditional_gate::applies(std::string const &triple,
                               std::string_view version,
                               build_options const &options) const {
  return target_filter_applies(triple, targets) && versions.admits(version) &&
         options.has_all(required_options);
}

bool ext_module_spec::wants_setup_enabled(std::string_view version) const {
  if (setup_enabled) { return true; }
  return std::ranges::any_of(setup_enabled_conditional, [&](auto const &cond) {
    return cond.enabled && cond.versions.admits(version);
  });
}

extension_catalog extension_catalog::load(std::string_view script,
                                          std::string const &origin) {
  auto lua{ sol_util_make_lua_state() };

  sol::table modules_table;
  try {
    modules_table = sol_util_eval_document(*lua, script, origin, "EXTENSION_MODULES");
  } catch (std::runtime_error const &e) { throw schema_violation(e.what()); }

  if (sol_util_contains_function(modules_table)) {
    throw schema_violation(origin + ": EXTENSION_MODULES must be declarative (found a "
                                    "function)");
  }

  extension_catalog catalog;
  for (auto const &[key, value] : modules_table) {
    if (key.get_type() != sol::type::string) {
      throw schema_violation(origin + ": EXTENSION_MODULES keys must be module names");
    }

    std::string const name{ key.as<std::string>() };
    if (!is_module_name(name)) {
      throw schema_violation(origin + ": invalid extension module name '" + name +
                             "' (must match ^[a-z_][a-z0-9_]*$)");
    }

    sol::object const value_obj(value);
    auto spec{ parse_entry(name, as_table(value_obj, "EXTENSION_MODULES." + name)) };
    catalog.modules_.emplace(name, std::move(spec));
  }

  return catalog;
}

extension_catalog extension_catalog::load(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return load(std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() },
              path.string());
}

ext_module_spec const *extension_catalog::find(std::string_view name) const {
  auto const it{ modules_.find(name) };
  return it == modules_.end() ? nullptr : &it->second;
}

std::set<std::string> extension_catalog::names() const {
  std::set<std::string> out;
  for (auto const &[name, spec] : modules_) { out.insert(name); }
  return out;
}

}  // namespace rtpack
