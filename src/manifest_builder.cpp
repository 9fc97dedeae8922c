#include "manifest_builder.h"

#include "errors.h"
#include "setup_grammar.h"
#include "target_predicate.h"
#include "tui.h"
#include "util.h"

#include "picojson.h"

#include <algorithm>
#include <array>
#include <iterator>
#include <set>
#include <stdexcept>

namespace rtpack {

namespace {

constexpr std::array<std::string_view, 8> kRequiredExtensions{
  "_codecs", "_io",      "_signal",      "_thread",
  "_tracemalloc", "_weakref", "faulthandler", "posix",
};

constexpr std::array<std::string_view, 3> kCoreObjectDirs{ "build/Objects/",
                                                            "build/Parser/",
                                                            "build/Python/" };

constexpr std::string_view kModulesDir{ "build/Modules/" };
constexpr std::string_view kLibDir{ "build/lib/" };

constexpr std::array<std::string_view, 6> kLinuxAllowedLinks{ "crypt", "dl",   "m",
                                                              "pthread", "rt", "util" };
constexpr std::array<std::string_view, 3> kAppleAllowedLinks{ "dl", "m", "pthread" };

// Libraries present in the artifact tree, keyed by bare name. Static archives
// win over shared objects of the same name.
using local_libraries_t = std::map<std::string, link_entry, std::less<>>;

local_libraries_t find_local_libraries(artifact_tree const &tree) {
  local_libraries_t libs;

  auto const add{ [&](std::string const &path, link_kind kind) {
    auto const slash{ path.rfind('/') };
    auto bare{ library_bare_name(std::string_view{ path }.substr(slash + 1)) };
    if (!bare) { return; }
    auto const it{ libs.find(*bare) };
    if (it != libs.end() && it->second.kind == link_kind::PATH_STATIC) { return; }
    libs.insert_or_assign(*bare, link_entry{ .name = *bare, .kind = kind, .path = path });
  } };

  for (auto const &path : tree.select(kLibDir, [](std::string_view name) {
         return name.starts_with("lib") && name.ends_with(".a");
       })) {
    add(path, link_kind::PATH_STATIC);
  }

  for (auto const &path : tree.select(kLibDir, [](std::string_view name) {
         return name.starts_with("lib") &&
                (name.ends_with(".dylib") || name.find(".so") != std::string_view::npos);
       })) {
    add(path, link_kind::PATH_DYNAMIC);
  }

  return libs;
}

link_entry resolve_link(setup_token const &token, local_libraries_t const &local) {
  if (token.kind == setup_token_kind::FRAMEWORK) {
    return { .name = token.value, .kind = link_kind::FRAMEWORK };
  }

  if (token.kind == setup_token_kind::ARCHIVE) {
    auto const slash{ token.value.rfind('/') };
    auto const file{ slash == std::string::npos ? token.value
                                                : token.value.substr(slash + 1) };
    auto const bare{ library_bare_name(file).value_or(file) };
    if (auto const it{ local.find(bare) };
        it != local.end() && it->second.kind == link_kind::PATH_STATIC) {
      return it->second;
    }
    return { .name = bare, .kind = link_kind::PATH_STATIC, .path = token.value };
  }

  if (auto const it{ local.find(token.value) }; it != local.end()) { return it->second; }
  return { .name = token.value, .kind = link_kind::SYSTEM };
}

std::vector<link_entry> resolve_links(setup_line const &line,
                                      local_libraries_t const &local) {
  std::vector<link_entry> links;
  for (auto const &token : line.tokens) {
    switch (token.kind) {
      case setup_token_kind::LINK:
      case setup_token_kind::HIDDEN_LINK:
      case setup_token_kind::ARCHIVE:
      case setup_token_kind::FRAMEWORK: {
        auto entry{ resolve_link(token, local) };
        if (std::ranges::find(links, entry) == links.end()) {
          links.push_back(std::move(entry));
        }
        break;
      }
      default: break;
    }
  }
  return links;
}

// Every local link must be attributable to a licensed package.
void attach_licenses(std::string const &owner,
                     extension_build_record &record,
                     package_registry const &packages) {
  std::set<std::string> licenses;
  std::set<std::string> license_paths;

  for (auto const &link : record.links) {
    if (!link.is_local()) { continue; }

    auto const *pkg{ packages.find_by_library(link.name) };
    if (!pkg || !pkg->has_license()) {
      throw missing_license_error(owner + ": local library '" + link.name + "' (" +
                                  link.path + ") has no license metadata");
    }

    licenses.insert(pkg->licenses.begin(), pkg->licenses.end());
    if (pkg->license_file) { license_paths.insert("licenses/" + *pkg->license_file); }
    if (pkg->license_public_domain) { record.license_public_domain = true; }
  }

  record.licenses.assign(licenses.begin(), licenses.end());
  record.license_paths.assign(license_paths.begin(), license_paths.end());
}

std::vector<link_entry> resolve_core_links(build_cell const &cell,
                                           build_vars const &vars,
                                           local_libraries_t const &local,
                                           package_registry const &packages) {
  bool const apple{ target_is_apple(cell.target_triple) };
  std::vector<link_entry> links;
  std::vector<std::string> unattributed;

  for (auto const &lib : vars.core_link_libraries()) {
    if (auto const it{ local.find(lib) }; it != local.end()) {
      auto const *pkg{ packages.find_by_library(lib) };
      if (!pkg || !pkg->has_license()) {
        throw missing_license_error("core: local library '" + lib + "' (" +
                                    it->second.path + ") has no license metadata");
      }
      links.push_back(it->second);
      continue;
    }

    bool const allowed{ apple ? std::ranges::find(kAppleAllowedLinks, lib) !=
                                    kAppleAllowedLinks.end()
                              : std::ranges::find(kLinuxAllowedLinks, lib) !=
                                    kLinuxAllowedLinks.end() };
    if (!allowed) {
      unattributed.push_back(lib);
      continue;
    }
    links.push_back({ .name = lib, .kind = link_kind::SYSTEM });
  }

  for (auto const &framework : vars.core_frameworks()) {
    if (!apple) {
      unattributed.push_back("-framework " + framework);
      continue;
    }
    links.push_back({ .name = framework, .kind = link_kind::FRAMEWORK });
  }

  if (!unattributed.empty()) {
    throw unattributed_link_error("core links libraries outside the " +
                                  std::string{ apple ? "apple" : "linux" } +
                                  " allow-list: " + util_join(unattributed, ", "));
  }

  return links;
}

std::vector<std::string> crt_features_for(std::string_view triple) {
  if (target_is_apple(triple)) { return { "libSystem" }; }
  if (target_is_musl(triple)) { return { "static" }; }
  if (target_is_linux(triple)) { return { "glibc-dynamic" }; }
  return {};
}

std::string object_file_format_for(build_cell const &cell, build_vars const &vars) {
  if (cell.options.has("lto")) {
    if (!vars.llvm_version) {
      throw std::runtime_error("manifest: lto build requires llvm_version in build vars");
    }
    return "llvm-bitcode:" + *vars.llvm_version;
  }
  return target_is_apple(cell.target_triple) ? "mach-o" : "elf";
}

std::optional<std::string> existing(artifact_tree const &tree, std::string path) {
  if (tree.contains(path)) { return path; }
  return std::nullopt;
}

std::string replace_all(std::string s, std::string_view from, std::string_view to) {
  for (auto pos{ s.find(from) }; pos != std::string::npos;
       pos = s.find(from, pos + to.size())) {
    s.replace(pos, from.size(), to);
  }
  return s;
}

picojson::value to_json(std::string const &s) { return picojson::value{ s }; }

picojson::value to_json(std::vector<std::string> const &items) {
  picojson::array arr;
  for (auto const &item : items) { arr.emplace_back(item); }
  return picojson::value{ arr };
}

picojson::value to_json(link_entry const &link) {
  picojson::object obj;
  obj["name"] = to_json(link.name);
  switch (link.kind) {
    case link_kind::SYSTEM: obj["system"] = picojson::value{ true }; break;
    case link_kind::FRAMEWORK: obj["framework"] = picojson::value{ true }; break;
    case link_kind::PATH_STATIC: obj["path_static"] = to_json(link.path); break;
    case link_kind::PATH_DYNAMIC: obj["path_dynamic"] = to_json(link.path); break;
  }
  return picojson::value{ obj };
}

picojson::value to_json(std::vector<link_entry> const &links) {
  picojson::array arr;
  for (auto const &link : links) { arr.push_back(to_json(link)); }
  return picojson::value{ arr };
}

picojson::value to_json(extension_build_record const &record) {
  picojson::object obj;
  obj["in_core"] = picojson::value{ record.in_core };
  obj["init_fn"] = to_json(record.init_fn);
  obj["links"] = to_json(record.links);
  obj["objs"] = to_json(record.objs);
  obj["required"] = picojson::value{ record.required };
  obj["variant"] = to_json(record.variant);
  if (!record.licenses.empty()) { obj["licenses"] = to_json(record.licenses); }
  if (!record.license_paths.empty()) {
    obj["license_paths"] = to_json(record.license_paths);
  }
  if (record.license_public_domain) {
    obj["license_public_domain"] = picojson::value{ true };
  }
  if (record.shared_lib) { obj["shared_lib"] = to_json(*record.shared_lib); }
  return picojson::value{ obj };
}

}  // namespace

bool extension_is_required(std::string_view name) {
  return std::ranges::find(kRequiredExtensions, name) != kRequiredExtensions.end();
}

namespace {

bool required_on_target(std::string const &name,
                        extension_catalog const &catalog,
                        std::string const &triple) {
  if (extension_is_required(name)) { return true; }
  auto const *spec{ catalog.find(name) };
  return spec && matches_any_target(triple, spec->required_targets);
}

}  // namespace

std::optional<std::string> library_bare_name(std::string_view file_name) {
  if (!file_name.starts_with("lib")) { return std::nullopt; }
  auto stem{ file_name.substr(3) };

  if (stem.ends_with(".a")) {
    stem.remove_suffix(2);
  } else if (stem.ends_with(".dylib")) {
    stem.remove_suffix(6);
  } else if (auto const so{ stem.find(".so") };
             so != std::string_view::npos &&
             (so + 3 == stem.size() || stem[so + 3] == '.')) {
    stem = stem.substr(0, so);
  } else {
    return std::nullopt;
  }

  if (stem.empty()) { return std::nullopt; }
  return std::string{ stem };
}

distribution_manifest build_manifest(manifest_inputs const &in, tui::logger &log) {
  auto const &cell{ in.cell };
  auto const local{ find_local_libraries(in.tree) };

  distribution_manifest manifest;
  manifest.target_triple = cell.target_triple;
  manifest.build_options = cell.options.str();
  manifest.python_version = in.vars.python_version;
  manifest.python_major_minor_version =
      python_version::parse(in.vars.python_version).major_minor();
  manifest.object_file_format = object_file_format_for(cell, in.vars);
  manifest.crt_features = crt_features_for(cell.target_triple);

  std::set<std::string> core_objects;
  for (auto const dir : kCoreObjectDirs) {
    core_objects.merge(in.tree.objects_under(dir));
  }
  auto const candidates{ in.tree.objects_under(kModulesDir) };

  std::set<std::string> claimed;
  auto const ext_suffix{ in.vars.var("EXT_SUFFIX") };

  for (auto const &directive : in.plan.directives) {
    if (directive.origin == directive_origin::CONFIG_C_ONLY) { continue; }

    auto const &name{ directive.extension };
    extension_build_record record;
    record.init_fn = "PyInit_" + name;
    record.in_core = directive.primary && directive.mode == build_mode::STATIC;
    record.variant = directive.variant;

    record.required = required_on_target(name, in.catalog, cell.target_triple);

    for (auto const &rel : directive.object_paths) {
      auto const obj{ "build/" + rel };
      if (!candidates.contains(obj)) {
        log.debug("%s: object %s not in artifact tree", name.c_str(), obj.c_str());
        continue;
      }
      if (claimed.insert(obj).second) { record.objs.push_back(obj); }
    }

    if (directive.line) {
      record.links = resolve_links(*directive.line, local);
      attach_licenses(name, record, in.packages);
    }

    if (directive.module_path) {
      auto const file{ replace_all(*directive.module_path, "$(EXT_SUFFIX)", ext_suffix) };
      record.shared_lib = existing(in.tree, "build/" + file);
    }

    manifest.extensions[name].push_back(std::move(record));
  }

  for (auto const &[name, init_fn] : in.native.init_table()) {
    auto const *directive{ in.plan.find_primary(name) };
    if (!directive || directive->origin != directive_origin::CONFIG_C_ONLY) { continue; }

    extension_build_record record;
    record.init_fn = init_fn;
    record.in_core = true;
    record.required = required_on_target(name, in.catalog, cell.target_triple);
    manifest.extensions[name].push_back(std::move(record));
  }

  // Objects no directive claimed belong to the core.
  std::vector<std::string> unclaimed;
  std::ranges::set_difference(candidates, claimed, std::back_inserter(unclaimed));
  for (auto const &obj : unclaimed) {
    log.debug("core: unclaimed module object %s", obj.c_str());
  }
  core_objects.insert(unclaimed.begin(), unclaimed.end());
  manifest.core.objs.assign(core_objects.begin(), core_objects.end());

  manifest.core.links = resolve_core_links(cell, in.vars, local, in.packages);
  if (auto const library{ in.vars.var("LIBRARY") }; !library.empty()) {
    manifest.core.static_lib = existing(in.tree, std::string{ kLibDir } + library);
  }
  if (auto const soname{ in.vars.var("INSTSONAME") };
      in.vars.shared_runtime() && !soname.empty()) {
    manifest.core.shared_lib = existing(in.tree, "install/lib/" + soname);
  }

  auto const *python{ in.packages.find("python") };
  if (!python || !python->has_license()) {
    throw missing_license_error("package registry has no license metadata for python");
  }
  manifest.licenses = python->licenses;
  if (python->license_file) {
    manifest.license_path = "licenses/" + *python->license_file;
  }

  log.info("manifest: %zu core objects, %zu extensions",
           manifest.core.objs.size(),
           manifest.extensions.size());

  return manifest;
}

void validate_manifest(distribution_manifest const &manifest,
                       extension_catalog const &catalog) {
  std::vector<std::string> uncataloged;
  std::map<std::string, std::string> owners;  // object -> owning extension

  for (auto const &obj : manifest.core.objs) { owners.emplace(obj, "core"); }

  for (auto const &[name, records] : manifest.extensions) {
    if (!catalog.contains(name)) { uncataloged.push_back(name); }

    for (auto const &record : records) {
      for (auto const &link : record.links) {
        if (link.name.empty()) {
          throw std::runtime_error("manifest: " + name + " has a link without a name");
        }
        if (link.is_local() && link.path.empty()) {
          throw std::runtime_error("manifest: " + name + " link '" + link.name +
                                   "' has no path");
        }
        if (link.is_local() && record.licenses.empty() && !record.license_public_domain) {
          throw missing_license_error("manifest: " + name + " links '" + link.name +
                                      "' without license metadata");
        }
      }

      for (auto const &obj : record.objs) {
        auto const [it, inserted]{ owners.emplace(obj, name) };
        if (!inserted) {
          throw std::runtime_error("manifest: object " + obj + " attributed to both " +
                                   it->second + " and " + name);
        }
      }
    }
  }

  if (!uncataloged.empty()) {
    auto const message{ "manifest: extensions missing from catalog: " +
                        util_join(uncataloged, ", ") };
    throw drift_error(message, std::move(uncataloged));
  }
}

std::string manifest_to_json(distribution_manifest const &manifest) {
  picojson::object core;
  core["objs"] = to_json(manifest.core.objs);
  core["links"] = to_json(manifest.core.links);
  if (auto const &lib{ manifest.core.static_lib }) { core["static_lib"] = to_json(*lib); }
  if (auto const &lib{ manifest.core.shared_lib }) { core["shared_lib"] = to_json(*lib); }

  picojson::object extensions;
  for (auto const &[name, records] : manifest.extensions) {
    picojson::array arr;
    for (auto const &record : records) { arr.push_back(to_json(record)); }
    extensions[name] = picojson::value{ arr };
  }

  picojson::object build_info;
  build_info["core"] = picojson::value{ core };
  build_info["extensions"] = picojson::value{ extensions };

  picojson::object root;
  root["version"] = to_json(manifest.version);
  root["target_triple"] = to_json(manifest.target_triple);
  root["build_options"] = to_json(manifest.build_options);
  root["python_version"] = to_json(manifest.python_version);
  root["python_major_minor_version"] = to_json(manifest.python_major_minor_version);
  root["object_file_format"] = to_json(manifest.object_file_format);
  root["build_info"] = picojson::value{ build_info };
  root["crt_features"] = to_json(manifest.crt_features);
  root["licenses"] = to_json(manifest.licenses);
  root["license_path"] = to_json(manifest.license_path);

  return picojson::value{ root }.serialize(true);
}

}  // namespace rtpack
