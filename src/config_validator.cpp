#include "config_validator.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <set>

namespace rtpack {

namespace {

std::vector<std::string> difference(std::set<std::string> const &a,
                                    std::set<std::string> const &b) {
  std::vector<std::string> out;
  std::ranges::set_difference(a, b, std::back_inserter(out));
  return out;
}

void log_group(tui::logger &log, char const *what, std::vector<std::string> const &names) {
  for (auto const &name : names) { log.error("%s: %s", name.c_str(), what); }
}

}  // namespace

bool drift_report::empty() const {
  return missing_from_catalog.empty() && setup_enabled_not_native.empty() &&
         native_not_setup_enabled.empty() && config_c_only_not_inittab.empty() &&
         inittab_not_config_c_only.empty();
}

std::vector<std::string> drift_report::offenders() const {
  std::set<std::string> all;
  for (auto const *group : { &missing_from_catalog,
                             &setup_enabled_not_native,
                             &native_not_setup_enabled,
                             &config_c_only_not_inittab,
                             &inittab_not_config_c_only }) {
    all.insert(group->begin(), group->end());
  }
  return { all.begin(), all.end() };
}

drift_report diff_native_config(extension_catalog const &catalog,
                                native_extension_index const &native,
                                std::string const &python_version) {
  std::set<std::string> wanted_enabled;
  std::set<std::string> wanted_config_c;

  for (auto const &[name, spec] : catalog.modules()) {
    if (!spec.versions.admits(python_version)) { continue; }
    if (spec.wants_setup_enabled(python_version)) { wanted_enabled.insert(name); }
    if (spec.config_c_only) { wanted_config_c.insert(name); }
  }

  std::set<std::string> inittab;
  for (auto const &[name, init_fn] : native.init_table()) { inittab.insert(name); }

  auto const actual_enabled{ native.enabled_modules() };

  drift_report report;
  report.missing_from_catalog = difference(native.declared_modules(), catalog.names());
  report.setup_enabled_not_native = difference(wanted_enabled, actual_enabled);
  report.native_not_setup_enabled = difference(actual_enabled, wanted_enabled);
  report.config_c_only_not_inittab = difference(wanted_config_c, inittab);
  report.inittab_not_config_c_only = difference(inittab, wanted_config_c);
  return report;
}

void validate_native_config(extension_catalog const &catalog,
                            native_extension_index const &native,
                            std::string const &python_version,
                            tui::logger &log) {
  auto const report{ diff_native_config(catalog, native, python_version) };
  if (report.empty()) {
    log.debug("native configuration agrees with catalog (%zu modules)",
              catalog.modules().size());
    return;
  }

  log_group(log, "declared in Modules/Setup but missing from catalog",
            report.missing_from_catalog);
  log_group(log, "marked setup-enabled but not enabled in Modules/Setup",
            report.setup_enabled_not_native);
  log_group(log, "enabled in Modules/Setup but not marked setup-enabled",
            report.native_not_setup_enabled);
  log_group(log, "marked config-c-only but missing from config.c.in",
            report.config_c_only_not_inittab);
  log_group(log, "present in config.c.in but not marked config-c-only",
            report.inittab_not_config_c_only);

  auto offenders{ report.offenders() };
  auto const message{ "extension catalog drifted from native configuration for Python " +
                      python_version + ": " + util_join(offenders, ", ") };
  throw drift_error(message, std::move(offenders));
}

}  // namespace rtpack
