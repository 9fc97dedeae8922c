#include "setup_synth.h"

#include "errors.h"
#include "target_predicate.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <array>
#include <utility>

namespace rtpack {

namespace {

constexpr std::array<std::string_view, 2> kDebugDisabledModules{ "xxlimited",
                                                                 "xxlimited_35" };

constexpr std::string_view kVariantMarker{ "variant:" };

// Primary directive state while the plan is assembled.
struct plan_builder {
  setup_plan plan;
  std::map<std::string, std::string, std::less<>> primary_tags;  // extension -> variant tag
  std::map<std::string, std::set<std::string>, std::less<>> seen_tags;
  std::map<std::string, std::vector<std::string>> object_cflags;
  std::vector<std::string> static_lines;
  std::vector<std::string> shared_lines;
  std::vector<std::string> variant_rules;
};

void append_tokens(setup_line &line, std::string_view words) {
  auto tokens{ setup_tokenize("_ " + std::string{ words }) };
  line.tokens.insert(line.tokens.end(),
                     std::make_move_iterator(tokens.begin() + 1),
                     std::make_move_iterator(tokens.end()));
}

std::vector<std::string> objects_for(setup_line const &line,
                                     std::string_view python_version) {
  std::vector<std::string> out;
  for (auto const &source : line.sources()) {
    out.push_back(setup_object_path(source, python_version));
  }
  return out;
}

// Moves -Dname=value tokens out of `line` into per-object flags. The legacy
// grammar reads '=' as a variable assignment.
void strip_valued_defines(setup_line &line,
                          std::vector<std::string> const &objects,
                          plan_builder &b) {
  std::vector<setup_token> kept;
  for (auto &token : line.tokens) {
    if (token.kind == setup_token_kind::DEFINE &&
        token.value.find('=') != std::string::npos) {
      for (auto const &obj : objects) { b.object_cflags[obj].push_back(token.render()); }
    } else {
      kept.push_back(std::move(token));
    }
  }
  line.tokens = std::move(kept);
}

void reject_assignment(std::string const &text, std::string const &extension) {
  if (text.find('=') != std::string::npos) {
    throw malformed_directive_error("setup: '=' in directive for " + extension +
                                    " cannot be expressed in Setup.local: " + text);
  }
}

void add_primary(setup_directive directive, build_cell const &cell, plan_builder &b) {
  if (directive.line && directive.origin != directive_origin::SETUP_ENABLED) {
    auto &line{ *directive.line };
    directive.object_paths = objects_for(line, cell.python_version);
    strip_valued_defines(line, directive.object_paths, b);
    directive.text = line.render();
    reject_assignment(directive.text, directive.extension);

    (directive.mode == build_mode::SHARED ? b.shared_lines : b.static_lines)
        .push_back(directive.text);
  }

  if (directive.mode == build_mode::SHARED &&
      directive.origin != directive_origin::CONFIG_C_ONLY) {
    directive.module_path = "Modules/" + directive.extension + "$(EXT_SUFFIX)";
  }

  b.primary_tags.emplace(directive.extension, directive.variant);
  b.plan.directives.push_back(std::move(directive));
}

// A second directive for an already registered extension. Its sources compile
// to uniquely named objects and link into <ext>_<variant>$(EXT_SUFFIX).
void add_variant(setup_directive directive,
                 build_cell const &cell,
                 plan_builder &b,
                 tui::logger &log) {
  auto &line{ *directive.line };
  auto const &ext{ directive.extension };
  auto const &tag{ directive.variant };
  std::string const original_text{ line.render() };

  for (auto const &source : line.sources()) {
    directive.object_paths.push_back("Modules/VARIANT-" + ext + "-" + tag + "-" +
                                     setup_source_stem(source) + ".o");
  }
  strip_valued_defines(line, directive.object_paths, b);

  std::vector<std::string> cflags;
  std::vector<std::string> ldflags;
  for (auto const &token : line.tokens) {
    switch (token.kind) {
      case setup_token_kind::DEFINE:
      case setup_token_kind::INCLUDE: cflags.push_back(token.render()); break;
      case setup_token_kind::LINK:
      case setup_token_kind::HIDDEN_LINK:
      case setup_token_kind::ARCHIVE:
      case setup_token_kind::FRAMEWORK:
      case setup_token_kind::ARG: ldflags.push_back(token.render()); break;
      case setup_token_kind::MODULE:
      case setup_token_kind::SOURCE: break;
    }
  }
  reject_assignment(util_join(cflags, " ") + " " + util_join(ldflags, " "), ext);

  auto const sources{ line.sources() };
  for (std::size_t i{ 0 }; i < sources.size(); ++i) {
    auto const &obj{ directive.object_paths[i] };
    std::string const src{ "$(srcdir)/Modules/" + sources[i] };
    std::string rule{ obj + ": " + src + "\n\t$(CC) $(PY_STDMODULE_CFLAGS) $(CCSHARED)" };
    if (!cflags.empty()) { rule += " " + util_join(cflags, " "); }
    rule += " -c " + src + " -o " + obj;
    b.variant_rules.push_back(std::move(rule));
  }

  if (target_is_fully_static(cell.target_triple)) {
    log.debug("%s: %s has no loadable module on fully static target %s",
              ext.c_str(),
              tag.c_str(),
              cell.target_triple.c_str());
  } else {
    std::string const target{ "Modules/" + ext + "_" + tag + "$(EXT_SUFFIX)" };
    auto const objs{ util_join(directive.object_paths, " ") };
    std::string rule{ target + ": " + objs + "\n\t$(BLDSHARED) " + objs };
    if (!ldflags.empty()) { rule += " " + util_join(ldflags, " "); }
    rule += " -o " + target;
    b.variant_rules.push_back(std::move(rule));
    directive.module_path = target;
  }

  // Written even when the link rule above is skipped.
  b.plan.sidecars["VARIANT-" + ext + "-" + tag + ".data"] = original_text + "\n";

  directive.primary = false;
  directive.mode = build_mode::SHARED;
  b.plan.directives.push_back(std::move(directive));
}

void add_directive(setup_directive directive,
                   build_cell const &cell,
                   plan_builder &b,
                   tui::logger &log) {
  if (!b.seen_tags[directive.extension].insert(directive.variant).second) {
    throw malformed_directive_error("setup: duplicate directive for " +
                                    directive.extension + " variant '" +
                                    directive.variant + "'");
  }

  auto const it{ b.primary_tags.find(directive.extension) };
  if (it == b.primary_tags.end()) {
    add_primary(std::move(directive), cell, b);
    return;
  }

  log.debug("%s: variant '%s' collides with primary '%s'",
            directive.extension.c_str(),
            directive.variant.c_str(),
            it->second.c_str());
  add_variant(std::move(directive), cell, b, log);
}

std::string render_setup_local(plan_builder const &b) {
  std::string out{ "*static*\n" };
  for (auto const &line : b.static_lines) { out += line + "\n"; }
  out += "\n*shared*\n";
  for (auto const &line : b.shared_lines) { out += line + "\n"; }
  out += "\n*disabled*\n";
  for (auto const &name : b.plan.disabled) { out += name + "\n"; }
  return out;
}

std::string render_makefile_extra(plan_builder const &b) {
  std::string out;
  for (auto const &[obj, flags] : b.object_cflags) {
    out += obj + ": PY_STDMODULE_CFLAGS += " + util_join(flags, " ") + "\n";
  }
  for (auto const &rule : b.variant_rules) { out += rule + "\n"; }
  return out;
}

}  // namespace

std::string_view directive_origin_name(directive_origin origin) {
  switch (origin) {
    case directive_origin::SYNTHESIZED: return "synthesized";
    case directive_origin::SETUP_ENABLED: return "setup-enabled";
    case directive_origin::CONFIG_C_ONLY: return "config-c-only";
    case directive_origin::VARIANT: return "variant";
  }
  return "synthesized";
}

setup_directive const *setup_plan::find_primary(std::string_view extension) const {
  for (auto const &d : directives) {
    if (d.primary && d.extension == extension) { return &d; }
  }
  return nullptr;
}

std::set<std::string> compute_disabled_set(extension_catalog const &catalog,
                                           build_cell const &cell) {
  std::set<std::string> disabled;
  for (auto const &[name, spec] : catalog.modules()) {
    if (!spec.versions.admits(cell.python_version) ||
        matches_any_target(cell.target_triple, spec.disabled_targets)) {
      disabled.insert(name);
    }
  }

  if (cell.options.has("debug")) {
    for (auto const name : kDebugDisabledModules) { disabled.emplace(name); }
  }

  return disabled;
}

setup_line synthesize_line(ext_module_spec const &spec,
                           build_cell const &cell,
                           synthesis_settings const &settings) {
  auto const &triple{ cell.target_triple };
  auto const &version{ cell.python_version };
  bool const apple{ target_is_apple(triple) };

  setup_line line;
  line.tokens.push_back({ setup_token_kind::MODULE, spec.name });

  auto const add{ [&line](setup_token_kind kind, std::string value) {
    if (value.empty() || value.find_first_of(" \t\r\n") != std::string::npos) {
      throw malformed_directive_error("setup: token '" + value + "' for " +
                                      line.extension() + " is not a single word");
    }
    setup_token token{ kind, std::move(value) };
    auto const reparsed{ setup_tokenize("_ " + token.render()) };
    if (reparsed.size() != 2 || reparsed[1] != token) {
      throw malformed_directive_error("setup: token '" + token.render() + "' for " +
                                      line.extension() + " does not parse back as written");
    }
    line.tokens.push_back(std::move(token));
  } };

  for (auto const &source : spec.sources) { add(setup_token_kind::SOURCE, source); }
  for (auto const &cond : spec.sources_conditional) {
    if (!cond.gate.applies(triple, version, cell.options)) { continue; }
    for (auto const &source : cond.sources) { add(setup_token_kind::SOURCE, source); }
  }

  for (auto const &define : spec.defines) { add(setup_token_kind::DEFINE, define); }
  for (auto const &cond : spec.defines_conditional) {
    if (cond.gate.applies(triple, version, cell.options)) {
      add(setup_token_kind::DEFINE, cond.define);
    }
  }

  for (auto const &include : spec.includes) { add(setup_token_kind::INCLUDE, include); }
  for (auto const &cond : spec.includes_conditional) {
    if (!cond.gate.applies(triple, version, cell.options)) { continue; }
    for (auto const &path : cond.paths) { add(setup_token_kind::INCLUDE, path); }
  }
  // The Apple SDK search path already covers the deps tree.
  if (!apple) {
    for (auto const &path : spec.includes_deps) {
      add(setup_token_kind::INCLUDE, settings.deps_root + "/" + path);
    }
  }

  auto const add_link{ [&](std::string const &name) {
    if (name.ends_with(".a")) {
      add(setup_token_kind::ARCHIVE, name);
    } else {
      add(apple ? setup_token_kind::HIDDEN_LINK : setup_token_kind::LINK, name);
    }
  } };

  for (auto const &name : spec.links) { add_link(name); }
  for (auto const &cond : spec.links_conditional) {
    if (!target_filter_applies(triple, cond.targets)) { continue; }
    if (cond.mode && *cond.mode != spec.mode) { continue; }
    add_link(cond.name);
  }

  if (apple) {
    for (auto const &framework : spec.frameworks) {
      add(setup_token_kind::FRAMEWORK, framework);
    }
  }

  for (auto const &entry : spec.linker_args) {
    if (target_filter_applies(triple, entry.targets)) {
      append_tokens(line, util_join(entry.args, " "));
    }
  }

  return line;
}

std::vector<variant_directive> parse_variant_file(std::string_view text) {
  std::vector<variant_directive> out;
  std::optional<std::string> tag;

  std::size_t line_no{ 0 };
  while (!text.empty()) {
    auto const nl{ text.find('\n') };
    auto const raw{ text.substr(0, nl) };
    text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
    ++line_no;

    switch (setup_classify_line(raw)) {
      case setup_line_kind::BLANK: break;

      case setup_line_kind::SECTION: {
        auto const name{ *setup_section_name(raw) };
        if (!name.starts_with(kVariantMarker) || name.size() == kVariantMarker.size()) {
          throw malformed_directive_error("variant file line " + std::to_string(line_no) +
                                          ": expected *variant:<tag>*, got *" + name + "*");
        }
        tag = name.substr(kVariantMarker.size());
        break;
      }

      case setup_line_kind::ASSIGNMENT:
        throw malformed_directive_error("variant file line " + std::to_string(line_no) +
                                        ": variable assignments are not supported");

      case setup_line_kind::DIRECTIVE:
        if (!tag) {
          throw malformed_directive_error("variant file line " + std::to_string(line_no) +
                                          ": directive before any *variant:<tag>* marker");
        }
        out.push_back({ *tag, std::string{ util_trim(raw) } });
        break;
    }
  }

  return out;
}

setup_plan synthesize_setup(extension_catalog const &catalog,
                            native_extension_index const &native,
                            build_cell const &cell,
                            std::vector<variant_directive> const &variants,
                            synthesis_settings const &settings,
                            tui::logger &log) {
  plan_builder b;
  b.plan.disabled = compute_disabled_set(catalog, cell);

  for (auto const &name : b.plan.disabled) { log.debug("%s: disabled", name.c_str()); }

  for (auto const &[name, spec] : catalog.modules()) {
    if (b.plan.disabled.contains(name)) { continue; }

    setup_directive directive{ .extension = name, .mode = spec.mode };

    if (spec.config_c_only) {
      directive.origin = directive_origin::CONFIG_C_ONLY;
      directive.mode = build_mode::STATIC;
    } else if (spec.wants_setup_enabled(cell.python_version)) {
      directive.origin = directive_origin::SETUP_ENABLED;
      if (auto const *entry{ native.find_enabled(name) }) {
        directive.line = entry->line;
        directive.object_paths = objects_for(entry->line, cell.python_version);
        directive.mode =
            entry->section == setup_section::SHARED ? build_mode::SHARED : build_mode::STATIC;
      } else {
        log.warn("%s: setup-enabled but not enabled in Modules/Setup", name.c_str());
      }
    } else {
      auto line{ synthesize_line(spec, cell, settings) };
      if (line.tokens.size() == 1) {
        log.debug("%s: nothing to synthesize", name.c_str());
        continue;
      }
      directive.line = std::move(line);
    }

    add_directive(std::move(directive), cell, b, log);
  }

  for (auto const &variant : variants) {
    auto line{ setup_parse_line(variant.text) };
    if (!line) {
      throw malformed_directive_error("variant '" + variant.tag +
                                      "': not a directive: " + variant.text);
    }

    auto const ext{ line->extension() };
    auto const *spec{ catalog.find(ext) };
    if (!spec) {
      throw malformed_directive_error("variant '" + variant.tag + "' names " + ext +
                                      ", which is not in the extension catalog");
    }
    if (b.plan.disabled.contains(ext)) {
      log.debug("%s: skipping variant '%s' of disabled module",
                ext.c_str(),
                variant.tag.c_str());
      continue;
    }

    add_directive(setup_directive{ .extension = ext,
                                   .variant = variant.tag,
                                   .line = std::move(*line),
                                   .mode = spec->mode,
                                   .origin = directive_origin::VARIANT },
                  cell,
                  b,
                  log);
  }

  b.plan.setup_local = render_setup_local(b);
  b.plan.makefile_extra = render_makefile_extra(b);

  log.info("synthesized %zu directives for %s (%s), %zu disabled",
           b.plan.directives.size(),
           cell.target_triple.c_str(),
           cell.options.str().c_str(),
           b.plan.disabled.size());

  return std::move(b.plan);
}

}  // namespace rtpack
