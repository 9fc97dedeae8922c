#include "native_config.h"

#include "util.h"

#include <regex>
#include <stdexcept>

namespace rtpack {

namespace {

// A commented-out declaration: "#_md5 md5module.c" or "# _scproxy _scproxy.m".
std::regex const &commented_module_regex() {
  static std::regex const re{
    R"(^([a-z_][a-z0-9_]*)\s+[a-zA-Z0-9/_.-]+\.(c|m|cpp|cc|cxx|C)(\s|$))"
  };
  return re;
}

std::regex const &inittab_entry_regex() {
  static std::regex const re{ R"re(\{"([^"]+)",\s*([^}]+)\},)re" };
  return re;
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    auto const nl{ text.find('\n') };
    lines.push_back(text.substr(0, nl));
    if (nl == std::string_view::npos) { break; }
    text.remove_prefix(nl + 1);
  }
  return lines;
}

std::string read_text(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ bytes.begin(), bytes.end() };
}

}  // namespace

std::map<std::string, std::string, std::less<>> parse_config_c_in(std::string_view text) {
  std::map<std::string, std::string, std::less<>> table;
  bool seen_inittab{ false };

  for (auto const raw : split_lines(text)) {
    if (raw.starts_with("struct _inittab")) { seen_inittab = true; }
    if (!seen_inittab) { continue; }
    if (raw.find("/* Sentinel */") != std::string_view::npos) { break; }

    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(raw.begin(), raw.end(), m, inittab_entry_regex())) {
      std::string const init_fn{ m[2].str() };
      table.emplace(m[1].str(), std::string{ util_trim(init_fn) });
    }
  }

  return table;
}

native_extension_index native_extension_index::parse(std::string_view setup_text,
                                                     std::string_view config_c_in_text) {
  native_extension_index index;
  setup_section section{ setup_section::STATIC };

  for (auto const raw : split_lines(setup_text)) {
    auto const line{ util_trim(raw) };
    if (line.empty()) { continue; }

    if (line.front() == '#') {
      auto const start{ line.find_first_not_of('#') };
      if (start == std::string_view::npos) { continue; }
      std::string const body_str{ util_trim(line.substr(start)) };
      if (std::regex_search(body_str, commented_module_regex())) {
        if (auto parsed{ setup_parse_line(body_str) }) {
          index.entries_.push_back({ std::move(*parsed), section, false });
        }
      }
      continue;
    }

    switch (setup_classify_line(line)) {
      case setup_line_kind::SECTION: {
        auto const name{ *setup_section_name(line) };
        if (name == "static") {
          section = setup_section::STATIC;
        } else if (name == "shared") {
          section = setup_section::SHARED;
        } else if (name == "disabled") {
          section = setup_section::DISABLED;
        } else {
          throw std::runtime_error("Modules/Setup: unknown section marker '*" + name + "*'");
        }
        break;
      }

      case setup_line_kind::DIRECTIVE: {
        auto parsed{ setup_parse_line(line) };
        // Disabled sections list bare names; only lines naming sources declare a module.
        if (parsed && !parsed->sources().empty()) {
          bool const enabled{ section != setup_section::DISABLED };
          index.entries_.push_back({ std::move(*parsed), section, enabled });
        }
        break;
      }

      case setup_line_kind::BLANK:
      case setup_line_kind::ASSIGNMENT: break;
    }
  }

  index.init_table_ = parse_config_c_in(config_c_in_text);
  return index;
}

native_extension_index native_extension_index::load(
    std::filesystem::path const &source_root) {
  auto const modules{ source_root / "Modules" };
  return parse(read_text(modules / "Setup"), read_text(modules / "config.c.in"));
}

std::set<std::string> native_extension_index::declared_modules() const {
  std::set<std::string> out;
  for (auto const &entry : entries_) { out.insert(entry.line.extension()); }
  return out;
}

std::set<std::string> native_extension_index::enabled_modules() const {
  std::set<std::string> out;
  for (auto const &entry : entries_) {
    if (entry.enabled) { out.insert(entry.line.extension()); }
  }
  return out;
}

native_setup_entry const *native_extension_index::find_enabled(std::string_view name) const {
  for (auto const &entry : entries_) {
    if (entry.enabled && entry.line.extension() == name) { return &entry; }
  }
  return nullptr;
}

}  // namespace rtpack
