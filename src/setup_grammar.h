#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

// Legacy Setup directive grammar:
//
//   name file1.c [file2.m ...] [-Dflag[=v]] [-Ipath] [-lname]
//        [-Xlinker -hidden-lname] [libfoo.a] [-framework Name] [other args]
//
// One directive per line; '#' starts a comment. Section markers and variable
// assignments are not directives.

enum class setup_token_kind {
  MODULE,
  SOURCE,
  DEFINE,
  INCLUDE,
  LINK,
  HIDDEN_LINK,
  ARCHIVE,
  FRAMEWORK,
  ARG,
};

struct setup_token {
  setup_token_kind kind;
  std::string value;  // payload without its flag prefix

  std::string render() const;
  bool operator==(setup_token const &) const = default;
};

// Structured view of one directive line.
struct setup_line {
  std::vector<setup_token> tokens;  // tokens[0] is the MODULE token

  std::string const &extension() const;
  std::vector<std::string> sources() const;
  std::vector<std::string> defines() const;
  std::vector<std::string> includes() const;
  std::vector<std::string> links() const;  // -l, hidden and archive tokens, in order
  std::vector<std::string> frameworks() const;
  std::vector<std::string> args() const;

  std::string render() const;
};

enum class setup_line_kind { BLANK, SECTION, ASSIGNMENT, DIRECTIVE };

// Splits a directive into tokens. The first word is the module name.
// Throws malformed_directive_error on a dangling -Xlinker or -framework.
std::vector<setup_token> setup_tokenize(std::string_view text);

setup_line_kind setup_classify_line(std::string_view raw);

// nullopt for blank, comment-only, section and assignment lines.
std::optional<setup_line> setup_parse_line(std::string_view raw);

// "static", "shared", "disabled", or "variant:<tag>" for a section marker line.
std::optional<std::string> setup_section_name(std::string_view raw);

// True for words makesetup compiles: .c, .m, .cpp, .cc, .cxx and .C files.
bool setup_is_source(std::string_view word);

// Object path, relative to the build directory, for a module source. Runtimes
// older than 3.9 flatten sources into Modules/ by basename.
std::string setup_object_path(std::string_view source, std::string_view python_version);

// Source stem: "_decimal/_decimal.c" -> "_decimal".
std::string setup_source_stem(std::string_view source);

}  // namespace rtpack
