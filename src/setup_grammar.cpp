#include "setup_grammar.h"

#include "errors.h"
#include "target_predicate.h"
#include "util.h"

#include <filesystem>
#include <initializer_list>

namespace rtpack {

namespace {

constexpr std::string_view kHiddenLinkPrefix{ "-hidden-l" };

// Suffixes makesetup compiles as module sources.
constexpr std::string_view kSourceSuffixes[]{ ".c", ".m", ".cpp", ".cc", ".cxx", ".C" };

std::string_view strip_comment(std::string_view raw) {
  auto const hash{ raw.find('#') };
  if (hash != std::string_view::npos) { raw = raw.substr(0, hash); }
  return util_trim(raw);
}

std::vector<std::string> collect(std::vector<setup_token> const &tokens,
                                 std::initializer_list<setup_token_kind> kinds) {
  std::vector<std::string> out;
  for (auto const &token : tokens) {
    for (auto const kind : kinds) {
      if (token.kind == kind) {
        out.push_back(token.value);
        break;
      }
    }
  }
  return out;
}

}  // namespace

std::string setup_token::render() const {
  switch (kind) {
    case setup_token_kind::DEFINE: return "-D" + value;
    case setup_token_kind::INCLUDE: return "-I" + value;
    case setup_token_kind::LINK: return "-l" + value;
    case setup_token_kind::HIDDEN_LINK:
      return "-Xlinker " + std::string{ kHiddenLinkPrefix } + value;
    case setup_token_kind::FRAMEWORK: return "-framework " + value;
    case setup_token_kind::MODULE:
    case setup_token_kind::SOURCE:
    case setup_token_kind::ARCHIVE:
    case setup_token_kind::ARG: return value;
  }
  return value;
}

std::string const &setup_line::extension() const { return tokens.front().value; }

std::vector<std::string> setup_line::sources() const {
  return collect(tokens, { setup_token_kind::SOURCE });
}

std::vector<std::string> setup_line::defines() const {
  return collect(tokens, { setup_token_kind::DEFINE });
}

std::vector<std::string> setup_line::includes() const {
  return collect(tokens, { setup_token_kind::INCLUDE });
}

std::vector<std::string> setup_line::links() const {
  return collect(tokens,
                 { setup_token_kind::LINK,
                   setup_token_kind::HIDDEN_LINK,
                   setup_token_kind::ARCHIVE });
}

std::vector<std::string> setup_line::frameworks() const {
  return collect(tokens, { setup_token_kind::FRAMEWORK });
}

std::vector<std::string> setup_line::args() const {
  return collect(tokens, { setup_token_kind::ARG });
}

std::string setup_line::render() const {
  std::vector<std::string> words;
  words.reserve(tokens.size());
  for (auto const &token : tokens) { words.push_back(token.render()); }
  return util_join(words, " ");
}

bool setup_is_source(std::string_view word) {
  if (word.starts_with('-')) { return false; }
  for (auto const suffix : kSourceSuffixes) {
    if (word.size() > suffix.size() && word.ends_with(suffix)) { return true; }
  }
  return false;
}

std::vector<setup_token> setup_tokenize(std::string_view text) {
  auto const words{ util_split_whitespace(text) };
  std::vector<setup_token> tokens;
  if (words.empty()) { return tokens; }

  tokens.push_back({ setup_token_kind::MODULE, words[0] });

  for (std::size_t i{ 1 }; i < words.size(); ++i) {
    std::string_view const word{ words[i] };

    if (word == "-Xlinker") {
      if (i + 1 >= words.size()) {
        throw malformed_directive_error("setup: dangling -Xlinker in '" +
                                        std::string{ text } + "'");
      }
      std::string_view const next{ words[++i] };
      if (next.size() > kHiddenLinkPrefix.size() && next.starts_with(kHiddenLinkPrefix)) {
        tokens.push_back({ setup_token_kind::HIDDEN_LINK,
                           std::string{ next.substr(kHiddenLinkPrefix.size()) } });
      } else {
        // Any other -Xlinker payload is an opaque pair.
        tokens.push_back({ setup_token_kind::ARG, std::string{ word } });
        tokens.push_back({ setup_token_kind::ARG, std::string{ next } });
      }
    } else if (word == "-framework") {
      if (i + 1 >= words.size()) {
        throw malformed_directive_error("setup: dangling -framework in '" +
                                        std::string{ text } + "'");
      }
      tokens.push_back({ setup_token_kind::FRAMEWORK, words[++i] });
    } else if (word.size() > 2 && word.starts_with("-D")) {
      tokens.push_back({ setup_token_kind::DEFINE, std::string{ word.substr(2) } });
    } else if (word.size() > 2 && word.starts_with("-I")) {
      tokens.push_back({ setup_token_kind::INCLUDE, std::string{ word.substr(2) } });
    } else if (word.size() > 2 && word.starts_with("-l")) {
      tokens.push_back({ setup_token_kind::LINK, std::string{ word.substr(2) } });
    } else if (setup_is_source(word)) {
      tokens.push_back({ setup_token_kind::SOURCE, std::string{ word } });
    } else if (!word.starts_with('-') && word.ends_with(".a")) {
      tokens.push_back({ setup_token_kind::ARCHIVE, std::string{ word } });
    } else {
      tokens.push_back({ setup_token_kind::ARG, std::string{ word } });
    }
  }

  return tokens;
}

std::optional<std::string> setup_section_name(std::string_view raw) {
  auto const line{ strip_comment(raw) };
  if (line.size() < 3 || line.front() != '*' || line.back() != '*') { return std::nullopt; }
  return std::string{ line.substr(1, line.size() - 2) };
}

setup_line_kind setup_classify_line(std::string_view raw) {
  auto const line{ strip_comment(raw) };
  if (line.empty()) { return setup_line_kind::BLANK; }
  if (setup_section_name(line)) { return setup_line_kind::SECTION; }

  auto const words{ util_split_whitespace(line) };
  if (words[0].find('=') != std::string::npos ||
      (words.size() > 1 && words[1].starts_with('='))) {
    return setup_line_kind::ASSIGNMENT;
  }
  return setup_line_kind::DIRECTIVE;
}

std::optional<setup_line> setup_parse_line(std::string_view raw) {
  if (setup_classify_line(raw) != setup_line_kind::DIRECTIVE) { return std::nullopt; }
  return setup_line{ setup_tokenize(strip_comment(raw)) };
}

std::string setup_object_path(std::string_view source, std::string_view python_version) {
  std::filesystem::path obj{ std::string{ source } };
  obj.replace_extension(".o");
  if (!meets_minimum_version(python_version, "3.9")) { obj = obj.filename(); }
  return (std::filesystem::path{ "Modules" } / obj).generic_string();
}

std::string setup_source_stem(std::string_view source) {
  return std::filesystem::path{ std::string{ source } }.stem().string();
}

}  // namespace rtpack
