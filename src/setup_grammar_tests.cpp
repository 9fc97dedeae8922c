#include "setup_grammar.h"

#include "errors.h"

#include "doctest.h"

#include <string>
#include <vector>

using rtpack::setup_token;
using rtpack::setup_token_kind;

TEST_CASE("setup_tokenize classifies every token form") {
  auto const tokens{ rtpack::setup_tokenize(
      "_ssl _ssl.c _ssl/cert.c -DUSE_SSL -I/tools/deps/include -lssl "
      "-Xlinker -hidden-lcrypto /tools/deps/lib/libz.a -framework Security -Os") };

  std::vector<setup_token> const expected{
    { setup_token_kind::MODULE, "_ssl" },
    { setup_token_kind::SOURCE, "_ssl.c" },
    { setup_token_kind::SOURCE, "_ssl/cert.c" },
    { setup_token_kind::DEFINE, "USE_SSL" },
    { setup_token_kind::INCLUDE, "/tools/deps/include" },
    { setup_token_kind::LINK, "ssl" },
    { setup_token_kind::HIDDEN_LINK, "crypto" },
    { setup_token_kind::ARCHIVE, "/tools/deps/lib/libz.a" },
    { setup_token_kind::FRAMEWORK, "Security" },
    { setup_token_kind::ARG, "-Os" },
  };
  CHECK(tokens == expected);
}

TEST_CASE("setup_tokenize reads flags before source suffixes") {
  auto const tokens{ rtpack::setup_tokenize(
      "_scproxy _scproxy.m helper.cpp -IInclude/internal.c -DX=a.c -lz") };
  std::vector<setup_token> const expected{
    { setup_token_kind::MODULE, "_scproxy" },
    { setup_token_kind::SOURCE, "_scproxy.m" },
    { setup_token_kind::SOURCE, "helper.cpp" },
    { setup_token_kind::INCLUDE, "Include/internal.c" },
    { setup_token_kind::DEFINE, "X=a.c" },
    { setup_token_kind::LINK, "z" },
  };
  CHECK(tokens == expected);
}

TEST_CASE("setup_tokenize keeps other -Xlinker payloads as opaque args") {
  auto const tokens{ rtpack::setup_tokenize("_x x.c -Xlinker -export_dynamic") };
  REQUIRE(tokens.size() == 4);
  CHECK(tokens[2] == setup_token{ setup_token_kind::ARG, "-Xlinker" });
  CHECK(tokens[3] == setup_token{ setup_token_kind::ARG, "-export_dynamic" });
}

TEST_CASE("setup_tokenize rejects dangling flags") {
  CHECK_THROWS_AS(rtpack::setup_tokenize("_x x.c -Xlinker"),
                  rtpack::malformed_directive_error);
  CHECK_THROWS_AS(rtpack::setup_tokenize("_x x.c -framework"),
                  rtpack::malformed_directive_error);
}

TEST_CASE("setup_tokenize of blank text is empty") {
  CHECK(rtpack::setup_tokenize("   ").empty());
}

TEST_CASE("setup_line accessors") {
  auto const line{ rtpack::setup_parse_line(
      "_hashlib _hashopenssl.c -DX -Ia -lssl -Xlinker -hidden-lcrypto libz.a "
      "-framework CoreFoundation -s") };
  REQUIRE(line);
  CHECK(line->extension() == "_hashlib");
  CHECK(line->sources() == std::vector<std::string>{ "_hashopenssl.c" });
  CHECK(line->defines() == std::vector<std::string>{ "X" });
  CHECK(line->includes() == std::vector<std::string>{ "a" });
  CHECK(line->links() == std::vector<std::string>{ "ssl", "crypto", "libz.a" });
  CHECK(line->frameworks() == std::vector<std::string>{ "CoreFoundation" });
  CHECK(line->args() == std::vector<std::string>{ "-s" });
}

TEST_CASE("rendered lines parse back to the same tokens") {
  std::vector<std::string> const lines{
    "zlib zlibmodule.c -I/tools/deps/include -lz",
    "_ctypes _ctypes/_ctypes.c _ctypes/callbacks.c -DUSING_MALLOC_CLOSURE_DOT_C=1",
    "_ssl _ssl.c -Xlinker -hidden-lssl -Xlinker -hidden-lcrypto",
    "_scproxy _scproxy.c -framework SystemConfiguration -framework CoreFoundation",
    "_x x.c /tools/deps/lib/libffi.a -Xlinker -s",
  };

  for (auto const &text : lines) {
    CAPTURE(text);
    auto const parsed{ rtpack::setup_parse_line(text) };
    REQUIRE(parsed);
    CHECK(parsed->render() == text);

    auto const reparsed{ rtpack::setup_parse_line(parsed->render()) };
    REQUIRE(reparsed);
    CHECK(reparsed->tokens == parsed->tokens);
  }
}

TEST_CASE("setup_classify_line") {
  using rtpack::setup_line_kind;
  CHECK(rtpack::setup_classify_line("") == setup_line_kind::BLANK);
  CHECK(rtpack::setup_classify_line("   # just a comment") == setup_line_kind::BLANK);
  CHECK(rtpack::setup_classify_line("*static*") == setup_line_kind::SECTION);
  CHECK(rtpack::setup_classify_line("*shared* # trailing") == setup_line_kind::SECTION);
  CHECK(rtpack::setup_classify_line("DESTLIB=$(LIBDEST)") == setup_line_kind::ASSIGNMENT);
  CHECK(rtpack::setup_classify_line("MODLIBS = $(LOCALMODLIBS)") ==
        setup_line_kind::ASSIGNMENT);
  CHECK(rtpack::setup_classify_line("posix posixmodule.c") == setup_line_kind::DIRECTIVE);
  CHECK(rtpack::setup_classify_line("#posix posixmodule.c") == setup_line_kind::BLANK);
}

TEST_CASE("setup_parse_line strips comments and skips non-directives") {
  auto const line{ rtpack::setup_parse_line("_abc _abc.c # always built") };
  REQUIRE(line);
  CHECK(line->render() == "_abc _abc.c");

  CHECK_FALSE(rtpack::setup_parse_line("*disabled*"));
  CHECK_FALSE(rtpack::setup_parse_line("PYTHONPATH=$(COREPYTHONPATH)"));
  CHECK_FALSE(rtpack::setup_parse_line("# _abc _abc.c"));
}

TEST_CASE("setup_section_name") {
  CHECK(rtpack::setup_section_name("*static*") == "static");
  CHECK(rtpack::setup_section_name("  *variant:lto* ") == "variant:lto");
  CHECK_FALSE(rtpack::setup_section_name("**"));
  CHECK_FALSE(rtpack::setup_section_name("static"));
}

TEST_CASE("setup_object_path keeps directories from 3.9") {
  CHECK(rtpack::setup_object_path("_decimal/_decimal.c", "3.12.1") ==
        "Modules/_decimal/_decimal.o");
  CHECK(rtpack::setup_object_path("zlibmodule.c", "3.9") == "Modules/zlibmodule.o");
  CHECK(rtpack::setup_object_path("_decimal/_decimal.c", "3.8.18") ==
        "Modules/_decimal.o");
}

TEST_CASE("setup_source_stem") {
  CHECK(rtpack::setup_source_stem("_decimal/_decimal.c") == "_decimal");
  CHECK(rtpack::setup_source_stem("foo.c") == "foo");
}

TEST_CASE("setup_is_source") {
  CHECK(rtpack::setup_is_source("a/b.c"));
  CHECK(rtpack::setup_is_source("b.cc"));
  CHECK(rtpack::setup_is_source("_scproxy.m"));
  CHECK(rtpack::setup_is_source("x.cpp"));
  CHECK(rtpack::setup_is_source("x.cxx"));
  CHECK(rtpack::setup_is_source("X.C"));
  CHECK_FALSE(rtpack::setup_is_source("x.h"));
  CHECK_FALSE(rtpack::setup_is_source(".c"));
  CHECK_FALSE(rtpack::setup_is_source("-Ix.c"));
  CHECK_FALSE(rtpack::setup_is_source("libz.a"));
}
