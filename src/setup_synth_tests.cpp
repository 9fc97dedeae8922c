#include "setup_synth.h"

#include "errors.h"
#include "tui.h"

#include "doctest.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr char const *kLinux{ "x86_64-unknown-linux-gnu" };
constexpr char const *kMusl{ "x86_64-unknown-linux-musl" };
constexpr char const *kApple{ "aarch64-apple-darwin" };

constexpr char const *kNativeSetup{ R"(*static*
_sre _sre/sre.c
posix -DPy_BUILD_CORE_BUILTIN posixmodule.c

*shared*
_ctypes _ctypes/_ctypes.c -lffi
)" };

constexpr char const *kNativeConfigC{ R"(struct _inittab _PyImport_Inittab[] = {
    {"marshal", PyMarshal_Init},
    /* Sentinel */
    {0, 0}
};
)" };

rtpack::extension_catalog catalog_of(std::string const &body) {
  return rtpack::extension_catalog::load("EXTENSION_MODULES = {\n" + body + "\n}",
                                         "catalog.lua");
}

rtpack::native_extension_index native_index() {
  return rtpack::native_extension_index::parse(kNativeSetup, kNativeConfigC);
}

rtpack::build_cell cell_for(std::string triple, std::string const &options = "noopt") {
  return { .target_triple = std::move(triple),
           .python_version = "3.12.4",
           .options = rtpack::build_options::parse(options) };
}

rtpack::setup_plan synthesize(rtpack::extension_catalog const &catalog,
                              rtpack::build_cell const &cell,
                              std::string_view variant_text = {}) {
  auto log{ rtpack::tui::logger::silent() };
  return rtpack::synthesize_setup(catalog,
                                  native_index(),
                                  cell,
                                  rtpack::parse_variant_file(variant_text),
                                  rtpack::synthesis_settings{},
                                  log);
}

std::vector<std::string> lines_starting_with(std::string const &text,
                                             std::string const &prefix) {
  std::vector<std::string> out;
  std::istringstream in{ text };
  for (std::string line; std::getline(in, line);) {
    if (line.starts_with(prefix)) { out.push_back(line); }
  }
  return out;
}

}  // namespace

TEST_CASE("synthesize_line renders sources, defines, includes and links in order") {
  auto const catalog{ catalog_of(R"(
  _hashlib = {
    sources = { "_hashopenssl.c" },
    defines = { "USE_OPENSSL" },
    includes = { "Modules/_hashlib" },
    ["includes-deps"] = { "include/openssl" },
    links = { "ssl", "crypto" },
  },)") };
  auto const &spec{ *catalog.find("_hashlib") };

  auto const line{ rtpack::synthesize_line(spec, cell_for(kLinux), {}) };
  CHECK(line.render() ==
        "_hashlib _hashopenssl.c -DUSE_OPENSSL -IModules/_hashlib "
        "-I/tools/deps/include/openssl -lssl -lcrypto");
}

TEST_CASE("synthesize_line hides link names on Apple targets") {
  auto const catalog{ catalog_of(R"(
  _hashlib = {
    sources = { "_hashopenssl.c" },
    links = { "crypto" },
    frameworks = { "Security" },
  },)") };
  auto const &spec{ *catalog.find("_hashlib") };

  SUBCASE("apple") {
    auto const text{ rtpack::synthesize_line(spec, cell_for(kApple), {}).render() };
    CHECK(text == "_hashlib _hashopenssl.c -Xlinker -hidden-lcrypto -framework Security");
    CHECK(text.find(" -lcrypto") == std::string::npos);
  }

  SUBCASE("linux has plain links and no frameworks") {
    auto const text{ rtpack::synthesize_line(spec, cell_for(kLinux), {}).render() };
    CHECK(text == "_hashlib _hashopenssl.c -lcrypto");
  }
}

TEST_CASE("synthesize_line omits deps includes on Apple targets") {
  auto const catalog{ catalog_of(R"(
  _curses = {
    sources = { "_cursesmodule.c" },
    ["includes-deps"] = { "include/ncursesw" },
  },)") };
  auto const &spec{ *catalog.find("_curses") };

  rtpack::synthesis_settings settings;
  settings.deps_root = "/opt/deps";

  CHECK(rtpack::synthesize_line(spec, cell_for(kLinux), settings).render() ==
        "_curses _cursesmodule.c -I/opt/deps/include/ncursesw");
  CHECK(rtpack::synthesize_line(spec, cell_for(kApple), settings).render() ==
        "_curses _cursesmodule.c");
}

TEST_CASE("synthesize_line treats static archive names as paths") {
  auto const catalog{ catalog_of(R"(
  _lzma = { sources = { "_lzmamodule.c" }, links = { "liblzma.a" } },)") };
  auto const &spec{ *catalog.find("_lzma") };

  auto const line{ rtpack::synthesize_line(spec, cell_for(kApple), {}) };
  CHECK(line.render() == "_lzma _lzmamodule.c liblzma.a");
  CHECK(line.links() == std::vector<std::string>{ "liblzma.a" });
}

TEST_CASE("synthesize_line filters conditional entries") {
  auto const catalog{ catalog_of(R"(
  _decimal = {
    sources = { "_decimal/_decimal.c" },
    ["sources-conditional"] = {
      { source = "_decimal/new.c", ["minimum-python-version"] = "3.13" },
      { source = "_decimal/linux.c", targets = { ".*-linux-.*" } },
      { source = "_decimal/debug.c", ["build-options"] = { "debug" } },
    },
    ["defines-conditional"] = {
      { define = "CONFIG_64", targets = { "x86_64-.*" } },
      { define = "CONFIG_32", targets = { "i686-.*" } },
    },
    ["links-conditional"] = {
      { name = "m", targets = { ".*-linux-.*" } },
      { name = "dl", ["build-mode"] = "shared" },
    },
    ["linker-args"] = {
      { args = { "-Xlinker", "-zdefs" }, targets = { ".*-linux-gnu" } },
    },
  },)") };
  auto const &spec{ *catalog.find("_decimal") };

  SUBCASE("linux release") {
    CHECK(rtpack::synthesize_line(spec, cell_for(kLinux), {}).render() ==
          "_decimal _decimal/_decimal.c _decimal/linux.c -DCONFIG_64 -lm "
          "-Xlinker -zdefs");
  }

  SUBCASE("linux debug") {
    auto const line{ rtpack::synthesize_line(spec, cell_for(kLinux, "debug"), {}) };
    auto const text{ line.render() };
    CHECK(text.find("_decimal/debug.c") != std::string::npos);
  }

  SUBCASE("apple") {
    CHECK(rtpack::synthesize_line(spec, cell_for(kApple), {}).render() ==
          "_decimal _decimal/_decimal.c");
  }
}

TEST_CASE("synthesize_line rejects tokens containing whitespace") {
  auto const catalog{ catalog_of(R"(
  _bad = { sources = { "_bad.c" }, defines = { "A B" } },)") };
  CHECK_THROWS_AS(
      rtpack::synthesize_line(*catalog.find("_bad"), cell_for(kLinux), {}),
      rtpack::malformed_directive_error);
}

TEST_CASE("synthesized lines parse back to the same token sets") {
  auto const catalog{ catalog_of(R"(
  _scproxy = {
    sources = { "_scproxy.m", "helper.cpp" },
    defines = { "SCPROXY=1" },
    includes = { "Include/internal.c" },
    links = { "z", "/tools/deps/lib/libffi.a" },
    frameworks = { "SystemConfiguration" },
  },)") };
  auto const &spec{ *catalog.find("_scproxy") };

  for (auto const *triple : { kLinux, kApple }) {
    CAPTURE(triple);
    auto const line{ rtpack::synthesize_line(spec, cell_for(triple), {}) };
    auto const parsed{ rtpack::setup_parse_line(line.render()) };
    REQUIRE(parsed);
    CHECK(parsed->sources() == line.sources());
    CHECK(parsed->defines() == line.defines());
    CHECK(parsed->includes() == line.includes());
    CHECK(parsed->links() == line.links());
    CHECK(parsed->frameworks() == line.frameworks());
    CHECK(parsed->args().empty());
    CHECK(line.sources() == std::vector<std::string>{ "_scproxy.m", "helper.cpp" });
    CHECK(line.includes() == std::vector<std::string>{ "Include/internal.c" });
  }
}

TEST_CASE("synthesize_line rejects tokens that would parse as another kind") {
  SUBCASE("header listed as a source") {
    auto const catalog{ catalog_of(R"(
  _bad = { sources = { "_bad.c", "_bad.h" } },)") };
    CHECK_THROWS_WITH_AS(
        rtpack::synthesize_line(*catalog.find("_bad"), cell_for(kLinux), {}),
        doctest::Contains("does not parse back"),
        rtpack::malformed_directive_error);
  }

  SUBCASE("flag listed as a source") {
    auto const catalog{ catalog_of(R"(
  _bad = { sources = { "-Iinclude/x.c" } },)") };
    CHECK_THROWS_AS(
        rtpack::synthesize_line(*catalog.find("_bad"), cell_for(kLinux), {}),
        rtpack::malformed_directive_error);
  }
}

TEST_CASE("compute_disabled_set") {
  auto const catalog{ catalog_of(R"(
  _old = { sources = { "_old.c" }, ["maximum-python-version"] = "3.10" },
  _ctypes = { sources = { "_ctypes/_ctypes.c" }, ["disabled-targets"] = { ".*-musl" } },
  xxlimited = { sources = { "xxlimited.c" } },
  zlib = { sources = { "zlibmodule.c" } },)") };

  SUBCASE("version and target gates") {
    auto const disabled{ rtpack::compute_disabled_set(catalog, cell_for(kMusl)) };
    CHECK(disabled == std::set<std::string>{ "_ctypes", "_old" });
  }

  SUBCASE("debug disables the xxlimited modules") {
    auto const disabled{ rtpack::compute_disabled_set(catalog,
                                                      cell_for(kLinux, "debug")) };
    CHECK(disabled.contains("xxlimited"));
    CHECK(disabled.contains("xxlimited_35"));
    CHECK_FALSE(disabled.contains("zlib"));
  }
}

TEST_CASE("synthesize_setup lays out Setup.local by section") {
  auto const catalog{ catalog_of(R"(
  _old = { sources = { "_old.c" }, ["maximum-python-version"] = "3.10" },
  _json = { sources = { "_json.c" } },
  _ctypes = {
    sources = { "_ctypes/_ctypes.c" },
    links = { "ffi" },
    ["build-mode"] = "shared",
  },
  _sre = { ["setup-enabled"] = true },
  _io = { ["config-c-only"] = true },
  _empty = {},)") };

  auto const plan{ synthesize(catalog, cell_for(kLinux)) };

  CHECK(plan.setup_local ==
        "*static*\n"
        "_json _json.c\n"
        "\n*shared*\n"
        "_ctypes _ctypes/_ctypes.c -lffi\n"
        "\n*disabled*\n"
        "_old\n");
  CHECK(plan.makefile_extra.empty());
  CHECK(plan.sidecars.empty());

  SUBCASE("every synthesized spec has exactly one primary directive") {
    for (auto const *name : { "_json", "_ctypes", "_sre", "_io" }) {
      CAPTURE(name);
      CHECK(std::count_if(plan.directives.begin(), plan.directives.end(), [&](auto &d) {
              return d.primary && d.extension == name;
            }) == 1);
    }
    CHECK(plan.find_primary("_empty") == nullptr);
    CHECK(plan.find_primary("_old") == nullptr);
  }

  SUBCASE("origins and objects") {
    auto const *ctypes{ plan.find_primary("_ctypes") };
    REQUIRE(ctypes);
    CHECK(ctypes->origin == rtpack::directive_origin::SYNTHESIZED);
    CHECK(ctypes->object_paths ==
          std::vector<std::string>{ "Modules/_ctypes/_ctypes.o" });
    CHECK(ctypes->module_path == "Modules/_ctypes$(EXT_SUFFIX)");

    auto const *sre{ plan.find_primary("_sre") };
    REQUIRE(sre);
    CHECK(sre->origin == rtpack::directive_origin::SETUP_ENABLED);
    CHECK(sre->text.empty());
    CHECK(sre->object_paths == std::vector<std::string>{ "Modules/_sre/sre.o" });

    auto const *io{ plan.find_primary("_io") };
    REQUIRE(io);
    CHECK(io->origin == rtpack::directive_origin::CONFIG_C_ONLY);
    CHECK(io->object_paths.empty());
    CHECK_FALSE(io->module_path);
  }
}

TEST_CASE("synthesize_setup moves valued defines into Makefile.extra") {
  auto const catalog{ catalog_of(R"(
  _x = { sources = { "_x.c", "_x_util.c" }, defines = { "A=1", "B" } },)") };

  auto const plan{ synthesize(catalog, cell_for(kLinux)) };

  CHECK(lines_starting_with(plan.setup_local, "_x ") ==
        std::vector<std::string>{ "_x _x.c _x_util.c -DB" });
  CHECK(plan.makefile_extra ==
        "Modules/_x.o: PY_STDMODULE_CFLAGS += -DA=1\n"
        "Modules/_x_util.o: PY_STDMODULE_CFLAGS += -DA=1\n");
}

TEST_CASE("synthesize_setup rejects assignments it cannot express") {
  auto const catalog{ catalog_of(R"(
  _x = { sources = { "_x.c" }, includes = { "a=b" } },)") };
  CHECK_THROWS_AS(synthesize(catalog, cell_for(kLinux)),
                  rtpack::malformed_directive_error);
}

TEST_CASE("synthesize_setup lists debug-disabled modules") {
  auto const catalog{ catalog_of(R"(
  xxlimited = { sources = { "xxlimited.c" } },)") };

  auto const plan{ synthesize(catalog, cell_for(kLinux, "debug")) };
  CHECK(plan.find_primary("xxlimited") == nullptr);
  CHECK(lines_starting_with(plan.setup_local, "xxlimited") ==
        std::vector<std::string>{ "xxlimited", "xxlimited_35" });
}

TEST_CASE("synthesize_setup keeps one line per extension for variants") {
  auto const catalog{ catalog_of("  foo = {},") };
  constexpr char const *kVariants{ R"(# two builds of foo
*variant:a*
foo foo.c -DFOO_A

*variant:b*
foo foo.c -DFOO_B=1 -lbar
)" };

  SUBCASE("dynamic target") {
    auto const plan{ synthesize(catalog, cell_for(kLinux), kVariants) };

    CHECK(lines_starting_with(plan.setup_local, "foo ") ==
          std::vector<std::string>{ "foo foo.c -DFOO_A" });

    REQUIRE(plan.sidecars.size() == 1);
    CHECK(plan.sidecars.at("VARIANT-foo-b.data") == "foo foo.c -DFOO_B=1 -lbar\n");

    auto const *primary{ plan.find_primary("foo") };
    REQUIRE(primary);
    CHECK(primary->variant == "a");
    CHECK(primary->origin == rtpack::directive_origin::VARIANT);

    auto const it{ std::find_if(plan.directives.begin(),
                                plan.directives.end(),
                                [](auto const &d) { return d.variant == "b"; }) };
    REQUIRE(it != plan.directives.end());
    CHECK_FALSE(it->primary);
    CHECK(it->mode == rtpack::build_mode::SHARED);
    CHECK(it->object_paths == std::vector<std::string>{ "Modules/VARIANT-foo-b-foo.o" });
    CHECK(it->module_path == "Modules/foo_b$(EXT_SUFFIX)");

    CHECK(plan.makefile_extra.find("Modules/VARIANT-foo-b-foo.o: PY_STDMODULE_CFLAGS += "
                                   "-DFOO_B=1\n") != std::string::npos);
    CHECK(plan.makefile_extra.find(
              "Modules/VARIANT-foo-b-foo.o: $(srcdir)/Modules/foo.c\n") !=
          std::string::npos);
    std::string const link_rule{ "Modules/foo_b$(EXT_SUFFIX): "
                                 "Modules/VARIANT-foo-b-foo.o\n"
                                 "\t$(BLDSHARED) Modules/VARIANT-foo-b-foo.o -lbar "
                                 "-o Modules/foo_b$(EXT_SUFFIX)\n" };
    CHECK(plan.makefile_extra.find(link_rule) != std::string::npos);
  }

  SUBCASE("fully static target writes the sidecar without a link rule") {
    auto const plan{ synthesize(catalog, cell_for(kMusl), kVariants) };

    CHECK(plan.sidecars.contains("VARIANT-foo-b.data"));
    CHECK(plan.makefile_extra.find("$(BLDSHARED)") == std::string::npos);
    CHECK(plan.makefile_extra.find("Modules/VARIANT-foo-b-foo.o: $(srcdir)") !=
          std::string::npos);

    auto const it{ std::find_if(plan.directives.begin(),
                                plan.directives.end(),
                                [](auto const &d) { return d.variant == "b"; }) };
    REQUIRE(it != plan.directives.end());
    CHECK_FALSE(it->module_path);
  }
}

TEST_CASE("synthesize_setup adds variants beside a synthesized primary") {
  auto const catalog{ catalog_of(R"(
  _sqlite3 = { sources = { "_sqlite/module.c" }, links = { "sqlite3" } },)") };

  constexpr char const *kVariants{ "*variant:new*\n"
                                   "_sqlite3 _sqlite/module.c -lsqlite3new\n" };
  auto const plan{ synthesize(catalog, cell_for(kLinux), kVariants) };

  CHECK(lines_starting_with(plan.setup_local, "_sqlite3 ") ==
        std::vector<std::string>{ "_sqlite3 _sqlite/module.c -lsqlite3" });
  CHECK(plan.find_primary("_sqlite3")->variant == "default");
  CHECK(plan.sidecars.contains("VARIANT-_sqlite3-new.data"));
}

TEST_CASE("synthesize_setup rejects bad variants") {
  auto const catalog{ catalog_of(R"(
  foo = { sources = { "foo.c" } },
  xxlimited = { sources = { "xxlimited.c" } },)") };

  SUBCASE("repeated tag for the primary") {
    CHECK_THROWS_AS(synthesize(catalog, cell_for(kLinux), "*variant:default*\nfoo a.c\n"),
                    rtpack::malformed_directive_error);
  }

  SUBCASE("repeated non-primary tag") {
    CHECK_THROWS_WITH_AS(
        synthesize(catalog, cell_for(kLinux), "*variant:b*\nfoo a.c\nfoo b.c\n"),
        "setup: duplicate directive for foo variant 'b'",
        rtpack::malformed_directive_error);
  }

  SUBCASE("uncataloged extension") {
    CHECK_THROWS_AS(synthesize(catalog, cell_for(kLinux), "*variant:a*\nbar bar.c\n"),
                    rtpack::malformed_directive_error);
  }

  SUBCASE("variants of disabled modules are skipped") {
    auto const plan{
      synthesize(catalog, cell_for(kLinux, "debug"), "*variant:a*\nxxlimited x.c\n")
    };
    CHECK(plan.sidecars.empty());
    CHECK(plan.find_primary("xxlimited") == nullptr);
  }
}

TEST_CASE("parse_variant_file") {
  SUBCASE("groups directives by marker") {
    auto const variants{ rtpack::parse_variant_file(
        "# comment\n\n*variant:a*\nfoo foo.c  # trailing\n*variant:b*\nbar bar.c\n") };
    REQUIRE(variants.size() == 2);
    CHECK(variants[0].tag == "a");
    CHECK(variants[0].text == "foo foo.c  # trailing");
    CHECK(variants[1].tag == "b");
    CHECK(variants[1].text == "bar bar.c");
  }

  SUBCASE("empty input") { CHECK(rtpack::parse_variant_file("").empty()); }

  SUBCASE("directive before a marker") {
    CHECK_THROWS_WITH_AS(
        rtpack::parse_variant_file("foo foo.c\n"),
        "variant file line 1: directive before any *variant:<tag>* marker",
        rtpack::malformed_directive_error);
  }

  SUBCASE("non-variant section") {
    CHECK_THROWS_AS(rtpack::parse_variant_file("*static*\nfoo foo.c\n"),
                    rtpack::malformed_directive_error);
  }

  SUBCASE("empty tag") {
    CHECK_THROWS_AS(rtpack::parse_variant_file("*variant:*\n"),
                    rtpack::malformed_directive_error);
  }

  SUBCASE("assignment") {
    CHECK_THROWS_AS(rtpack::parse_variant_file("*variant:a*\nFOO=bar\n"),
                    rtpack::malformed_directive_error);
  }
}
