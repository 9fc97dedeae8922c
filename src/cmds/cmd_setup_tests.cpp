#include "cmds/cmd_matrix.h"
#include "cmds/cmd_setup.h"
#include "cmds/cmd_validate.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr char const *kCatalog{ R"lua(
EXTENSION_MODULES = {
  marshal = { ["config-c-only"] = true },
  posix = { ["setup-enabled"] = true },
  _json = { sources = { "_json.c" }, defines = { "JSON_LEVEL=2" } },
  _ctypes = {
    sources = { "_ctypes/_ctypes.c" },
    links = { "ffi" },
    ["build-mode"] = "shared",
    ["disabled-targets"] = { ".*-musl" },
  },
}
)lua" };

constexpr char const *kSetup{ R"(*static*
posix -DPy_BUILD_CORE_BUILTIN posixmodule.c
)" };

constexpr char const *kConfigCIn{ R"(struct _inittab _PyImport_Inittab[] = {
    {"marshal", PyMarshal_Init},
    /* Sentinel */
    {0, 0}
};
)" };

struct source_fixture {
  fs::path root;

  source_fixture() {
    std::mt19937_64 rng{ std::random_device{}() };
    root = fs::temp_directory_path() / ("rtpack-cmd-setup-" + std::to_string(rng()));
    fs::create_directories(root / "src" / "Modules");
    write(root / "catalog.lua", kCatalog);
    write(root / "src" / "Modules" / "Setup", kSetup);
    write(root / "src" / "Modules" / "config.c.in", kConfigCIn);
    write(root / "variants", "*variant:alt*\n_json _json.c -DJSON_ALT\n");
  }

  ~source_fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  source_fixture(source_fixture const &) = delete;
  source_fixture &operator=(source_fixture const &) = delete;

  static void write(fs::path const &path, std::string const &content) {
    std::ofstream out{ path, std::ios::binary };
    out << content;
  }

  static std::string read(fs::path const &path) {
    auto const bytes{ rtpack::util_load_file(path) };
    return std::string(bytes.begin(), bytes.end());
  }
};

}  // namespace

TEST_CASE_FIXTURE(source_fixture, "cmd_validate accepts a consistent catalog") {
  auto log{ rtpack::tui::logger::silent() };
  rtpack::cmd_validate::cfg cfg;
  cfg.catalog_path = root / "catalog.lua";
  cfg.source_root = root / "src";
  cfg.python_version = "3.12.4";
  CHECK_NOTHROW(rtpack::cmd::create(cfg, log)->execute());

  SUBCASE("drift is reported") {
    write(root / "src" / "Modules" / "Setup",
          "*static*\nposix posixmodule.c\n_sre sre.c\n");
    CHECK_THROWS_AS(rtpack::cmd::create(cfg, log)->execute(), rtpack::drift_error);
  }
}

TEST_CASE_FIXTURE(source_fixture, "cmd_setup writes one cell") {
  auto log{ rtpack::tui::logger::silent() };
  rtpack::cmd_setup::cfg cfg;
  cfg.catalog_path = root / "catalog.lua";
  cfg.source_root = root / "src";
  cfg.target_triple = "x86_64-unknown-linux-gnu";
  cfg.python_version = "3.12.4";
  cfg.variant_file = root / "variants";
  cfg.output_dir = root / "out";

  rtpack::cmd::create(cfg, log)->execute();

  CHECK(read(root / "out" / "Setup.local") ==
        "*static*\n"
        "_json _json.c\n"
        "\n*shared*\n"
        "_ctypes _ctypes/_ctypes.c -lffi\n"
        "\n*disabled*\n");
  CHECK(read(root / "out" / "Makefile.extra")
            .starts_with("Modules/_json.o: PY_STDMODULE_CFLAGS += -DJSON_LEVEL=2\n"));
  CHECK(read(root / "out" / "VARIANT-_json-alt.data") == "_json _json.c -DJSON_ALT\n");

  SUBCASE("bad options") {
    cfg.options = "turbo";
    CHECK_THROWS_AS(rtpack::cmd::create(cfg, log)->execute(), std::invalid_argument);
  }
}

TEST_CASE_FIXTURE(source_fixture, "cmd_matrix synthesizes every cell") {
  auto log{ rtpack::tui::logger::silent() };
  rtpack::cmd_matrix::cfg cfg;
  cfg.catalog_path = root / "catalog.lua";
  cfg.source_root = root / "src";
  cfg.python_version = "3.12.4";
  cfg.target_triples = { "x86_64-unknown-linux-gnu", "x86_64-unknown-linux-musl" };
  cfg.options = { "noopt", "debug" };
  cfg.output_dir = root / "matrix";

  rtpack::cmd::create(cfg, log)->execute();

  for (auto const *triple : { "x86_64-unknown-linux-gnu", "x86_64-unknown-linux-musl" }) {
    for (auto const *options : { "noopt", "debug" }) {
      CAPTURE(triple);
      CAPTURE(options);
      CHECK(fs::exists(root / "matrix" / triple / options / "Setup.local"));
    }
  }

  auto const musl{ read(root / "matrix" / "x86_64-unknown-linux-musl" / "noopt" /
                        "Setup.local") };
  CHECK(musl.ends_with("*disabled*\n_ctypes\n"));

  SUBCASE("a failing cell fails the matrix") {
    cfg.options = { "noopt", "bogus" };
    CHECK_THROWS_WITH_AS(rtpack::cmd::create(cfg, log)->execute(),
                         "matrix: 2 of 4 cells failed",
                         std::runtime_error);
  }
}
