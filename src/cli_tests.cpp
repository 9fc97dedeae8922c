#include "cli.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

rtpack::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return rtpack::cli_parse(static_cast<int>(args.size()), argv.data());
}

struct cli_files {
  fs::path dir;
  fs::path file;

  cli_files() {
    std::mt19937_64 rng{ std::random_device{}() };
    dir = fs::temp_directory_path() / ("rtpack-cli-test-" + std::to_string(rng()));
    fs::create_directories(dir);
    file = dir / "input";
    std::ofstream{ file } << "x";
  }

  ~cli_files() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  cli_files(cli_files const &) = delete;
  cli_files &operator=(cli_files const &) = delete;
};

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "rtpack" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("-v flag") {
    auto const parsed{ parse({ "rtpack", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<rtpack::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("subcommand") {
    auto const parsed{ parse({ "rtpack", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<rtpack::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: verbosity") {
  CHECK(parse({ "rtpack", "version" }).verbosity == rtpack::tui::level::TUI_INFO);
  CHECK(parse({ "rtpack", "-q", "version" }).verbosity == rtpack::tui::level::TUI_WARN);

  auto const verbose{ parse({ "rtpack", "--verbose", "version" }) };
  CHECK(verbose.verbosity == rtpack::tui::level::TUI_DEBUG);
  CHECK(verbose.decorated_logging);
}

TEST_CASE_FIXTURE(cli_files, "cli_parse: cmd_setup") {
  auto const parsed{ parse({ "rtpack",
                             "setup",
                             "--catalog",
                             file.string(),
                             "--source-root",
                             dir.string(),
                             "--target",
                             "aarch64-apple-darwin",
                             "--python-version",
                             "3.13.1",
                             "--options",
                             "pgo+lto",
                             "-o",
                             (dir / "out").string() }) };

  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<rtpack::cmd_setup::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg);
  CHECK(cfg->catalog_path == file);
  CHECK(cfg->source_root == dir);
  CHECK(cfg->target_triple == "aarch64-apple-darwin");
  CHECK(cfg->python_version == "3.13.1");
  CHECK(cfg->options == "pgo+lto");
  CHECK(cfg->output_dir == dir / "out");
  CHECK_FALSE(cfg->variant_file);
  CHECK(cfg->deps_root == "/tools/deps");
}

TEST_CASE_FIXTURE(cli_files, "cli_parse: cmd_setup requires existing inputs") {
  auto const parsed{ parse({ "rtpack",
                             "setup",
                             "--catalog",
                             (dir / "missing.lua").string(),
                             "--source-root",
                             dir.string(),
                             "--target",
                             "x86_64-unknown-linux-gnu",
                             "--python-version",
                             "3.12.4",
                             "-o",
                             dir.string() }) };

  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE_FIXTURE(cli_files, "cli_parse: cmd_matrix collects repeated options") {
  auto const parsed{ parse({ "rtpack",
                             "matrix",
                             "--catalog",
                             file.string(),
                             "--source-root",
                             dir.string(),
                             "--python-version",
                             "3.12.4",
                             "--target",
                             "x86_64-unknown-linux-gnu",
                             "--target",
                             "aarch64-apple-darwin",
                             "--options",
                             "noopt",
                             "--options",
                             "debug" }) };

  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<rtpack::cmd_matrix::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg);
  CHECK(cfg->target_triples ==
        std::vector<std::string>{ "x86_64-unknown-linux-gnu", "aarch64-apple-darwin" });
  CHECK(cfg->options == std::vector<std::string>{ "noopt", "debug" });
  CHECK_FALSE(cfg->output_dir);
}

TEST_CASE_FIXTURE(cli_files, "cli_parse: cmd_normalize and cmd_hash") {
  SUBCASE("normalize") {
    auto const parsed{ parse({ "rtpack", "normalize", file.string(), "out.tar" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<rtpack::cmd_normalize::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg);
    CHECK(cfg->input == file);
    CHECK(cfg->output == "out.tar");
    CHECK(cfg->metadata_member == "python/PYTHON.json");
  }

  SUBCASE("hash") {
    auto const parsed{ parse({ "rtpack", "hash", file.string() }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<rtpack::cmd_hash::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg);
    CHECK(cfg->file_path == file);
  }
}
