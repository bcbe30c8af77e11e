#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using sysglyph::app::ConfigError;
using sysglyph::app::RunConfig;
using sysglyph::model::Style;

namespace {

const char* kEnvNames[] = {
  "SYSGLYPH_STYLE", "SYSGLYPH_WIDTH", "SYSGLYPH_HEIGHT", "SYSGLYPH_INTERVAL_MS",
  "SYSGLYPH_ALT_SCREEN", "SYSGLYPH_VERBOSE",
  "sysglyph_STYLE", "sysglyph_WIDTH", "sysglyph_HEIGHT", "sysglyph_INTERVAL_MS",
  "sysglyph_ALT_SCREEN", "sysglyph_VERBOSE",
};

// Points XDG_CONFIG_HOME at a fresh directory and clears SYSGLYPH_* so the
// host configuration never leaks into a test.
fs::path isolate_env(const char* tag) {
  auto dir = fs::temp_directory_path() / fs::path(std::string("sysglyph_test_cfg_") + tag) /
             fs::path(std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir / "sysglyph");
  setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
  for (const char* n : kEnvNames) unsetenv(n);
  return dir;
}

bool throws_config_error(const std::vector<std::string>& args) {
  try {
    (void)sysglyph::app::load_run_config(args);
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

} // namespace

TEST(config_defaults) {
  isolate_env("defaults");
  auto cfg = sysglyph::app::load_run_config({});
  ASSERT_TRUE(cfg.command == RunConfig::Command::Run);
  ASSERT_EQ(cfg.canvas.width, 80);
  ASSERT_EQ(cfg.canvas.height, 24);
  ASSERT_TRUE(cfg.canvas.style == Style::Plasma);
  ASSERT_EQ(cfg.interval.count(), 500);
  ASSERT_TRUE(!cfg.seed.has_value());
  ASSERT_EQ(cfg.iterations, 0);
  ASSERT_TRUE(!cfg.snapshot_mode());
  ASSERT_TRUE(cfg.alt_screen);
  ASSERT_TRUE(!cfg.verbose);
}

TEST(config_cli_overrides) {
  isolate_env("cli");
  auto cfg = sysglyph::app::load_run_config({"run", "--style", "waves", "--width", "100", "--height", "30",
                                             "--interval", "250", "--seed", "42", "--once", "--iterations", "3"});
  ASSERT_TRUE(cfg.canvas.style == Style::Waves);
  ASSERT_EQ(cfg.canvas.width, 100);
  ASSERT_EQ(cfg.canvas.height, 30);
  ASSERT_EQ(cfg.interval.count(), 250);
  ASSERT_EQ(cfg.seed.value_or(0), 42u);
  ASSERT_EQ(cfg.iterations, 3);
  ASSERT_TRUE(cfg.once);
  ASSERT_TRUE(cfg.snapshot_mode());
}

TEST(config_metrics_command_and_json) {
  isolate_env("metrics");
  auto cfg = sysglyph::app::load_run_config({"metrics"});
  ASSERT_TRUE(cfg.command == RunConfig::Command::Metrics);
  auto j = sysglyph::app::load_run_config({"--json"});
  ASSERT_TRUE(j.json);
  ASSERT_TRUE(j.snapshot_mode());
}

TEST(config_rejects_bad_cli) {
  isolate_env("bad");
  ASSERT_TRUE(throws_config_error({"--width", "0"}));
  ASSERT_TRUE(throws_config_error({"--height", "0"}));
  ASSERT_TRUE(throws_config_error({"--width", "70000"}));
  ASSERT_TRUE(throws_config_error({"--width", "-5"}));
  ASSERT_TRUE(throws_config_error({"--width", "wide"}));
  ASSERT_TRUE(throws_config_error({"--style", "neon"}));
  ASSERT_TRUE(throws_config_error({"--interval"}));
  ASSERT_TRUE(throws_config_error({"--interval", "600001"}));
  ASSERT_TRUE(throws_config_error({"--bogus"}));
  ASSERT_TRUE(throws_config_error({"run", "metrics"}));
  ASSERT_TRUE(throws_config_error({"--config", "/nonexistent/sysglyph.toml"}));
}

TEST(config_help_short_circuits_validation) {
  isolate_env("help");
  auto cfg = sysglyph::app::load_run_config({"--help"});
  ASSERT_TRUE(cfg.show_help);
  auto v = sysglyph::app::load_run_config({"-V"});
  ASSERT_TRUE(v.show_version);
}

TEST(config_file_then_env_precedence) {
  auto dir = isolate_env("precedence");
  std::ofstream(dir / "sysglyph/config.toml") <<
    "[canvas]\n"
    "width = 120\n"
    "style = \"ember\"\n"
    "seed = 9\n"
    "[loop]\n"
    "interval_ms = 100\n"
    "[ui]\n"
    "alt_screen = false\n";
  setenv("SYSGLYPH_WIDTH", "90", 1);
  setenv("SYSGLYPH_HEIGHT", "33", 1);
  auto cfg = sysglyph::app::load_run_config({});
  ASSERT_EQ(cfg.canvas.width, 120);  // file beats env
  ASSERT_EQ(cfg.canvas.height, 33);  // env fills what the file leaves out
  ASSERT_TRUE(cfg.canvas.style == Style::Ember);
  ASSERT_EQ(cfg.seed.value_or(0), 9u);
  ASSERT_EQ(cfg.interval.count(), 100);
  ASSERT_TRUE(!cfg.alt_screen);
  auto cli = sysglyph::app::load_run_config({"--width", "40", "--style", "waves"});
  ASSERT_EQ(cli.canvas.width, 40);   // command line beats both
  ASSERT_TRUE(cli.canvas.style == Style::Waves);
  unsetenv("SYSGLYPH_WIDTH");
  unsetenv("SYSGLYPH_HEIGHT");
}

TEST(config_unknown_style_outside_cli_falls_back) {
  auto dir = isolate_env("fallback");
  std::ofstream(dir / "sysglyph/config.toml") << "[canvas]\nstyle = \"neon\"\n";
  auto cfg = sysglyph::app::load_run_config({});
  ASSERT_TRUE(cfg.canvas.style == Style::Plasma);
  fs::remove(dir / "sysglyph/config.toml");
  setenv("SYSGLYPH_STYLE", "EMBER", 1);
  auto env = sysglyph::app::load_run_config({});
  ASSERT_TRUE(env.canvas.style == Style::Ember);
  setenv("SYSGLYPH_STYLE", "glitter", 1);
  auto bad = sysglyph::app::load_run_config({});
  ASSERT_TRUE(bad.canvas.style == Style::Plasma);
  unsetenv("SYSGLYPH_STYLE");
}

TEST(config_explicit_file_and_bad_values) {
  auto dir = isolate_env("explicit");
  auto path = dir / "custom.toml";
  std::ofstream(path) << "[canvas]\nheight = 0\n";
  ASSERT_TRUE(throws_config_error({"--config", path.string()}));
  std::ofstream(path) << "[canvas]\nwidth = lots\n";
  ASSERT_TRUE(throws_config_error({"--config", path.string()}));
  std::ofstream(path) << "[canvas]\nheight = 12\n";
  auto cfg = sysglyph::app::load_run_config({"--config", path.string()});
  ASSERT_EQ(cfg.canvas.height, 12);
}

TEST(config_env_lowercase_alias) {
  isolate_env("alias");
  setenv("sysglyph_INTERVAL_MS", "750", 1);
  auto cfg = sysglyph::app::load_run_config({});
  ASSERT_EQ(cfg.interval.count(), 750);
  unsetenv("sysglyph_INTERVAL_MS");
  setenv("SYSGLYPH_WIDTH", "abc", 1);
  ASSERT_TRUE(throws_config_error({}));
  unsetenv("SYSGLYPH_WIDTH");
}

TEST(config_file_path_uses_xdg) {
  auto dir = isolate_env("xdg");
  ASSERT_EQ(sysglyph::app::config_file_path(), (dir / "sysglyph/config.toml").string());
  ASSERT_TRUE(sysglyph::app::usage_text().find("--style") != std::string::npos);
}
