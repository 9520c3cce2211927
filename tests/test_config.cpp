#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

static std::string cfg_path(const char* tag) {
  return (std::filesystem::temp_directory_path() /
          ("rcpu_test_cfg_" + std::string(tag) + "_" + std::to_string(::getpid()) + ".toml")).string();
}

TEST(config_defaults_without_file) {
  auto c = rcpu::app::load_config(cfg_path("absent"));
  ASSERT_TRUE(c.source_path.empty());
  ASSERT_EQ(c.sampling.interval_ms, 1000);
  ASSERT_EQ(c.sampling.channel_capacity, 64);
  ASSERT_EQ(c.sampling.skip_on_integrity_error, true);
  ASSERT_EQ(c.gate.require_intel, true);
  ASSERT_EQ(c.gate.require_smt, true);
  ASSERT_EQ(c.ui.max_rows, 20);
  ASSERT_EQ(c.log.quiet, false);
}

TEST(config_toml_overrides_env) {
  auto path = cfg_path("toml");
  std::ofstream(path) <<
    "[sampling]\n"
    "interval_ms = 250\n"
    "skip_on_integrity_error = false\n"
    "[gate]\n"
    "require_intel = false\n"
    "[ui]\n"
    "max_rows = 5\n";
  setenv("RCPU_INTERVAL_MS", "2000", 1);
  setenv("RCPU_MAX_ROWS", "7", 1);
  auto c = rcpu::app::load_config(path);
  unsetenv("RCPU_INTERVAL_MS");
  unsetenv("RCPU_MAX_ROWS");
  ASSERT_EQ(c.source_path, path);
  ASSERT_EQ(c.sampling.interval_ms, 250);
  ASSERT_EQ(c.sampling.skip_on_integrity_error, false);
  ASSERT_EQ(c.gate.require_intel, false);
  ASSERT_EQ(c.gate.require_smt, true);
  ASSERT_EQ(c.ui.max_rows, 5);
  std::filesystem::remove(path);
}

TEST(config_env_fallback_and_lowercase_spelling) {
  setenv("rcpu_interval_ms", "3000", 1);
  setenv("RCPU_LOG_QUIET", "1", 1);
  setenv("RCPU_REQUIRE_SMT", "false", 1);
  auto c = rcpu::app::load_config(cfg_path("env"));
  unsetenv("rcpu_interval_ms");
  unsetenv("RCPU_LOG_QUIET");
  unsetenv("RCPU_REQUIRE_SMT");
  ASSERT_EQ(c.sampling.interval_ms, 3000);
  ASSERT_EQ(c.log.quiet, true);
  ASSERT_EQ(c.gate.require_smt, false);
}

TEST(config_clamps_out_of_range_values) {
  auto path = cfg_path("clamp");
  std::ofstream(path) <<
    "[sampling]\n"
    "interval_ms = 1\n"
    "channel_capacity = 100000\n"
    "[ui]\n"
    "max_rows = 0\n";
  auto c = rcpu::app::load_config(path);
  ASSERT_EQ(c.sampling.interval_ms, 50);
  ASSERT_EQ(c.sampling.channel_capacity, 4096);
  ASSERT_EQ(c.ui.max_rows, 1);
  std::filesystem::remove(path);
}
