#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("rcpu_test_toml_" + std::string(suffix) + "_" + std::to_string(::getpid()) + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  rcpu::util::TomlReader tr;
  ASSERT_TRUE(!tr.load(tmp_path("nonexistent")));
}

TEST(toml_load_sections_and_types) {
  auto path = tmp_path("basic");
  write_file(path,
    "# rcpu settings\n"
    "[sampling]\n"
    "interval_ms = 500   # twice a second\n"
    "skip_on_integrity_error = false\n"
    "\n"
    "[ ui ]\n"
    "label = \"a # not a comment\"\n"
  );
  rcpu::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampling", "interval_ms"), 500);
  ASSERT_EQ(tr.get_bool("sampling", "skip_on_integrity_error", true), false);
  ASSERT_EQ(tr.get_string("ui", "label"), "a # not a comment");
  ASSERT_TRUE(tr.bad_lines().empty());
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[ui]\ncolor = true\n");
  rcpu::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("ui", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("ui", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("ui", "missing_bool", true), true);
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
  ASSERT_TRUE(tr.has("ui", "color"));
  ASSERT_TRUE(!tr.has("ui", "missing"));
  ASSERT_TRUE(!tr.has("nosection", "color"));
  remove_file(path);
}

TEST(toml_bool_and_int_coercion) {
  auto path = tmp_path("coerce");
  write_file(path,
    "[b]\n"
    "a = true\n"
    "b = FALSE\n"
    "c = 1\n"
    "d = junk\n"
    "[n]\n"
    "neg = -7\n"
    "str = hello\n"
  );
  rcpu::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b", true), false);
  ASSERT_EQ(tr.get_bool("b", "c"), true);
  ASSERT_EQ(tr.get_bool("b", "d", true), true);
  ASSERT_EQ(tr.get_bool("b", "d", false), false);
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  remove_file(path);
}

TEST(toml_reports_malformed_lines) {
  auto path = tmp_path("bad");
  write_file(path,
    "[sampling\n"
    "interval_ms = 250\n"
    "just words\n"
    "= 5\n"
  );
  rcpu::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.bad_lines().size(), 3u);
  ASSERT_EQ(tr.bad_lines()[0], 1);
  ASSERT_EQ(tr.bad_lines()[1], 3);
  ASSERT_EQ(tr.bad_lines()[2], 4);
  // key before any valid header lands in the root section
  ASSERT_EQ(tr.get_int("", "interval_ms"), 250);
  remove_file(path);
}
