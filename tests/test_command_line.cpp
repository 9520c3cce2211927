#include "minitest.hpp"
#include "app/CommandLine.hpp"
#include <vector>

using rcpu::util::Errc;

static Errc parse(std::vector<const char*> args, rcpu::app::CliOptions& o, std::string& why) {
  args.insert(args.begin(), "rcpu");
  return rcpu::app::parse_command_line(static_cast<int>(args.size()), args.data(), o, why);
}

TEST(cli_defaults_and_flags) {
  rcpu::app::CliOptions o; std::string why;
  ASSERT_TRUE(parse({}, o, why) == Errc::Ok);
  ASSERT_EQ(o.interval_ms, 0);
  ASSERT_EQ(o.iterations, 0);
  ASSERT_TRUE(parse({"--config", "/tmp/x.toml", "--interval-ms", "250", "--iterations", "3", "--no-gate", "--plain"}, o, why) == Errc::Ok);
  ASSERT_EQ(o.config_path, "/tmp/x.toml");
  ASSERT_EQ(o.interval_ms, 250);
  ASSERT_EQ(o.iterations, 3);
  ASSERT_TRUE(o.no_gate && o.plain && !o.help);
  ASSERT_TRUE(parse({"-h"}, o, why) == Errc::Ok);
  ASSERT_TRUE(o.help);
}

TEST(cli_rejects_zero_and_negative_interval) {
  rcpu::app::CliOptions o; std::string why;
  ASSERT_TRUE(parse({"--interval-ms", "0"}, o, why) == Errc::Configuration);
  ASSERT_TRUE(why.find("--interval-ms") != std::string::npos);
  ASSERT_TRUE(parse({"--interval-ms", "-500"}, o, why) == Errc::Configuration);
  ASSERT_TRUE(parse({"--iterations", "0"}, o, why) == Errc::Configuration);
  ASSERT_TRUE(parse({"--iterations", "-1"}, o, why) == Errc::Configuration);
}

TEST(cli_rejects_malformed_values_and_unknown_flags) {
  rcpu::app::CliOptions o; std::string why;
  ASSERT_TRUE(parse({"--interval-ms", "10abc"}, o, why) == Errc::Configuration);
  ASSERT_TRUE(parse({"--interval-ms", "99999999999"}, o, why) == Errc::Configuration);
  ASSERT_TRUE(parse({"--interval-ms"}, o, why) == Errc::Configuration);
  ASSERT_TRUE(parse({"--config"}, o, why) == Errc::Configuration);
  ASSERT_TRUE(parse({"--bogus"}, o, why) == Errc::Configuration);
  ASSERT_EQ(why, "unknown argument: --bogus");
}
