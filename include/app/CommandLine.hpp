#pragma once
#include <string>
#include "util/Errc.hpp"

namespace rcpu::app {

struct CliOptions {
  std::string config_path;
  int interval_ms{0};  // 0 => from config
  int iterations{0};   // 0 => run until Ctrl+C
  bool no_gate{false};
  bool plain{false};
  bool help{false};
};

// Parse argv[1..]. Errc::Configuration with why filled on an unknown
// flag, a missing value, or a value that is not a positive integer.
[[nodiscard]] rcpu::util::Errc parse_command_line(int argc, const char* const* argv,
                                                  CliOptions& out, std::string& why);

} // namespace rcpu::app
