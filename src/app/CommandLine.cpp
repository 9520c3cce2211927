#include "app/CommandLine.hpp"

#include <charconv>
#include <cstring>
#include <utility>

namespace rcpu::app {

using rcpu::util::Errc;

// Whole-string decimal, at least 1
static bool parse_positive(const char* s, int& out) {
  const char* e = s + std::strlen(s);
  int v = 0;
  auto [ptr, ec] = std::from_chars(s, e, v);
  if (ec != std::errc() || ptr != e || v < 1) return false;
  out = v;
  return true;
}

Errc parse_command_line(int argc, const char* const* argv, CliOptions& out, std::string& why) {
  CliOptions o{};
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    const bool has_value = i + 1 < argc;
    if (a == "--config") {
      if (!has_value) { why = "--config needs a path"; return Errc::Configuration; }
      o.config_path = argv[++i];
    } else if (a == "--interval-ms" || a == "--iterations") {
      if (!has_value) { why = a + " needs a value"; return Errc::Configuration; }
      int& dst = (a == "--interval-ms") ? o.interval_ms : o.iterations;
      if (!parse_positive(argv[++i], dst)) {
        why = "invalid value for " + a + ": " + argv[i] + " (expected a positive integer)";
        return Errc::Configuration;
      }
    }
    else if (a == "--no-gate") o.no_gate = true;
    else if (a == "--plain") o.plain = true;
    else if (a == "-h" || a == "--help") o.help = true;
    else { why = "unknown argument: " + a; return Errc::Configuration; }
  }
  out = std::move(o);
  return Errc::Ok;
}

} // namespace rcpu::app
