#pragma once
#include <string>
#include "util/Errc.hpp"

namespace rcpu::collectors {

struct GateRules {
  bool require_intel{true};
  bool require_smt{true};
};

struct CapabilityReport {
  std::string cpu_model;
  bool smt_active{false};
};

// Startup check: processor family and SMT state. Any failure is a
// configuration error; the sampling loop must not start.
[[nodiscard]] rcpu::util::Errc check_capabilities(const GateRules& rules, CapabilityReport& out, std::string& why);

// "model name" (x86) or "Model Name" / "Hardware" (arm) from cpuinfo text.
[[nodiscard]] std::string parse_cpu_model(const std::string& cpuinfo);

} // namespace rcpu::collectors
