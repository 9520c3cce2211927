#include "collectors/CapabilityGate.hpp"
#include "util/Procfs.hpp"

#include <sstream>

namespace rcpu::collectors {

using rcpu::util::Errc;

static std::string trim(std::string s) {
  while (!s.empty() && (s.front()==' '||s.front()=='\t')) s.erase(s.begin());
  while (!s.empty() && (s.back()==' '||s.back()=='\t'||s.back()=='\r'||s.back()=='\n')) s.pop_back();
  return s;
}

std::string parse_cpu_model(const std::string& cpuinfo) {
  std::istringstream ss(cpuinfo);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("model name", 0) == 0 || line.rfind("Model Name", 0) == 0 || line.rfind("Hardware", 0) == 0) {
      auto pos = line.find(':');
      if (pos != std::string::npos) return trim(line.substr(pos + 1));
    }
  }
  return {};
}

Errc check_capabilities(const GateRules& rules, CapabilityReport& out, std::string& why) {
  auto info = rcpu::util::read_file_string("/proc/cpuinfo");
  if (!info) { why = "cannot read /proc/cpuinfo"; return Errc::Configuration; }
  out.cpu_model = parse_cpu_model(*info);
  if (out.cpu_model.empty()) { why = "no model name in /proc/cpuinfo"; return Errc::Configuration; }
  if (rules.require_intel && out.cpu_model.find("Intel") == std::string::npos) {
    why = "unsupported CPU model: " + out.cpu_model;
    return Errc::Configuration;
  }

  auto smt = rcpu::util::read_file_string("/sys/devices/system/cpu/smt/active");
  if (!smt) {
    if (rules.require_smt) { why = "cannot read /sys/devices/system/cpu/smt/active"; return Errc::Configuration; }
    out.smt_active = false;
    return Errc::Ok;
  }
  out.smt_active = trim(*smt) == "1";
  if (rules.require_smt && !out.smt_active) {
    why = "SMT is not enabled";
    return Errc::Configuration;
  }
  return Errc::Ok;
}

} // namespace rcpu::collectors
