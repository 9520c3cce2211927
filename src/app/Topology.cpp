#include "app/Topology.hpp"

#include <map>
#include <utility>

namespace rcpu::app {

using rcpu::util::Errc;

Errc build_core_topology(const std::vector<rcpu::model::CpuInfo>& infos, rcpu::model::CoreTopology& out,
                         std::string& why) {
  if (infos.empty()) { why = "no logical CPUs"; return Errc::Configuration; }
  rcpu::model::CoreTopology t{};
  std::map<rcpu::model::PhysicalCoreId, std::vector<rcpu::model::LogicalCpuId>> grouped;
  for (const auto& info : infos) {
    if (!t.cpu_to_core.emplace(info.cpu, info.core).second) {
      why = "CPU " + std::to_string(info.cpu) + " listed twice";
      return Errc::Configuration;
    }
    grouped[info.core].push_back(info.cpu);
  }
  for (const auto& [core, cpus] : grouped) {
    if (cpus.size() != 2) {
      why = "core " + std::to_string(core) + " has " + std::to_string(cpus.size()) + " CPUs, expected 2";
      return Errc::Configuration;
    }
    t.core_to_cpus.emplace(core, std::array<rcpu::model::LogicalCpuId, 2>{cpus[0], cpus[1]});
  }
  t.cpus = infos;
  out = std::move(t);
  return Errc::Ok;
}

} // namespace rcpu::app
