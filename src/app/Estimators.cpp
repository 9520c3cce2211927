#include "app/Estimators.hpp"

#include <algorithm>

namespace rcpu::app {

using rcpu::util::Errc;

static double usage_pct(uint64_t idle, uint64_t total) {
  return 100.0 * (1.0 - static_cast<double>(idle) / static_cast<double>(total));
}

Errc naive_usage(const rcpu::model::PeriodMap& periods, double& out_pct) {
  uint64_t total = 0, idle = 0;
  for (const auto& [cpu, p] : periods) {
    total += p.total;
    idle += p.total_idle;
  }
  if (total == 0) return Errc::Degenerate;
  out_pct = usage_pct(idle, total);
  return Errc::Ok;
}

Errc adjusted_usage(const rcpu::model::PeriodMap& periods, const rcpu::model::CoreTopology& topo,
                    double& out_pct, int* skipped_cores) {
  uint64_t total = 0, idle = 0;
  int skipped = 0;
  for (const auto& [core, cpus] : topo.core_to_cpus) {
    auto ht0 = periods.find(cpus[0]);
    auto ht1 = periods.find(cpus[1]);
    if (ht0 == periods.end() || ht1 == periods.end()) { ++skipped; continue; }
    total += std::max(ht0->second.total, ht1->second.total);
    idle  += std::min(ht0->second.total_idle, ht1->second.total_idle);
  }
  if (skipped_cores) *skipped_cores = skipped;
  if (total == 0) return Errc::Degenerate;
  out_pct = usage_pct(idle, total);
  return Errc::Ok;
}

} // namespace rcpu::app
