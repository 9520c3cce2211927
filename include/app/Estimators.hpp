#pragma once
#include "model/Cpu.hpp"
#include "util/Errc.hpp"

namespace rcpu::app {

// Conventional average over logical CPUs (top/htop/btop):
// 100 * (1 - sum(idle) / sum(total)). Degenerate when sum(total) == 0.
[[nodiscard]] rcpu::util::Errc naive_usage(const rcpu::model::PeriodMap& periods, double& out_pct);

// SMT-aware usage. Per physical core the window is the larger sibling
// total and the idle time is the smaller sibling idle; both are summed
// over cores before taking 100 * (1 - idle / total).
// Cores missing either sibling in periods are left out and counted in
// skipped_cores when given. Degenerate when the summed window is 0.
[[nodiscard]] rcpu::util::Errc adjusted_usage(const rcpu::model::PeriodMap& periods,
                                              const rcpu::model::CoreTopology& topo,
                                              double& out_pct, int* skipped_cores = nullptr);

} // namespace rcpu::app
