#pragma once
#include <cstdint>
#include <vector>
#include "model/Cpu.hpp"
#include "util/Errc.hpp"

namespace rcpu::app {

// b - a, or 0 when the counter went backwards (reset, wrap, hotplug).
[[nodiscard]] constexpr uint64_t saturating_sub(uint64_t b, uint64_t a) noexcept {
  return b >= a ? b - a : 0;
}

// Build the period between two snapshots of the same logical CPU.
// PairingMismatch if the CPU ids differ, TimeOrder if t2 precedes t1;
// out is untouched on failure.
[[nodiscard]] rcpu::util::Errc make_period(const rcpu::model::CounterSnapshot& t1,
                                           const rcpu::model::CounterSnapshot& t2,
                                           rcpu::model::CpuPeriod& out);

struct PairFailure {
  rcpu::model::LogicalCpuId cpu_id{-1};
  rcpu::util::Errc error{rcpu::util::Errc::Ok};
};

// Pair two snapshot sets by CPU id and compute every period that can be
// computed. A CPU present in only one of the two sets is a PairingMismatch.
// Failed CPUs are reported in failures (when given) and left out of out;
// the first failure is returned, Errc::Ok if none.
[[nodiscard]] rcpu::util::Errc pair_snapshot_sets(const std::vector<rcpu::model::CounterSnapshot>& previous,
                                                  const std::vector<rcpu::model::CounterSnapshot>& current,
                                                  rcpu::model::PeriodMap& out,
                                                  std::vector<PairFailure>* failures = nullptr);

} // namespace rcpu::app
