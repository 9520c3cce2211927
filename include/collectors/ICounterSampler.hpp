#pragma once
#include <vector>
#include "model/Cpu.hpp"
#include "util/Errc.hpp"

namespace rcpu::collectors {

// Source of per-logical-CPU counter snapshots. The sampling loop only
// depends on this seam so tests can script counter sequences.
class ICounterSampler {
public:
  virtual ~ICounterSampler() = default;

  // Fill out with one snapshot per logical CPU, all sharing one timestamp.
  // out is left unchanged unless Errc::Ok is returned.
  [[nodiscard]] virtual rcpu::util::Errc sample(std::vector<rcpu::model::CounterSnapshot>& out) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace rcpu::collectors
