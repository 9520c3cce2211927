#pragma once
#include <string>
#include <string_view>
#include <utility>
#include "collectors/ICounterSampler.hpp"

namespace rcpu::collectors {

class ProcStatSampler : public ICounterSampler {
public:
  explicit ProcStatSampler(std::string path = "/proc/stat") : path_(std::move(path)) {}
  [[nodiscard]] rcpu::util::Errc sample(std::vector<rcpu::model::CounterSnapshot>& out) override;
  [[nodiscard]] const char* name() const override { return "procstat"; }

  // Parse one "cpuN ..." line. Returns false for the aggregate line,
  // non-cpu lines, and lines with fewer than ten valid counters.
  static bool parse_cpu_line(std::string_view line, rcpu::model::CounterSnapshot& out);

private:
  std::string path_;
};

} // namespace rcpu::collectors
