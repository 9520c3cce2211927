#include "collectors/ProcStatSampler.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <charconv>

namespace rcpu::collectors {

using rcpu::model::CounterSnapshot;
using rcpu::util::Errc;

static uint64_t sat_sub(uint64_t a, uint64_t b) { return a >= b ? a - b : 0; }

bool ProcStatSampler::parse_cpu_line(std::string_view line, CounterSnapshot& out) {
  if (!line.starts_with("cpu")) return false;
  size_t pos = 3;
  size_t label_end = pos;
  while (label_end < line.size() && line[label_end] >= '0' && line[label_end] <= '9') ++label_end;
  // "cpu " is the system-wide total
  if (label_end == pos) return false;
  if (label_end < line.size() && line[label_end] != ' ' && line[label_end] != '\t') return false;
  int id = -1;
  auto [id_end, id_ec] = std::from_chars(line.data() + pos, line.data() + label_end, id);
  if (id_ec != std::errc() || id_end != line.data() + label_end) return false;

  uint64_t vals[10]{}; int n = 0;
  size_t start = label_end;
  while (n < 10 && start < line.size()) {
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t')) ++start;
    if (start >= line.size()) break;
    size_t end = start;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t') ++end;
    auto [ptr, ec] = std::from_chars(line.data() + start, line.data() + end, vals[n]);
    if (ec != std::errc() || ptr != line.data() + end) return false;
    ++n;
    start = end;
  }
  if (n < 10) return false;

  out.cpu_id = id;
  // guest time is also counted in user (and guest_nice in nice)
  out.user = sat_sub(vals[0], vals[8]);
  out.nice = sat_sub(vals[1], vals[9]);
  out.system = vals[2]; out.idle = vals[3]; out.iowait = vals[4];
  out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
  out.guest = vals[8]; out.guest_nice = vals[9];
  return true;
}

Errc ProcStatSampler::sample(std::vector<CounterSnapshot>& out) {
  auto txt_opt = rcpu::util::read_file_string(path_);
  if (!txt_opt) return Errc::Io;
  const auto now = rcpu::model::Clock::now();
  const std::string& txt = *txt_opt;
  std::vector<CounterSnapshot> per;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    CounterSnapshot s{};
    if (parse_cpu_line(line, s)) {
      s.collected_at = now;
      per.push_back(s);
    }
    start = end + 1;
  }
  if (per.empty()) return Errc::EmptyData;
  std::sort(per.begin(), per.end(), [](const CounterSnapshot& a, const CounterSnapshot& b){ return a.cpu_id < b.cpu_id; });
  out = std::move(per);
  return Errc::Ok;
}

} // namespace rcpu::collectors
