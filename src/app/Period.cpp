#include "app/Period.hpp"

#include <unordered_map>
#include <unordered_set>

namespace rcpu::app {

using rcpu::util::Errc;

Errc make_period(const rcpu::model::CounterSnapshot& t1, const rcpu::model::CounterSnapshot& t2,
                 rcpu::model::CpuPeriod& out) {
  if (t1.cpu_id != t2.cpu_id) return Errc::PairingMismatch;
  if (t2.collected_at < t1.collected_at) return Errc::TimeOrder;

  rcpu::model::CpuPeriod p{};
  p.cpu_id = t1.cpu_id;
  p.start = t1.collected_at;
  p.end = t2.collected_at;
  p.user       = saturating_sub(t2.user, t1.user);
  p.nice       = saturating_sub(t2.nice, t1.nice);
  p.system     = saturating_sub(t2.system, t1.system);
  p.idle       = saturating_sub(t2.idle, t1.idle);
  p.iowait     = saturating_sub(t2.iowait, t1.iowait);
  p.irq        = saturating_sub(t2.irq, t1.irq);
  p.softirq    = saturating_sub(t2.softirq, t1.softirq);
  p.steal      = saturating_sub(t2.steal, t1.steal);
  p.guest      = saturating_sub(t2.guest, t1.guest);
  p.guest_nice = saturating_sub(t2.guest_nice, t1.guest_nice);
  p.total_system  = p.system + p.irq + p.softirq;
  p.total_idle    = p.idle + p.iowait;
  p.total_virtual = p.guest + p.guest_nice;
  p.total = p.user + p.nice + p.total_system + p.total_idle + p.steal + p.total_virtual;
  out = p;
  return Errc::Ok;
}

Errc pair_snapshot_sets(const std::vector<rcpu::model::CounterSnapshot>& previous,
                        const std::vector<rcpu::model::CounterSnapshot>& current,
                        rcpu::model::PeriodMap& out, std::vector<PairFailure>* failures) {
  std::unordered_map<rcpu::model::LogicalCpuId, const rcpu::model::CounterSnapshot*> by_id;
  by_id.reserve(previous.size());
  for (const auto& s : previous) by_id.emplace(s.cpu_id, &s);

  Errc first = Errc::Ok;
  auto fail = [&](rcpu::model::LogicalCpuId id, Errc e) {
    if (first == Errc::Ok) first = e;
    if (failures) failures->push_back(PairFailure{id, e});
  };
  out.clear();
  out.reserve(current.size());
  for (const auto& t2 : current) {
    auto it = by_id.find(t2.cpu_id);
    if (it == by_id.end()) { fail(t2.cpu_id, Errc::PairingMismatch); continue; }
    rcpu::model::CpuPeriod p{};
    auto ec = make_period(*it->second, t2, p);
    if (ec != Errc::Ok) { fail(t2.cpu_id, ec); continue; }
    out.emplace(p.cpu_id, p);
  }
  // CPUs offlined since the previous sample
  std::unordered_set<rcpu::model::LogicalCpuId> seen;
  seen.reserve(current.size());
  for (const auto& t2 : current) seen.insert(t2.cpu_id);
  for (const auto& t1 : previous) {
    if (!seen.count(t1.cpu_id)) fail(t1.cpu_id, Errc::PairingMismatch);
  }
  return first;
}

} // namespace rcpu::app
