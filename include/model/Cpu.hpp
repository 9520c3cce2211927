#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace rcpu::model {

using LogicalCpuId = int;
using PhysicalCoreId = int;
using Clock = std::chrono::system_clock;

// Cumulative per-logical-CPU counters from /proc/stat, in clock ticks.
// user and nice are already net of guest and guest_nice.
struct CounterSnapshot {
  LogicalCpuId cpu_id{-1};
  Clock::time_point collected_at{};
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t guest{}, guest_nice{};
  uint64_t total_idle() const { return idle + iowait; }
  uint64_t total_system() const { return system + irq + softirq; }
  uint64_t total_virtual() const { return guest + guest_nice; }
  uint64_t total() const { return user + nice + total_system() + total_idle() + steal + total_virtual(); }
};

// Per-category deltas between two snapshots of one logical CPU.
struct CpuPeriod {
  LogicalCpuId cpu_id{-1};
  Clock::time_point start{};
  Clock::time_point end{};
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t guest{}, guest_nice{};
  uint64_t total_system{};  // system + irq + softirq
  uint64_t total_idle{};    // idle + iowait
  uint64_t total_virtual{}; // guest + guest_nice
  uint64_t total{};
};

using PeriodMap = std::unordered_map<LogicalCpuId, CpuPeriod>;

struct CpuInfo {
  LogicalCpuId cpu{};
  PhysicalCoreId core{};
  int socket{};
  int node{};
};

// Validated 2-way SMT layout; built only through app::build_core_topology.
struct CoreTopology {
  std::vector<CpuInfo> cpus;
  std::unordered_map<LogicalCpuId, PhysicalCoreId> cpu_to_core;
  std::map<PhysicalCoreId, std::array<LogicalCpuId, 2>> core_to_cpus;
};

struct UtilizationSample {
  Clock::time_point timestamp{};
  double naive_usage_pct{};
  double adjusted_usage_pct{};
  double naive_remaining_pct{};
  double adjusted_remaining_pct{};
  double difference_pct{};        // naive_remaining - adjusted_remaining
};

} // namespace rcpu::model
