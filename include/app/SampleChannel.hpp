#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "model/Cpu.hpp"

namespace rcpu::app {

// Bounded lock-free single-producer/single-consumer queue of samples.
// Samples are copied in and out; the producer never blocks and drops
// the new sample when the queue is full.
class SampleChannel {
public:
  explicit SampleChannel(size_t capacity = 64);
  SampleChannel(const SampleChannel&) = delete;
  SampleChannel& operator=(const SampleChannel&) = delete;

  // Producer side only.
  bool try_push(const rcpu::model::UtilizationSample& s);
  // Consumer side only.
  bool try_pop(rcpu::model::UtilizationSample& out);

  size_t capacity() const { return slots_.size(); }
  size_t size() const;
  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
  std::vector<rcpu::model::UtilizationSample> slots_;
  alignas(64) std::atomic<uint64_t> head_{0}; // next write, owned by producer
  alignas(64) std::atomic<uint64_t> tail_{0}; // next read, owned by consumer
  std::atomic<uint64_t> dropped_{0};
};

} // namespace rcpu::app
