#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <thread>
#include <vector>
#include "collectors/ICounterSampler.hpp"
#include "model/Cpu.hpp"

namespace rcpu::app {

enum class LoopState { AwaitingBaseline, Steady };

enum class TickResult { Baseline, Emitted, SkippedIo, SkippedIntegrity, SkippedDegenerate };

struct LoopOptions {
  std::chrono::milliseconds interval{1000};
  // Drop the whole tick when any CPU fails to pair. When false the
  // estimators run over the CPUs that did pair.
  bool skip_on_integrity_error{true};
  bool quiet{false};
};

struct LoopStats {
  uint64_t ticks{};
  uint64_t emitted{};
  uint64_t skipped_io{};
  uint64_t skipped_integrity{};
  uint64_t skipped_degenerate{};
  uint64_t coalesced{}; // wakeups skipped because a tick overran the interval
};

using SampleSink = std::function<void(const rcpu::model::UtilizationSample&)>;

// Fixed-interval driver: sample, pair with the previous set, estimate, emit.
// The first successful sample only establishes the baseline.
class SamplingLoop {
public:
  SamplingLoop(rcpu::collectors::ICounterSampler& sampler, rcpu::model::CoreTopology topology,
               SampleSink sink, LoopOptions opts = {});
  ~SamplingLoop();
  SamplingLoop(const SamplingLoop&) = delete;
  SamplingLoop& operator=(const SamplingLoop&) = delete;

  // One pipeline pass on the calling thread. Not to be mixed with start().
  TickResult tick();

  // Run ticks on a background thread until stop(). A stop request is
  // observed between ticks, never inside one.
  void start();
  void stop();

  LoopState state() const { return state_.load(std::memory_order_acquire); }
  LoopStats stats() const;

private:
  void run(std::stop_token st);
  void note(const char* fmt, ...) const;

  rcpu::collectors::ICounterSampler& sampler_;
  rcpu::model::CoreTopology topology_;
  SampleSink sink_;
  LoopOptions opts_;
  std::vector<rcpu::model::CounterSnapshot> previous_;
  std::atomic<LoopState> state_{LoopState::AwaitingBaseline};
  std::atomic<uint64_t> ticks_{0}, emitted_{0}, skipped_io_{0}, skipped_integrity_{0},
                        skipped_degenerate_{0}, coalesced_{0};
  std::jthread thread_{};
};

} // namespace rcpu::app
