#include "app/SamplingLoop.hpp"
#include "app/Estimators.hpp"
#include "app/Period.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <utility>

using namespace std::chrono;

namespace rcpu::app {

using rcpu::util::Errc;

SamplingLoop::SamplingLoop(rcpu::collectors::ICounterSampler& sampler, rcpu::model::CoreTopology topology,
                           SampleSink sink, LoopOptions opts)
    : sampler_(sampler), topology_(std::move(topology)), sink_(std::move(sink)), opts_(opts) {
  if (opts_.interval <= milliseconds(0)) opts_.interval = milliseconds(1000);
}

SamplingLoop::~SamplingLoop() { stop(); }

void SamplingLoop::note(const char* fmt, ...) const {
  if (opts_.quiet) return;
  std::fputs("rcpu: SamplingLoop: ", stderr);
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fputc('\n', stderr);
}

TickResult SamplingLoop::tick() {
  ticks_.fetch_add(1, std::memory_order_relaxed);
  std::vector<rcpu::model::CounterSnapshot> current;
  auto ec = sampler_.sample(current);
  if (ec == Errc::Ok && current.empty()) ec = Errc::EmptyData;
  if (ec != Errc::Ok) {
    // previous stays as-is so the next good sample spans the gap
    skipped_io_.fetch_add(1, std::memory_order_relaxed);
    note("skipped tick: %s sampler failed (%s)", sampler_.name(), rcpu::util::to_string(ec));
    return TickResult::SkippedIo;
  }

  if (state_.load(std::memory_order_relaxed) == LoopState::AwaitingBaseline) {
    previous_ = std::move(current);
    state_.store(LoopState::Steady, std::memory_order_release);
    return TickResult::Baseline;
  }

  rcpu::model::PeriodMap periods;
  std::vector<PairFailure> failures;
  ec = pair_snapshot_sets(previous_, current, periods, &failures);
  if (ec != Errc::Ok) {
    for (const auto& f : failures) {
      note("cpu %d: cannot pair snapshots (%s)", f.cpu_id, rcpu::util::to_string(f.error));
    }
    if (opts_.skip_on_integrity_error) {
      previous_ = std::move(current);
      skipped_integrity_.fetch_add(1, std::memory_order_relaxed);
      note("skipped tick: %zu CPUs failed to pair", failures.size());
      return TickResult::SkippedIntegrity;
    }
  }

  const auto ts = current.front().collected_at;
  previous_ = std::move(current);

  double naive = 0.0, adjusted = 0.0;
  int incomplete_cores = 0;
  auto e_naive = naive_usage(periods, naive);
  auto e_adj = adjusted_usage(periods, topology_, adjusted, &incomplete_cores);
  if (incomplete_cores > 0) {
    // naive and adjusted would cover different CPU sets
    if (opts_.skip_on_integrity_error) {
      skipped_integrity_.fetch_add(1, std::memory_order_relaxed);
      note("skipped tick: %d cores without both sibling periods", incomplete_cores);
      return TickResult::SkippedIntegrity;
    }
    note("%d cores without both sibling periods left out", incomplete_cores);
  }
  if (e_naive != Errc::Ok || e_adj != Errc::Ok) {
    skipped_degenerate_.fetch_add(1, std::memory_order_relaxed);
    note("skipped tick: no elapsed counter time (naive %s, adjusted %s)",
         rcpu::util::to_string(e_naive), rcpu::util::to_string(e_adj));
    return TickResult::SkippedDegenerate;
  }

  rcpu::model::UtilizationSample s{};
  s.timestamp = ts;
  s.naive_usage_pct = naive;
  s.adjusted_usage_pct = adjusted;
  s.naive_remaining_pct = 100.0 - naive;
  s.adjusted_remaining_pct = 100.0 - adjusted;
  s.difference_pct = s.naive_remaining_pct - s.adjusted_remaining_pct;
  if (sink_) sink_(s);
  emitted_.fetch_add(1, std::memory_order_relaxed);
  return TickResult::Emitted;
}

void SamplingLoop::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void SamplingLoop::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

LoopStats SamplingLoop::stats() const {
  LoopStats s{};
  s.ticks = ticks_.load(std::memory_order_relaxed);
  s.emitted = emitted_.load(std::memory_order_relaxed);
  s.skipped_io = skipped_io_.load(std::memory_order_relaxed);
  s.skipped_integrity = skipped_integrity_.load(std::memory_order_relaxed);
  s.skipped_degenerate = skipped_degenerate_.load(std::memory_order_relaxed);
  s.coalesced = coalesced_.load(std::memory_order_relaxed);
  return s;
}

void SamplingLoop::run(std::stop_token st) {
  const auto interval = duration_cast<steady_clock::duration>(opts_.interval);
  auto next_due = steady_clock::now();
  while (!st.stop_requested()) {
    (void)tick();
    next_due += interval;
    auto now = steady_clock::now();
    if (next_due <= now) {
      // overran: drop the missed wakeups instead of catching up
      auto missed = (now - next_due) / interval + 1;
      coalesced_.fetch_add(static_cast<uint64_t>(missed), std::memory_order_relaxed);
      next_due += interval * missed;
    }
    // sleep in short slices so a stop request is seen before the next tick
    while (!st.stop_requested()) {
      auto rem = next_due - steady_clock::now();
      if (rem <= steady_clock::duration::zero()) break;
      std::this_thread::sleep_for(std::min<steady_clock::duration>(rem, 50ms));
    }
  }
}

} // namespace rcpu::app
