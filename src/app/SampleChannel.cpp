#include "app/SampleChannel.hpp"

namespace rcpu::app {

SampleChannel::SampleChannel(size_t capacity) : slots_(capacity > 0 ? capacity : 1) {}

bool SampleChannel::try_push(const rcpu::model::UtilizationSample& s) {
  const uint64_t h = head_.load(std::memory_order_relaxed);
  const uint64_t t = tail_.load(std::memory_order_acquire);
  if (h - t >= slots_.size()) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  slots_[h % slots_.size()] = s;
  head_.store(h + 1, std::memory_order_release);
  return true;
}

bool SampleChannel::try_pop(rcpu::model::UtilizationSample& out) {
  const uint64_t t = tail_.load(std::memory_order_relaxed);
  const uint64_t h = head_.load(std::memory_order_acquire);
  if (t == h) return false;
  out = slots_[t % slots_.size()];
  tail_.store(t + 1, std::memory_order_release);
  return true;
}

size_t SampleChannel::size() const {
  const uint64_t h = head_.load(std::memory_order_acquire);
  const uint64_t t = tail_.load(std::memory_order_acquire);
  return static_cast<size_t>(h - t);
}

} // namespace rcpu::app
