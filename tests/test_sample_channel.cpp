#include "minitest.hpp"
#include "app/SampleChannel.hpp"
#include <thread>

static rcpu::model::UtilizationSample sample_with(double naive) {
  rcpu::model::UtilizationSample s{};
  s.naive_usage_pct = naive;
  return s;
}

TEST(channel_fifo_and_drop_when_full) {
  rcpu::app::SampleChannel ch(3);
  ASSERT_EQ(ch.capacity(), 3u);
  ASSERT_TRUE(ch.try_push(sample_with(1)));
  ASSERT_TRUE(ch.try_push(sample_with(2)));
  ASSERT_TRUE(ch.try_push(sample_with(3)));
  ASSERT_TRUE(!ch.try_push(sample_with(4)));
  ASSERT_EQ(ch.dropped(), 1u);
  ASSERT_EQ(ch.size(), 3u);
  rcpu::model::UtilizationSample out{};
  ASSERT_TRUE(ch.try_pop(out)); ASSERT_EQ(out.naive_usage_pct, 1.0);
  ASSERT_TRUE(ch.try_push(sample_with(5)));
  ASSERT_TRUE(ch.try_pop(out)); ASSERT_EQ(out.naive_usage_pct, 2.0);
  ASSERT_TRUE(ch.try_pop(out)); ASSERT_EQ(out.naive_usage_pct, 3.0);
  ASSERT_TRUE(ch.try_pop(out)); ASSERT_EQ(out.naive_usage_pct, 5.0);
  ASSERT_TRUE(!ch.try_pop(out));
}

TEST(channel_spsc_threads_preserve_order) {
  rcpu::app::SampleChannel ch(8);
  constexpr int kCount = 20000;
  std::thread producer([&]{
    for (int i = 0; i < kCount; ++i) {
      while (!ch.try_push(sample_with(i))) std::this_thread::yield();
    }
  });
  int expected = 0;
  rcpu::model::UtilizationSample out{};
  while (expected < kCount) {
    if (ch.try_pop(out)) {
      ASSERT_EQ(out.naive_usage_pct, static_cast<double>(expected));
      ++expected;
    } else {
      std::this_thread::yield();
    }
  }
  producer.join();
  ASSERT_EQ(expected, kCount);
}
