#include "minitest.hpp"
#include "collectors/ProcStatSampler.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using rcpu::model::CounterSnapshot;
using rcpu::util::Errc;

static fs::path make_root_stat(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("rcpu_test_stat_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  return root;
}

TEST(procstat_line_subtracts_guest) {
  CounterSnapshot s{};
  ASSERT_TRUE(rcpu::collectors::ProcStatSampler::parse_cpu_line(
      "cpu3 1000 300 200 5000 40 5 6 7 100 20", s));
  ASSERT_EQ(s.cpu_id, 3);
  ASSERT_EQ(s.user, 900u);
  ASSERT_EQ(s.nice, 280u);
  ASSERT_EQ(s.system, 200u);
  ASSERT_EQ(s.idle, 5000u);
  ASSERT_EQ(s.iowait, 40u);
  ASSERT_EQ(s.irq, 5u);
  ASSERT_EQ(s.softirq, 6u);
  ASSERT_EQ(s.steal, 7u);
  ASSERT_EQ(s.guest, 100u);
  ASSERT_EQ(s.guest_nice, 20u);
}

TEST(procstat_line_rejects_aggregate_and_short_lines) {
  CounterSnapshot s{};
  ASSERT_TRUE(!rcpu::collectors::ProcStatSampler::parse_cpu_line("cpu  1 2 3 4 5 6 7 8 9 10", s));
  ASSERT_TRUE(!rcpu::collectors::ProcStatSampler::parse_cpu_line("cpu0 1 2 3 4 5 6 7 8", s));
  ASSERT_TRUE(!rcpu::collectors::ProcStatSampler::parse_cpu_line("intr 1 2 3 4 5 6 7 8 9 10", s));
  ASSERT_TRUE(!rcpu::collectors::ProcStatSampler::parse_cpu_line("cpu1 1 2 x 4 5 6 7 8 9 10", s));
  ASSERT_TRUE(!rcpu::collectors::ProcStatSampler::parse_cpu_line("cpufoo 1 2 3 4 5 6 7 8 9 10", s));
}

TEST(procstat_line_rejects_out_of_range_cpu_label) {
  CounterSnapshot s{};
  s.cpu_id = 7;
  ASSERT_TRUE(!rcpu::collectors::ProcStatSampler::parse_cpu_line("cpu99999999999 1 2 3 4 5 6 7 8 0 0", s));
  ASSERT_EQ(s.cpu_id, 7);
  ASSERT_TRUE(rcpu::collectors::ProcStatSampler::parse_cpu_line("cpu2147483647 1 2 3 4 5 6 7 8 0 0", s));
  ASSERT_EQ(s.cpu_id, 2147483647);
}

TEST(procstat_sampler_reads_per_cpu_records) {
  auto root = make_root_stat("ok");
  std::ofstream(root / "proc/stat") <<
    "cpu  4000 0 400 20000 0 0 0 0 200 0\n"
    "cpu1 1000 0 100 5000 0 0 0 0 50 0\n"
    "cpu0 1000 0 100 5000 0 0 0 0 100 0\n"
    "intr 12345 0 0\n"
    "ctxt 99999\n";
  setenv("RCPU_PROC_ROOT", root.c_str(), 1);
  rcpu::collectors::ProcStatSampler sampler;
  std::vector<CounterSnapshot> out;
  auto ec = sampler.sample(out);
  unsetenv("RCPU_PROC_ROOT");
  ASSERT_TRUE(ec == Errc::Ok);
  ASSERT_EQ(out.size(), 2u);
  ASSERT_EQ(out[0].cpu_id, 0);
  ASSERT_EQ(out[0].user, 900u);
  ASSERT_EQ(out[1].cpu_id, 1);
  ASSERT_EQ(out[1].user, 950u);
  ASSERT_TRUE(out[0].collected_at == out[1].collected_at);
  fs::remove_all(root);
}

TEST(procstat_sampler_missing_file_is_io) {
  auto root = make_root_stat("missing");
  setenv("RCPU_PROC_ROOT", root.c_str(), 1);
  rcpu::collectors::ProcStatSampler sampler;
  std::vector<CounterSnapshot> out{CounterSnapshot{}};
  auto ec = sampler.sample(out);
  unsetenv("RCPU_PROC_ROOT");
  ASSERT_TRUE(ec == Errc::Io);
  ASSERT_EQ(out.size(), 1u);
  fs::remove_all(root);
}

TEST(procstat_sampler_no_cpu_lines_is_empty_data) {
  auto root = make_root_stat("empty");
  std::ofstream(root / "proc/stat") << "cpu  4000 0 400 20000 0 0 0 0 200 0\nintr 1\n";
  setenv("RCPU_PROC_ROOT", root.c_str(), 1);
  rcpu::collectors::ProcStatSampler sampler;
  std::vector<CounterSnapshot> out;
  auto ec = sampler.sample(out);
  unsetenv("RCPU_PROC_ROOT");
  ASSERT_TRUE(ec == Errc::EmptyData);
  ASSERT_TRUE(out.empty());
  fs::remove_all(root);
}
