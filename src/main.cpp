#include "app/CommandLine.hpp"
#include "app/Config.hpp"
#include "app/SampleChannel.hpp"
#include "app/SamplingLoop.hpp"
#include "app/Topology.hpp"
#include "collectors/CapabilityGate.hpp"
#include "collectors/ProcStatSampler.hpp"
#include "collectors/TopologyReader.hpp"
#include "ui/TableRenderer.hpp"
#include "ui/Terminal.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace rcpu;

static void print_usage(std::ostream& os) {
  os << "Usage: rcpu [--config PATH] [--interval-ms MS] [--iterations N] [--no-gate] [--plain]\n";
  os << "Notes: prints average vs SMT-adjusted CPU usage every interval until Ctrl+C.\n";
}

int main(int argc, char** argv) {
  std::signal(SIGINT, ui::on_stop_signal);
  std::signal(SIGTERM, ui::on_stop_signal);

  app::CliOptions cli;
  std::string why;
  if (app::parse_command_line(argc, argv, cli, why) != util::Errc::Ok) {
    std::fprintf(stderr, "rcpu: %s\n", why.c_str());
    print_usage(std::cerr);
    return 2;
  }
  if (cli.help) { print_usage(std::cout); return 0; }
  const std::string& config_path = cli.config_path;
  const int iterations = cli.iterations;

  app::Config cfg = app::load_config(config_path);
  if (!cfg.source_path.empty()) {
    std::fprintf(stderr, "rcpu: Config: loaded %s\n", cfg.source_path.c_str());
    for (int ln : cfg.bad_lines) std::fprintf(stderr, "rcpu: Config: ignoring malformed line %d\n", ln);
  } else if (!config_path.empty()) {
    std::fprintf(stderr, "rcpu: Config: cannot read %s, using defaults\n", config_path.c_str());
  }
  if (cli.interval_ms > 0) cfg.sampling.interval_ms = std::clamp(cli.interval_ms, 50, 60000);

  if (!cli.no_gate) {
    collectors::GateRules rules{cfg.gate.require_intel, cfg.gate.require_smt};
    collectors::CapabilityReport report{};
    if (collectors::check_capabilities(rules, report, why) != util::Errc::Ok) {
      std::fprintf(stderr, "rcpu: fatal: %s\n", why.c_str());
      return 1;
    }
    std::fprintf(stderr, "rcpu: CPU model: %s\n", report.cpu_model.c_str());
    std::fprintf(stderr, "rcpu: SMT is %s\n", report.smt_active ? "enabled" : "disabled");
  }

  std::vector<model::CpuInfo> infos;
  auto ec = collectors::SysfsTopologyReader{}.read(infos, why);
  if (ec != util::Errc::Ok) {
    std::fprintf(stderr, "rcpu: fatal: failed to get CPU topology (%s): %s\n", util::to_string(ec), why.c_str());
    return 1;
  }
  std::fprintf(stderr, "rcpu: CPU infos:\n");
  for (const auto& info : infos) {
    std::fprintf(stderr, "  CPU %d, Core %d, Socket %d, Node %d\n", info.cpu, info.core, info.socket, info.node);
  }
  model::CoreTopology topo;
  if (app::build_core_topology(infos, topo, why) != util::Errc::Ok) {
    std::fprintf(stderr, "rcpu: fatal: %s\n", why.c_str());
    return 1;
  }

  app::SampleChannel channel(static_cast<size_t>(cfg.sampling.channel_capacity));
  collectors::ProcStatSampler sampler;
  app::LoopOptions opts{};
  opts.interval = std::chrono::milliseconds(cfg.sampling.interval_ms);
  opts.skip_on_integrity_error = cfg.sampling.skip_on_integrity_error;
  opts.quiet = cfg.log.quiet;
  app::SamplingLoop loop(sampler, std::move(topo),
                         [&channel](const model::UtilizationSample& s){ (void)channel.try_push(s); }, opts);

  const bool table_mode = !cli.plain && ui::tty_stdout();
  ui::TableStyle style{};
  style.color = cfg.ui.color && table_mode;
  style.unicode = ui::use_unicode();
  style.clear_screen = cfg.ui.clear_screen;
  style.max_rows = cfg.ui.max_rows;
  ui::TableRenderer renderer(style);

  std::fprintf(stderr, "rcpu: Collector is running (interval %dms, %zu cores)\n",
               cfg.sampling.interval_ms, infos.size() / 2);
  std::atexit(&ui::on_atexit_restore);
  ui::CursorGuard cursor{table_mode};
  loop.start();

  int shown = 0;
  model::UtilizationSample s{};
  while (!ui::g_stop.load() && (iterations == 0 || shown < iterations)) {
    while ((iterations == 0 || shown < iterations) && channel.try_pop(s)) {
      renderer.emit(s, stdout, table_mode);
      ++shown;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  loop.stop();

  auto st = loop.stats();
  std::fprintf(stderr,
               "rcpu: stopped: ticks=%llu emitted=%llu skipped(io=%llu integrity=%llu degenerate=%llu) "
               "coalesced=%llu dropped=%llu\n",
               (unsigned long long)st.ticks, (unsigned long long)st.emitted,
               (unsigned long long)st.skipped_io, (unsigned long long)st.skipped_integrity,
               (unsigned long long)st.skipped_degenerate, (unsigned long long)st.coalesced,
               (unsigned long long)channel.dropped());
  return 0;
}
