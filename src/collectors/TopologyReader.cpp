#include "collectors/TopologyReader.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <charconv>
#include <map>
#include <string>
#include <tuple>
#include <utility>

namespace rcpu::collectors {

using rcpu::model::CpuInfo;
using rcpu::util::Errc;

static constexpr const char* kCpuDir = "/sys/devices/system/cpu";

// "cpu12" -> 12, "cpufreq" / "cpuidle" -> -1
static int parse_index(const std::string& name, const char* prefix) {
  const size_t plen = std::char_traits<char>::length(prefix);
  if (name.size() <= plen || name.compare(0, plen, prefix) != 0) return -1;
  int v = -1;
  auto [ptr, ec] = std::from_chars(name.data() + plen, name.data() + name.size(), v);
  if (ec != std::errc() || ptr != name.data() + name.size()) return -1;
  return v;
}

Errc SysfsTopologyReader::read(std::vector<CpuInfo>& out, std::string& why) const {
  auto entries = rcpu::util::list_dir(kCpuDir);
  if (entries.empty()) {
    why = std::string("cannot list ") + kCpuDir;
    return Errc::Io;
  }
  struct Raw { int cpu, core_id, socket, node; };
  std::vector<Raw> raw;
  for (const auto& name : entries) {
    int cpu = parse_index(name, "cpu");
    if (cpu < 0) continue;
    std::string base = std::string(kCpuDir) + "/" + name;
    auto core_id = rcpu::util::read_file_int(base + "/topology/core_id");
    auto socket = rcpu::util::read_file_int(base + "/topology/physical_package_id");
    // offline CPUs have no topology directory
    if (!core_id || !socket) continue;
    int node = 0;
    for (const auto& sub : rcpu::util::list_dir(base)) {
      int n = parse_index(sub, "node");
      if (n >= 0) { node = n; break; }
    }
    raw.push_back(Raw{cpu, static_cast<int>(*core_id), static_cast<int>(*socket), node});
  }
  if (raw.empty()) {
    why = std::string("no online CPU with topology under ") + kCpuDir;
    return Errc::EmptyData;
  }

  // Dense global core index in (node, socket, core_id) order, as lscpu reports it.
  std::map<std::tuple<int,int,int>, int> core_index;
  for (const auto& r : raw) core_index.emplace(std::make_tuple(r.node, r.socket, r.core_id), 0);
  int next = 0;
  for (auto& kv : core_index) kv.second = next++;

  std::vector<CpuInfo> infos;
  infos.reserve(raw.size());
  for (const auto& r : raw) {
    infos.push_back(CpuInfo{r.cpu, core_index[std::make_tuple(r.node, r.socket, r.core_id)], r.socket, r.node});
  }
  std::sort(infos.begin(), infos.end(), [](const CpuInfo& a, const CpuInfo& b){
    return std::tie(a.node, a.socket, a.core, a.cpu) < std::tie(b.node, b.socket, b.core, b.cpu);
  });
  out = std::move(infos);
  return Errc::Ok;
}

} // namespace rcpu::collectors
