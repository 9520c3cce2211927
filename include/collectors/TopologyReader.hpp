#pragma once
#include <string>
#include <vector>
#include "model/Cpu.hpp"
#include "util/Errc.hpp"

namespace rcpu::collectors {

// Reads logical CPU placement from /sys/devices/system/cpu.
class SysfsTopologyReader {
public:
  // Fills out sorted by (node, socket, core, cpu). Core ids are dense
  // global indices, one per distinct (node, socket, core_id).
  [[nodiscard]] rcpu::util::Errc read(std::vector<rcpu::model::CpuInfo>& out, std::string& why) const;
};

} // namespace rcpu::collectors
