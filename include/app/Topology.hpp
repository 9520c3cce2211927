#pragma once
#include <string>
#include <vector>
#include "model/Cpu.hpp"
#include "util/Errc.hpp"

namespace rcpu::app {

// Validate a CPU placement list for 2-way SMT and index it both ways.
// Errc::Configuration (with why filled) on an empty list, a repeated
// logical CPU id, or any core without exactly two logical CPUs.
[[nodiscard]] rcpu::util::Errc build_core_topology(const std::vector<rcpu::model::CpuInfo>& infos,
                                                   rcpu::model::CoreTopology& out, std::string& why);

} // namespace rcpu::app
