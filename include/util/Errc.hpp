#pragma once

namespace rcpu::util {

// Failure kinds shared by the sampler, estimators and startup checks.
enum class Errc {
  Ok,
  Io,              // counter/topology source unreadable
  EmptyData,       // source readable but held no per-CPU records
  PairingMismatch, // snapshots of different CPUs, or a CPU with no baseline
  TimeOrder,       // second snapshot older than the first
  Degenerate,      // zero total period
  Configuration,   // unsupported host or invalid topology
};

[[nodiscard]] constexpr const char* to_string(Errc e) {
  switch (e) {
    case Errc::Ok: return "ok";
    case Errc::Io: return "io";
    case Errc::EmptyData: return "empty-data";
    case Errc::PairingMismatch: return "pairing-mismatch";
    case Errc::TimeOrder: return "time-order";
    case Errc::Degenerate: return "degenerate";
    case Errc::Configuration: return "configuration";
  }
  return "unknown";
}

[[nodiscard]] constexpr bool is_integrity_error(Errc e) {
  return e == Errc::PairingMismatch || e == Errc::TimeOrder;
}

} // namespace rcpu::util
