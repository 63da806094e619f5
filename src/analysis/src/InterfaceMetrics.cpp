/**
 * @file InterfaceMetrics.cpp
 * @brief Implementation of traffic filtering and error ratios.
 */

#include "src/analysis/inc/InterfaceMetrics.hpp"

#include <fmt/core.h>

namespace ifscan {

namespace analysis {

/* ----------------------------- InterfaceMetrics Methods ----------------------------- */

std::string InterfaceMetrics::toString() const {
  std::string out;
  out += fmt::format("{}: {} pkts, (E+CRC)={:.6f}% err={:.6f}% crc={:.6f}%", counters.name,
                     totalPackets, errorCrcRatio, errorRatio, crcRatio);
  if (hasOutputErrors()) {
    out += fmt::format(" out_err={:.6f}%", outputErrorRatio);
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

double percentRatio(std::uint64_t numerator, std::uint64_t denominator) noexcept {
  if (denominator == 0) {
    return 0.0;
  }
  return (static_cast<double>(numerator) / static_cast<double>(denominator)) * 100.0;
}

bool passesTrafficFilter(const InterfaceCounters& counters) noexcept {
  return counters.totalPackets() > 0 && counters.maxRate() >= MIN_RATE_PPS;
}

InterfaceMetrics computeMetrics(const InterfaceCounters& counters) {
  InterfaceMetrics m{};
  m.counters = counters;
  m.totalPackets = counters.totalPackets();
  m.errorCrcRatio = percentRatio(counters.errorCrcSum(), counters.inputPackets);
  m.errorRatio = percentRatio(counters.inputErrors, counters.inputPackets);
  m.crcRatio = percentRatio(counters.crcErrors, counters.inputPackets);
  m.outputErrorRatio = percentRatio(counters.outputErrors, counters.outputPackets);
  return m;
}

MetricsResult computeInterfaceMetrics(const std::vector<InterfaceCounters>& records) {
  MetricsResult result{};
  result.rawCount = records.size();
  result.interfaces.reserve(records.size());

  for (const InterfaceCounters& C : records) {
    // Never carried traffic (admin down or unused port)
    if (C.totalPackets() == 0) {
      ++result.droppedNoTraffic;
      continue;
    }

    // Test port: too little traffic for a meaningful ratio
    if (C.maxRate() < MIN_RATE_PPS) {
      ++result.droppedLowRate;
      continue;
    }

    result.interfaces.push_back(computeMetrics(C));
  }

  return result;
}

} // namespace analysis

} // namespace ifscan
