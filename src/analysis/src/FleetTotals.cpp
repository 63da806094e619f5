/**
 * @file FleetTotals.cpp
 * @brief Implementation of network-wide totals.
 */

#include "src/analysis/inc/FleetTotals.hpp"

#include <fmt/core.h>

namespace ifscan {

namespace analysis {

/* ----------------------------- FleetTotals Methods ----------------------------- */

double FleetTotals::issuePercent() const noexcept {
  return percentRatio(withIssuesCount, analyzedCount);
}

std::string FleetTotals::toString() const {
  std::string out;
  out += fmt::format("Interfaces: {} analyzed, {} with error/CRC issues ({:.1f}%)\n",
                     analyzedCount, withIssuesCount, issuePercent());
  out += fmt::format("  packets: in={} out={}\n", inputPackets, outputPackets);
  out += fmt::format("  errors: in={} crc={} out={}\n", inputErrors, crcErrors, outputErrors);
  out += fmt::format("  drops: in={} out={}\n", inputDrops, outputDrops);
  out += fmt::format("  overall (E+CRC)/input: {:.6f}%\n", overallErrorCrcRatio);
  return out;
}

/* ----------------------------- API ----------------------------- */

FleetTotals computeFleetTotals(const std::vector<InterfaceMetrics>& metrics) noexcept {
  FleetTotals totals{};

  for (const InterfaceMetrics& M : metrics) {
    const InterfaceCounters& C = M.counters;
    totals.inputPackets = saturatingAdd(totals.inputPackets, C.inputPackets);
    totals.outputPackets = saturatingAdd(totals.outputPackets, C.outputPackets);
    totals.inputErrors = saturatingAdd(totals.inputErrors, C.inputErrors);
    totals.crcErrors = saturatingAdd(totals.crcErrors, C.crcErrors);
    totals.outputErrors = saturatingAdd(totals.outputErrors, C.outputErrors);
    totals.inputDrops = saturatingAdd(totals.inputDrops, C.inputDrops);
    totals.outputDrops = saturatingAdd(totals.outputDrops, C.outputDrops);

    if (M.hasErrorCrc()) {
      ++totals.withIssuesCount;
    }
    if (M.hasOutputErrors()) {
      ++totals.withOutputErrorsCount;
    }
  }

  totals.analyzedCount = metrics.size();
  totals.overallErrorCrcRatio =
      percentRatio(saturatingAdd(totals.inputErrors, totals.crcErrors), totals.inputPackets);
  return totals;
}

} // namespace analysis

} // namespace ifscan
