#ifndef IFSCAN_ANALYSIS_FLEET_TOTALS_HPP
#define IFSCAN_ANALYSIS_FLEET_TOTALS_HPP
/**
 * @file FleetTotals.hpp
 * @brief Network-wide counter totals across analyzed interfaces.
 * @note Thread-safe: Pure computation.
 */

#include "src/analysis/inc/InterfaceMetrics.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ifscan {

namespace analysis {

/* ----------------------------- FleetTotals ----------------------------- */

/**
 * @brief Summed counters and summary ratios over the filtered set.
 */
struct FleetTotals {
  std::uint64_t inputPackets{0};  ///< Sum of inputPackets
  std::uint64_t outputPackets{0}; ///< Sum of outputPackets
  std::uint64_t inputErrors{0};   ///< Sum of inputErrors
  std::uint64_t crcErrors{0};     ///< Sum of crcErrors
  std::uint64_t outputErrors{0};  ///< Sum of outputErrors
  std::uint64_t inputDrops{0};    ///< Sum of inputDrops
  std::uint64_t outputDrops{0};   ///< Sum of outputDrops

  /// (inputErrors + crcErrors) / inputPackets * 100, 0 when inputPackets is 0.
  double overallErrorCrcRatio{0.0};

  std::size_t analyzedCount{0};         ///< Interfaces summed
  std::size_t withIssuesCount{0};       ///< Interfaces with errorCrcRatio > 0
  std::size_t withOutputErrorsCount{0}; ///< Interfaces with outputErrorRatio > 0

  /// @brief Share of analyzed interfaces with error/CRC issues (percent, 0 if none analyzed).
  [[nodiscard]] double issuePercent() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Sum counters across analyzed interfaces.
 * @param metrics Filtered metrics (see computeInterfaceMetrics()).
 * @return Totals; all zero for an empty sequence.
 */
[[nodiscard]] FleetTotals computeFleetTotals(const std::vector<InterfaceMetrics>& metrics) noexcept;

} // namespace analysis

} // namespace ifscan

#endif // IFSCAN_ANALYSIS_FLEET_TOTALS_HPP
