#ifndef IFSCAN_ANALYSIS_INTERFACE_METRICS_HPP
#define IFSCAN_ANALYSIS_INTERFACE_METRICS_HPP
/**
 * @file InterfaceMetrics.hpp
 * @brief Traffic filtering and derived error ratios per interface.
 * @note Thread-safe: All functions are pure.
 *
 * Only interfaces that carried traffic (totalPackets > 0) and run at or above
 * MIN_RATE_PPS in either direction produce metrics. Everything below the rate
 * threshold is treated as a test port.
 */

#include "src/analysis/inc/InterfaceCounters.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ifscan {

namespace analysis {

/* ----------------------------- Constants ----------------------------- */

/// Minimum 5 minute rate (packets/sec, either direction) for an interface to be analyzed.
inline constexpr std::uint64_t MIN_RATE_PPS = 100'000;

/* ----------------------------- InterfaceMetrics ----------------------------- */

/**
 * @brief Raw counters plus derived ratios for one analyzed interface.
 *
 * Ratios are percentages. Input ratios use inputPackets as denominator and
 * the output ratio uses outputPackets; a zero denominator yields 0.
 */
struct InterfaceMetrics {
  InterfaceCounters counters{}; ///< Source counters

  std::uint64_t totalPackets{0}; ///< inputPackets + outputPackets
  double errorCrcRatio{0.0};     ///< (inputErrors + crcErrors) / inputPackets * 100
  double errorRatio{0.0};        ///< inputErrors / inputPackets * 100
  double crcRatio{0.0};          ///< crcErrors / inputPackets * 100
  double outputErrorRatio{0.0};  ///< outputErrors / outputPackets * 100

  /// @brief Interface name.
  [[nodiscard]] const std::string& name() const noexcept { return counters.name; }

  /// @brief True if any input error or CRC error was counted.
  [[nodiscard]] bool hasErrorCrc() const noexcept { return errorCrcRatio > 0.0; }

  /// @brief True if any output error was counted.
  [[nodiscard]] bool hasOutputErrors() const noexcept { return outputErrorRatio > 0.0; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- MetricsResult ----------------------------- */

/**
 * @brief Filtered metrics plus a tally of what the filters removed.
 */
struct MetricsResult {
  std::vector<InterfaceMetrics> interfaces; ///< Survivors, in extraction order
  std::size_t rawCount{0};                  ///< Records examined
  std::size_t droppedNoTraffic{0};          ///< Removed: totalPackets == 0
  std::size_t droppedLowRate{0};            ///< Removed: maxRate < MIN_RATE_PPS
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Percentage with a zero-denominator guard.
 * @return numerator / denominator * 100, or 0 when denominator is 0.
 */
[[nodiscard]] double percentRatio(std::uint64_t numerator, std::uint64_t denominator) noexcept;

/**
 * @brief Check both inclusion filters.
 * @return true if totalPackets > 0 and maxRate >= MIN_RATE_PPS.
 */
[[nodiscard]] bool passesTrafficFilter(const InterfaceCounters& counters) noexcept;

/**
 * @brief Derive ratios for one record without filtering.
 * @param counters Source counters (copied into the result).
 */
[[nodiscard]] InterfaceMetrics computeMetrics(const InterfaceCounters& counters);

/**
 * @brief Filter records and derive ratios for the survivors.
 * @param records Extracted counters.
 * @return Surviving metrics in input order, plus filter tallies.
 */
[[nodiscard]] MetricsResult computeInterfaceMetrics(const std::vector<InterfaceCounters>& records);

} // namespace analysis

} // namespace ifscan

#endif // IFSCAN_ANALYSIS_INTERFACE_METRICS_HPP
