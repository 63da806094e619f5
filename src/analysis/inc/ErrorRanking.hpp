#ifndef IFSCAN_ANALYSIS_ERROR_RANKING_HPP
#define IFSCAN_ANALYSIS_ERROR_RANKING_HPP
/**
 * @file ErrorRanking.hpp
 * @brief Ranked report views and severity classification.
 * @note Thread-safe: All functions are pure; inputs are never modified.
 *
 * Three views over the same metrics sequence:
 *  - rankTopErrorCrc(): worst inbound offenders (errorCrcRatio > 0), top N
 *  - rankTopOutputErrors(): worst outbound offenders (outputErrorRatio > 0), top N
 *  - rankComplete(): every analyzed interface
 *
 * Sorting is a stable descending sort, so equal ratios keep the order of the
 * input sequence (extraction order when fed from computeInterfaceMetrics()).
 *
 * The top views grade with classifyTopSeverity(); the complete view grades with
 * the tighter classifySweepSeverity() cutoffs.
 */

#include "src/analysis/inc/InterfaceMetrics.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ifscan {

namespace analysis {

/* ----------------------------- Constants ----------------------------- */

/// Default number of entries in the top error+CRC view.
inline constexpr std::size_t DEFAULT_TOP_ERROR_COUNT = 10;

/// Default number of entries in the top output-error view.
inline constexpr std::size_t DEFAULT_TOP_OUTPUT_ERROR_COUNT = 5;

/* ----------------------------- SeverityTier ----------------------------- */

/**
 * @brief Coarse health classification of a ratio.
 */
enum class SeverityTier : std::uint8_t {
  CRITICAL = 0,
  HIGH,
  MEDIUM,
  LOW,
  GOOD, ///< Only produced by the complete view (no errors at all)
};

/**
 * @brief Human-readable tier name ("CRITICAL", "HIGH", ...).
 */
[[nodiscard]] const char* toString(SeverityTier tier) noexcept;

/**
 * @brief Tier for the top views.
 *
 * > 1.0 CRITICAL, > 0.1 HIGH, > 0.01 MEDIUM, otherwise LOW.
 *
 * @param ratioPercent Ratio in percent.
 */
[[nodiscard]] SeverityTier classifyTopSeverity(double ratioPercent) noexcept;

/**
 * @brief Tier for the complete view.
 *
 * > 0.1 CRITICAL, > 0.01 HIGH, > 0.001 MEDIUM, otherwise LOW if any input or
 * CRC error was counted, GOOD if none.
 *
 * @param errorCrcRatio Error+CRC ratio in percent.
 * @param errorCrcSum inputErrors + crcErrors.
 */
[[nodiscard]] SeverityTier classifySweepSeverity(double errorCrcRatio,
                                                 std::uint64_t errorCrcSum) noexcept;

/* ----------------------------- RankedInterface ----------------------------- */

/**
 * @brief One row of a report view.
 */
struct RankedInterface {
  std::size_t rank{0};                       ///< 1-based position in the view
  SeverityTier severity{SeverityTier::GOOD}; ///< Tier under the view's cutoffs
  InterfaceMetrics metrics{};                ///< Ranked interface

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Top interfaces by error+CRC ratio.
 * @param metrics Analyzed interfaces.
 * @param limit Maximum entries returned.
 * @return Entries with errorCrcRatio > 0, descending, graded by classifyTopSeverity().
 */
[[nodiscard]] std::vector<RankedInterface>
rankTopErrorCrc(const std::vector<InterfaceMetrics>& metrics,
                std::size_t limit = DEFAULT_TOP_ERROR_COUNT);

/**
 * @brief Top interfaces by output error ratio.
 * @param metrics Analyzed interfaces.
 * @param limit Maximum entries returned.
 * @return Entries with outputErrorRatio > 0, descending, graded by classifyTopSeverity().
 */
[[nodiscard]] std::vector<RankedInterface>
rankTopOutputErrors(const std::vector<InterfaceMetrics>& metrics,
                    std::size_t limit = DEFAULT_TOP_OUTPUT_ERROR_COUNT);

/**
 * @brief All interfaces by error+CRC ratio.
 * @param metrics Analyzed interfaces.
 * @return Every entry, descending, graded by classifySweepSeverity().
 */
[[nodiscard]] std::vector<RankedInterface>
rankComplete(const std::vector<InterfaceMetrics>& metrics);

} // namespace analysis

} // namespace ifscan

#endif // IFSCAN_ANALYSIS_ERROR_RANKING_HPP
