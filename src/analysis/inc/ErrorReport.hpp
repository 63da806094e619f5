#ifndef IFSCAN_ANALYSIS_ERROR_REPORT_HPP
#define IFSCAN_ANALYSIS_ERROR_REPORT_HPP
/**
 * @file ErrorReport.hpp
 * @brief End-to-end interface error report: extract, filter, rank, aggregate.
 * @note Thread-safe: All functions are stateless.
 *
 * The report is pure data. Rendering (tables, JSON) is left to the caller.
 * A source that cannot be loaded yields an empty report carrying the status.
 */

#include "src/analysis/inc/ErrorRanking.hpp"
#include "src/analysis/inc/FleetTotals.hpp"
#include "src/analysis/inc/InterfaceCounters.hpp"
#include "src/analysis/inc/InterfaceMetrics.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ifscan {

namespace analysis {

/* ----------------------------- ReportConfig ----------------------------- */

/**
 * @brief View sizes for a report.
 */
struct ReportConfig {
  std::size_t topErrorCount{DEFAULT_TOP_ERROR_COUNT};              ///< Top error+CRC entries
  std::size_t topOutputErrorCount{DEFAULT_TOP_OUTPUT_ERROR_COUNT}; ///< Top output-error entries
};

/* ----------------------------- ErrorReport ----------------------------- */

/**
 * @brief All report views and totals for one input.
 */
struct ErrorReport {
  SourceStatus status{SourceStatus::OK}; ///< Load/parse outcome
  int sysErrno{0};                       ///< errno behind a load failure
  std::string detail;                    ///< Parse failure description

  std::size_t rawCount{0};         ///< Interfaces found in the text
  std::size_t droppedNoTraffic{0}; ///< Removed: no packets
  std::size_t droppedLowRate{0};   ///< Removed: below MIN_RATE_PPS

  std::vector<InterfaceMetrics> interfaces;     ///< Analyzed interfaces, extraction order
  std::vector<RankedInterface> topErrorCrc;     ///< Top error+CRC view
  std::vector<RankedInterface> topOutputErrors; ///< Top output-error view
  std::vector<RankedInterface> complete;        ///< Complete ranked view
  FleetTotals totals{};                         ///< Network-wide totals

  /// @brief True if no interface survived (or nothing was loaded).
  [[nodiscard]] bool empty() const noexcept { return interfaces.empty(); }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Build the report from already-extracted counters.
 * @param records Extracted counters.
 * @param config View sizes.
 */
[[nodiscard]] ErrorReport assembleErrorReport(const std::vector<InterfaceCounters>& records,
                                              const ReportConfig& config = {});

/**
 * @brief Build the report from raw "show interface" text.
 * @param text Whole device output.
 * @param config View sizes.
 * @return Report; empty with SOURCE_UNREADABLE if parsing raised.
 */
[[nodiscard]] ErrorReport buildErrorReport(std::string_view text,
                                           const ReportConfig& config = {}) noexcept;

/**
 * @brief Load a file and build the report.
 * @param path Input file path.
 * @param config View sizes.
 * @return Report; empty with a failure status if the file could not be used.
 */
[[nodiscard]] ErrorReport loadErrorReport(const char* path,
                                          const ReportConfig& config = {}) noexcept;

} // namespace analysis

} // namespace ifscan

#endif // IFSCAN_ANALYSIS_ERROR_REPORT_HPP
