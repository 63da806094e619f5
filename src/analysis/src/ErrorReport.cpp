/**
 * @file ErrorReport.cpp
 * @brief Implementation of the end-to-end error report.
 */

#include "src/analysis/inc/ErrorReport.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <exception>
#include <utility>

#include <fmt/core.h>

namespace ifscan {

namespace analysis {

namespace {

using ifscan::helpers::strings::copyOrClear;

/// Empty report carrying a failure.
ErrorReport failedReport(SourceStatus status, int sysErrno) noexcept {
  ErrorReport report{};
  report.status = status;
  report.sysErrno = sysErrno;
  return report;
}

ErrorReport fromExtraction(ExtractionResult&& extraction, const ReportConfig& config) noexcept {
  if (extraction.status != SourceStatus::OK) {
    ErrorReport report = failedReport(extraction.status, extraction.sysErrno);
    report.detail = std::move(extraction.detail);
    return report;
  }

  try {
    return assembleErrorReport(extraction.interfaces, config);
  } catch (const std::exception& e) {
    ErrorReport report = failedReport(SourceStatus::SOURCE_UNREADABLE, 0);
    copyOrClear(report.detail, e.what());
    return report;
  }
}

} // namespace

/* ----------------------------- ErrorReport Methods ----------------------------- */

std::string ErrorReport::toString() const {
  std::string out;
  if (status != SourceStatus::OK) {
    out += fmt::format("Status: {}", analysis::toString(status));
    if (!detail.empty()) {
      out += fmt::format(" ({})", detail);
    }
    out += '\n';
  }

  out += fmt::format("Parsed: {} interfaces ({} without traffic, {} below {} pps)\n", rawCount,
                     droppedNoTraffic, droppedLowRate, MIN_RATE_PPS);
  out += totals.toString();

  if (!topErrorCrc.empty()) {
    out += "Top error+CRC:\n";
    for (const RankedInterface& ROW : topErrorCrc) {
      out += "  ";
      out += ROW.toString();
      out += '\n';
    }
  }

  if (!topOutputErrors.empty()) {
    out += "Top output errors:\n";
    for (const RankedInterface& ROW : topOutputErrors) {
      out += "  ";
      out += ROW.toString();
      out += '\n';
    }
  }

  return out;
}

/* ----------------------------- API ----------------------------- */

ErrorReport assembleErrorReport(const std::vector<InterfaceCounters>& records,
                                const ReportConfig& config) {
  MetricsResult metrics = computeInterfaceMetrics(records);

  ErrorReport report{};
  report.rawCount = metrics.rawCount;
  report.droppedNoTraffic = metrics.droppedNoTraffic;
  report.droppedLowRate = metrics.droppedLowRate;

  report.topErrorCrc = rankTopErrorCrc(metrics.interfaces, config.topErrorCount);
  report.topOutputErrors = rankTopOutputErrors(metrics.interfaces, config.topOutputErrorCount);
  report.complete = rankComplete(metrics.interfaces);
  report.totals = computeFleetTotals(metrics.interfaces);
  report.interfaces = std::move(metrics.interfaces);

  return report;
}

ErrorReport buildErrorReport(std::string_view text, const ReportConfig& config) noexcept {
  return fromExtraction(extractInterfaceCountersSafe(text), config);
}

ErrorReport loadErrorReport(const char* path, const ReportConfig& config) noexcept {
  return fromExtraction(loadInterfaceCounters(path), config);
}

} // namespace analysis

} // namespace ifscan
