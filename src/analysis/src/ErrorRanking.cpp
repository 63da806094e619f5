/**
 * @file ErrorRanking.cpp
 * @brief Implementation of report views and severity tiers.
 */

#include "src/analysis/inc/ErrorRanking.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

namespace ifscan {

namespace analysis {

namespace {

/* ----------------------------- Constants ----------------------------- */

// Top views
constexpr double TOP_CRITICAL = 1.0;
constexpr double TOP_HIGH = 0.1;
constexpr double TOP_MEDIUM = 0.01;

// Complete view
constexpr double SWEEP_CRITICAL = 0.1;
constexpr double SWEEP_HIGH = 0.01;
constexpr double SWEEP_MEDIUM = 0.001;

/* ----------------------------- Helpers ----------------------------- */

using RatioOf = double (*)(const InterfaceMetrics&);

double errorCrcOf(const InterfaceMetrics& m) { return m.errorCrcRatio; }

double outputErrorOf(const InterfaceMetrics& m) { return m.outputErrorRatio; }

/// Pointers to the entries with ratio > 0 (or all when keepZero), stable-sorted descending.
std::vector<const InterfaceMetrics*> sortedByRatio(const std::vector<InterfaceMetrics>& metrics,
                                                   RatioOf ratio, bool keepZero) {
  std::vector<const InterfaceMetrics*> order;
  order.reserve(metrics.size());
  for (const InterfaceMetrics& M : metrics) {
    if (keepZero || ratio(M) > 0.0) {
      order.push_back(&M);
    }
  }

  std::stable_sort(order.begin(), order.end(),
                   [ratio](const InterfaceMetrics* a, const InterfaceMetrics* b) {
                     return ratio(*a) > ratio(*b);
                   });
  return order;
}

std::vector<RankedInterface> topView(const std::vector<InterfaceMetrics>& metrics, RatioOf ratio,
                                     std::size_t limit) {
  const std::vector<const InterfaceMetrics*> ORDER = sortedByRatio(metrics, ratio, false);
  const std::size_t COUNT = std::min(limit, ORDER.size());

  std::vector<RankedInterface> out;
  out.reserve(COUNT);
  for (std::size_t i = 0; i < COUNT; ++i) {
    RankedInterface row{};
    row.rank = i + 1;
    row.severity = classifyTopSeverity(ratio(*ORDER[i]));
    row.metrics = *ORDER[i];
    out.push_back(std::move(row));
  }
  return out;
}

} // namespace

/* ----------------------------- SeverityTier ----------------------------- */

const char* toString(SeverityTier tier) noexcept {
  switch (tier) {
  case SeverityTier::CRITICAL:
    return "CRITICAL";
  case SeverityTier::HIGH:
    return "HIGH";
  case SeverityTier::MEDIUM:
    return "MEDIUM";
  case SeverityTier::LOW:
    return "LOW";
  case SeverityTier::GOOD:
    return "GOOD";
  }
  return "UNKNOWN";
}

SeverityTier classifyTopSeverity(double ratioPercent) noexcept {
  if (ratioPercent > TOP_CRITICAL) {
    return SeverityTier::CRITICAL;
  }
  if (ratioPercent > TOP_HIGH) {
    return SeverityTier::HIGH;
  }
  if (ratioPercent > TOP_MEDIUM) {
    return SeverityTier::MEDIUM;
  }
  return SeverityTier::LOW;
}

SeverityTier classifySweepSeverity(double errorCrcRatio, std::uint64_t errorCrcSum) noexcept {
  if (errorCrcRatio > SWEEP_CRITICAL) {
    return SeverityTier::CRITICAL;
  }
  if (errorCrcRatio > SWEEP_HIGH) {
    return SeverityTier::HIGH;
  }
  if (errorCrcRatio > SWEEP_MEDIUM) {
    return SeverityTier::MEDIUM;
  }
  return (errorCrcSum > 0) ? SeverityTier::LOW : SeverityTier::GOOD;
}

/* ----------------------------- RankedInterface Methods ----------------------------- */

std::string RankedInterface::toString() const {
  return fmt::format("#{} [{}] {}", rank, analysis::toString(severity), metrics.toString());
}

/* ----------------------------- API ----------------------------- */

std::vector<RankedInterface> rankTopErrorCrc(const std::vector<InterfaceMetrics>& metrics,
                                             std::size_t limit) {
  return topView(metrics, &errorCrcOf, limit);
}

std::vector<RankedInterface> rankTopOutputErrors(const std::vector<InterfaceMetrics>& metrics,
                                                 std::size_t limit) {
  return topView(metrics, &outputErrorOf, limit);
}

std::vector<RankedInterface> rankComplete(const std::vector<InterfaceMetrics>& metrics) {
  const std::vector<const InterfaceMetrics*> ORDER = sortedByRatio(metrics, &errorCrcOf, true);

  std::vector<RankedInterface> out;
  out.reserve(ORDER.size());
  for (std::size_t i = 0; i < ORDER.size(); ++i) {
    const InterfaceMetrics& M = *ORDER[i];
    RankedInterface row{};
    row.rank = i + 1;
    row.severity = classifySweepSeverity(M.errorCrcRatio, M.counters.errorCrcSum());
    row.metrics = M;
    out.push_back(std::move(row));
  }
  return out;
}

} // namespace analysis

} // namespace ifscan
