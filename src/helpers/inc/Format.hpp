#ifndef IFSCAN_HELPERS_FORMAT_HPP
#define IFSCAN_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable number formatting for report output.
 *
 * Provides consistent formatting across CLI tools and diagnostic output.
 * Uses fmt library for string formatting.
 *
 * @note All functions return std::string (heap allocation). Use only for
 *       presentation (CLI output, logging, etc.).
 */

#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace ifscan {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format an unsigned count with ',' thousands separators.
 * @param value Count to format.
 * @return Formatted string (e.g., "1,234,567").
 */
[[nodiscard]] inline std::string withThousands(std::uint64_t value) {
  const std::string DIGITS = fmt::format("{}", value);

  std::string out;
  out.reserve(DIGITS.size() + DIGITS.size() / 3);

  const std::size_t LEAD = DIGITS.size() % 3;
  for (std::size_t i = 0; i < DIGITS.size(); ++i) {
    if (i != 0 && (i % 3) == LEAD) {
      out.push_back(',');
    }
    out.push_back(DIGITS[i]);
  }
  return out;
}

/**
 * @brief Format a percentage value with six decimal places.
 * @param percent Value already scaled to percent.
 * @return Formatted string without the '%' sign (e.g., "0.080000").
 */
[[nodiscard]] inline std::string percent6(double percent) {
  return fmt::format("{:.6f}", percent);
}

} // namespace format
} // namespace helpers
} // namespace ifscan

#endif // IFSCAN_HELPERS_FORMAT_HPP
