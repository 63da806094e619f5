#ifndef IFSCAN_HELPERS_STRINGS_HPP
#define IFSCAN_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for line-oriented text parsing.
 *
 * Provides whitespace trimming, line splitting and bounded integer parsing over
 * std::string_view. None of the functions allocate except splitLines() and
 * copyOrClear().
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace ifscan {
namespace helpers {
namespace strings {

/* ----------------------------- Classification ----------------------------- */

/// @brief True for space, tab, CR, LF, vertical tab and form feed.
[[nodiscard]] inline constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

/// @brief True for ASCII decimal digits.
[[nodiscard]] inline constexpr bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Strip leading whitespace.
 * @param sv Input view.
 * @return View without leading whitespace (may be empty).
 */
[[nodiscard]] inline std::string_view trimLeft(std::string_view sv) noexcept {
  std::size_t i = 0;
  while (i < sv.size() && isSpace(sv[i])) {
    ++i;
  }
  return sv.substr(i);
}

/**
 * @brief Strip trailing whitespace, including CR/LF.
 * @param sv Input view.
 * @return View without trailing whitespace (may be empty).
 */
[[nodiscard]] inline std::string_view trimRight(std::string_view sv) noexcept {
  std::size_t len = sv.size();
  while (len > 0 && isSpace(sv[len - 1])) {
    --len;
  }
  return sv.substr(0, len);
}

/// @brief Strip whitespace on both sides.
[[nodiscard]] inline std::string_view trim(std::string_view sv) noexcept {
  return trimRight(trimLeft(sv));
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split text into lines on "\n", "\r\n" or a lone "\r".
 * @param text Whole input; views point into it and must not outlive it.
 * @return Line views without their terminators.
 *
 * A final line without a terminator is included; a trailing terminator does
 * not produce an extra empty line.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t END = text.find_first_of("\r\n", start);
    if (END == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, END - start));
    start = END + 1;
    if (text[END] == '\r' && start < text.size() && text[start] == '\n') {
      ++start;
    }
  }
  return lines;
}

/* ----------------------------- Numbers ----------------------------- */

/**
 * @brief Parse a run of decimal digits as an unsigned 64-bit value.
 * @param digits Digits only (leading/trailing non-digits stop the scan).
 * @return Parsed value, saturated at UINT64_MAX on overflow; 0 if no digits.
 */
[[nodiscard]] inline std::uint64_t parseUint64(std::string_view digits) noexcept {
  constexpr std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();

  std::uint64_t value = 0;
  for (const char C : digits) {
    if (!isDigit(C)) {
      break;
    }
    const auto DIGIT = static_cast<std::uint64_t>(C - '0');
    if (value > (MAX - DIGIT) / 10) {
      return MAX;
    }
    value = value * 10 + DIGIT;
  }
  return value;
}

/**
 * @brief Strictly parse an unsigned value (whole view must be digits).
 * @param sv Input text.
 * @param out Parsed value on success.
 * @return false if empty, contains a non-digit, or overflows.
 */
[[nodiscard]] inline bool tryParseUint64(std::string_view sv, std::uint64_t& out) noexcept {
  if (sv.empty()) {
    return false;
  }
  constexpr std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();

  std::uint64_t value = 0;
  for (const char C : sv) {
    if (!isDigit(C)) {
      return false;
    }
    const auto DIGIT = static_cast<std::uint64_t>(C - '0');
    if (value > (MAX - DIGIT) / 10) {
      return false;
    }
    value = value * 10 + DIGIT;
  }
  out = value;
  return true;
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 */
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Copy a C string into @p out without throwing.
 * @param out Destination; left empty if the copy cannot be allocated.
 * @param text Source (nullptr copies as empty).
 */
inline void copyOrClear(std::string& out, const char* text) noexcept {
  try {
    out = (text != nullptr) ? text : "";
  } catch (const std::bad_alloc&) {
    out.clear();
  }
}

} // namespace strings
} // namespace helpers
} // namespace ifscan

#endif // IFSCAN_HELPERS_STRINGS_HPP
