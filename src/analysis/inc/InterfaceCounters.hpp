#ifndef IFSCAN_ANALYSIS_INTERFACE_COUNTERS_HPP
#define IFSCAN_ANALYSIS_INTERFACE_COUNTERS_HPP
/**
 * @file InterfaceCounters.hpp
 * @brief Per-interface counters recovered from "show interface" text output.
 * @note Thread-safe: All free functions are stateless and safe to call concurrently.
 *
 * Design: Single-pass fold over the input lines.
 *  - InterfaceExtractor carries the accumulator (records + current cursor)
 *  - extractInterfaceCounters() folds consumeLine() over the whole text
 *  - loadInterfaceCounters() reads a file fully, then extracts
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ifscan {

namespace analysis {

/* ----------------------------- SourceStatus ----------------------------- */

/**
 * @brief Status codes for loading interface text from a source.
 */
enum class SourceStatus : unsigned char {
  OK = 0,
  SOURCE_UNAVAILABLE, ///< Source could not be opened (missing, permission, directory)
  SOURCE_UNREADABLE,  ///< Read failed after opening, or parsing raised an exception
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(SourceStatus status) noexcept;

/* ----------------------------- Counter Arithmetic ----------------------------- */

/**
 * @brief a + b, clamped at UINT64_MAX.
 *
 * Counters that overflowed while parsing are held at UINT64_MAX; sums of them
 * stay there instead of wrapping.
 */
[[nodiscard]] constexpr std::uint64_t saturatingAdd(std::uint64_t a, std::uint64_t b) noexcept {
  return (b > UINT64_MAX - a) ? UINT64_MAX : a + b;
}

/* ----------------------------- InterfaceCounters ----------------------------- */

/**
 * @brief Raw counters for one interface as reported by the device.
 *
 * All values default to 0; a counter whose line never appeared stays 0, so
 * "explicitly zero" and "never reported" are indistinguishable.
 */
struct InterfaceCounters {
  std::string name; ///< Interface name (e.g., "GigabitEthernet0/1")

  std::uint64_t inputPackets{0};  ///< Total packets received
  std::uint64_t outputPackets{0}; ///< Total packets transmitted
  std::uint64_t inputRate{0};     ///< 5 minute input rate (packets/sec)
  std::uint64_t outputRate{0};    ///< 5 minute output rate (packets/sec)

  std::uint64_t inputErrors{0};   ///< Input errors
  std::uint64_t crcErrors{0};     ///< CRC errors
  std::uint64_t frameErrors{0};   ///< Framing errors
  std::uint64_t overrunErrors{0}; ///< Receiver overruns
  std::uint64_t ignoredErrors{0}; ///< Ignored frames
  std::uint64_t abortErrors{0};   ///< Aborted frames

  std::uint64_t outputErrors{0}; ///< Output errors
  std::uint64_t underruns{0};    ///< Transmitter underruns

  std::uint64_t inputDrops{0};  ///< Total input drops
  std::uint64_t outputDrops{0}; ///< Total output drops

  /// @brief inputPackets + outputPackets (saturating).
  [[nodiscard]] std::uint64_t totalPackets() const noexcept;

  /// @brief max(inputRate, outputRate).
  [[nodiscard]] std::uint64_t maxRate() const noexcept;

  /// @brief inputErrors + crcErrors (saturating).
  [[nodiscard]] std::uint64_t errorCrcSum() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- InterfaceExtractor ----------------------------- */

/**
 * @brief Accumulator for the line-by-line extraction fold.
 *
 * Holds the records seen so far (in order of first appearance) and the
 * "current interface" cursor. Each consumeLine() call advances the fold by one
 * line. A repeated interface header resets that interface's record to zero in
 * place, so the last occurrence wins while the first position is kept.
 */
class InterfaceExtractor {
public:
  /**
   * @brief Feed one line of device output.
   * @param line Raw line; leading/trailing whitespace is ignored.
   * @return true if the line was an interface header or set a field.
   * @note May throw std::regex_error or std::bad_alloc.
   */
  bool consumeLine(std::string_view line);

  /// @brief Name of the interface subsequent lines apply to (empty if none).
  [[nodiscard]] std::string_view currentInterface() const noexcept;

  /// @brief Number of distinct interfaces seen so far.
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

  /**
   * @brief Hand the accumulated records to the caller.
   * @return Records in order of first appearance. The extractor is reset.
   */
  [[nodiscard]] std::vector<InterfaceCounters> finish() noexcept;

private:
  static constexpr std::size_t NO_CURRENT = static_cast<std::size_t>(-1);

  std::vector<InterfaceCounters> records_;
  std::unordered_map<std::string, std::size_t> index_;
  std::size_t current_{NO_CURRENT}; ///< Index into records_
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Extract per-interface counters from "show interface" text.
 * @param text Whole device output.
 * @return Records in order of first appearance.
 * @note May throw std::regex_error or std::bad_alloc; see loadInterfaceCounters().
 */
[[nodiscard]] std::vector<InterfaceCounters> extractInterfaceCounters(std::string_view text);

/**
 * @brief Result of loading and extracting a text source.
 */
struct ExtractionResult {
  SourceStatus status{SourceStatus::OK};     ///< Load/parse outcome
  std::vector<InterfaceCounters> interfaces; ///< Empty unless status is OK
  int sysErrno{0};                           ///< errno of the failed open/read (0 if none)
  std::string detail;                        ///< Parse failure description (empty if none)
};

/**
 * @brief Extract counters, converting any parse exception into a status.
 * @param text Whole device output.
 * @return OK with records, or SOURCE_UNREADABLE with no records.
 */
[[nodiscard]] ExtractionResult extractInterfaceCountersSafe(std::string_view text) noexcept;

/**
 * @brief Read a file fully and extract per-interface counters.
 * @param path File path.
 * @return Status and records; never throws, failures yield zero records.
 */
[[nodiscard]] ExtractionResult loadInterfaceCounters(const char* path) noexcept;

} // namespace analysis

} // namespace ifscan

#endif // IFSCAN_ANALYSIS_INTERFACE_COUNTERS_HPP
