/**
 * @file InterfaceCounters.cpp
 * @brief Implementation of "show interface" counter extraction.
 */

#include "src/analysis/inc/InterfaceCounters.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <regex>
#include <utility>

#include <fmt/core.h>

namespace ifscan {

namespace analysis {

namespace {

using ifscan::helpers::strings::copyOrClear;
using ifscan::helpers::strings::isDigit;
using ifscan::helpers::strings::parseUint64;
using ifscan::helpers::strings::splitLines;
using ifscan::helpers::strings::trim;

using LineMatch = std::match_results<std::string_view::const_iterator>;

/* ----------------------------- Header Matching ----------------------------- */

// Header: "<name> is up|down ...", e.g. "GigabitEthernet0/1 is up, line protocol is up".
// The name is [A-Za-z][A-Za-z0-9-./]+ and is scanned directly; the state part
// after it goes through the regex, over a bounded tail only.

/// State following the interface name.
constexpr const char* HEADER_STATE_PATTERN = R"(^\s+is\s+(up|down))";

/// Longest text after the name the state pattern is run over.
constexpr std::size_t MAX_STATE_SCAN = 256;

const std::regex& headerStatePattern() {
  static const std::regex STATE(HEADER_STATE_PATTERN, std::regex::optimize);
  return STATE;
}

constexpr bool isAsciiAlpha(char c) noexcept {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

constexpr bool isNameChar(char c) noexcept {
  return isAsciiAlpha(c) || isDigit(c) || c == '-' || c == '.' || c == '/';
}

/// Interface name if @p line is a header, else empty.
std::string_view headerName(std::string_view line) {
  if (line.empty() || !isAsciiAlpha(line[0])) {
    return {};
  }

  std::size_t end = 1;
  while (end < line.size() && isNameChar(line[end])) {
    ++end;
  }
  if (end < 2) {
    return {};
  }

  const std::string_view TAIL = line.substr(end, MAX_STATE_SCAN);
  LineMatch m;
  if (!std::regex_search(TAIL.begin(), TAIL.end(), m, headerStatePattern())) {
    return {};
  }
  return line.substr(0, end);
}

/* ----------------------------- Field Scanning ----------------------------- */

// Field lines are matched by literal anchors and digit runs. Work is linear in
// line length and stack use is constant.

constexpr std::size_t MAX_CAPTURES = 6;

using Captures = std::array<std::uint64_t, MAX_CAPTURES>;

/// Start of the digit run ending at @p end, not reaching below @p floor.
std::size_t digitRunStart(std::string_view line, std::size_t end, std::size_t floor) noexcept {
  std::size_t begin = end;
  while (begin > floor && isDigit(line[begin - 1])) {
    --begin;
  }
  return begin;
}

/**
 * First "<digits><suffix>" at or after @p from, digits clipped at @p from.
 * @return Position just past the suffix, or npos.
 */
std::size_t findNumberBefore(std::string_view line, std::size_t from, std::string_view suffix,
                             std::uint64_t& value) noexcept {
  std::size_t pos = line.find(suffix, from);
  while (pos != std::string_view::npos) {
    const std::size_t BEGIN = digitRunStart(line, pos, from);
    if (BEGIN < pos) {
      value = parseUint64(line.substr(BEGIN, pos - BEGIN));
      return pos + suffix.size();
    }
    pos = line.find(suffix, pos + 1);
  }
  return std::string_view::npos;
}

/// "<label> ... <N><suffix>": label, anything, then the first number followed by suffix.
bool scanLabeledNumber(std::string_view line, std::string_view label, std::string_view suffix,
                       std::uint64_t& value) noexcept {
  const std::size_t AT = line.find(label);
  if (AT == std::string_view::npos) {
    return false;
  }
  return findNumberBefore(line, AT + label.size(), suffix, value) != std::string_view::npos;
}

/// "<N1><lead> ... <N2><trail>": the first N1 followed by lead, then the first N2 followed by trail.
bool scanNumberPair(std::string_view line, std::string_view lead, std::string_view trail,
                    Captures& out) noexcept {
  const std::size_t AFTER_LEAD = findNumberBefore(line, 0, lead, out[0]);
  if (AFTER_LEAD == std::string_view::npos) {
    return false;
  }
  return findNumberBefore(line, AFTER_LEAD, trail, out[1]) != std::string_view::npos;
}

/**
 * "<N1><sep1><N2><sep2>...<Nk><sepk>" with no gaps. Tries every occurrence of
 * the first separator, leftmost first.
 */
template <std::size_t N>
bool scanNumberSequence(std::string_view line, const std::array<std::string_view, N>& seps,
                        Captures& out) noexcept {
  static_assert(N <= MAX_CAPTURES, "too many captures");

  std::size_t pos = line.find(seps[0]);
  while (pos != std::string_view::npos) {
    const std::size_t BEGIN = digitRunStart(line, pos, 0);
    if (BEGIN < pos) {
      out[0] = parseUint64(line.substr(BEGIN, pos - BEGIN));

      std::size_t cursor = pos + seps[0].size();
      std::size_t field = 1;
      for (; field < N; ++field) {
        std::size_t end = cursor;
        while (end < line.size() && isDigit(line[end])) {
          ++end;
        }
        if (end == cursor || line.substr(end, seps[field].size()) != seps[field]) {
          break;
        }
        out[field] = parseUint64(line.substr(cursor, end - cursor));
        cursor = end + seps[field].size();
      }
      if (field == N) {
        return true;
      }
    }
    pos = line.find(seps[0], pos + 1);
  }
  return false;
}

/* ----------------------------- Field Matchers ----------------------------- */

bool matchInputRate(std::string_view line, Captures& out) noexcept {
  return scanLabeledNumber(line, "5 minute input rate", " packets/sec", out[0]);
}

bool matchOutputRate(std::string_view line, Captures& out) noexcept {
  return scanLabeledNumber(line, "5 minute output rate", " packets/sec", out[0]);
}

bool matchInputPackets(std::string_view line, Captures& out) noexcept {
  return scanNumberPair(line, " packets input", " total input drops", out);
}

bool matchOutputPackets(std::string_view line, Captures& out) noexcept {
  return scanNumberPair(line, " packets output", " total output drops", out);
}

bool matchInputErrors(std::string_view line, Captures& out) noexcept {
  static constexpr std::array<std::string_view, 6> SEPS = {
      " input errors, ", " CRC, ", " frame, ", " overrun, ", " ignored, ", " abort"};
  return scanNumberSequence(line, SEPS, out);
}

bool matchOutputErrors(std::string_view line, Captures& out) noexcept {
  static constexpr std::array<std::string_view, 2> SEPS = {" output errors, ", " underruns"};
  return scanNumberSequence(line, SEPS, out);
}

/* ----------------------------- Field Handlers ----------------------------- */

void setInputRate(InterfaceCounters& c, const Captures& v) noexcept { c.inputRate = v[0]; }

void setOutputRate(InterfaceCounters& c, const Captures& v) noexcept { c.outputRate = v[0]; }

void setInputPackets(InterfaceCounters& c, const Captures& v) noexcept {
  c.inputPackets = v[0];
  c.inputDrops = v[1];
}

void setOutputPackets(InterfaceCounters& c, const Captures& v) noexcept {
  c.outputPackets = v[0];
  c.outputDrops = v[1];
}

void setInputErrors(InterfaceCounters& c, const Captures& v) noexcept {
  c.inputErrors = v[0];
  c.crcErrors = v[1];
  c.frameErrors = v[2];
  c.overrunErrors = v[3];
  c.ignoredErrors = v[4];
  c.abortErrors = v[5];
}

void setOutputErrors(InterfaceCounters& c, const Captures& v) noexcept {
  c.outputErrors = v[0];
  c.underruns = v[1];
}

/* ----------------------------- Dispatch Table ----------------------------- */

using FieldMatcher = bool (*)(std::string_view, Captures&) noexcept;
using FieldHandler = void (*)(InterfaceCounters&, const Captures&) noexcept;

struct FieldRule {
  FieldMatcher match;
  FieldHandler apply;
};

/// Field rules in priority order; the first match wins for a line.
constexpr std::array<FieldRule, 6> FIELD_RULES{{
    {&matchInputRate, &setInputRate},
    {&matchOutputRate, &setOutputRate},
    {&matchInputPackets, &setInputPackets},
    {&matchOutputPackets, &setOutputPackets},
    {&matchInputErrors, &setInputErrors},
    {&matchOutputErrors, &setOutputErrors},
}};

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(SourceStatus status) noexcept {
  switch (status) {
  case SourceStatus::OK:
    return "OK";
  case SourceStatus::SOURCE_UNAVAILABLE:
    return "SOURCE_UNAVAILABLE";
  case SourceStatus::SOURCE_UNREADABLE:
    return "SOURCE_UNREADABLE";
  }
  return "UNKNOWN";
}

/* ----------------------------- InterfaceCounters Methods ----------------------------- */

std::uint64_t InterfaceCounters::totalPackets() const noexcept {
  return saturatingAdd(inputPackets, outputPackets);
}

std::uint64_t InterfaceCounters::maxRate() const noexcept {
  return std::max(inputRate, outputRate);
}

std::uint64_t InterfaceCounters::errorCrcSum() const noexcept {
  return saturatingAdd(inputErrors, crcErrors);
}

std::string InterfaceCounters::toString() const {
  std::string out;
  out += fmt::format("{}: in={} out={} pkts, rate in={} out={} pps", name, inputPackets,
                     outputPackets, inputRate, outputRate);
  out += fmt::format(" [in_err={} crc={} frame={} overrun={} ignored={} abort={}]", inputErrors,
                     crcErrors, frameErrors, overrunErrors, ignoredErrors, abortErrors);
  out += fmt::format(" [out_err={} underruns={} drops in={} out={}]", outputErrors, underruns,
                     inputDrops, outputDrops);
  return out;
}

/* ----------------------------- InterfaceExtractor Methods ----------------------------- */

bool InterfaceExtractor::consumeLine(std::string_view line) {
  const std::string_view TRIMMED = trim(line);
  const std::string_view HEADER = headerName(TRIMMED);

  if (!HEADER.empty()) {
    std::string name(HEADER);

    auto it = index_.find(name);
    if (it == index_.end()) {
      InterfaceCounters fresh{};
      fresh.name = name;
      records_.push_back(std::move(fresh));
      it = index_.emplace(std::move(name), records_.size() - 1).first;
    } else {
      // Repeated header: last occurrence wins, position of the first is kept
      InterfaceCounters fresh{};
      fresh.name = std::move(name);
      records_[it->second] = std::move(fresh);
    }

    current_ = it->second;
    return true;
  }

  if (current_ == NO_CURRENT) {
    return false;
  }

  Captures values{};
  for (const FieldRule& RULE : FIELD_RULES) {
    if (RULE.match(TRIMMED, values)) {
      RULE.apply(records_[current_], values);
      return true;
    }
  }

  return false;
}

std::string_view InterfaceExtractor::currentInterface() const noexcept {
  if (current_ == NO_CURRENT) {
    return {};
  }
  return records_[current_].name;
}

std::vector<InterfaceCounters> InterfaceExtractor::finish() noexcept {
  std::vector<InterfaceCounters> out = std::move(records_);
  records_.clear();
  index_.clear();
  current_ = NO_CURRENT;
  return out;
}

/* ----------------------------- API ----------------------------- */

std::vector<InterfaceCounters> extractInterfaceCounters(std::string_view text) {
  InterfaceExtractor extractor;
  for (const std::string_view LINE : splitLines(text)) {
    extractor.consumeLine(LINE);
  }
  return extractor.finish();
}

ExtractionResult extractInterfaceCountersSafe(std::string_view text) noexcept {
  ExtractionResult result{};
  try {
    result.interfaces = extractInterfaceCounters(text);
  } catch (const std::exception& e) {
    result.status = SourceStatus::SOURCE_UNREADABLE;
    result.interfaces.clear();
    copyOrClear(result.detail, e.what());
  }
  return result;
}

ExtractionResult loadInterfaceCounters(const char* path) noexcept {
  namespace files = ifscan::helpers::files;

  std::string text;
  int errNo = 0;
  const files::FileReadStatus READ = files::readWholeFile(path, text, errNo);

  if (READ != files::FileReadStatus::OK) {
    ExtractionResult result{};
    result.status = (READ == files::FileReadStatus::OPEN_FAILED) ? SourceStatus::SOURCE_UNAVAILABLE
                                                                 : SourceStatus::SOURCE_UNREADABLE;
    result.sysErrno = errNo;
    return result;
  }

  return extractInterfaceCountersSafe(text);
}

} // namespace analysis

} // namespace ifscan
