#ifndef IFSCAN_HELPERS_ARGS_HPP
#define IFSCAN_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parsing plus positional operands for CLI tools.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "src/helpers/inc/Strings.hpp"

namespace ifscan {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--foo"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/// Operands that are neither flags nor flag values, in command-line order.
using Positionals = std::vector<std::string_view>;

namespace detail {

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  bool required;
  std::string_view flag;
};

inline void setError(std::optional<std::reference_wrapper<std::string>>& error,
                     std::string msg) {
  if (error) {
    error->get() = std::move(msg);
  }
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag is matched, it consumes the next nargs tokens literally as its
 * values. Tokens starting with "--" that name no flag are rejected; any other
 * token is collected as a positional operand.
 *
 * @param args        Argument list (non-owning views; must outlive the call).
 * @param map         Definitions of accepted flags and their requirements.
 * @param pargs       Output map of parsed values (entries are overwritten per key).
 * @param positionals Output operand list (appended in order).
 * @param error       Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          Positionals& positionals,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  try {
    std::unordered_map<std::string_view, detail::ArgDefView> lut;
    lut.reserve(map.size());
    for (const auto& KV : map) {
      lut.emplace(KV.second.flag,
                  detail::ArgDefView{KV.first, KV.second.nargs, KV.second.required, KV.second.flag});
    }

    std::bitset<256> seen;
    const std::size_t N = args.size();

    for (std::size_t i = 0; i < N; ++i) {
      const std::string_view TOK = args[i];
      auto it = lut.find(TOK);
      if (it == lut.end()) {
        if (strings::startsWith(TOK, "--")) {
          detail::setError(error, fmt::format("Unknown argument '{}'", TOK));
          return false;
        }
        positionals.emplace_back(TOK);
        continue;
      }

      const detail::ArgDefView& D = it->second;

      // Need tokens in [i+1, i+D.need]
      if (i + static_cast<std::size_t>(D.need) >= N) {
        detail::setError(error, fmt::format("Argument out of bounds: expected {} values for flag '{}'",
                                            D.need, D.flag));
        return false;
      }

      auto& out = pargs.try_emplace(D.key).first->second;
      out.clear();
      out.reserve(D.need);
      for (std::uint8_t k = 0; k < D.need; ++k) {
        out.emplace_back(args[i + 1 + k]);
      }

      seen.set(D.key);
      i += D.need;
    }

    for (const auto& KV : map) {
      if (KV.second.required && !seen.test(KV.first)) {
        detail::setError(error, fmt::format("Missing required argument: key='{}', flag='{}'",
                                            KV.first, KV.second.flag));
        return false;
      }
    }
  } catch (const std::exception& e) {
    detail::setError(error, fmt::format("Argument parsing failed: {}", e.what()));
    return false;
  }

  return true;
}

/**
 * @brief Parse a flag value as a positive count.
 * @param value Flag value text.
 * @param out Parsed count on success.
 * @return false if not a decimal integer or zero.
 */
[[nodiscard]] inline bool parseCount(std::string_view value, std::size_t& out) noexcept {
  std::uint64_t parsed = 0;
  if (!strings::tryParseUint64(value, parsed) || parsed == 0) {
    return false;
  }
  out = static_cast<std::size_t>(parsed);
  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * Generates formatted help text from the argument map.
 *
 * @param progName    Program name (typically argv[0]).
 * @param operands    Operand synopsis shown after the program name (e.g., "[FILE]").
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view operands,
                       std::string_view description, const ArgMap& map) noexcept {
  fmt::print("Usage: {} {}[OPTIONS]\n\n", progName,
             operands.empty() ? std::string{} : fmt::format("{} ", operands));

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  // Collect and sort flags for consistent output
  std::vector<std::pair<std::string_view, const ArgDef*>> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.emplace_back(KV.second.flag, &KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::size_t maxFlagWidth = 16;
  for (const auto& ENTRY : entries) {
    const ArgDef& DEF = *ENTRY.second;
    const std::size_t WIDTH = DEF.flag.size() + (DEF.nargs > 0 ? 8 : 0); // " <value>"
    maxFlagWidth = std::max(maxFlagWidth, WIDTH);
  }
  maxFlagWidth = std::min<std::size_t>(maxFlagWidth, 30);

  for (const auto& ENTRY : entries) {
    const ArgDef& DEF = *ENTRY.second;

    std::string flagStr(DEF.flag);
    if (DEF.nargs > 0) {
      flagStr.append(" <value>");
    }

    fmt::print("  {:<{}}  {}", flagStr, maxFlagWidth, DEF.desc);
    if (DEF.required) {
      fmt::print("{}(required)", DEF.desc.empty() ? "" : " ");
    }
    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace ifscan

#endif // IFSCAN_HELPERS_ARGS_HPP
