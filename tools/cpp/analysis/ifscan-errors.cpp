/**
 * @file ifscan-errors.cpp
 * @brief Ranked interface error and CRC report from "show interface" output.
 *
 * Reads a saved "show interface" capture, drops test ports (5 minute rate
 * below 100k packets/sec) and reports the worst interfaces by
 * (input errors + CRC) / input packets and by output errors / output packets,
 * followed by a complete ranking and network-wide totals.
 */

#include "src/analysis/inc/ErrorReport.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace analysis = ifscan::analysis;
namespace args = ifscan::helpers::args;

using ifscan::helpers::format::percent6;
using ifscan::helpers::format::withThousands;

namespace {

/* ----------------------------- Constants ----------------------------- */

/// Input used when no file is given on the command line.
constexpr const char* DEFAULT_INPUT_PATH = "int_error.txt";

constexpr std::size_t WIDE_RULE = 120;
constexpr std::size_t REPORT_RULE = 100;
constexpr std::size_t TABLE_RULE = 80;

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_FILE = 2,
  ARG_TOP = 3,
  ARG_TOP_OUTPUT = 4,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Rank interfaces by error and CRC ratios from saved 'show interface' output.\n\n"
    "Interfaces with no traffic or a 5 minute rate below 100k packets/sec are excluded.\n"
    "FILE defaults to int_error.txt in the current directory.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_FILE] = {"--file", 1, false, "Input file (alternative to FILE)"};
  map[ARG_TOP] = {"--top", 1, false, "Entries in the error+CRC top list (default: 10)"};
  map[ARG_TOP_OUTPUT] = {"--top-output", 1, false,
                         "Entries in the output error top list (default: 5)"};
  return map;
}

/* ----------------------------- Diagnostics ----------------------------- */

/// Report a load failure on stderr. The report itself is still printed.
void logLoadFailure(const analysis::ErrorReport& report, const char* path) {
  switch (report.status) {
  case analysis::SourceStatus::OK:
    return;
  case analysis::SourceStatus::SOURCE_UNAVAILABLE:
    fmt::print(stderr, "Error: File {} not found or not readable ({})\n", path,
               std::strerror(report.sysErrno));
    return;
  case analysis::SourceStatus::SOURCE_UNREADABLE:
    if (report.sysErrno != 0) {
      fmt::print(stderr, "Error parsing file: {}\n", std::strerror(report.sysErrno));
    } else {
      fmt::print(stderr, "Error parsing file: {}\n", report.detail);
    }
    return;
  }
}

/* ----------------------------- Human Output ----------------------------- */

void printRule(char c, std::size_t width) { fmt::print("{}\n", std::string(width, c)); }

void printTopErrorCrc(const analysis::ErrorReport& report, std::size_t topCount) {
  const analysis::FleetTotals& T = report.totals;

  printRule('=', WIDE_RULE);
  fmt::print("COMPREHENSIVE INTERFACE ERROR AND CRC ANALYSIS\n");
  printRule('=', WIDE_RULE);
  fmt::print("Analysis of high-traffic interfaces (5-min rate >= 100k packets/sec)\n");
  fmt::print("Showing (Error + CRC) / Input_Packets ratio\n");
  printRule('=', WIDE_RULE);

  fmt::print("\nSUMMARY:\n");
  fmt::print("Total high-traffic interfaces analyzed: {}\n", T.analyzedCount);
  fmt::print("Interfaces with error/CRC issues: {}\n", T.withIssuesCount);
  fmt::print("Percentage with issues: {:.1f}%\n", T.issuePercent());

  fmt::print("\nTOP {} INTERFACES BY (ERROR + CRC) / INPUT_PACKETS RATIO:\n", topCount);
  printRule('-', TABLE_RULE);
  fmt::print("{:<4} {:<25} {:<12} {:<12} {:<15} {:<10}\n", "Rank", "Interface", "(E+CRC)%",
             "Error+CRC", "Input Pkts", "Status");
  printRule('-', TABLE_RULE);

  for (const analysis::RankedInterface& ROW : report.topErrorCrc) {
    const analysis::InterfaceCounters& C = ROW.metrics.counters;
    fmt::print("{:<4} {:<25} {:<12} {:<12} {:<15} {:<10}\n", ROW.rank, C.name,
               percent6(ROW.metrics.errorCrcRatio), withThousands(C.errorCrcSum()),
               withThousands(C.inputPackets), analysis::toString(ROW.severity));
  }

  fmt::print("\nDETAILED BREAKDOWN OF TOP {}:\n", topCount);
  printRule('-', TABLE_RULE);

  for (const analysis::RankedInterface& ROW : report.topErrorCrc) {
    const analysis::InterfaceMetrics& M = ROW.metrics;
    const analysis::InterfaceCounters& C = M.counters;

    fmt::print("\n{}. Interface: {}\n", ROW.rank, C.name);
    fmt::print("   Input Packets:        {}\n", withThousands(C.inputPackets));
    fmt::print("   Input Errors:         {}\n", withThousands(C.inputErrors));
    fmt::print("   CRC Errors:           {}\n", withThousands(C.crcErrors));
    fmt::print("   Error + CRC Sum:      {}\n", withThousands(C.errorCrcSum()));
    fmt::print("   (Error+CRC)/Input:    {}%\n", percent6(M.errorCrcRatio));
    fmt::print("   Error/Input Ratio:    {}%\n", percent6(M.errorRatio));
    fmt::print("   CRC/Input Ratio:      {}%\n", percent6(M.crcRatio));

    if (C.frameErrors > 0) {
      fmt::print("   Frame Errors:         {}\n", withThousands(C.frameErrors));
    }
    if (C.outputErrors > 0) {
      fmt::print("   Output Errors:        {}\n", withThousands(C.outputErrors));
    }
    if (C.inputDrops > 0 || C.outputDrops > 0) {
      fmt::print("   Input Drops:          {}\n", withThousands(C.inputDrops));
      fmt::print("   Output Drops:         {}\n", withThousands(C.outputDrops));
    }
  }
}

void printTopOutputErrors(const analysis::ErrorReport& report, std::size_t topCount) {
  if (report.topOutputErrors.empty()) {
    fmt::print("\nNO OUTPUT ERRORS FOUND\n");
    printRule('=', 50);
    fmt::print("All high-traffic interfaces have 0 output errors.\n");
    return;
  }

  fmt::print("\nTOP {} INTERFACES BY OUTPUT ERROR RATIO:\n", topCount);
  printRule('=', TABLE_RULE);
  fmt::print("Analysis of interfaces with output errors / output_packets\n");
  printRule('=', TABLE_RULE);
  fmt::print("{:<4} {:<25} {:<12} {:<15} {:<15} {:<10}\n", "Rank", "Interface", "Output Err%",
             "Output Errors", "Output Pkts", "Status");
  printRule('-', TABLE_RULE);

  for (const analysis::RankedInterface& ROW : report.topOutputErrors) {
    const analysis::InterfaceCounters& C = ROW.metrics.counters;
    fmt::print("{:<4} {:<25} {:<12} {:<15} {:<15} {:<10}\n", ROW.rank, C.name,
               percent6(ROW.metrics.outputErrorRatio), withThousands(C.outputErrors),
               withThousands(C.outputPackets), analysis::toString(ROW.severity));
  }

  fmt::print("\nDETAILED BREAKDOWN OF TOP {} OUTPUT ERROR INTERFACES:\n", topCount);
  printRule('-', TABLE_RULE);

  for (const analysis::RankedInterface& ROW : report.topOutputErrors) {
    const analysis::InterfaceCounters& C = ROW.metrics.counters;

    fmt::print("\n{}. Interface: {}\n", ROW.rank, C.name);
    fmt::print("   Output Packets:       {}\n", withThousands(C.outputPackets));
    fmt::print("   Output Errors:        {}\n", withThousands(C.outputErrors));
    fmt::print("   Output Error Ratio:   {}%\n", percent6(ROW.metrics.outputErrorRatio));
    fmt::print("   Underruns:            {}\n", withThousands(C.underruns));
    if (C.outputDrops > 0) {
      fmt::print("   Output Drops:         {}\n", withThousands(C.outputDrops));
    }
  }
}

void printComplete(const analysis::ErrorReport& report) {
  fmt::print("\n\n");
  printRule('=', REPORT_RULE);
  fmt::print("COMPLETE HIGH-TRAFFIC INTERFACE ANALYSIS\n");
  printRule('=', REPORT_RULE);
  fmt::print("All interfaces with 5-minute rate >= 100k packets/sec, sorted by error+CRC ratio\n");
  printRule('=', REPORT_RULE);

  fmt::print("{:<25} {:<15} {:<10} {:<12} {:<15}\n", "Interface", "Input Pkts", "E+CRC",
             "(E+CRC)%", "Classification");
  printRule('-', TABLE_RULE);

  for (const analysis::RankedInterface& ROW : report.complete) {
    const analysis::InterfaceCounters& C = ROW.metrics.counters;
    fmt::print("{:<25} {:<15} {:<10} {:<12} {:<15}\n", C.name, withThousands(C.inputPackets),
               withThousands(C.errorCrcSum()), percent6(ROW.metrics.errorCrcRatio),
               analysis::toString(ROW.severity));
  }

  const analysis::FleetTotals& T = report.totals;

  fmt::print("\n");
  printRule('=', TABLE_RULE);
  fmt::print("NETWORK-WIDE STATISTICS (High-Traffic Interfaces Only)\n");
  printRule('=', TABLE_RULE);
  fmt::print("Total Input Packets:      {}\n", withThousands(T.inputPackets));
  fmt::print("Total Output Packets:     {}\n", withThousands(T.outputPackets));
  fmt::print("Total Input Errors:       {}\n", withThousands(T.inputErrors));
  fmt::print("Total CRC Errors:         {}\n", withThousands(T.crcErrors));
  fmt::print("Total Output Errors:      {}\n", withThousands(T.outputErrors));
  fmt::print("Total Input Drops:        {}\n", withThousands(T.inputDrops));
  fmt::print("Total Output Drops:       {}\n", withThousands(T.outputDrops));
  fmt::print("Overall (Error+CRC)/Input Rate: {}%\n", percent6(T.overallErrorCrcRatio));
}

void printHuman(const analysis::ErrorReport& report, const char* path,
                const analysis::ReportConfig& config) {
  fmt::print("Parsing interface data from {}...\n", path);
  fmt::print("Filtering out test ports (5-minute rate < 100k packets/sec)...\n");

  logLoadFailure(report, path);

  if (report.empty()) {
    if (report.status == analysis::SourceStatus::OK && report.rawCount > 0) {
      fmt::print("No qualifying interface data found (after filtering test ports).\n");
    } else {
      fmt::print("No interface data could be parsed from the file.\n");
    }
  } else {
    fmt::print("Successfully parsed {} high-traffic interfaces.\n", report.interfaces.size());
    printTopErrorCrc(report, config.topErrorCount);
    printTopOutputErrors(report, config.topOutputErrorCount);
    printComplete(report);
  }

  fmt::print("\n");
  printRule('=', TABLE_RULE);
  fmt::print("ANALYSIS COMPLETE\n");
  printRule('=', TABLE_RULE);
}

/* ----------------------------- JSON Output ----------------------------- */

/// Escape quotes, backslashes and control characters for a JSON string body.
std::string jsonEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char C : text) {
    if (C == '"' || C == '\\') {
      out.push_back('\\');
      out.push_back(C);
    } else if (static_cast<unsigned char>(C) < 0x20) {
      out += fmt::format("\\u{:04x}", static_cast<unsigned>(C));
    } else {
      out.push_back(C);
    }
  }
  return out;
}

void printJsonRows(const char* key, const std::vector<analysis::RankedInterface>& rows,
                   bool last) {
  fmt::print("  \"{}\": [", key);

  bool first = true;
  for (const analysis::RankedInterface& ROW : rows) {
    const analysis::InterfaceMetrics& M = ROW.metrics;
    const analysis::InterfaceCounters& C = M.counters;

    fmt::print("{}\n    {{", first ? "" : ",");
    first = false;
    fmt::print("\"rank\": {}, \"name\": \"{}\", \"severity\": \"{}\", ", ROW.rank, C.name,
               analysis::toString(ROW.severity));
    fmt::print("\"inputPackets\": {}, \"outputPackets\": {}, \"inputRate\": {}, "
               "\"outputRate\": {}, ",
               C.inputPackets, C.outputPackets, C.inputRate, C.outputRate);
    fmt::print("\"inputErrors\": {}, \"crcErrors\": {}, \"frameErrors\": {}, "
               "\"overrunErrors\": {}, \"ignoredErrors\": {}, \"abortErrors\": {}, ",
               C.inputErrors, C.crcErrors, C.frameErrors, C.overrunErrors, C.ignoredErrors,
               C.abortErrors);
    fmt::print("\"outputErrors\": {}, \"underruns\": {}, \"inputDrops\": {}, "
               "\"outputDrops\": {}, ",
               C.outputErrors, C.underruns, C.inputDrops, C.outputDrops);
    fmt::print("\"errorCrcRatio\": {:.6f}, \"errorRatio\": {:.6f}, \"crcRatio\": {:.6f}, "
               "\"outputErrorRatio\": {:.6f}}}",
               M.errorCrcRatio, M.errorRatio, M.crcRatio, M.outputErrorRatio);
  }

  fmt::print("{}]{}\n", rows.empty() ? "" : "\n  ", last ? "" : ",");
}

void printJson(const analysis::ErrorReport& report, const char* path) {
  const analysis::FleetTotals& T = report.totals;

  fmt::print("{{\n");
  fmt::print("  \"source\": \"{}\",\n", jsonEscape(path));
  fmt::print("  \"status\": \"{}\",\n", analysis::toString(report.status));
  fmt::print("  \"minRatePps\": {},\n", analysis::MIN_RATE_PPS);
  fmt::print("  \"parsedInterfaces\": {},\n", report.rawCount);
  fmt::print("  \"droppedNoTraffic\": {},\n", report.droppedNoTraffic);
  fmt::print("  \"droppedLowRate\": {},\n", report.droppedLowRate);
  fmt::print("  \"summary\": {{\n");
  fmt::print("    \"analyzed\": {},\n", T.analyzedCount);
  fmt::print("    \"withIssues\": {},\n", T.withIssuesCount);
  fmt::print("    \"withOutputErrors\": {},\n", T.withOutputErrorsCount);
  fmt::print("    \"issuePercent\": {:.6f}\n", T.issuePercent());
  fmt::print("  }},\n");
  fmt::print("  \"totals\": {{\n");
  fmt::print("    \"inputPackets\": {},\n", T.inputPackets);
  fmt::print("    \"outputPackets\": {},\n", T.outputPackets);
  fmt::print("    \"inputErrors\": {},\n", T.inputErrors);
  fmt::print("    \"crcErrors\": {},\n", T.crcErrors);
  fmt::print("    \"outputErrors\": {},\n", T.outputErrors);
  fmt::print("    \"inputDrops\": {},\n", T.inputDrops);
  fmt::print("    \"outputDrops\": {},\n", T.outputDrops);
  fmt::print("    \"overallErrorCrcRatio\": {:.6f}\n", T.overallErrorCrcRatio);
  fmt::print("  }},\n");

  printJsonRows("topErrorCrc", report.topErrorCrc, false);
  printJsonRows("topOutputErrors", report.topOutputErrors, false);
  printJsonRows("complete", report.complete, true);

  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  args::Positionals operands;
  analysis::ReportConfig config{};
  bool jsonOutput = false;
  const char* path = DEFAULT_INPUT_PATH;

  if (argc > 1) {
    std::vector<std::string_view> argList;
    argList.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      argList.emplace_back(argv[i]);
    }

    std::string error;
    if (!args::parseArgs(argList, ARG_MAP, pargs, operands, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      args::printUsage(argv[0], "[FILE]", DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (pargs.count(ARG_HELP) != 0) {
      args::printUsage(argv[0], "[FILE]", DESCRIPTION, ARG_MAP);
      return 0;
    }

    if (operands.size() > 1) {
      fmt::print(stderr, "Error: Expected at most one input file\n");
      return 1;
    }

    jsonOutput = (pargs.count(ARG_JSON) != 0);

    // Views point into argv, which outlives main's use of them
    if (pargs.count(ARG_FILE) != 0) {
      path = pargs[ARG_FILE][0].data();
    } else if (!operands.empty()) {
      path = operands[0].data();
    }

    if (pargs.count(ARG_TOP) != 0 && !args::parseCount(pargs[ARG_TOP][0], config.topErrorCount)) {
      fmt::print(stderr, "Error: --top must be a positive integer\n");
      return 1;
    }

    if (pargs.count(ARG_TOP_OUTPUT) != 0 &&
        !args::parseCount(pargs[ARG_TOP_OUTPUT][0], config.topOutputErrorCount)) {
      fmt::print(stderr, "Error: --top-output must be a positive integer\n");
      return 1;
    }
  }

  const analysis::ErrorReport REPORT = analysis::loadErrorReport(path, config);

  if (jsonOutput) {
    logLoadFailure(REPORT, path);
    printJson(REPORT, path);
  } else {
    printHuman(REPORT, path, config);
  }

  // A degraded (empty) report is still a completed run
  return 0;
}
