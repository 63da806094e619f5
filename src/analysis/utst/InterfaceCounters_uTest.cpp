/**
 * @file InterfaceCounters_uTest.cpp
 * @brief Unit tests for ifscan::analysis::InterfaceCounters extraction.
 *
 * Notes:
 *  - Inputs are literal "show interface" excerpts; no files except the loader tests.
 *  - Loader tests write to a temporary directory and remove the file afterwards.
 */

#include "src/analysis/inc/InterfaceCounters.hpp"
#include "src/analysis/inc/InterfaceMetrics.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

using ifscan::analysis::extractInterfaceCounters;
using ifscan::analysis::extractInterfaceCountersSafe;
using ifscan::analysis::ExtractionResult;
using ifscan::analysis::InterfaceCounters;
using ifscan::analysis::InterfaceExtractor;
using ifscan::analysis::loadInterfaceCounters;
using ifscan::analysis::passesTrafficFilter;
using ifscan::analysis::saturatingAdd;
using ifscan::analysis::SourceStatus;

namespace {

/// One fully populated interface block.
constexpr const char* GIG01_BLOCK =
    "GigabitEthernet0/1 is up, line protocol is up\n"
    "  Hardware is iGbE, address is 0011.2233.4455 (bia 0011.2233.4455)\n"
    "  MTU 1500 bytes, BW 1000000 Kbit/sec, DLY 10 usec,\n"
    "  5 minute input rate 123456000 bits/sec, 150000 packets/sec\n"
    "  5 minute output rate 98765000 bits/sec, 120000 packets/sec\n"
    "     1000000 packets input, 987654321 bytes, 5 total input drops\n"
    "     500 input errors, 300 CRC, 7 frame, 1 overrun, 2 ignored, 3 abort\n"
    "     2000000 packets output, 123456789 bytes, 9 total output drops\n"
    "     4 output errors, 6 underruns\n";

} // namespace

/* ----------------------------- InterfaceCounters Tests ----------------------------- */

/** @test Default InterfaceCounters is zeroed. */
TEST(InterfaceCountersTest, DefaultZero) {
  const InterfaceCounters DEFAULT{};

  EXPECT_TRUE(DEFAULT.name.empty());
  EXPECT_EQ(DEFAULT.inputPackets, 0U);
  EXPECT_EQ(DEFAULT.outputPackets, 0U);
  EXPECT_EQ(DEFAULT.totalPackets(), 0U);
  EXPECT_EQ(DEFAULT.maxRate(), 0U);
  EXPECT_EQ(DEFAULT.errorCrcSum(), 0U);
}

/** @test maxRate picks the larger direction. */
TEST(InterfaceCountersTest, MaxRate) {
  InterfaceCounters c{};
  c.inputRate = 10;
  c.outputRate = 250000;
  EXPECT_EQ(c.maxRate(), 250000U);

  c.inputRate = 300000;
  EXPECT_EQ(c.maxRate(), 300000U);
}

/** @test toString includes the interface name. */
TEST(InterfaceCountersTest, ToStringHasName) {
  InterfaceCounters c{};
  c.name = "Te0/0/1";
  EXPECT_NE(c.toString().find("Te0/0/1"), std::string::npos);
}

/** @test SourceStatus names are stable. */
TEST(InterfaceCountersTest, StatusNames) {
  EXPECT_STREQ(toString(SourceStatus::OK), "OK");
  EXPECT_STREQ(toString(SourceStatus::SOURCE_UNAVAILABLE), "SOURCE_UNAVAILABLE");
  EXPECT_STREQ(toString(SourceStatus::SOURCE_UNREADABLE), "SOURCE_UNREADABLE");
}

/* ----------------------------- Extraction Tests ----------------------------- */

/** @test Every field of a complete block is captured. */
TEST(InterfaceExtractionTest, FullBlock) {
  const auto RECORDS = extractInterfaceCounters(GIG01_BLOCK);
  ASSERT_EQ(RECORDS.size(), 1U);

  const InterfaceCounters& C = RECORDS[0];
  EXPECT_EQ(C.name, "GigabitEthernet0/1");
  EXPECT_EQ(C.inputRate, 150000U);
  EXPECT_EQ(C.outputRate, 120000U);
  EXPECT_EQ(C.inputPackets, 1000000U);
  EXPECT_EQ(C.inputDrops, 5U);
  EXPECT_EQ(C.outputPackets, 2000000U);
  EXPECT_EQ(C.outputDrops, 9U);
  EXPECT_EQ(C.inputErrors, 500U);
  EXPECT_EQ(C.crcErrors, 300U);
  EXPECT_EQ(C.frameErrors, 7U);
  EXPECT_EQ(C.overrunErrors, 1U);
  EXPECT_EQ(C.ignoredErrors, 2U);
  EXPECT_EQ(C.abortErrors, 3U);
  EXPECT_EQ(C.outputErrors, 4U);
  EXPECT_EQ(C.underruns, 6U);
}

/** @test Empty text yields no records. */
TEST(InterfaceExtractionTest, EmptyInput) {
  EXPECT_TRUE(extractInterfaceCounters("").empty());
  EXPECT_TRUE(extractInterfaceCounters("\n\n   \n").empty());
}

/** @test Field lines before any header are ignored. */
TEST(InterfaceExtractionTest, FieldsBeforeHeaderIgnored) {
  const auto RECORDS = extractInterfaceCounters("  5 minute input rate 0 bits/sec, 500000 packets/sec\n"
                                                "Te1/1 is down, line protocol is down\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].name, "Te1/1");
  EXPECT_EQ(RECORDS[0].inputRate, 0U);
}

/** @test Missing lines leave counters at zero. */
TEST(InterfaceExtractionTest, MissingFieldsDefaultZero) {
  const auto RECORDS = extractInterfaceCounters("GigabitEthernet0/2 is up, line protocol is up\n"
                                                "     3 output errors, 2 underruns\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].outputErrors, 3U);
  EXPECT_EQ(RECORDS[0].underruns, 2U);
  EXPECT_EQ(RECORDS[0].outputPackets, 0U);
  EXPECT_EQ(RECORDS[0].inputPackets, 0U);
  EXPECT_EQ(RECORDS[0].inputRate, 0U);
}

/** @test Lines are attributed to the most recent header. */
TEST(InterfaceExtractionTest, MultipleInterfacesInOrder) {
  const auto RECORDS = extractInterfaceCounters("Gi0/1 is up, line protocol is up\n"
                                                "  5 minute input rate 1 bits/sec, 111 packets/sec\n"
                                                "Port-channel10.200 is up, line protocol is up\n"
                                                "  5 minute input rate 1 bits/sec, 222 packets/sec\n"
                                                "Vlan100 is down, line protocol is down\n");
  ASSERT_EQ(RECORDS.size(), 3U);
  EXPECT_EQ(RECORDS[0].name, "Gi0/1");
  EXPECT_EQ(RECORDS[0].inputRate, 111U);
  EXPECT_EQ(RECORDS[1].name, "Port-channel10.200");
  EXPECT_EQ(RECORDS[1].inputRate, 222U);
  EXPECT_EQ(RECORDS[2].name, "Vlan100");
  EXPECT_EQ(RECORDS[2].inputRate, 0U);
}

/** @test A repeated header replaces the record but keeps its first position. */
TEST(InterfaceExtractionTest, DuplicateHeaderLastWins) {
  const auto RECORDS = extractInterfaceCounters("Gi0/1 is up, line protocol is up\n"
                                                "     100 packets input, 1 bytes, 1 total input drops\n"
                                                "Gi0/2 is up, line protocol is up\n"
                                                "Gi0/1 is up, line protocol is up\n"
                                                "  5 minute output rate 9 bits/sec, 42 packets/sec\n");
  ASSERT_EQ(RECORDS.size(), 2U);
  EXPECT_EQ(RECORDS[0].name, "Gi0/1");
  EXPECT_EQ(RECORDS[0].inputPackets, 0U);
  EXPECT_EQ(RECORDS[0].inputDrops, 0U);
  EXPECT_EQ(RECORDS[0].outputRate, 42U);
  EXPECT_EQ(RECORDS[1].name, "Gi0/2");
}

/** @test Header requires "is up" or "is down" right after the name. */
TEST(InterfaceExtractionTest, HeaderPatternStrict) {
  const auto RECORDS =
      extractInterfaceCounters("Hardware is iGbE, address is 0011.2233.4455\n"
                               "GigabitEthernet0/3 is administratively down, line protocol is down\n"
                               "0Bad is up, line protocol is up\n"
                               "  Line protocol is up\n");
  EXPECT_TRUE(RECORDS.empty());
}

/** @test CRLF line endings and tabs are trimmed. */
TEST(InterfaceExtractionTest, CrLfAndTabs) {
  const auto RECORDS = extractInterfaceCounters("Gi0/1 is up, line protocol is up\r\n"
                                                "\t\t12 input errors, 34 CRC, 0 frame, 0 overrun, 0 "
                                                "ignored, 0 abort\r\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].name, "Gi0/1");
  EXPECT_EQ(RECORDS[0].inputErrors, 12U);
  EXPECT_EQ(RECORDS[0].crcErrors, 34U);
}

/** @test Rate is taken from packets/sec, not bits/sec. */
TEST(InterfaceExtractionTest, RateUsesPacketsPerSec) {
  const auto RECORDS = extractInterfaceCounters("Gi0/1 is up\n"
                                                "  5 minute input rate 999999999 bits/sec, 7 packets/sec\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].inputRate, 7U);
}

/** @test Oversized numbers saturate instead of failing. */
TEST(InterfaceExtractionTest, OverflowSaturates) {
  const auto RECORDS =
      extractInterfaceCounters("Gi0/1 is up\n"
                               "  99999999999999999999999 output errors, 1 underruns\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].outputErrors, UINT64_MAX);
  EXPECT_EQ(RECORDS[0].underruns, 1U);
}

/** @test Elided middle of the packets line still matches. */
TEST(InterfaceExtractionTest, ElidedPacketsLine) {
  const auto RECORDS = extractInterfaceCounters("GigabitEthernet0/1 is up\n"
                                                "1000000 packets input, ... 5 total input drops\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].inputPackets, 1000000U);
  EXPECT_EQ(RECORDS[0].inputDrops, 5U);
}

/** @test The first number followed by packets/sec after the label wins. */
TEST(InterfaceExtractionTest, RateTakesFirstPacketsPerSec) {
  const auto RECORDS =
      extractInterfaceCounters("Gi0/1 is up\n"
                               "  5 minute input rate 12 packets/sec, 34 packets/sec\n"
                               "  5 minute output rate packets/sec then 56 packets/sec\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].inputRate, 12U);
  EXPECT_EQ(RECORDS[0].outputRate, 56U);
}

/** @test Packet count comes from the first "N packets input"; drops from the next "N total input drops". */
TEST(InterfaceExtractionTest, PacketsLineLeftmostCount) {
  const auto RECORDS =
      extractInterfaceCounters("Gi0/1 is up\n"
                               "10 packets input, 20 packets input, 3 total input drops\n"
                               "x packets output, 40 packets output, 9 total output drops\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].inputPackets, 10U);
  EXPECT_EQ(RECORDS[0].inputDrops, 3U);
  EXPECT_EQ(RECORDS[0].outputPackets, 40U);
  EXPECT_EQ(RECORDS[0].outputDrops, 9U);
}

/** @test A broken error sequence is skipped in favor of a later complete one. */
TEST(InterfaceExtractionTest, ErrorSequenceRetriesLaterMatch) {
  const auto RECORDS = extractInterfaceCounters(
      "Gi0/1 is up\n"
      "7 input errors, x CRC; 1 input errors, 2 CRC, 3 frame, 4 overrun, 5 ignored, 6 abort\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].inputErrors, 1U);
  EXPECT_EQ(RECORDS[0].crcErrors, 2U);
  EXPECT_EQ(RECORDS[0].frameErrors, 3U);
  EXPECT_EQ(RECORDS[0].overrunErrors, 4U);
  EXPECT_EQ(RECORDS[0].ignoredErrors, 5U);
  EXPECT_EQ(RECORDS[0].abortErrors, 6U);
}

/** @test Megabyte-long lines, including a long interface name, are scanned without failing. */
TEST(InterfaceExtractionTest, VeryLongLines) {
  constexpr std::size_t LONG = 1U << 20;

  std::string text = "Gi0/1 is up\n";
  text += "  5 minute input rate " + std::string(LONG, 'x') + "\n";
  text += "  5 minute output rate " + std::string(LONG, '9') + " packets/sec\n";
  text += std::string(LONG, '1') + " input errors, " + std::string(LONG, 'y') + "\n";
  text += "  1000 packets input, " + std::string(LONG, ' ') + "2 total input drops\n";
  text += std::string(LONG, 'a') + " is up, line protocol is up\n";
  text += "  3 output errors, 4 underruns\n";

  const ExtractionResult RES = extractInterfaceCountersSafe(text);
  EXPECT_EQ(RES.status, SourceStatus::OK);
  ASSERT_EQ(RES.interfaces.size(), 2U);

  const InterfaceCounters& FIRST = RES.interfaces[0];
  EXPECT_EQ(FIRST.name, "Gi0/1");
  EXPECT_EQ(FIRST.inputRate, 0U);
  EXPECT_EQ(FIRST.outputRate, UINT64_MAX);
  EXPECT_EQ(FIRST.inputErrors, 0U);
  EXPECT_EQ(FIRST.inputPackets, 1000U);
  EXPECT_EQ(FIRST.inputDrops, 2U);

  const InterfaceCounters& SECOND = RES.interfaces[1];
  EXPECT_EQ(SECOND.name.size(), LONG);
  EXPECT_EQ(SECOND.outputErrors, 3U);
  EXPECT_EQ(SECOND.underruns, 4U);
}

/** @test Lone CR line endings separate lines like LF. */
TEST(InterfaceExtractionTest, CrOnlyLineEndings) {
  std::string text = GIG01_BLOCK;
  std::replace(text.begin(), text.end(), '\n', '\r');

  const auto RECORDS = extractInterfaceCounters(text);
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].inputPackets, 1000000U);
  EXPECT_EQ(RECORDS[0].inputRate, 150000U);
  EXPECT_EQ(RECORDS[0].crcErrors, 300U);
  EXPECT_EQ(RECORDS[0].underruns, 6U);
}

/** @test Sums of saturated counters stay saturated and the record keeps its traffic. */
TEST(InterfaceExtractionTest, SaturatedSumsDoNotWrap) {
  const auto RECORDS =
      extractInterfaceCounters("Gi0/1 is up\n"
                               "  5 minute input rate 1 bits/sec, 150000 packets/sec\n"
                               "  99999999999999999999999 packets input, 1 bytes, 0 total input drops\n"
                               "  99999999999999999999999 input errors, 5 CRC, 0 frame, 0 overrun, "
                               "0 ignored, 0 abort\n"
                               "  1 packets output, 1 bytes, 0 total output drops\n");
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].inputPackets, UINT64_MAX);
  EXPECT_EQ(RECORDS[0].totalPackets(), UINT64_MAX);
  EXPECT_EQ(RECORDS[0].errorCrcSum(), UINT64_MAX);
  EXPECT_TRUE(passesTrafficFilter(RECORDS[0]));
}

/** @test saturatingAdd clamps at the top of the range. */
TEST(InterfaceCountersTest, SaturatingAdd) {
  EXPECT_EQ(saturatingAdd(2, 3), 5U);
  EXPECT_EQ(saturatingAdd(UINT64_MAX, 1), UINT64_MAX);
  EXPECT_EQ(saturatingAdd(UINT64_MAX - 1, 1), UINT64_MAX);
  EXPECT_EQ(saturatingAdd(UINT64_MAX, UINT64_MAX), UINT64_MAX);
}

/* ----------------------------- InterfaceExtractor Tests ----------------------------- */

/** @test Cursor follows headers and consumeLine reports matches. */
TEST(InterfaceExtractorTest, CursorAndMatches) {
  InterfaceExtractor ex;
  EXPECT_TRUE(ex.currentInterface().empty());

  EXPECT_FALSE(ex.consumeLine("  3 output errors, 2 underruns"));
  EXPECT_TRUE(ex.consumeLine("Te0/0/0 is up, line protocol is up"));
  EXPECT_EQ(ex.currentInterface(), "Te0/0/0");
  EXPECT_TRUE(ex.consumeLine("  3 output errors, 2 underruns"));
  EXPECT_FALSE(ex.consumeLine("  Encapsulation ARPA, loopback not set"));
  EXPECT_EQ(ex.size(), 1U);

  const auto RECORDS = ex.finish();
  ASSERT_EQ(RECORDS.size(), 1U);
  EXPECT_EQ(RECORDS[0].outputErrors, 3U);

  // finish() resets the fold
  EXPECT_EQ(ex.size(), 0U);
  EXPECT_TRUE(ex.currentInterface().empty());
}

/* ----------------------------- Safe/Loader Tests ----------------------------- */

/** @test Safe extraction reports OK on normal text. */
TEST(InterfaceLoaderTest, SafeExtractOk) {
  const ExtractionResult RES = extractInterfaceCountersSafe(GIG01_BLOCK);
  EXPECT_EQ(RES.status, SourceStatus::OK);
  EXPECT_EQ(RES.interfaces.size(), 1U);
  EXPECT_TRUE(RES.detail.empty());
}

/** @test Missing file is SOURCE_UNAVAILABLE with no records. */
TEST(InterfaceLoaderTest, MissingFile) {
  const ExtractionResult RES = loadInterfaceCounters("/nonexistent/ifscan/int_error.txt");
  EXPECT_EQ(RES.status, SourceStatus::SOURCE_UNAVAILABLE);
  EXPECT_TRUE(RES.interfaces.empty());
  EXPECT_NE(RES.sysErrno, 0);
}

/** @test Null path is SOURCE_UNAVAILABLE. */
TEST(InterfaceLoaderTest, NullPath) {
  const ExtractionResult RES = loadInterfaceCounters(nullptr);
  EXPECT_EQ(RES.status, SourceStatus::SOURCE_UNAVAILABLE);
  EXPECT_TRUE(RES.interfaces.empty());
}

/** @test A directory is not a readable source. */
TEST(InterfaceLoaderTest, DirectoryUnavailable) {
  const ExtractionResult RES = loadInterfaceCounters("/");
  EXPECT_EQ(RES.status, SourceStatus::SOURCE_UNAVAILABLE);
  EXPECT_TRUE(RES.interfaces.empty());
}

/** @test A real file is read and parsed. */
TEST(InterfaceLoaderTest, ReadsFile) {
  char path[] = "/tmp/ifscan_counters_XXXXXX";
  const int FD = ::mkstemp(path);
  ASSERT_GE(FD, 0);
  ::close(FD);

  {
    std::ofstream out(path);
    out << GIG01_BLOCK;
  }

  const ExtractionResult RES = loadInterfaceCounters(path);
  std::remove(path);

  EXPECT_EQ(RES.status, SourceStatus::OK);
  ASSERT_EQ(RES.interfaces.size(), 1U);
  EXPECT_EQ(RES.interfaces[0].crcErrors, 300U);
}
