#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "bdeck_reader.hpp"
#include "test_helpers.hpp"

namespace tc_season {
namespace {

using test_util::longLine;
using test_util::shortLine;

const WindRadii kR34{80, 70, 60, 80};
const WindRadii kR50{40, 35, 30, 40};
const WindRadii kR64{20, 15, 10, 20};

BDeckReadOptions allRecords() {
  BDeckReadOptions o;
  o.formal_advisory_only = false;
  o.tropical_nature_only = false;
  return o;
}

TEST(BDeckReader, SafeIntFallsBackToSentinel) {
  EXPECT_EQ(safeInt(" 45 "), 45);
  EXPECT_EQ(safeInt("-12"), -12);
  EXPECT_EQ(safeInt("xx"), kMissingValue);
  EXPECT_EQ(safeInt("12a"), kMissingValue);
  EXPECT_EQ(safeInt(""), kMissingValue);
  EXPECT_EQ(safeInt("99999999999999"), kMissingValue);
}

TEST(BDeckReader, LineCursorOnlyMovesForward) {
  const std::vector<std::string> lines = {"a", "b"};
  LineCursor cursor(lines);
  EXPECT_FALSE(cursor.atEnd());
  EXPECT_EQ(cursor.take(), "a");
  EXPECT_EQ(cursor.position(), 1u);
  EXPECT_EQ(cursor.take(), "b");
  EXPECT_TRUE(cursor.atEnd());
}

TEST(BDeckReader, LongRecordCollectsAllRadii) {
  const std::vector<std::string> lines = {
      longLine("2019022012", 65, "TY", 34, kR34),
      longLine("2019022012", 65, "TY", 50, kR50),
      longLine("2019022012", 65, "TY", 64, kR64),
  };

  const BDeckData data = parseBDeckLines(lines);
  ASSERT_EQ(data.records.size(), 1u);
  const BDeckRecord& r = data.records[0];

  EXPECT_TRUE(r.long_format);
  EXPECT_EQ(r.basin, "WP");
  EXPECT_EQ(r.number, 2);
  EXPECT_EQ(r.timestamp, "2019022012");
  EXPECT_EQ(r.time.hour, 12);
  EXPECT_EQ(r.techcode, "BEST");
  EXPECT_EQ(r.tau, 0);
  EXPECT_DOUBLE_EQ(r.lat, 10.5);
  EXPECT_DOUBLE_EQ(r.lon, 144.5);
  EXPECT_EQ(r.wind, 65);
  ASSERT_TRUE(r.pressure.has_value());
  EXPECT_EQ(*r.pressure, 985);
  EXPECT_EQ(r.raw_category, "TY");
  EXPECT_EQ(r.category, "C1");

  ASSERT_TRUE(r.r34.has_value());
  ASSERT_TRUE(r.r50.has_value());
  ASSERT_TRUE(r.r64.has_value());
  EXPECT_EQ(*r.r34, kR34);
  EXPECT_EQ(*r.r50, kR50);
  EXPECT_EQ(*r.r64, kR64);

  EXPECT_EQ(r.lci, 1005);
  EXPECT_EQ(r.lci_radius, 180);
  EXPECT_EQ(r.rmw, 20);
  EXPECT_EQ(r.name, std::string("WUTIP"));
  EXPECT_EQ(r.depth, std::string("D"));
}

TEST(BDeckReader, FiftyKnotRecordReadsOneContinuation) {
  const std::vector<std::string> lines = {
      longLine("2019022018", 55, "TS", 34, kR34),
      longLine("2019022018", 55, "TS", 50, kR50),
      longLine("2019022100", 45, "TS", 34, kR34),
  };

  const BDeckData data = parseBDeckLines(lines);
  ASSERT_EQ(data.records.size(), 2u);
  EXPECT_EQ(*data.records[0].r50, kR50);
  EXPECT_FALSE(data.records[0].r64.has_value());
  EXPECT_EQ(data.records[1].timestamp, "2019022100");
  EXPECT_TRUE(data.records[1].r34.has_value());
  EXPECT_FALSE(data.records[1].r50.has_value());
}

TEST(BDeckReader, MismatchedContinuationIsConsumed) {
  const std::vector<std::string> lines = {
      longLine("2019022012", 55, "TS", 34, kR34),
      longLine("2019022018", 45, "TS", 34, kR34),
      longLine("2019022100", 40, "TS", 34, kR34),
  };

  const BDeckData data = parseBDeckLines(lines);
  ASSERT_EQ(data.records.size(), 2u);
  EXPECT_EQ(data.records[0].timestamp, "2019022012");
  EXPECT_TRUE(data.records[0].r34.has_value());
  EXPECT_FALSE(data.records[0].r50.has_value());
  // The 18Z line was taken by the lookahead and dropped.
  EXPECT_EQ(data.records[1].timestamp, "2019022100");
}

TEST(BDeckReader, MismatchStopsSixtyFourKnotLookahead) {
  const std::vector<std::string> lines = {
      longLine("2019022012", 70, "TY", 34, kR34),
      longLine("2019022018", 70, "TY", 34, kR34),
      longLine("2019022018", 70, "TY", 50, kR50),
  };

  const BDeckData data = parseBDeckLines(lines);
  ASSERT_EQ(data.records.size(), 2u);
  EXPECT_FALSE(data.records[0].r50.has_value());
  EXPECT_FALSE(data.records[0].r64.has_value());
  // The leftover 50 kt line of 18Z is read as a record of its own.
  EXPECT_EQ(data.records[1].timestamp, "2019022018");
}

TEST(BDeckReader, LookaheadAtEndKeepsRecord) {
  const BDeckData data = parseBDeckLines({longLine("2019022012", 70, "TY", 34, kR34)});
  ASSERT_EQ(data.records.size(), 1u);
  EXPECT_TRUE(data.records[0].r34.has_value());
  EXPECT_FALSE(data.records[0].r50.has_value());
  EXPECT_FALSE(data.records[0].r64.has_value());
}

TEST(BDeckReader, ShortFormatHasNoLongFields) {
  const BDeckData data = parseBDeckLines({shortLine("1999010100", 40, "TS", 998, "150S", "1200W")});
  ASSERT_EQ(data.records.size(), 1u);
  const BDeckRecord& r = data.records[0];

  EXPECT_FALSE(r.long_format);
  EXPECT_DOUBLE_EQ(r.lat, -15.0);
  EXPECT_DOUBLE_EQ(r.lon, -120.0);
  EXPECT_EQ(r.technum, "01");
  EXPECT_EQ(r.pressure, 998);
  EXPECT_EQ(r.category, "TS");
  EXPECT_FALSE(r.r34.has_value());
  EXPECT_FALSE(r.r50.has_value());
  EXPECT_FALSE(r.lci.has_value());
  EXPECT_FALSE(r.rmw.has_value());
  EXPECT_FALSE(r.name.has_value());
  EXPECT_FALSE(r.depth.has_value());
}

TEST(BDeckReader, MinimalShortRecordClassifiesFromWind) {
  const BDeckData data = parseBDeckLines({"WP, 01, 1999010100,   , BEST,   0,  95N, 1450E,  90"});
  ASSERT_EQ(data.records.size(), 1u);
  EXPECT_EQ(data.records[0].category, "C2");
  EXPECT_TRUE(data.records[0].raw_category.empty());
  EXPECT_FALSE(data.records[0].pressure.has_value());
}

TEST(BDeckReader, FormalAdvisoryFilter) {
  const std::vector<std::string> lines = {
      shortLine("1999010100", 30),
      shortLine("1999010103", 35),
      shortLine("1999010106", 40),
  };

  EXPECT_EQ(parseBDeckLines(lines).records.size(), 2u);
  EXPECT_EQ(parseBDeckLines(lines, allRecords()).records.size(), 3u);
}

TEST(BDeckReader, TropicalNatureFilterAppliesToLongFormatOnly) {
  BDeckReadOptions opts;
  opts.tropical_nature_only = true;

  const std::vector<std::string> lines = {
      longLine("2019022000", 30, "SD", 34, kR34),
      longLine("2019022006", 40, "TS", 34, kR34),
      longLine("2019022012", 40, "EX", 34, kR34),
      shortLine("2019022018", 40, "EX"),
  };

  const BDeckData data = parseBDeckLines(lines, opts);
  ASSERT_EQ(data.records.size(), 2u);
  EXPECT_EQ(data.records[0].raw_category, "TS");
  EXPECT_EQ(data.records[1].raw_category, "EX");
  EXPECT_FALSE(data.records[1].long_format);

  EXPECT_EQ(parseBDeckLines(lines).records.size(), 4u);
}

TEST(BDeckReader, MalformedFieldsDegradeToSentinel) {
  const BDeckData data = parseBDeckLines({
      "WP, 01, 1999010100, 01, BEST,   0,  95N, 1450E,  xx, 1004, TD",
      "WP, 01, 1999O10100, 01, BEST,   0,  95N, 1450E,  40, 1004, TS",
      "WP, 01, 1999010106",
      "",
  });

  ASSERT_EQ(data.records.size(), 1u);
  EXPECT_EQ(data.records[0].wind, kMissingValue);
  EXPECT_EQ(data.metadata.skipped_lines, 2u);
}

TEST(BDeckReader, MetadataTracksPeakAndMinimum) {
  const std::vector<std::string> lines = {
      shortLine("2019080100", 30, "TD", 1004),
      shortLine("2019080106", 45, "TS", 995),
      shortLine("2019080112", 45, "TS", 990),
      shortLine("2019080118", 40, "TS", 997),
  };

  const BDeckData data = parseBDeckLines(lines);
  EXPECT_EQ(data.metadata.max_wind, 45);
  ASSERT_EQ(data.metadata.peak_times.size(), 2u);
  EXPECT_EQ(data.metadata.peak_times[0].hour, 6);
  EXPECT_EQ(data.metadata.peak_times[1].hour, 12);
  EXPECT_EQ(data.metadata.min_pressure, 990);
  EXPECT_EQ(data.metadata.full_code, "WP01");
  EXPECT_TRUE(data.metadata.name.empty());
}

TEST(BDeckReader, MetadataNameComesFromPeak) {
  const std::vector<std::string> lines = {
      longLine("2019022000", 30, "TD", 34, kR34, "TWO"),
      longLine("2019022006", 45, "TS", 34, kR34, "WUTIP"),
      longLine("2019022012", 40, "TS", 34, kR34, "LATER"),
  };

  const BDeckData data = parseBDeckLines(lines);
  EXPECT_EQ(data.metadata.name, "WUTIP");
  EXPECT_EQ(data.metadata.full_code, "WP02");
}

TEST(BDeckReader, LoadFromFile) {
  const std::filesystem::path path = std::filesystem::temp_directory_path() / "tc_season_test_bwp022019.dat";
  {
    std::ofstream ofs(path);
    ofs << longLine("2019022012", 55, "TS", 34, kR34) << "\r\n";
    ofs << longLine("2019022012", 55, "TS", 50, kR50) << "\n";
  }

  BDeckData data;
  ASSERT_TRUE(loadBDeckFile(path, data));
  ASSERT_EQ(data.records.size(), 1u);
  EXPECT_EQ(*data.records[0].r50, kR50);
  std::filesystem::remove(path);

  EXPECT_FALSE(loadBDeckFile(path, data));
  EXPECT_TRUE(data.records.empty());
}

}  // namespace
}  // namespace tc_season
