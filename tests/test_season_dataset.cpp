#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "season_dataset.hpp"
#include "test_helpers.hpp"

namespace tc_season {
namespace {

using test_util::utc;
using test_util::vec;

using Types = std::optional<std::vector<std::string>>;

Storm span(const std::string& id, const DateTime& start, const DateTime& end, double lon = 130.0,
           Types types = std::nullopt) {
  return Storm(id, {start, end}, vec({lon, lon + 1.0}), vec({15.0, 16.0}), vec({40.0, 40.0}), std::nullopt,
               std::move(types));
}

// The dataset keeps pointers into the storms, so it must not bind to a temporary.
static_assert(std::is_constructible<SeasonDataset, const std::vector<Storm>&>::value,
              "SeasonDataset is built from an lvalue vector");
static_assert(!std::is_constructible<SeasonDataset, std::vector<Storm>&&>::value,
              "SeasonDataset must not bind to a temporary vector");

class SeasonDatasetTest : public ::testing::Test {
 protected:
  SeasonDatasetTest()
      : storms_({
            span("WP01", utc(2019, 8, 1), utc(2019, 8, 11)),
            span("WP02", utc(2019, 8, 6), utc(2019, 8, 16)),
            span("EP03", utc(2019, 8, 21), utc(2019, 8, 26), -120.0),
            span("WP04", utc(2019, 8, 7), utc(2019, 8, 9), 130.0, Types(std::vector<std::string>{"EX", "EX"})),
            span("WP10", utc(2019, 12, 31, 12), utc(2020, 1, 1, 6)),
        }),
        dataset_(storms_) {}

  std::vector<Storm> storms_;
  SeasonDataset dataset_;
};

TEST_F(SeasonDatasetTest, IndexesBySeasonAndId) {
  EXPECT_TRUE(dataset_.hasSeason(2019));
  EXPECT_FALSE(dataset_.hasSeason(2020));
  EXPECT_EQ(dataset_.seasons(), std::vector<int>{2019});
  EXPECT_EQ(dataset_.stormsOf(2019).size(), 5u);

  const Storm* s = dataset_.getStorm("WP022019");
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s, &storms_[1]);
  EXPECT_EQ(dataset_.getStorm("WP022020"), nullptr);
  EXPECT_THROW(dataset_.stormsOf(2020), std::out_of_range);
}

TEST_F(SeasonDatasetTest, TropicalOverlapSkipsStormsWithoutTropicalPart) {
  const std::vector<StormOverlap> overlaps = dataset_.overlappingStorms(2019);
  ASSERT_EQ(overlaps.size(), 1u);
  EXPECT_EQ(overlaps[0].start, utc(2019, 8, 6));
  EXPECT_EQ(overlaps[0].end, utc(2019, 8, 11));
  EXPECT_EQ(overlaps[0].storm_ids, (std::vector<std::string>{"WP012019", "WP022019"}));
}

TEST_F(SeasonDatasetTest, AllRecordOverlapIncludesEveryStorm) {
  const std::vector<StormOverlap> overlaps = dataset_.overlappingStorms(2019, false);
  ASSERT_EQ(overlaps.size(), 3u);
  EXPECT_EQ(overlaps[0].start, utc(2019, 8, 6));
  EXPECT_EQ(overlaps[0].end, utc(2019, 8, 7));
  EXPECT_EQ(overlaps[1].end, utc(2019, 8, 9));
  EXPECT_EQ(overlaps[1].storm_ids, (std::vector<std::string>{"WP012019", "WP022019", "WP042019"}));
  EXPECT_EQ(overlaps[2].start, utc(2019, 8, 9));
  EXPECT_EQ(overlaps[2].end, utc(2019, 8, 11));
}

TEST_F(SeasonDatasetTest, OverlapBasinFilter) {
  EXPECT_TRUE(dataset_.overlappingStorms(2019, true, Basin::EPAC).empty());
  EXPECT_EQ(dataset_.overlappingStorms(2019, true, Basin::WPAC).size(), 1u);
}

TEST_F(SeasonDatasetTest, OverlapOfUnknownSeasonThrows) {
  EXPECT_THROW(dataset_.overlappingStorms(2005), std::out_of_range);
}

TEST_F(SeasonDatasetTest, DailyAceCoversCalendarYear) {
  const Eigen::VectorXd daily = dataset_.dailyAce(2019);
  ASSERT_EQ(daily.size(), 365);

  // Aug 1 is day 212 of 2019; only WP01 is active and tropical at 00Z.
  EXPECT_DOUBLE_EQ(daily(212), 0.16);
  // Aug 7: only WP04 has a sample, and it is extratropical.
  EXPECT_DOUBLE_EQ(daily(218), 0.0);
  EXPECT_NEAR(daily.sum(), dataset_.cumulativeAce(2019)(364), 1e-12);
}

TEST_F(SeasonDatasetTest, DailyAcePicksUpNeighbouringSeason) {
  // WP10 belongs to 2019 but its Jan 1 06Z sample lands in 2020.
  const Eigen::VectorXd daily = dataset_.dailyAce(2020);
  ASSERT_EQ(daily.size(), 366);
  EXPECT_DOUBLE_EQ(daily(0), 0.16);
  EXPECT_DOUBLE_EQ(daily.tail(365).sum(), 0.0);

  const Eigen::VectorXd d2019 = dataset_.dailyAce(2019);
  EXPECT_DOUBLE_EQ(d2019(364), 0.16);
}

TEST_F(SeasonDatasetTest, DailyAceBasinFilter) {
  const Eigen::VectorXd all = dataset_.dailyAce(2019);
  const Eigen::VectorXd epac = dataset_.dailyAce(2019, false, Basin::EPAC);
  const Eigen::VectorXd wpac = dataset_.dailyAce(2019, false, Basin::WPAC);
  // EP03: Aug 21 (day 232) and Aug 26 (day 237) samples.
  EXPECT_DOUBLE_EQ(epac(232), 0.16);
  EXPECT_DOUBLE_EQ(epac(237), 0.16);
  EXPECT_DOUBLE_EQ(wpac(232), 0.0);
  EXPECT_NEAR(epac.sum() + wpac.sum(), all.sum(), 1e-12);
}

TEST_F(SeasonDatasetTest, YearWithoutDataThrows) {
  EXPECT_THROW(dataset_.dailyAce(1990), std::out_of_range);
  EXPECT_THROW(dataset_.cumulativeAce(1990), std::out_of_range);
  EXPECT_NO_THROW(dataset_.dailyAce(2018));
}

TEST(SeasonDataset, LeapDayFoldsIntoMarchFirst) {
  const std::vector<Storm> storms = {
      Storm("WP01", {utc(2020, 2, 28, 0), utc(2020, 2, 29, 0), utc(2020, 3, 1, 0)}, vec({130.0, 131.0, 132.0}),
            vec({15.0, 15.0, 15.0}), vec({40.0, 60.0, 50.0})),
  };
  const SeasonDataset ds(storms);

  const Eigen::VectorXd plain = ds.dailyAce(2020);
  ASSERT_EQ(plain.size(), 366);
  EXPECT_DOUBLE_EQ(plain(58), 0.16);
  EXPECT_DOUBLE_EQ(plain(59), 0.36);
  EXPECT_DOUBLE_EQ(plain(60), 0.25);

  const Eigen::VectorXd folded = ds.dailyAce(2020, true);
  ASSERT_EQ(folded.size(), 365);
  EXPECT_DOUBLE_EQ(folded(58), 0.16);
  EXPECT_DOUBLE_EQ(folded(59), plain(59) + plain(60));
  EXPECT_DOUBLE_EQ(folded(60), plain(61));
  EXPECT_DOUBLE_EQ(folded(364), plain(365));

  const Eigen::VectorXd cumulative = ds.cumulativeAce(2020, true);
  ASSERT_EQ(cumulative.size(), 365);
  EXPECT_NEAR(cumulative(364), 0.77, 1e-12);
}

TEST(SeasonDataset, PushLeapDayIsNoOpInCommonYear) {
  const std::vector<Storm> storms = {span("WP01", utc(2019, 3, 1), utc(2019, 3, 2))};
  const SeasonDataset ds(storms);
  const Eigen::VectorXd a = ds.dailyAce(2019);
  const Eigen::VectorXd b = ds.dailyAce(2019, true);
  ASSERT_EQ(b.size(), 365);
  EXPECT_TRUE(a.isApprox(b));
}

TEST(SeasonDataset, OverlapOfSingleStormIsEmpty) {
  const std::vector<Storm> storms = {span("WP01", utc(2019, 8, 1), utc(2019, 8, 11))};
  const SeasonDataset ds(storms);
  EXPECT_TRUE(ds.overlappingStorms(2019).empty());
}

}  // namespace
}  // namespace tc_season
