#pragma once

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "classification.hpp"
#include "storm.hpp"
#include "time_utils.hpp"

namespace tc_season {

struct StormOverlap {
  DateTime start;
  DateTime end;
  std::vector<std::string> storm_ids;  // full ATCF ids, in dataset order
};

// Storms grouped by season. Holds pointers into the caller's storms, which
// must outlive the dataset.
class SeasonDataset {
 public:
  explicit SeasonDataset(const std::vector<Storm>& storms);
  // A temporary vector would leave the dataset pointing at freed storms.
  explicit SeasonDataset(std::vector<Storm>&&) = delete;

  bool hasSeason(int year) const { return seasons_.count(year) != 0; }
  std::vector<int> seasons() const;
  // Throws std::out_of_range if the season has no storms.
  const std::vector<const Storm*>& stormsOf(int year) const;

  // nullptr when the id is unknown.
  const Storm* getStorm(const std::string& full_atcf_id) const;

  // ACE per day of the calendar year (365 or 366 entries), gathered from the
  // storms of year-1, year and year+1. With push_leap_day the Feb 29 value is
  // folded into Mar 1 and the array shrinks to 365.
  // Throws std::out_of_range if none of the three seasons is present.
  Eigen::VectorXd dailyAce(int year,
                           bool push_leap_day = false,
                           std::optional<Basin> basin = std::nullopt) const;

  // Running sum of dailyAce().
  Eigen::VectorXd cumulativeAce(int year,
                                bool push_leap_day = false,
                                std::optional<Basin> basin = std::nullopt) const;

  // Spans in which two or more storms of the season are active at once.
  // tropical: use the tropical part of each track; storms without one are left out.
  // basin: only storms with at least one sample in that basin.
  // Throws std::out_of_range if the season has no storms.
  std::vector<StormOverlap> overlappingStorms(int year,
                                              bool tropical = true,
                                              std::optional<Basin> basin = std::nullopt) const;

 private:
  std::map<int, std::vector<const Storm*>> seasons_;
  std::unordered_map<std::string, const Storm*> storms_;
};

}  // namespace tc_season
