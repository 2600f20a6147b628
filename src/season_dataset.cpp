#include "season_dataset.hpp"

#include <stdexcept>
#include <utility>

#include "overlap.hpp"

namespace tc_season {

static constexpr Eigen::Index kFeb29Index = 59;

SeasonDataset::SeasonDataset(const std::vector<Storm>& storms) {
  for (const Storm& s : storms) {
    seasons_[s.season()].push_back(&s);
    storms_[s.fullAtcfId()] = &s;
  }
}

std::vector<int> SeasonDataset::seasons() const {
  std::vector<int> out;
  out.reserve(seasons_.size());
  for (const auto& kv : seasons_) out.push_back(kv.first);
  return out;
}

const std::vector<const Storm*>& SeasonDataset::stormsOf(int year) const {
  const auto it = seasons_.find(year);
  if (it == seasons_.end()) {
    throw std::out_of_range("Season " + std::to_string(year) + " not in dataset");
  }
  return it->second;
}

const Storm* SeasonDataset::getStorm(const std::string& full_atcf_id) const {
  const auto it = storms_.find(full_atcf_id);
  return (it == storms_.end()) ? nullptr : it->second;
}

Eigen::VectorXd SeasonDataset::dailyAce(int year, bool push_leap_day, std::optional<Basin> basin) const {
  if (!hasSeason(year - 1) && !hasSeason(year) && !hasSeason(year + 1)) {
    throw std::out_of_range("Year " + std::to_string(year) + " not in dataset");
  }

  const Eigen::Index days = isLeapYear(year) ? 366 : 365;
  Eigen::VectorXd ace = Eigen::VectorXd::Zero(days);

  DateTime jan1;
  jan1.year = year;
  jan1.month = 1;
  jan1.day = 1;
  const long jan1_mjd = static_cast<long>(toModifiedJulianDate(jan1));

  for (int y = year - 1; y <= year + 1; ++y) {
    const auto it = seasons_.find(y);
    if (it == seasons_.end()) continue;

    for (const Storm* storm : it->second) {
      for (const auto& kv : storm->dailyAce()) {
        const long offset = kv.first - jan1_mjd;
        if (offset < 0 || offset >= days) continue;
        ace(offset) += basin ? kv.second.get(*basin) : kv.second.total();
      }
    }
  }

  if (push_leap_day && days == 366) {
    Eigen::VectorXd folded(365);
    folded.head(kFeb29Index) = ace.head(kFeb29Index);
    folded(kFeb29Index) = ace(kFeb29Index) + ace(kFeb29Index + 1);
    folded.tail(365 - kFeb29Index - 1) = ace.tail(366 - kFeb29Index - 2);
    return folded;
  }
  return ace;
}

Eigen::VectorXd SeasonDataset::cumulativeAce(int year, bool push_leap_day, std::optional<Basin> basin) const {
  Eigen::VectorXd ace = dailyAce(year, push_leap_day, basin);
  for (Eigen::Index k = 1; k < ace.size(); ++k) {
    ace(k) += ace(k - 1);
  }
  return ace;
}

std::vector<StormOverlap> SeasonDataset::overlappingStorms(int year, bool tropical, std::optional<Basin> basin) const {
  const std::vector<const Storm*>& storms = stormsOf(year);

  std::vector<const Storm*> members;
  std::vector<std::pair<DateTime, DateTime>> intervals;
  for (const Storm* s : storms) {
    if (basin && !s->visitsBasin(*basin)) continue;
    if (tropical) {
      if (!s->startTimeTropical() || !s->endTimeTropical()) continue;
      intervals.emplace_back(*s->startTimeTropical(), *s->endTimeTropical());
    } else {
      intervals.emplace_back(s->startTime(), s->endTime());
    }
    members.push_back(s);
  }

  std::vector<StormOverlap> out;
  for (const OverlapSpan<DateTime>& span : findOverlaps(intervals)) {
    StormOverlap o;
    o.start = span.start;
    o.end = span.end;
    for (std::size_t idx : span.members) {
      o.storm_ids.push_back(members[idx]->fullAtcfId());
    }
    out.push_back(std::move(o));
  }
  return out;
}

}  // namespace tc_season
