#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "bdeck_reader.hpp"
#include "classification.hpp"
#include "geodesy.hpp"
#include "time_utils.hpp"

namespace tc_season {

// Samples closer than this [deg] to a selection polygon count as inside.
constexpr double kSelectionToleranceDeg = 0.01;

struct TrackFlags {
  bool subset = false;        // fewer samples than the track it came from
  bool continuous = true;     // no samples dropped from the middle
  bool interpolated = false;  // resampled onto a uniform grid
};

// ACE per day, keyed by floor(MJD).
using DailyAce = std::map<long, BasinACE>;

// One storm's best track. Immutable after construction; all derived
// quantities are computed once in the constructor.
class Storm {
 public:
  // Throws std::invalid_argument if the series is empty, the columns differ
  // in length or the times decrease. Times are normalized to UTC.
  Storm(std::string atcf_id,
        std::vector<DateTime> time,
        Eigen::VectorXd lon,
        Eigen::VectorXd lat,
        Eigen::VectorXd wind,
        std::optional<Eigen::VectorXd> pressure = std::nullopt,
        std::optional<std::vector<std::string>> storm_type = std::nullopt,
        std::string name = std::string(),
        TrackFlags flags = TrackFlags());

  // Throws std::runtime_error if the file cannot be read or has no usable records.
  static Storm fromBDeck(const std::filesystem::path& file,
                         const BDeckReadOptions& options = BDeckReadOptions{false, false});

  // Throws std::invalid_argument if data holds no records.
  static Storm fromBDeckData(const BDeckData& data);

  // Identity
  const std::string& atcfId() const { return atcf_id_; }
  std::string atcfBasin() const;
  int atcfNumber() const;
  int season() const { return season_; }
  std::string fullAtcfId() const;
  const std::string& name() const { return name_; }

  // Samples
  std::size_t size() const { return time_.size(); }
  const std::vector<DateTime>& time() const { return time_; }
  const Eigen::VectorXd& lon() const { return lon_; }
  const Eigen::VectorXd& lat() const { return lat_; }
  const Eigen::VectorXd& wind() const { return wind_; }
  const Eigen::VectorXd& mjd() const { return mjd_; }
  const std::optional<Eigen::VectorXd>& pressure() const { return pressure_; }
  const std::optional<std::vector<std::string>>& stormType() const { return storm_type_; }
  const TrackFlags& flags() const { return flags_; }

  const DateTime& startTime() const { return time_.front(); }
  const DateTime& endTime() const { return time_.back(); }
  // Empty when type codes exist but none is tropical.
  const std::optional<DateTime>& startTimeTropical() const { return start_tropical_; }
  const std::optional<DateTime>& endTimeTropical() const { return end_tropical_; }

  double maxWind() const { return wind_.maxCoeff(); }

  const DailyAce& dailyAce() const { return daily_ace_; }
  double totalAce() const { return total_ace_; }
  // Uncached evaluation behind dailyAce().
  DailyAce computeDailyAce() const;

  // Bearing [deg] and speed [kt] of each step; size() - 1 entries.
  const Movement& movement() const { return movement_; }

  // True if any sample lies in the basin.
  bool visitsBasin(Basin basin) const;

  // Samples inside the (lon, lat) polygon grown by kSelectionToleranceDeg.
  // Returns nullopt when no sample matches.
  std::optional<Storm> selectWithin(const std::vector<Eigen::Vector2d>& polygon) const;

  // Resample onto a uniform grid of interval_hours. Numeric columns are
  // linear (extrapolated at the ends), type codes nearest-neighbour.
  // Throws std::invalid_argument for a discontinuous track or interval <= 0.
  Storm interpolate(double interval_hours) const;

 private:
  Storm subset(const std::vector<std::size_t>& indices, TrackFlags flags) const;
  int computeSeason() const;
  bool isTropicalSample(std::size_t k) const;

  std::string atcf_id_;
  std::string name_;
  std::vector<DateTime> time_;
  Eigen::VectorXd lon_;
  Eigen::VectorXd lat_;
  Eigen::VectorXd wind_;
  std::optional<Eigen::VectorXd> pressure_;
  std::optional<std::vector<std::string>> storm_type_;
  TrackFlags flags_;

  // Derived
  Eigen::VectorXd mjd_;
  int season_ = 0;
  std::optional<DateTime> start_tropical_;
  std::optional<DateTime> end_tropical_;
  DailyAce daily_ace_;
  double total_ace_ = 0.0;
  Movement movement_;
};

// Build one Storm per file (the batch counterpart of Storm::fromBDeck).
// Throws std::runtime_error naming the first file that cannot be read.
std::vector<Storm> loadStorms(const std::vector<std::filesystem::path>& files,
                              const BDeckReadOptions& options = BDeckReadOptions{false, false});

}  // namespace tc_season
