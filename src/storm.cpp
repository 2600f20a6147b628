#include "storm.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "interpolation.hpp"

namespace tc_season {

static bool isSynoptic(const DateTime& t) {
  return t.hour % 6 == 0;
}

// Removes the +-360 jumps of a dateline crossing so the series can be
// interpolated; wrapLongitude() brings values back.
static Eigen::VectorXd unwrapLongitude(const Eigen::VectorXd& lon) {
  Eigen::VectorXd out = lon;
  double offset = 0.0;
  for (Eigen::Index k = 1; k < lon.size(); ++k) {
    const double d = lon(k) - lon(k - 1);
    if (d > 180.0) {
      offset -= 360.0;
    } else if (d < -180.0) {
      offset += 360.0;
    }
    out(k) = lon(k) + offset;
  }
  return out;
}

static double wrapLongitude(double lon, bool signed_range) {
  if (signed_range) {
    double x = std::fmod(lon + 180.0, 360.0);
    if (x < 0) x += 360.0;
    return x - 180.0;
  }
  double x = std::fmod(lon, 360.0);
  if (x < 0) x += 360.0;
  return x;
}

Storm::Storm(std::string atcf_id,
             std::vector<DateTime> time,
             Eigen::VectorXd lon,
             Eigen::VectorXd lat,
             Eigen::VectorXd wind,
             std::optional<Eigen::VectorXd> pressure,
             std::optional<std::vector<std::string>> storm_type,
             std::string name,
             TrackFlags flags)
    : atcf_id_(std::move(atcf_id)),
      name_(std::move(name)),
      time_(std::move(time)),
      lon_(std::move(lon)),
      lat_(std::move(lat)),
      wind_(std::move(wind)),
      pressure_(std::move(pressure)),
      storm_type_(std::move(storm_type)),
      flags_(flags) {
  const Eigen::Index n = static_cast<Eigen::Index>(time_.size());
  if (n == 0) {
    throw std::invalid_argument("Storm " + atcf_id_ + ": empty track");
  }
  if (lon_.size() != n || lat_.size() != n || wind_.size() != n ||
      (pressure_ && pressure_->size() != n) ||
      (storm_type_ && static_cast<Eigen::Index>(storm_type_->size()) != n)) {
    throw std::invalid_argument("Storm " + atcf_id_ + ": column lengths differ");
  }

  mjd_.resize(n);
  for (Eigen::Index k = 0; k < n; ++k) {
    time_[k] = toUtc(time_[k]);
    mjd_(k) = toModifiedJulianDate(time_[k]);
    if (k > 0 && mjd_(k) < mjd_(k - 1)) {
      throw std::invalid_argument("Storm " + atcf_id_ + ": times are not in order");
    }
  }

  season_ = computeSeason();

  if (!storm_type_) {
    start_tropical_ = time_.front();
    end_tropical_ = time_.back();
  } else {
    for (std::size_t k = 0; k < time_.size(); ++k) {
      if (isTropicalType((*storm_type_)[k])) {
        if (!start_tropical_) start_tropical_ = time_[k];
        end_tropical_ = time_[k];
      }
    }
  }

  daily_ace_ = computeDailyAce();
  for (const auto& kv : daily_ace_) {
    total_ace_ += kv.second.total();
  }

  movement_ = computeMovement(lon_, lat_, mjd_);
}

Storm Storm::fromBDeckData(const BDeckData& data) {
  const std::vector<BDeckRecord>& recs = data.records;
  if (recs.empty()) {
    throw std::invalid_argument("Storm: no BDeck records");
  }

  const Eigen::Index n = static_cast<Eigen::Index>(recs.size());
  std::vector<DateTime> time;
  time.reserve(recs.size());
  Eigen::VectorXd lon(n), lat(n), wind(n), pres(n);
  std::vector<std::string> types;
  types.reserve(recs.size());
  bool any_pressure = false;
  bool any_type = false;

  for (Eigen::Index k = 0; k < n; ++k) {
    const BDeckRecord& r = recs[k];
    time.push_back(r.time);
    lon(k) = r.lon;
    lat(k) = r.lat;
    wind(k) = r.wind;
    pres(k) = r.pressure.value_or(kMissingValue);
    any_pressure = any_pressure || r.pressure.has_value();
    any_type = any_type || !r.raw_category.empty();
    types.push_back(r.raw_category);
  }

  std::optional<Eigen::VectorXd> pressure;
  if (any_pressure) pressure = std::move(pres);
  std::optional<std::vector<std::string>> storm_type;
  if (any_type) storm_type = std::move(types);

  return Storm(data.metadata.full_code, std::move(time), std::move(lon), std::move(lat), std::move(wind),
               std::move(pressure), std::move(storm_type), data.metadata.name);
}

Storm Storm::fromBDeck(const std::filesystem::path& file, const BDeckReadOptions& options) {
  BDeckData data;
  if (!loadBDeckFile(file, data, options)) {
    throw std::runtime_error("Cannot open BDeck file: " + file.string());
  }
  if (data.records.empty()) {
    throw std::runtime_error("No usable records in BDeck file: " + file.string());
  }
  return fromBDeckData(data);
}

std::string Storm::atcfBasin() const {
  return atcf_id_.substr(0, 2);
}

int Storm::atcfNumber() const {
  if (atcf_id_.size() <= 2) return kMissingValue;
  return safeInt(atcf_id_.substr(2));
}

std::string Storm::fullAtcfId() const {
  return atcf_id_ + std::to_string(season_);
}

// Northern basins count the calendar year; southern seasons run July-June and
// are named after the year they end in. A storm crossing Jan 1 goes to the
// new year only when its number modulo 60 is below 3.
int Storm::computeSeason() const {
  const int start_year = startTime().year;
  const int end_year = endTime().year;

  if (start_year == end_year) {
    if (isNorthernHemisphereBasin(atcfBasin())) {
      return start_year;
    }
    return (startTime().month >= 7) ? start_year + 1 : start_year;
  }

  // Non-negative remainder, so the -999 sentinel lands on 21.
  const int number = atcfNumber();
  if (((number % 60) + 60) % 60 < 3) {
    return end_year;
  }
  return start_year;
}

bool Storm::isTropicalSample(std::size_t k) const {
  if (!storm_type_) return true;
  return isTropicalType((*storm_type_)[k]);
}

DailyAce Storm::computeDailyAce() const {
  DailyAce data;
  for (std::size_t k = 0; k < time_.size(); ++k) {
    const Eigen::Index i = static_cast<Eigen::Index>(k);
    if (!isTropicalSample(k) || !isSynoptic(time_[k]) || wind_(i) < 35.0) {
      continue;
    }
    const double ace = wind_(i) * wind_(i) / 10000.0;
    const long day = static_cast<long>(std::floor(mjd_(i)));
    data[day].add(getBasin(lon_(i), lat_(i)), ace);
  }
  return data;
}

bool Storm::visitsBasin(Basin basin) const {
  for (Eigen::Index k = 0; k < lon_.size(); ++k) {
    if (getBasin(lon_(k), lat_(k)) == basin) return true;
  }
  return false;
}

Storm Storm::subset(const std::vector<std::size_t>& indices, TrackFlags flags) const {
  const Eigen::Index n = static_cast<Eigen::Index>(indices.size());
  std::vector<DateTime> time;
  time.reserve(indices.size());
  Eigen::VectorXd lon(n), lat(n), wind(n);
  std::optional<Eigen::VectorXd> pressure;
  if (pressure_) pressure = Eigen::VectorXd(n);
  std::optional<std::vector<std::string>> storm_type;
  if (storm_type_) storm_type = std::vector<std::string>();

  for (Eigen::Index k = 0; k < n; ++k) {
    const std::size_t src = indices[k];
    const Eigen::Index s = static_cast<Eigen::Index>(src);
    time.push_back(time_[src]);
    lon(k) = lon_(s);
    lat(k) = lat_(s);
    wind(k) = wind_(s);
    if (pressure) (*pressure)(k) = (*pressure_)(s);
    if (storm_type) storm_type->push_back((*storm_type_)[src]);
  }

  return Storm(atcf_id_, std::move(time), std::move(lon), std::move(lat), std::move(wind),
               std::move(pressure), std::move(storm_type), name_, flags);
}

std::optional<Storm> Storm::selectWithin(const std::vector<Eigen::Vector2d>& polygon) const {
  if (polygon.size() < 3) {
    throw std::invalid_argument("selectWithin: polygon needs at least 3 vertices");
  }

  std::vector<std::size_t> selected;
  bool continuous = flags_.continuous;
  for (std::size_t k = 0; k < time_.size(); ++k) {
    const Eigen::Index i = static_cast<Eigen::Index>(k);
    if (!withinBufferedPolygon(Eigen::Vector2d(lon_(i), lat_(i)), polygon, kSelectionToleranceDeg)) {
      continue;
    }
    if (!selected.empty() && k - selected.back() > 1) {
      continuous = false;
    }
    selected.push_back(k);
  }

  if (selected.empty()) {
    return std::nullopt;
  }

  TrackFlags flags = flags_;
  flags.continuous = continuous;
  flags.subset = flags_.subset || selected.size() < time_.size();
  return subset(selected, flags);
}

Storm Storm::interpolate(double interval_hours) const {
  if (!flags_.continuous) {
    throw std::invalid_argument("interpolate: " + atcf_id_ + " track is not continuous");
  }
  if (!(interval_hours > 0.0)) {
    throw std::invalid_argument("interpolate: interval must be positive");
  }

  const Eigen::VectorXd hours = mjd_ * 24.0;
  const Eigen::VectorXd grid = uniformGrid(hours(0), hours(hours.size() - 1), interval_hours);

  bool signed_lon = true;
  for (Eigen::Index k = 0; k < lon_.size(); ++k) {
    if (lon_(k) > 180.0) signed_lon = false;
  }
  Eigen::VectorXd lon = interpLinear(grid, hours, unwrapLongitude(lon_));
  for (Eigen::Index k = 0; k < lon.size(); ++k) {
    lon(k) = wrapLongitude(lon(k), signed_lon);
  }

  Eigen::VectorXd lat = interpLinear(grid, hours, lat_);
  Eigen::VectorXd wind = interpLinear(grid, hours, wind_);

  std::optional<Eigen::VectorXd> pressure;
  if (pressure_) pressure = interpLinear(grid, hours, *pressure_);

  std::optional<std::vector<std::string>> storm_type;
  if (storm_type_) {
    const Eigen::VectorXi nearest = nearestIndex(grid, hours);
    storm_type = std::vector<std::string>();
    storm_type->reserve(static_cast<std::size_t>(nearest.size()));
    for (Eigen::Index k = 0; k < nearest.size(); ++k) {
      storm_type->push_back((*storm_type_)[static_cast<std::size_t>(nearest(k))]);
    }
  }

  std::vector<DateTime> time;
  time.reserve(static_cast<std::size_t>(grid.size()));
  for (Eigen::Index k = 0; k < grid.size(); ++k) {
    time.push_back(fromModifiedJulianDate(grid(k) / 24.0));
  }

  TrackFlags flags = flags_;
  flags.interpolated = true;
  return Storm(atcf_id_, std::move(time), std::move(lon), std::move(lat), std::move(wind),
               std::move(pressure), std::move(storm_type), name_, flags);
}

std::vector<Storm> loadStorms(const std::vector<std::filesystem::path>& files, const BDeckReadOptions& options) {
  std::vector<Storm> storms;
  storms.reserve(files.size());
  for (const auto& f : files) {
    storms.push_back(Storm::fromBDeck(f, options));
  }
  return storms;
}

}  // namespace tc_season
