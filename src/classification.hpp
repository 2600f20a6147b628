#pragma once

#include <optional>
#include <string>

namespace tc_season {

enum class Basin {
  WPAC,
  EPAC,
  NIO,
  SHEM,
  ATL
};

// Accepts "wpac", "epac", "nio", "shem", "atl" in any case.
std::optional<Basin> basinFromString(const std::string& s);
std::string basinToString(Basin b);

// Basin of a sample position. Longitude may be signed (W negative) or 0-360.
Basin getBasin(double lon_deg, double lat_deg);

// ACE totals of one bucket, split by basin.
struct BasinACE {
  double wpac = 0.0;
  double epac = 0.0;
  double nio = 0.0;
  double shem = 0.0;
  double atl = 0.0;

  double total() const { return wpac + epac + nio + shem + atl; }
  double get(Basin b) const;
  void add(Basin b, double ace);
};

// Saffir-Simpson-like intensity bucket derived from wind alone.
enum class Intensity {
  TD,
  TS,
  C1,
  C2,
  C3,
  C4,
  C5
};

Intensity classifyWind(int wind_kt);
std::string intensityToString(Intensity i);

// Best category for a record: the raw code unless it is absent, empty or one
// of the ambiguous TY/HU/ST/MH buckets, which are resolved from wind.
std::string bestCategory(int wind_kt, const std::optional<std::string>& raw_category = std::nullopt);

// TD, TS, TY, HU, ST
bool isTropicalType(const std::string& storm_type);

// WP, EP, CP, AL, IO
bool isNorthernHemisphereBasin(const std::string& atcf_basin);

}  // namespace tc_season
