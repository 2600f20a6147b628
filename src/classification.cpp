#include "classification.hpp"

#include <cctype>
#include <cmath>

namespace tc_season {

std::optional<Basin> basinFromString(const std::string& s) {
  std::string t;
  t.reserve(s.size());
  for (char c : s) {
    t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (t == "wpac") return Basin::WPAC;
  if (t == "epac") return Basin::EPAC;
  if (t == "nio") return Basin::NIO;
  if (t == "shem") return Basin::SHEM;
  if (t == "atl") return Basin::ATL;
  return std::nullopt;
}

std::string basinToString(Basin b) {
  switch (b) {
    case Basin::WPAC: return "wpac";
    case Basin::EPAC: return "epac";
    case Basin::NIO: return "nio";
    case Basin::SHEM: return "shem";
    case Basin::ATL: return "atl";
  }
  return "wpac";
}

Basin getBasin(double lon_deg, double lat_deg) {
  if (lat_deg < 0) {
    return Basin::SHEM;
  }

  double lon = std::fmod(lon_deg, 360.0);
  if (lon < 0) lon += 360.0;

  if (lon < 100) {
    if (lat_deg < 40) return Basin::NIO;
    return (lon < 70) ? Basin::ATL : Basin::WPAC;
  }
  if (lon < 180) return Basin::WPAC;
  if (lon < 240) return Basin::EPAC;
  if (lon > 300) return Basin::ATL;
  // EPAC / Atlantic boundary is not a meridian; treat the gap as EPAC.
  return Basin::EPAC;
}

double BasinACE::get(Basin b) const {
  switch (b) {
    case Basin::WPAC: return wpac;
    case Basin::EPAC: return epac;
    case Basin::NIO: return nio;
    case Basin::SHEM: return shem;
    case Basin::ATL: return atl;
  }
  return 0.0;
}

void BasinACE::add(Basin b, double ace) {
  switch (b) {
    case Basin::WPAC: wpac += ace; break;
    case Basin::EPAC: epac += ace; break;
    case Basin::NIO: nio += ace; break;
    case Basin::SHEM: shem += ace; break;
    case Basin::ATL: atl += ace; break;
  }
}

Intensity classifyWind(int wind_kt) {
  if (wind_kt > 137) return Intensity::C5;
  if (wind_kt > 114) return Intensity::C4;
  if (wind_kt > 96) return Intensity::C3;
  if (wind_kt > 83) return Intensity::C2;
  if (wind_kt > 64) return Intensity::C1;
  if (wind_kt > 34) return Intensity::TS;
  return Intensity::TD;
}

std::string intensityToString(Intensity i) {
  switch (i) {
    case Intensity::TD: return "TD";
    case Intensity::TS: return "TS";
    case Intensity::C1: return "C1";
    case Intensity::C2: return "C2";
    case Intensity::C3: return "C3";
    case Intensity::C4: return "C4";
    case Intensity::C5: return "C5";
  }
  return "TD";
}

std::string bestCategory(int wind_kt, const std::optional<std::string>& raw_category) {
  if (raw_category && !raw_category->empty()) {
    const std::string& r = *raw_category;
    if (r != "TY" && r != "HU" && r != "ST" && r != "MH") {
      return r;
    }
  }
  return intensityToString(classifyWind(wind_kt));
}

bool isTropicalType(const std::string& storm_type) {
  return storm_type == "TD" || storm_type == "TS" || storm_type == "TY" ||
         storm_type == "HU" || storm_type == "ST";
}

bool isNorthernHemisphereBasin(const std::string& atcf_basin) {
  return atcf_basin == "WP" || atcf_basin == "EP" || atcf_basin == "CP" ||
         atcf_basin == "AL" || atcf_basin == "IO";
}

}  // namespace tc_season
