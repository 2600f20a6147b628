#include "bdeck_reader.hpp"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "classification.hpp"

namespace tc_season {

static std::vector<std::string> splitFields(const std::string& line) {
  std::string s = line;
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();

  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = s.find(',', start);
    if (comma == std::string::npos) {
      fields.push_back(s.substr(start));
      break;
    }
    fields.push_back(s.substr(start, comma - start));
    start = comma + 1;
  }
  return fields;
}

int safeInt(const std::string& s) {
  const std::string t = trim(s);
  try {
    std::size_t pos = 0;
    const int v = std::stoi(t, &pos);
    if (pos != t.size()) return kMissingValue;
    return v;
  } catch (const std::invalid_argument&) {
    return kMissingValue;
  } catch (const std::out_of_range&) {
    return kMissingValue;
  }
}

// "123N" -> 12.3, "456W" -> -45.6
static double parseCoordinate(const std::string& field, char negative_hemisphere) {
  const std::string t = trim(field);
  if (t.empty()) return kMissingValue / 10.0;
  double v = safeInt(t.substr(0, t.size() - 1)) / 10.0;
  if (std::toupper(static_cast<unsigned char>(t.back())) == negative_hemisphere) {
    v = -v;
  }
  return v;
}

static std::optional<WindRadii> parseRadii(const std::vector<std::string>& fields) {
  if (fields.size() < 17) return std::nullopt;
  return WindRadii{safeInt(fields[13]), safeInt(fields[14]), safeInt(fields[15]), safeInt(fields[16])};
}

static bool isFormalAdvisory(const std::string& timestamp) {
  if (timestamp.size() < 2) return false;
  const std::string hh = timestamp.substr(timestamp.size() - 2);
  return hh == "00" || hh == "06" || hh == "12" || hh == "18";
}

static bool isNonTropicalNature(const std::string& raw_category) {
  return raw_category == "SS" || raw_category == "SD" || raw_category == "EX";
}

// Reads the continuation line for one radii threshold. Returns false when the
// lookahead must stop: input exhausted or the line belongs to another time.
static bool readContinuation(LineCursor& cursor,
                             const std::string& timestamp,
                             std::optional<WindRadii>& radii) {
  if (cursor.atEnd()) return false;
  const std::vector<std::string> fields = splitFields(cursor.take());
  if (fields.size() < 3 || trim(fields[2]) != timestamp) return false;
  radii = parseRadii(fields);
  return true;
}

static void accumulateMetadata(BDeckMetadata& meta, const BDeckRecord& rec) {
  if (rec.wind > meta.max_wind) {
    meta.max_wind = rec.wind;
    meta.peak_times.assign(1, rec.time);
    if (rec.name) meta.name = *rec.name;
  } else if (rec.wind == meta.max_wind) {
    meta.peak_times.push_back(rec.time);
  }

  if (rec.pressure && *rec.pressure < meta.min_pressure) {
    meta.min_pressure = *rec.pressure;
  }

  char code[32];
  std::snprintf(code, sizeof(code), "%s%02d", rec.basin.c_str(), rec.number);
  meta.full_code = code;
}

BDeckData parseBDeckLines(const std::vector<std::string>& lines, const BDeckReadOptions& options) {
  BDeckData out;
  LineCursor cursor(lines);

  while (!cursor.atEnd()) {
    const std::vector<std::string> fields = splitFields(cursor.take());
    if (fields.size() < 9) {
      if (!trim(fields[0]).empty() || fields.size() > 1) ++out.metadata.skipped_lines;
      continue;
    }

    const bool long_format = fields.size() > 20;
    const std::string timestamp = trim(fields[2]);

    if (options.formal_advisory_only && !isFormalAdvisory(timestamp)) {
      continue;
    }
    if (long_format && options.tropical_nature_only && isNonTropicalNature(trim(fields[10]))) {
      continue;
    }

    BDeckRecord rec;
    if (!parseBDeckTimestamp(timestamp, rec.time)) {
      ++out.metadata.skipped_lines;
      continue;
    }

    rec.long_format = long_format;
    rec.basin = trim(fields[0]);
    rec.number = safeInt(fields[1]);
    rec.timestamp = timestamp;
    rec.technum = trim(fields[3]);
    rec.techcode = trim(fields[4]);
    rec.tau = safeInt(fields[5]);
    rec.lat = parseCoordinate(fields[6], 'S');
    rec.lon = parseCoordinate(fields[7], 'W');
    rec.wind = safeInt(fields[8]);
    rec.category = bestCategory(rec.wind);

    if (fields.size() > 9) {
      rec.pressure = safeInt(fields[9]);
      rec.raw_category = fields.size() > 10 ? trim(fields[10]) : std::string();
      rec.category = bestCategory(rec.wind, rec.raw_category);
    }

    if (long_format) {
      rec.lci = safeInt(fields[17]);
      rec.lci_radius = safeInt(fields[18]);
      rec.rmw = safeInt(fields[19]);
      if (fields.size() > 28) {
        rec.name = trim(fields[27]);
        rec.depth = trim(fields[28]);
      }
      if (rec.wind > 34) {
        rec.r34 = parseRadii(fields);
      }
      // The 50 kt and 64 kt radii live on the following lines of the same time.
      bool more = true;
      if (rec.wind >= 50) {
        more = readContinuation(cursor, timestamp, rec.r50);
      }
      if (more && rec.wind > 64) {
        readContinuation(cursor, timestamp, rec.r64);
      }
    }

    accumulateMetadata(out.metadata, rec);
    out.records.push_back(std::move(rec));
  }

  return out;
}

bool loadBDeckFile(const std::filesystem::path& file, BDeckData& out, const BDeckReadOptions& options) {
  out = BDeckData();

  std::ifstream ifs(file);
  if (!ifs.is_open()) {
    return false;
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(ifs, line)) {
    lines.push_back(line);
  }

  out = parseBDeckLines(lines, options);
  return true;
}

}  // namespace tc_season
