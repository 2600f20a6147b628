#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "time_utils.hpp"

namespace tc_season {

// Substituted for numeric fields that fail to parse.
constexpr int kMissingValue = -999;

// Wind radii [nm] per quadrant, in the order NE, SE, SW, NW.
using WindRadii = std::array<int, 4>;

struct BDeckRecord {
  bool long_format = false;
  std::string basin;
  int number = 0;
  std::string timestamp;              // "YYYYMMDDHH"
  DateTime time;
  std::string technum;
  std::string techcode;
  int tau = 0;
  double lat = 0.0;                   // degrees, S negative
  double lon = 0.0;                   // degrees, W negative
  int wind = 0;                       // kt
  std::string category;               // best category, see bestCategory()
  std::string raw_category;           // empty when the line has no type field
  std::optional<int> pressure;        // hPa

  // Long format only.
  std::optional<WindRadii> r34;
  std::optional<WindRadii> r50;
  std::optional<WindRadii> r64;
  std::optional<int> lci;             // last closed isobar pressure
  std::optional<int> lci_radius;
  std::optional<int> rmw;             // radius of maximum wind
  std::optional<std::string> name;
  std::optional<std::string> depth;
};

// Running summary of one read.
struct BDeckMetadata {
  int max_wind = 0;
  std::vector<DateTime> peak_times;   // every sample reaching max_wind
  int min_pressure = 9999;
  std::string full_code;              // basin + 2-digit number, e.g. "WP01"
  std::string name;                   // name at the first peak
  std::size_t skipped_lines = 0;
};

struct BDeckData {
  std::vector<BDeckRecord> records;
  BDeckMetadata metadata;
};

struct BDeckReadOptions {
  bool formal_advisory_only = true;   // keep 00/06/12/18 UTC only
  bool tropical_nature_only = false;  // drop SS/SD/EX (long format only)
};

// Forward-only view over the lines of one file. The wind-radii continuation
// lookahead consumes lines through it, so a consumed line is never revisited.
class LineCursor {
 public:
  explicit LineCursor(const std::vector<std::string>& lines) : lines_(lines) {}

  bool atEnd() const { return pos_ >= lines_.size(); }
  std::size_t position() const { return pos_; }

  const std::string& take() { return lines_[pos_++]; }

 private:
  const std::vector<std::string>& lines_;
  std::size_t pos_ = 0;
};

// Integer parse that yields kMissingValue instead of failing.
int safeInt(const std::string& s);

// Parse the lines of one storm's BDeck file. Malformed lines are skipped
// and counted, never fatal.
BDeckData parseBDeckLines(const std::vector<std::string>& lines,
                          const BDeckReadOptions& options = BDeckReadOptions());

// Load a BDeck file.
// Returns false if the file cannot be opened; content errors are tolerated.
bool loadBDeckFile(const std::filesystem::path& file,
                   BDeckData& out,
                   const BDeckReadOptions& options = BDeckReadOptions());

}  // namespace tc_season
