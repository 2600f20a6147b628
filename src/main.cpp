#include <Eigen/Dense>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bdeck_reader.hpp"
#include "classification.hpp"
#include "season_dataset.hpp"
#include "storm.hpp"
#include "time_utils.hpp"

#ifndef TC_SEASON_DATA_DIR
#define TC_SEASON_DATA_DIR ""
#endif

namespace fs = std::filesystem;
using tc_season::Basin;
using tc_season::BDeckReadOptions;
using tc_season::SeasonDataset;
using tc_season::Storm;

struct Args {
  fs::path data_dir;
  int year = 0;                       // 0 => latest season found
  std::optional<Basin> basin;

  bool push_leap_day = false;
  bool tropical_overlap = true;

  BDeckReadOptions read{false, false};

  bool write_csv = true;
  std::string csv_file = "tc_season_ace.csv";
};

static void printUsage(const char* exe) {
  std::cout
      << "Usage: " << exe << " [options]\n\n"
      << "Options:\n"
      << "  --data_dir <path>        Directory containing BDeck files (b*.dat)\n"
      << "  --year <YYYY>            Season to summarize (default: latest in data)\n"
      << "  --basin <name>           Restrict ACE and overlaps: wpac|epac|nio|shem|atl\n"
      << "  --push_leap_day          Fold Feb 29 into Mar 1 in the daily series\n"
      << "  --all_records            Overlaps over whole tracks, not only tropical parts\n"
      << "  --formal_only            Read 00/06/12/18 UTC records only\n"
      << "  --tropical_only          Drop SS/SD/EX records while reading\n"
      << "  --no_csv                 Do not write CSV output\n"
      << "  --csv <file>             CSV output filename (default: tc_season_ace.csv)\n"
      << "  -h, --help               Show this help\n";
}

static bool parseArgs(int argc, char** argv, Args& a) {
  if (std::string(TC_SEASON_DATA_DIR).size() > 0) {
    a.data_dir = fs::path(TC_SEASON_DATA_DIR);
  } else {
    a.data_dir = fs::current_path();
  }

  for (int i = 1; i < argc; ++i) {
    const std::string key = argv[i];
    auto needValue = [&](const std::string& k) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << k << "\n";
        return nullptr;
      }
      return argv[++i];
    };

    if (key == "-h" || key == "--help") {
      return false;
    } else if (key == "--data_dir") {
      const char* v = needValue(key);
      if (!v) return false;
      a.data_dir = fs::path(v);
    } else if (key == "--year") {
      const char* v = needValue(key);
      if (!v) return false;
      a.year = std::stoi(v);
    } else if (key == "--basin") {
      const char* v = needValue(key);
      if (!v) return false;
      a.basin = tc_season::basinFromString(v);
      if (!a.basin) {
        std::cerr << "Unknown basin: " << v << "\n";
        return false;
      }
    } else if (key == "--push_leap_day") {
      a.push_leap_day = true;
    } else if (key == "--all_records") {
      a.tropical_overlap = false;
    } else if (key == "--formal_only") {
      a.read.formal_advisory_only = true;
    } else if (key == "--tropical_only") {
      a.read.tropical_nature_only = true;
    } else if (key == "--no_csv") {
      a.write_csv = false;
    } else if (key == "--csv") {
      const char* v = needValue(key);
      if (!v) return false;
      a.csv_file = v;
      a.write_csv = true;
    } else {
      std::cerr << "Unknown option: " << key << "\n";
      return false;
    }
  }

  return true;
}

// BDeck files are named like bwp012019.dat
static std::vector<fs::path> findBDeckFiles(const fs::path& dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) continue;
    const std::string fname = entry.path().filename().string();
    if (fname.size() > 1 && (fname[0] == 'b' || fname[0] == 'B') && entry.path().extension() == ".dat") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

int main(int argc, char** argv) {
  Args args;
  try {
    if (!parseArgs(argc, argv, args)) {
      printUsage(argv[0]);
      return (argc > 1) ? 1 : 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "Bad option value: " << e.what() << "\n";
    printUsage(argv[0]);
    return 1;
  }

  const std::vector<fs::path> files = findBDeckFiles(args.data_dir);
  if (files.empty()) {
    std::cerr << "No BDeck files found in: " << args.data_dir << "\n";
    std::cerr << "Tip: pass --data_dir /path/to/bdeck\n";
    return 2;
  }

  std::vector<Storm> storms;
  storms.reserve(files.size());
  for (const auto& f : files) {
    try {
      storms.push_back(Storm::fromBDeck(f, args.read));
    } catch (const std::exception& e) {
      std::cerr << "Skipping " << f.filename() << ": " << e.what() << "\n";
    }
  }
  if (storms.empty()) {
    std::cerr << "No storms could be read from: " << args.data_dir << "\n";
    return 3;
  }

  const SeasonDataset dataset(storms);
  const int year = (args.year != 0) ? args.year : dataset.seasons().back();

  std::cout << "Loaded " << storms.size() << " storms from: " << args.data_dir << "\n";

  Eigen::VectorXd daily;
  Eigen::VectorXd cumulative;
  try {
    daily = dataset.dailyAce(year, args.push_leap_day, args.basin);
    cumulative = dataset.cumulativeAce(year, args.push_leap_day, args.basin);
  } catch (const std::out_of_range& e) {
    std::cerr << e.what() << "\n";
    return 4;
  }

  if (dataset.hasSeason(year)) {
    std::cout << "\nSeason " << year << "\n";
    for (const Storm* s : dataset.stormsOf(year)) {
      std::cout << "  " << s->fullAtcfId() << "  " << (s->name().empty() ? "-" : s->name())
                << "  start=" << tc_season::formatIso(s->startTime())
                << "  max_wind=" << s->maxWind() << " kt"
                << "  ACE=" << s->totalAce() << "\n";
    }

    const auto overlaps = dataset.overlappingStorms(year, args.tropical_overlap, args.basin);
    std::cout << "\nOverlaps: " << overlaps.size() << "\n";
    for (const auto& o : overlaps) {
      std::cout << "  " << tc_season::formatIso(o.start) << " -> " << tc_season::formatIso(o.end) << " :";
      for (const auto& id : o.storm_ids) std::cout << " " << id;
      std::cout << "\n";
    }
  } else {
    std::cout << "\nNo storms assigned to season " << year << "; ACE from neighbouring seasons only.\n";
  }

  std::ofstream csv;
  if (args.write_csv) {
    csv.open(args.csv_file);
    if (!csv.is_open()) {
      std::cerr << "Warning: could not open CSV file for writing: " << args.csv_file << "\n";
    } else {
      csv << "day_index,daily_ace,cumulative_ace\n";
      for (Eigen::Index k = 0; k < daily.size(); ++k) {
        csv << k << "," << daily(k) << "," << cumulative(k) << "\n";
      }
      csv.close();
      std::cout << "Wrote CSV: " << args.csv_file << "\n";
    }
  }

  std::cout << "\n==== Season summary ====\n";
  std::cout << "Year: " << year;
  if (args.basin) std::cout << " (" << tc_season::basinToString(*args.basin) << ")";
  std::cout << "\n";
  std::cout << "Total ACE: " << (cumulative.size() > 0 ? cumulative(cumulative.size() - 1) : 0.0) << "\n";
  std::cout << "========================\n";

  return 0;
}
