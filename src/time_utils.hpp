#pragma once

#include <string>

namespace tc_season {

struct DateTime {
  int year = 0;
  int month = 0;   // 1-12
  int day = 0;     // 1-31
  int hour = 0;
  int minute = 0;
  double second = 0.0;
  int utc_offset_minutes = 0;  // 0 => UTC
};

bool operator==(const DateTime& a, const DateTime& b);
bool operator!=(const DateTime& a, const DateTime& b);
bool operator<(const DateTime& a, const DateTime& b);
bool operator<=(const DateTime& a, const DateTime& b);
bool operator>(const DateTime& a, const DateTime& b);

// Copy of s without leading and trailing whitespace.
std::string trim(const std::string& s);

// Parse a BDeck timestamp "YYYYMMDDHH" (surrounding blanks allowed).
// Returns true on success.
bool parseBDeckTimestamp(const std::string& ts, DateTime& out);

// "YYYYMMDDHH"
std::string formatBDeckTimestamp(const DateTime& t);

// "YYYY-MM-DD HH:MM:SSZ"
std::string formatIso(const DateTime& t);

bool isLeapYear(int year);

// Convert calendar date/time to Modified Julian Date (JD - 2400000.5).
// A non-zero UTC offset is removed first.
double toModifiedJulianDate(const DateTime& t);

// Inverse of toModifiedJulianDate; result is UTC, rounded to the microsecond.
DateTime fromModifiedJulianDate(double mjd);

// Same instant expressed in UTC.
DateTime toUtc(const DateTime& t);

}  // namespace tc_season
