#include "time_utils.hpp"

#include <cmath>
#include <cstdio>
#include <cctype>
#include <tuple>

namespace tc_season {

static constexpr long long kMicrosPerDay = 86400LL * 1000000LL;

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

static int daysInMonth(int year, int month) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

bool operator==(const DateTime& a, const DateTime& b) {
  if (a.utc_offset_minutes == b.utc_offset_minutes) {
    return std::tie(a.year, a.month, a.day, a.hour, a.minute, a.second) ==
           std::tie(b.year, b.month, b.day, b.hour, b.minute, b.second);
  }
  return toModifiedJulianDate(a) == toModifiedJulianDate(b);
}

bool operator!=(const DateTime& a, const DateTime& b) { return !(a == b); }

bool operator<(const DateTime& a, const DateTime& b) {
  if (a.utc_offset_minutes == b.utc_offset_minutes) {
    return std::tie(a.year, a.month, a.day, a.hour, a.minute, a.second) <
           std::tie(b.year, b.month, b.day, b.hour, b.minute, b.second);
  }
  return toModifiedJulianDate(a) < toModifiedJulianDate(b);
}

bool operator<=(const DateTime& a, const DateTime& b) { return !(b < a); }
bool operator>(const DateTime& a, const DateTime& b) { return b < a; }

bool parseBDeckTimestamp(const std::string& ts, DateTime& out) {
  const std::string s = trim(ts);
  if (s.size() != 10) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }

  const int year = std::stoi(s.substr(0, 4));
  const int month = std::stoi(s.substr(4, 2));
  const int day = std::stoi(s.substr(6, 2));
  const int hour = std::stoi(s.substr(8, 2));

  if (month < 1 || month > 12) return false;
  if (day < 1 || day > daysInMonth(year, month)) return false;
  if (hour > 23) return false;

  out = DateTime{};
  out.year = year;
  out.month = month;
  out.day = day;
  out.hour = hour;
  return true;
}

std::string formatBDeckTimestamp(const DateTime& t) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d%02d", t.year, t.month, t.day, t.hour);
  return buf;
}

std::string formatIso(const DateTime& t) {
  const DateTime u = toUtc(t);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02dZ",
                u.year, u.month, u.day, u.hour, u.minute, static_cast<int>(u.second));
  return buf;
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

// Gregorian calendar to MJD. The integer day count is kept apart from the
// day fraction so the result stays accurate to about a microsecond.
double toModifiedJulianDate(const DateTime& t) {
  int Y = t.year;
  int M = t.month;
  const int D = t.day;

  if (M <= 2) {
    Y -= 1;
    M += 12;
  }

  const int A = static_cast<int>(std::floor(Y / 100.0));
  const int B = 2 - A + static_cast<int>(std::floor(A / 4.0));

  // JD = days - 1524.5 and MJD = JD - 2400000.5
  const long long days = static_cast<long long>(std::floor(365.25 * (Y + 4716))) +
                         static_cast<long long>(std::floor(30.6001 * (M + 1))) + D + B;
  const double day_fraction =
      (t.hour + (t.minute - t.utc_offset_minutes + t.second / 60.0) / 60.0) / 24.0;

  return static_cast<double>(days - 2401525LL) + day_fraction;
}

DateTime fromModifiedJulianDate(double mjd) {
  long long mjd_day = static_cast<long long>(std::floor(mjd));
  long long micros = std::llround((mjd - static_cast<double>(mjd_day)) * static_cast<double>(kMicrosPerDay));
  if (micros >= kMicrosPerDay) {
    mjd_day += 1;
    micros -= kMicrosPerDay;
  }

  // Fliegel & Van Flandern, on the Julian day number of that civil day.
  long long l = mjd_day + 2400001LL + 68569LL;
  const long long n = (4 * l) / 146097;
  l = l - (146097 * n + 3) / 4;
  const long long i = (4000 * (l + 1)) / 1461001;
  l = l - (1461 * i) / 4 + 31;
  const long long j = (80 * l) / 2447;
  const long long day = l - (2447 * j) / 80;
  l = j / 11;
  const long long month = j + 2 - 12 * l;
  const long long year = 100 * (n - 49) + i + l;

  DateTime t;
  t.year = static_cast<int>(year);
  t.month = static_cast<int>(month);
  t.day = static_cast<int>(day);
  t.hour = static_cast<int>(micros / 3600000000LL);
  micros -= t.hour * 3600000000LL;
  t.minute = static_cast<int>(micros / 60000000LL);
  micros -= t.minute * 60000000LL;
  t.second = static_cast<double>(micros) / 1e6;
  return t;
}

DateTime toUtc(const DateTime& t) {
  if (t.utc_offset_minutes == 0) return t;
  return fromModifiedJulianDate(toModifiedJulianDate(t));
}

}  // namespace tc_season
