#include "geodesy.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tc_season {

static constexpr double kPi = 3.14159265358979323846;
static double deg2rad(double deg) { return deg * kPi / 180.0; }
static double rad2deg(double rad) { return rad * 180.0 / kPi; }

static double wrap360(double deg) {
  double x = std::fmod(deg, 360.0);
  if (x < 0) x += 360.0;
  return x;
}

double haversineDistanceNm(double lon1_deg, double lat1_deg, double lon2_deg, double lat2_deg) {
  const double lat1 = deg2rad(lat1_deg);
  const double lat2 = deg2rad(lat2_deg);
  const double dlat = lat2 - lat1;
  const double dlon = deg2rad(lon2_deg - lon1_deg);

  const double a = std::sin(dlat * 0.5) * std::sin(dlat * 0.5) +
                   std::cos(lat1) * std::cos(lat2) * std::sin(dlon * 0.5) * std::sin(dlon * 0.5);
  const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return kEarthRadiusNm * c;
}

double initialBearingDeg(double lon1_deg, double lat1_deg, double lon2_deg, double lat2_deg) {
  const double lat1 = deg2rad(lat1_deg);
  const double lat2 = deg2rad(lat2_deg);
  const double dlon = deg2rad(lon2_deg - lon1_deg);

  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  return wrap360(rad2deg(std::atan2(y, x)));
}

Movement computeMovement(const Eigen::VectorXd& lon_deg,
                         const Eigen::VectorXd& lat_deg,
                         const Eigen::VectorXd& mjd) {
  if (lon_deg.size() != lat_deg.size() || lon_deg.size() != mjd.size()) {
    throw std::invalid_argument("computeMovement: column lengths differ");
  }

  Movement m;
  const Eigen::Index steps = lon_deg.size() > 0 ? lon_deg.size() - 1 : 0;
  m.bearing_deg = Eigen::VectorXd::Zero(steps);
  m.speed_kt = Eigen::VectorXd::Zero(steps);

  for (Eigen::Index k = 0; k < steps; ++k) {
    m.bearing_deg(k) = initialBearingDeg(lon_deg(k), lat_deg(k), lon_deg(k + 1), lat_deg(k + 1));

    const double hours = (mjd(k + 1) - mjd(k)) * 24.0;
    if (hours > 0.0) {
      m.speed_kt(k) = haversineDistanceNm(lon_deg(k), lat_deg(k), lon_deg(k + 1), lat_deg(k + 1)) / hours;
    }
  }
  return m;
}

// Even-odd ray casting.
bool pointInPolygon(const Eigen::Vector2d& p, const std::vector<Eigen::Vector2d>& polygon) {
  const std::size_t n = polygon.size();
  if (n < 3) return false;

  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Eigen::Vector2d& a = polygon[i];
    const Eigen::Vector2d& b = polygon[j];
    if ((a.y() > p.y()) != (b.y() > p.y())) {
      const double x_cross = a.x() + (p.y() - a.y()) * (b.x() - a.x()) / (b.y() - a.y());
      if (p.x() < x_cross) inside = !inside;
    }
  }
  return inside;
}

static double distanceToSegment(const Eigen::Vector2d& p, const Eigen::Vector2d& a, const Eigen::Vector2d& b) {
  const Eigen::Vector2d ab = b - a;
  const double len2 = ab.squaredNorm();
  if (len2 == 0.0) return (p - a).norm();
  const double t = std::clamp((p - a).dot(ab) / len2, 0.0, 1.0);
  return (p - (a + t * ab)).norm();
}

double distanceToPolygonBoundary(const Eigen::Vector2d& p, const std::vector<Eigen::Vector2d>& polygon) {
  double best = std::numeric_limits<double>::infinity();
  const std::size_t n = polygon.size();
  for (std::size_t i = 0; i < n; ++i) {
    best = std::min(best, distanceToSegment(p, polygon[i], polygon[(i + 1) % n]));
  }
  return best;
}

bool withinBufferedPolygon(const Eigen::Vector2d& p,
                           const std::vector<Eigen::Vector2d>& polygon,
                           double buffer_deg) {
  return pointInPolygon(p, polygon) || distanceToPolygonBoundary(p, polygon) <= buffer_deg;
}

}  // namespace tc_season
