#pragma once

#include <Eigen/Dense>

#include <vector>

namespace tc_season {

// Mean Earth radius in nautical miles (6371.0088 km / 1.852).
constexpr double kEarthRadiusNm = 3440.0695;

// Great-circle distance [nm] between two (lon, lat) points in degrees.
double haversineDistanceNm(double lon1_deg, double lat1_deg, double lon2_deg, double lat2_deg);

// Initial great-circle bearing [deg, 0-360) from point 1 to point 2.
double initialBearingDeg(double lon1_deg, double lat1_deg, double lon2_deg, double lat2_deg);

struct Movement {
  Eigen::VectorXd bearing_deg;  // N-1 entries
  Eigen::VectorXd speed_kt;     // N-1 entries
};

// Per-step bearing and speed between consecutive samples.
// mjd is the sample time axis in days; a step with no elapsed time has speed 0.
Movement computeMovement(const Eigen::VectorXd& lon_deg,
                         const Eigen::VectorXd& lat_deg,
                         const Eigen::VectorXd& mjd);

// Planar (lon, lat) polygon tests. The polygon may be given open or closed.
bool pointInPolygon(const Eigen::Vector2d& p, const std::vector<Eigen::Vector2d>& polygon);

// Smallest distance [deg] from p to any polygon edge.
double distanceToPolygonBoundary(const Eigen::Vector2d& p, const std::vector<Eigen::Vector2d>& polygon);

// Inside the polygon grown outward by buffer_deg.
bool withinBufferedPolygon(const Eigen::Vector2d& p,
                           const std::vector<Eigen::Vector2d>& polygon,
                           double buffer_deg);

}  // namespace tc_season
