#pragma once

#include <Eigen/Dense>

namespace tc_season {

// Piecewise-linear interpolation of (xp, fp) at x. xp must be non-decreasing.
// Outside [xp(0), xp(n-1)] the first/last segment is extended.
Eigen::VectorXd interpLinear(const Eigen::VectorXd& x,
                             const Eigen::VectorXd& xp,
                             const Eigen::VectorXd& fp);

// For every x, the index of the closest xp (the earlier one on ties).
Eigen::VectorXi nearestIndex(const Eigen::VectorXd& x, const Eigen::VectorXd& xp);

// Uniform grid with the given step covering [t0, t1]: starts at t0 floored to
// a multiple of step and ends at t1 ceiled to a multiple of step.
Eigen::VectorXd uniformGrid(double t0, double t1, double step);

}  // namespace tc_season
