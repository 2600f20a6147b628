#include "interpolation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tc_season {

// Slack for rounding in t / step when aligning the grid ends.
static constexpr double kGridEps = 1e-9;

// Index k of the segment [xp(k), xp(k+1)] used for x.
static Eigen::Index segmentFor(double x, const Eigen::VectorXd& xp) {
  const Eigen::Index n = xp.size();
  const double* begin = xp.data();
  const double* it = std::upper_bound(begin, begin + n, x);
  Eigen::Index k = static_cast<Eigen::Index>(it - begin) - 1;
  if (k < 0) k = 0;
  if (k > n - 2) k = n - 2;
  return k;
}

Eigen::VectorXd interpLinear(const Eigen::VectorXd& x,
                             const Eigen::VectorXd& xp,
                             const Eigen::VectorXd& fp) {
  if (xp.size() != fp.size() || xp.size() == 0) {
    throw std::invalid_argument("interpLinear: sample columns empty or of different length");
  }

  Eigen::VectorXd out(x.size());
  if (xp.size() == 1) {
    out.setConstant(fp(0));
    return out;
  }

  for (Eigen::Index i = 0; i < x.size(); ++i) {
    Eigen::Index k = segmentFor(x(i), xp);
    // Skip zero-width segments from repeated times.
    while (k > 0 && xp(k + 1) == xp(k)) --k;
    const double dx = xp(k + 1) - xp(k);
    if (dx == 0.0) {
      out(i) = fp(k);
      continue;
    }
    const double w = (x(i) - xp(k)) / dx;
    out(i) = fp(k) + w * (fp(k + 1) - fp(k));
  }
  return out;
}

Eigen::VectorXi nearestIndex(const Eigen::VectorXd& x, const Eigen::VectorXd& xp) {
  if (xp.size() == 0) {
    throw std::invalid_argument("nearestIndex: no samples");
  }

  Eigen::VectorXi out(x.size());
  for (Eigen::Index i = 0; i < x.size(); ++i) {
    if (xp.size() == 1) {
      out(i) = 0;
      continue;
    }
    const Eigen::Index k = segmentFor(x(i), xp);
    const double dl = std::abs(x(i) - xp(k));
    const double dr = std::abs(xp(k + 1) - x(i));
    out(i) = static_cast<int>(dr < dl ? k + 1 : k);
  }
  return out;
}

Eigen::VectorXd uniformGrid(double t0, double t1, double step) {
  if (!(step > 0.0)) {
    throw std::invalid_argument("uniformGrid: step must be positive");
  }

  const double first = std::floor(t0 / step + kGridEps);
  const double last = std::ceil(t1 / step - kGridEps);
  const Eigen::Index n = static_cast<Eigen::Index>(last - first) + 1;

  Eigen::VectorXd grid(std::max<Eigen::Index>(n, 1));
  for (Eigen::Index i = 0; i < grid.size(); ++i) {
    grid(i) = (first + static_cast<double>(i)) * step;
  }
  return grid;
}

}  // namespace tc_season
