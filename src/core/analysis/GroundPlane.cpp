// Copyright (c) 2025 tlsbatch contributors

// This file is part of tlsbatch

// tlsbatch is free software: you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. tlsbatch is distributed in the hope that it will be
// useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with tlsbatch. If not, see
// <https://www.gnu.org/licenses/>.

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <tlsbatch/analysis/GroundPlane.hpp>
#include <tlsbatch/common/datastructures.hpp>

#include "fmt/format.h"

namespace tlsbatch::analysis {

  MinZGrid get_min_z_grid(const ScanData& scan, double grid_extent,
                          double grid_resolution, const arr2d& grid_origin) {
    if (!(grid_resolution > 0) || !(grid_extent > 0)) {
      throw tlsbatchException("Grid extent and resolution must be positive");
    }
    const size_t ncells =
        static_cast<size_t>(std::ceil(grid_extent / grid_resolution));
    const double xmin = grid_origin[0] - grid_extent / 2;
    const double ymin = grid_origin[1] - grid_extent / 2;
    const auto nan = std::numeric_limits<double>::quiet_NaN();

    std::vector<double> zmin(ncells * ncells, nan);
    std::vector<double> rmin(ncells * ncells, nan);
    std::vector<arr2d> xy(ncells * ncells);

    for (const auto& ret : scan.returns) {
      const auto& p = ret.position;
      double col = std::floor((p[0] - xmin) / grid_resolution);
      double row = std::floor((p[1] - ymin) / grid_resolution);
      if (col < 0 || row < 0 || col >= ncells || row >= ncells) continue;
      size_t idx = static_cast<size_t>(row) * ncells + static_cast<size_t>(col);
      if (std::isnan(zmin[idx]) || p[2] < zmin[idx]) {
        zmin[idx] = p[2];
        rmin[idx] = ret.range;
        xy[idx] = {p[0], p[1]};
      }
    }

    MinZGrid grid;
    for (size_t idx = 0; idx < zmin.size(); ++idx) {
      if (std::isnan(zmin[idx])) continue;
      grid.x.push_back(xy[idx][0]);
      grid.y.push_back(xy[idx][1]);
      grid.z.push_back(zmin[idx]);
      grid.r.push_back(rmin[idx]);
    }
    return grid;
  }

  namespace {
    Eigen::Vector3d weighted_lstsq(const Eigen::MatrixXd& A,
                                   const Eigen::VectorXd& b,
                                   const Eigen::VectorXd& w) {
      Eigen::VectorXd sw = w.array().sqrt();
      Eigen::MatrixXd Aw = A.array().colwise() * sw.array();
      Eigen::VectorXd bw = b.array() * sw.array();
      return Aw.colPivHouseholderQr().solve(bw);
    }

    double median(std::vector<double> values) {
      auto mid = values.begin() + values.size() / 2;
      std::nth_element(values.begin(), mid, values.end());
      return *mid;
    }
  }  // namespace

  PlaneFit plane_fit_hubers(const vec1d& x, const vec1d& y, const vec1d& z,
                            const vec1d& w, double k, size_t max_iterations,
                            double tolerance) {
    const size_t n = z.size();
    if (x.size() != n || y.size() != n || (!w.empty() && w.size() != n)) {
      throw tlsbatchException("Plane fit inputs differ in length");
    }
    if (n < 3) {
      throw tlsbatchException(
          fmt::format("Not enough ground points to fit a plane: {}", n));
    }

    // fit in centered coordinates, project coordinates are large
    double xc = 0, yc = 0;
    for (size_t i = 0; i < n; ++i) {
      xc += x[i];
      yc += y[i];
    }
    xc /= n;
    yc /= n;

    Eigen::MatrixXd A(n, 3);
    Eigen::VectorXd b(n);
    Eigen::VectorXd prior(n);
    for (size_t i = 0; i < n; ++i) {
      A(i, 0) = 1.0;
      A(i, 1) = x[i] - xc;
      A(i, 2) = y[i] - yc;
      b(i) = z[i];
      prior(i) = w.empty() ? 1.0 : w[i];
      if (!std::isfinite(prior(i)) || prior(i) < 0) {
        throw tlsbatchException("Invalid plane fit weight");
      }
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(A);
    if (svd.rank() < 3) {
      throw tlsbatchException("Ground points are collinear");
    }

    PlaneFit fit;
    Eigen::Vector3d params = weighted_lstsq(A, b, prior);
    for (fit.iterations = 1; fit.iterations <= max_iterations;
         ++fit.iterations) {
      Eigen::VectorXd residuals = b - A * params;

      // robust scale from the median absolute deviation
      std::vector<double> abs_r(n);
      for (size_t i = 0; i < n; ++i) abs_r[i] = std::abs(residuals(i));
      double scale = median(abs_r) / 0.6745;
      if (scale < 1e-12) {
        fit.converged = true;
        break;
      }

      Eigen::VectorXd weights(n);
      for (size_t i = 0; i < n; ++i) {
        double u = abs_r[i] / scale;
        weights(i) = prior(i) * (u <= k ? 1.0 : k / u);
      }

      Eigen::Vector3d next = weighted_lstsq(A, b, weights);
      double change = (next - params).cwiseAbs().maxCoeff();
      params = next;
      if (change < tolerance) {
        fit.converged = true;
        break;
      }
    }
    fit.iterations = std::min(fit.iterations, max_iterations);

    fit.slope_x = params(1);
    fit.slope_y = params(2);
    fit.intercept = params(0) - fit.slope_x * xc - fit.slope_y * yc;
    return fit;
  }

}  // namespace tlsbatch::analysis
