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

#pragma once

#include <tlsbatch/analysis/ScanData.hpp>
#include <tlsbatch/common/common.hpp>

namespace tlsbatch::analysis {

  /**
   * @brief Lowest return per cell of a square grid around a sensor.
   *
   * Only cells that received at least one return are listed. r is the range
   * from the sensor origin to the lowest return of the cell.
   */
  struct MinZGrid {
    vec1d x;
    vec1d y;
    vec1d z;
    vec1d r;

    size_t size() const { return z.size(); }
  };

  /**
   * @brief Grid the returns of a scan and keep the lowest return per cell.
   *
   * @param grid_extent Edge length of the grid, centered on grid_origin.
   * @param grid_resolution Cell size.
   */
  MinZGrid get_min_z_grid(const ScanData& scan, double grid_extent,
                          double grid_resolution, const arr2d& grid_origin);

  // z = intercept + slope_x * x + slope_y * y
  struct PlaneFit {
    double intercept = 0;
    double slope_x = 0;
    double slope_y = 0;
    size_t iterations = 0;
    bool converged = false;

    double height_at(double x, double y) const {
      return intercept + slope_x * x + slope_y * y;
    }
    arr3d parameters() const { return {intercept, slope_x, slope_y}; }
  };

  /**
   * @brief Robust plane fit with Huber weights by iteratively reweighted
   * least squares.
   *
   * @param w Prior weights per point, eg. 1/r. Empty means uniform weights.
   * @throws tlsbatchException with fewer than three points or a degenerate
   * point configuration.
   */
  PlaneFit plane_fit_hubers(const vec1d& x, const vec1d& y, const vec1d& z,
                            const vec1d& w = {}, double k = 1.345,
                            size_t max_iterations = 100,
                            double tolerance = 1e-8);

}  // namespace tlsbatch::analysis
