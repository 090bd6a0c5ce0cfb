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

#include <array>
#include <filesystem>
#include <vector>

#include <tlsbatch/common/common.hpp>

namespace tlsbatch::bounds {

  /**
   * @brief Spatial domain shared by all scan positions of a batch run.
   */
  struct BoundingVolume {
    // xmin, ymin, zmin, xmax, ymax, zmax
    arr6d bounds;

    double xmin() const { return bounds[0]; }
    double ymin() const { return bounds[1]; }
    double zmin() const { return bounds[2]; }
    double xmax() const { return bounds[3]; }
    double ymax() const { return bounds[4]; }
    double zmax() const { return bounds[5]; }

    TBox<double> box() const {
      return TBox<double>{bounds[0], bounds[1], bounds[2],
                          bounds[3], bounds[4], bounds[5]};
    }
  };

  // Number of cells along x, y and z for the given voxel size.
  struct GridDimensions {
    size_t nx = 0;
    size_t ny = 0;
    size_t nz = 0;
  };

  /**
   * @brief Compute the buffered bounds of a set of sensor origins.
   *
   * Minima are lowered by one buffer and maxima raised by one and a half
   * buffer, both floor-rounded to a multiple of the buffer. Then the lower z
   * bound is lowered by another buffer and the upper z bound raised by hmax.
   * The result does not depend on the order of the origins.
   *
   * @throws ConfigurationError if origins is empty or buffer <= 0.
   */
  BoundingVolume compute_bounds(const std::vector<arr3d>& origins,
                                double buffer, double hmax);

  // Reads the sensor origin of every transform file, then calls
  // compute_bounds().
  BoundingVolume compute_bounds_from_transforms(
      const std::vector<std::filesystem::path>& transform_files, double buffer,
      double hmax);

  /**
   * @brief Floor of extent / voxelsize per axis.
   *
   * @throws ConfigurationError if voxelsize <= 0.
   */
  GridDimensions grid_dimensions(const BoundingVolume& volume,
                                 double voxelsize);

}  // namespace tlsbatch::bounds
