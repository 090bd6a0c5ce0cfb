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
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "box.hpp"

namespace tlsbatch {

  typedef std::array<double, 2> arr2d;
  typedef std::array<double, 3> arr3d;
  typedef std::array<double, 6> arr6d;

  typedef std::vector<double> vec1d;

  // file names keyed by grid layer name, ordered for stable serialisation
  typedef std::map<std::string, std::string> FileMap;

  /**
   * @brief Regular 3D grid of float values stored x fastest, then y, then z.
   *
   * Cell (0, 0, 0) is the cell with the lowest x, y and z coordinates.
   */
  struct Grid3D {
    std::vector<float> array;
    size_t dim_x = 0;
    size_t dim_y = 0;
    size_t dim_z = 0;
    double min_x = 0;
    double min_y = 0;
    double min_z = 0;
    double cellsize = 1;
    float nodataval = -9999;

    Grid3D() = default;
    Grid3D(size_t nx, size_t ny, size_t nz, float fill = 0)
        : array(nx * ny * nz, fill), dim_x(nx), dim_y(ny), dim_z(nz){};

    size_t index(size_t ix, size_t iy, size_t iz) const {
      return (iz * dim_y + iy) * dim_x + ix;
    }
    float& at(size_t ix, size_t iy, size_t iz) {
      return array[index(ix, iy, iz)];
    }
    float at(size_t ix, size_t iy, size_t iz) const {
      return array[index(ix, iy, iz)];
    }
    size_t size() const { return array.size(); }
  };

  /**
   * @brief Single band raster with a north-up geotransform.
   */
  struct Raster {
    std::vector<float> array;
    size_t dim_x = 0;
    size_t dim_y = 0;
    // GDAL order: origin x, pixel width, 0, origin y, 0, pixel height (< 0)
    std::array<double, 6> geotransform = {0, 1, 0, 0, 0, -1};
    std::optional<float> nodataval;

    std::optional<float> sample(double x, double y) const;
  };

  // Returns true if s matches pattern, where '?' matches any single character
  // and '#' matches a single decimal digit.
  bool match_pattern(const std::string& s, const std::string& pattern);

}  // namespace tlsbatch
