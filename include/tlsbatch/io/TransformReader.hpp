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

#include <Eigen/Core>
#include <filesystem>
#include <tlsbatch/common/common.hpp>

namespace tlsbatch::io {

  /**
   * @brief 4x4 scan position transform with the sensor origin in row 3.
   *
   * RISCAN stores the matrix with the translation in the last column. After
   * reading, the matrix is transposed, so that a point in scanner
   * coordinates transforms to world coordinates as `[x y z 1] * M`.
   */
  typedef Eigen::Matrix4d TransformMatrix;

  /**
   * @brief Read a RISCAN .DAT transform file.
   *
   * The file contains four rows of four whitespace separated numbers.
   *
   * @throws tlsbatchException if the file cannot be opened or does not hold
   * exactly 16 numbers.
   */
  TransformMatrix read_transform_file(const std::filesystem::path& path);

  // World coordinates of the sensor, the first three values of row 3.
  arr3d sensor_origin(const TransformMatrix& transform);

  // Transform a point from scanner to world coordinates.
  arr3d apply_transform(const TransformMatrix& transform, const arr3d& p);

}  // namespace tlsbatch::io
