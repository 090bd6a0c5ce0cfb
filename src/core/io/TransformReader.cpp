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

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/io/TransformReader.hpp>

#include "fmt/format.h"

namespace tlsbatch::io {

  TransformMatrix read_transform_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
      throw tlsbatchException(
          fmt::format("Unable to open transform file {}", path.string()));
    }

    std::vector<double> values;
    std::string token;
    while (in >> token) {
      try {
        size_t consumed = 0;
        double v = std::stod(token, &consumed);
        if (consumed != token.size()) throw std::invalid_argument(token);
        values.push_back(v);
      } catch (const std::exception&) {
        throw tlsbatchException(fmt::format(
            "Invalid value '{}' in transform file {}", token, path.string()));
      }
    }
    if (values.size() != 16) {
      throw tlsbatchException(
          fmt::format("Transform file {} holds {} values, expected 16",
                      path.string(), values.size()));
    }

    // values are in row major order, the transpose puts the translation in
    // row 3
    TransformMatrix stored;
    for (int row = 0; row < 4; ++row) {
      for (int col = 0; col < 4; ++col) {
        stored(row, col) = values[row * 4 + col];
      }
    }
    return stored.transpose();
  }

  arr3d sensor_origin(const TransformMatrix& transform) {
    return {transform(3, 0), transform(3, 1), transform(3, 2)};
  }

  arr3d apply_transform(const TransformMatrix& transform, const arr3d& p) {
    Eigen::RowVector4d h(p[0], p[1], p[2], 1.0);
    Eigen::RowVector4d w = h * transform;
    return {w[0], w[1], w[2]};
  }

}  // namespace tlsbatch::io
