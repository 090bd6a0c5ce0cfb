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

#include <cmath>
#include <tlsbatch/bounds/BoundsAggregator.hpp>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/common/formatters.hpp>
#include <tlsbatch/io/TransformReader.hpp>
#include <tlsbatch/logger/logger.h>

namespace tlsbatch::bounds {

  BoundingVolume compute_bounds(const std::vector<arr3d>& origins,
                                double buffer, double hmax) {
    if (origins.empty()) {
      throw ConfigurationError("no positions to bound");
    }
    if (!(buffer > 0)) {
      throw ConfigurationError(
          fmt::format("Bounds buffer must be higher than 0, got {}", buffer));
    }

    TBox<double> box;
    box.add(origins);
    logger::Logger::get_logger().debug("Sensor origins span {}", box);

    BoundingVolume volume;
    for (size_t i = 0; i < 3; ++i) {
      volume.bounds[i] = std::floor((box.pmin[i] - buffer) / buffer) * buffer;
      volume.bounds[i + 3] =
          std::floor((box.pmax[i] + 1.5 * buffer) / buffer) * buffer;
    }
    volume.bounds[2] -= buffer;
    volume.bounds[5] += hmax;

    for (auto v : volume.bounds) {
      if (!std::isfinite(v)) {
        throw ConfigurationError("Bounds are not finite");
      }
    }
    logger::Logger::get_logger().debug("Voxelization volume {}", volume.box());
    return volume;
  }

  BoundingVolume compute_bounds_from_transforms(
      const std::vector<std::filesystem::path>& transform_files, double buffer,
      double hmax) {
    std::vector<arr3d> origins;
    origins.reserve(transform_files.size());
    for (const auto& path : transform_files) {
      origins.push_back(io::sensor_origin(io::read_transform_file(path)));
    }
    auto volume = compute_bounds(origins, buffer, hmax);
    logger::Logger::get_logger().info(
        "Bounds: xmin={:.1f}, ymin={:.1f}, zmin={:.1f}, xmax={:.1f}, "
        "ymax={:.1f}, zmax={:.1f}",
        volume.xmin(), volume.ymin(), volume.zmin(), volume.xmax(),
        volume.ymax(), volume.zmax());
    return volume;
  }

  GridDimensions grid_dimensions(const BoundingVolume& volume,
                                 double voxelsize) {
    if (!(voxelsize > 0)) {
      throw ConfigurationError(
          fmt::format("Voxel size must be higher than 0, got {}", voxelsize));
    }
    auto cells = [voxelsize](double lo, double hi) -> size_t {
      double n = std::floor((hi - lo) / voxelsize);
      return n > 0 ? static_cast<size_t>(n) : 0;
    };
    return {cells(volume.xmin(), volume.xmax()),
            cells(volume.ymin(), volume.ymax()),
            cells(volume.zmin(), volume.zmax())};
  }

}  // namespace tlsbatch::bounds
