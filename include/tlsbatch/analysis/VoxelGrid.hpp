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

#include <functional>
#include <map>
#include <optional>
#include <string>

#include <tlsbatch/analysis/ScanData.hpp>
#include <tlsbatch/bounds/BoundsAggregator.hpp>
#include <tlsbatch/common/common.hpp>

namespace tlsbatch::analysis {

  // names of the voxel layers, also used as output file suffix
  inline constexpr const char* LAYER_HITS = "hits";
  inline constexpr const char* LAYER_MISS = "miss";
  inline constexpr const char* LAYER_OCCL = "occl";
  inline constexpr const char* LAYER_PGAP = "pgap";
  inline constexpr const char* LAYER_ZENI = "zeni";

  typedef std::map<std::string, Grid3D> GridMap;

  /**
   * @brief Visit the cells of grid that a ray passes through, in order.
   *
   * The callback receives the cell indices and the ray parameters where the
   * ray enters and leaves the cell. direction need not be normalised, t is
   * measured in units of its length. Traversal stops when the ray leaves the
   * grid or the callback returns false.
   */
  void traverse_grid(
      const Grid3D& grid, const arr3d& origin, const arr3d& direction,
      const std::function<bool(size_t ix, size_t iy, size_t iz, double t0,
                               double t1)>& visit);

  /**
   * @brief Voxelization of the pulses of a single scan position.
   *
   * Every pulse is traced from its origin through the grid. Returns of the
   * pulse are hits of the voxel they fall in, weighted by 1 / target_count.
   * The part of the pulse that is not yet intercepted counts as a miss, a
   * voxel behind the last return counts the pulse as occluded.
   */
  class VoxelGrid {
   public:
    VoxelGrid(const bounds::BoundingVolume& volume, double voxelsize,
              const Raster* dtm = nullptr);

    void add_scan(const ScanData& scan);

    /**
     * @brief Derive the pgap and zeni layers.
     *
     * Voxels that no pulse passed through, and voxels below the terrain
     * model, are set to the nodata value in every layer.
     */
    GridMap compute(bool save_counts = true) const;

    size_t nx() const { return hits_.dim_x; }
    size_t ny() const { return hits_.dim_y; }
    size_t nz() const { return hits_.dim_z; }

   private:
    Grid3D hits_, miss_, occl_, zenith_sum_, zenith_cnt_;
    const Raster* dtm_;

    Grid3D empty_like(float fill) const;
    bool below_terrain(size_t ix, size_t iy, size_t iz) const;
  };

}  // namespace tlsbatch::analysis
