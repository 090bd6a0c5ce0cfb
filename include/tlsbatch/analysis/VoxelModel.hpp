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

#include <tlsbatch/analysis/VoxelGrid.hpp>
#include <tlsbatch/common/common.hpp>

namespace tlsbatch::analysis {

  struct VoxelModelResult {
    // vertical and horizontal plant area per voxel
    Grid3D paiv;
    Grid3D paih;
    // number of positions that observed the voxel
    Grid3D nscans;
  };

  /**
   * @brief Linear model over the voxel grids of several scan positions.
   *
   * Per voxel, -ln(Pgap) of every observing position is regressed on
   * 2/pi * tan(zenith). The slope is the vertical and the intercept the
   * horizontal plant area.
   */
  class VoxelModel {
   public:
    // Grids need the pgap and zeni layers, with hits and miss for the
    // weighted model. All grids must have the same dimensions.
    void add_position(GridMap layers);

    size_t position_count() const { return positions_.size(); }

    /**
     * @brief Fit the model in every voxel with at least min_n observations.
     *
     * With weighted set, every observation is weighted by the number of
     * pulses that passed through the voxel.
     *
     * @throws ConfigurationError when no positions were added, or weighted
     * is set and a position lacks the count layers.
     */
    VoxelModelResult run_linear_model(size_t min_n = 3,
                                      bool weighted = false) const;

    /**
     * @brief Canopy cover per height level.
     *
     * For every column the plant area at and above a level is accumulated
     * and converted to cover as 1 - exp(-0.5 * pai). The profile is the mean
     * over the columns with at least one estimate at or above the level.
     * Levels without any estimate are NaN.
     */
    static vec1d cover_profile(const Grid3D& paiv);

   private:
    std::vector<GridMap> positions_;
  };

}  // namespace tlsbatch::analysis
