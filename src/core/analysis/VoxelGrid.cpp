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

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <tlsbatch/analysis/VoxelGrid.hpp>
#include <tlsbatch/common/datastructures.hpp>

#include "fmt/format.h"

namespace tlsbatch::analysis {

  namespace {
    constexpr double EPS = 1e-9;

    double dot(const arr3d& a, const arr3d& b) {
      return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
    }
  }  // namespace

  void traverse_grid(
      const Grid3D& grid, const arr3d& origin, const arr3d& direction,
      const std::function<bool(size_t ix, size_t iy, size_t iz, double t0,
                               double t1)>& visit) {
    const double cs = grid.cellsize;
    const arr3d lo = {grid.min_x, grid.min_y, grid.min_z};
    const std::array<size_t, 3> dim = {grid.dim_x, grid.dim_y, grid.dim_z};
    if (dim[0] == 0 || dim[1] == 0 || dim[2] == 0) return;

    // clip the ray against the grid box
    double t_enter = 0;
    double t_exit = std::numeric_limits<double>::infinity();
    for (size_t a = 0; a < 3; ++a) {
      double hi = lo[a] + dim[a] * cs;
      if (std::abs(direction[a]) < EPS) {
        if (origin[a] < lo[a] || origin[a] >= hi) return;
        continue;
      }
      double ta = (lo[a] - origin[a]) / direction[a];
      double tb = (hi - origin[a]) / direction[a];
      if (ta > tb) std::swap(ta, tb);
      t_enter = std::max(t_enter, ta);
      t_exit = std::min(t_exit, tb);
    }
    if (!(t_exit > t_enter)) return;

    std::array<long, 3> cell;
    std::array<long, 3> step;
    std::array<double, 3> t_max;
    std::array<double, 3> t_delta;
    for (size_t a = 0; a < 3; ++a) {
      double p = origin[a] + t_enter * direction[a];
      long c = static_cast<long>(std::floor((p - lo[a]) / cs));
      cell[a] = std::clamp<long>(c, 0, static_cast<long>(dim[a]) - 1);
      if (std::abs(direction[a]) < EPS) {
        step[a] = 0;
        t_max[a] = std::numeric_limits<double>::infinity();
        t_delta[a] = std::numeric_limits<double>::infinity();
      } else if (direction[a] > 0) {
        step[a] = 1;
        t_max[a] = (lo[a] + (cell[a] + 1) * cs - origin[a]) / direction[a];
        t_delta[a] = cs / direction[a];
      } else {
        step[a] = -1;
        t_max[a] = (lo[a] + cell[a] * cs - origin[a]) / direction[a];
        t_delta[a] = -cs / direction[a];
      }
    }

    double t = t_enter;
    while (t < t_exit) {
      size_t axis = 0;
      if (t_max[1] < t_max[axis]) axis = 1;
      if (t_max[2] < t_max[axis]) axis = 2;
      double t_next = std::min(t_max[axis], t_exit);
      if (t_next > t) {
        if (!visit(static_cast<size_t>(cell[0]), static_cast<size_t>(cell[1]),
                   static_cast<size_t>(cell[2]), t, t_next)) {
          return;
        }
      }
      t = t_next;
      cell[axis] += step[axis];
      t_max[axis] += t_delta[axis];
      if (cell[axis] < 0 || cell[axis] >= static_cast<long>(dim[axis])) {
        return;
      }
    }
  }

  VoxelGrid::VoxelGrid(const bounds::BoundingVolume& volume, double voxelsize,
                       const Raster* dtm)
      : dtm_(dtm) {
    auto dims = bounds::grid_dimensions(volume, voxelsize);
    if (dims.nx == 0 || dims.ny == 0 || dims.nz == 0) {
      throw ConfigurationError(fmt::format(
          "Voxel grid is empty: {} x {} x {}", dims.nx, dims.ny, dims.nz));
    }
    hits_ = Grid3D(dims.nx, dims.ny, dims.nz, 0);
    hits_.min_x = volume.xmin();
    hits_.min_y = volume.ymin();
    hits_.min_z = volume.zmin();
    hits_.cellsize = voxelsize;
    miss_ = hits_;
    occl_ = hits_;
    zenith_sum_ = hits_;
    zenith_cnt_ = hits_;
  }

  Grid3D VoxelGrid::empty_like(float fill) const {
    Grid3D grid = hits_;
    std::fill(grid.array.begin(), grid.array.end(), fill);
    return grid;
  }

  void VoxelGrid::add_scan(const ScanData& scan) {
    // returns of every pulse as (distance along the pulse, weight)
    std::vector<std::vector<std::pair<double, double>>> pulse_returns(
        scan.pulses.size());
    for (const auto& ret : scan.returns) {
      if (ret.pulse_index >= scan.pulses.size()) {
        throw tlsbatchException(fmt::format("Return refers to pulse {} of {}",
                                            ret.pulse_index,
                                            scan.pulses.size()));
      }
      const auto& pulse = scan.pulses[ret.pulse_index];
      auto dir = pulse.direction();
      arr3d offset = {ret.position[0] - pulse.origin[0],
                      ret.position[1] - pulse.origin[1],
                      ret.position[2] - pulse.origin[2]};
      double weight = ret.target_count > 0 ? 1.0 / ret.target_count : 1.0;
      pulse_returns[ret.pulse_index].emplace_back(dot(offset, dir), weight);
    }

    for (size_t pi = 0; pi < scan.pulses.size(); ++pi) {
      const auto& pulse = scan.pulses[pi];
      auto& returns = pulse_returns[pi];
      std::sort(returns.begin(), returns.end());
      const float zenith =
          static_cast<float>(pulse.zenith * 180.0 / std::numbers::pi);

      double remaining = 1.0;
      size_t next = 0;
      traverse_grid(
          hits_, pulse.origin, pulse.direction(),
          [&](size_t ix, size_t iy, size_t iz, double t0, double t1) {
            // returns in front of the grid
            while (next < returns.size() && returns[next].first < t0) {
              remaining -= returns[next++].second;
            }
            if (remaining <= EPS) {
              occl_.at(ix, iy, iz) += 1;
              return true;
            }
            double intercepted = 0;
            while (next < returns.size() && returns[next].first < t1) {
              intercepted += returns[next++].second;
            }
            hits_.at(ix, iy, iz) += static_cast<float>(intercepted);
            miss_.at(ix, iy, iz) +=
                static_cast<float>(std::max(0.0, remaining - intercepted));
            zenith_sum_.at(ix, iy, iz) += zenith;
            zenith_cnt_.at(ix, iy, iz) += 1;
            remaining -= intercepted;
            return true;
          });
    }
  }

  bool VoxelGrid::below_terrain(size_t ix, size_t iy, size_t iz) const {
    if (dtm_ == nullptr) return false;
    const double cs = hits_.cellsize;
    auto ground = dtm_->sample(hits_.min_x + (ix + 0.5) * cs,
                               hits_.min_y + (iy + 0.5) * cs);
    if (!ground.has_value()) return false;
    return hits_.min_z + (iz + 0.5) * cs < *ground;
  }

  GridMap VoxelGrid::compute(bool save_counts) const {
    const float nodata = hits_.nodataval;
    Grid3D pgap = empty_like(nodata);
    Grid3D zeni = empty_like(nodata);
    Grid3D hits = hits_, miss = miss_, occl = occl_;

    for (size_t iz = 0; iz < nz(); ++iz) {
      for (size_t iy = 0; iy < ny(); ++iy) {
        for (size_t ix = 0; ix < nx(); ++ix) {
          if (below_terrain(ix, iy, iz)) {
            hits.at(ix, iy, iz) = nodata;
            miss.at(ix, iy, iz) = nodata;
            occl.at(ix, iy, iz) = nodata;
            continue;
          }
          double total = hits_.at(ix, iy, iz) + miss_.at(ix, iy, iz);
          if (total <= 0) continue;
          pgap.at(ix, iy, iz) = static_cast<float>(miss_.at(ix, iy, iz) / total);
          zeni.at(ix, iy, iz) =
              zenith_sum_.at(ix, iy, iz) / zenith_cnt_.at(ix, iy, iz);
        }
      }
    }

    GridMap layers;
    layers[LAYER_PGAP] = std::move(pgap);
    layers[LAYER_ZENI] = std::move(zeni);
    if (save_counts) {
      layers[LAYER_HITS] = std::move(hits);
      layers[LAYER_MISS] = std::move(miss);
      layers[LAYER_OCCL] = std::move(occl);
    }
    return layers;
  }

}  // namespace tlsbatch::analysis
