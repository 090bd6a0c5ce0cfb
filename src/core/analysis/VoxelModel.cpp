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
#include <tlsbatch/analysis/VoxelModel.hpp>
#include <tlsbatch/common/datastructures.hpp>

#include "fmt/format.h"

namespace tlsbatch::analysis {

  namespace {
    constexpr double MIN_PGAP = 1e-6;

    const Grid3D& require_layer(const GridMap& layers, const char* name) {
      auto it = layers.find(name);
      if (it == layers.end()) {
        throw ConfigurationError(
            fmt::format("Voxel grids lack the {} layer", name));
      }
      return it->second;
    }

    bool same_shape(const Grid3D& a, const Grid3D& b) {
      return a.dim_x == b.dim_x && a.dim_y == b.dim_y && a.dim_z == b.dim_z;
    }
  }  // namespace

  void VoxelModel::add_position(GridMap layers) {
    const auto& pgap = require_layer(layers, LAYER_PGAP);
    require_layer(layers, LAYER_ZENI);
    for (const auto& [name, grid] : layers) {
      if (!same_shape(grid, pgap)) {
        throw ConfigurationError(
            fmt::format("Voxel layer {} differs in shape", name));
      }
    }
    if (!positions_.empty() &&
        !same_shape(pgap, positions_.front().at(LAYER_PGAP))) {
      throw ConfigurationError(
          "Voxel grids of the positions differ in dimensions");
    }
    positions_.push_back(std::move(layers));
  }

  VoxelModelResult VoxelModel::run_linear_model(size_t min_n,
                                                bool weighted) const {
    if (positions_.empty()) {
      throw ConfigurationError("No voxel grids to model");
    }
    if (weighted) {
      for (const auto& layers : positions_) {
        if (!layers.count(LAYER_HITS) || !layers.count(LAYER_MISS)) {
          throw ConfigurationError(
              "The weighted model needs the hits and miss grids");
        }
      }
    }

    const Grid3D& shape = positions_.front().at(LAYER_PGAP);
    const float nodata = shape.nodataval;
    VoxelModelResult result;
    result.paiv = shape;
    std::fill(result.paiv.array.begin(), result.paiv.array.end(), nodata);
    result.paih = result.paiv;
    result.nscans = result.paiv;
    std::fill(result.nscans.array.begin(), result.nscans.array.end(), 0.f);

    vec1d xs, ys, ws;
    for (size_t i = 0; i < shape.size(); ++i) {
      xs.clear();
      ys.clear();
      ws.clear();
      for (const auto& layers : positions_) {
        const auto& pgap = layers.at(LAYER_PGAP);
        float p = pgap.array[i];
        float zenith = layers.at(LAYER_ZENI).array[i];
        if (p == pgap.nodataval || zenith == pgap.nodataval) continue;
        double w = 1;
        if (weighted) {
          w = layers.at(LAYER_HITS).array[i] + layers.at(LAYER_MISS).array[i];
          if (!(w > 0)) continue;
        }
        xs.push_back(2.0 / std::numbers::pi *
                     std::tan(zenith * std::numbers::pi / 180.0));
        ys.push_back(-std::log(std::max<double>(p, MIN_PGAP)));
        ws.push_back(w);
      }
      result.nscans.array[i] = static_cast<float>(xs.size());
      if (xs.empty() || xs.size() < min_n) continue;

      double sw = 0, xm = 0, ym = 0;
      for (size_t k = 0; k < xs.size(); ++k) {
        sw += ws[k];
        xm += ws[k] * xs[k];
        ym += ws[k] * ys[k];
      }
      xm /= sw;
      ym /= sw;
      double sxy = 0, sxx = 0;
      for (size_t k = 0; k < xs.size(); ++k) {
        sxy += ws[k] * (xs[k] - xm) * (ys[k] - ym);
        sxx += ws[k] * (xs[k] - xm) * (xs[k] - xm);
      }
      // all observations from the same direction, no vertical component
      double paiv = sxx > 1e-12 ? sxy / sxx : 0.0;
      double paih = ym - paiv * xm;
      result.paiv.array[i] = static_cast<float>(paiv);
      result.paih.array[i] = static_cast<float>(paih);
    }
    return result;
  }

  vec1d VoxelModel::cover_profile(const Grid3D& paiv) {
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    vec1d cover(paiv.dim_z, nan);
    if (paiv.dim_z == 0) return cover;

    vec1d sum(paiv.dim_z, 0);
    std::vector<size_t> columns(paiv.dim_z, 0);
    for (size_t iy = 0; iy < paiv.dim_y; ++iy) {
      for (size_t ix = 0; ix < paiv.dim_x; ++ix) {
        double cumulative = 0;
        bool seen = false;
        for (size_t iz = paiv.dim_z; iz-- > 0;) {
          float v = paiv.at(ix, iy, iz);
          if (v != paiv.nodataval && std::isfinite(v)) {
            cumulative += v;
            seen = true;
          }
          if (!seen) continue;
          sum[iz] += 1.0 - std::exp(-0.5 * cumulative);
          ++columns[iz];
        }
      }
    }
    for (size_t iz = 0; iz < paiv.dim_z; ++iz) {
      if (columns[iz] > 0) cover[iz] = sum[iz] / columns[iz];
    }
    return cover;
  }

}  // namespace tlsbatch::analysis
