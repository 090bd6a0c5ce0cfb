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
#include <numbers>
#include <tlsbatch/analysis/VoxelModel.hpp>
#include <tlsbatch/common/datastructures.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace tlsbatch;
using namespace tlsbatch::analysis;
using Catch::Matchers::WithinAbs;

namespace {
  // Single voxel layers of a position looking at the voxel from zenith.
  GridMap single_voxel(double zenith, double paih, double paiv,
                       float shots = 0) {
    double x = 2.0 / std::numbers::pi * std::tan(zenith * std::numbers::pi / 180);
    GridMap layers;
    layers[LAYER_PGAP] = Grid3D(1, 1, 1, std::exp(-(paih + paiv * x)));
    layers[LAYER_ZENI] = Grid3D(1, 1, 1, zenith);
    if (shots > 0) {
      layers[LAYER_HITS] = Grid3D(1, 1, 1, shots / 2);
      layers[LAYER_MISS] = Grid3D(1, 1, 1, shots / 2);
    }
    return layers;
  }
}  // namespace

TEST_CASE("linear model recovers vertical and horizontal plant area") {
  VoxelModel model;
  for (double zenith : {30.0, 45.0, 60.0}) {
    model.add_position(single_voxel(zenith, 0.2, 0.5));
  }
  REQUIRE(model.position_count() == 3);

  auto result = model.run_linear_model(3);
  CHECK(result.nscans.at(0, 0, 0) == 3);
  CHECK_THAT(result.paiv.at(0, 0, 0), WithinAbs(0.5, 1e-4));
  CHECK_THAT(result.paih.at(0, 0, 0), WithinAbs(0.2, 1e-4));

  SECTION("too few observations") {
    auto sparse = model.run_linear_model(4);
    CHECK(sparse.nscans.at(0, 0, 0) == 3);
    CHECK(sparse.paiv.at(0, 0, 0) == sparse.paiv.nodataval);
    CHECK(sparse.paih.at(0, 0, 0) == sparse.paih.nodataval);
  }
}

TEST_CASE("weighted linear model") {
  VoxelModel model;
  model.add_position(single_voxel(30, 0.2, 0.5, 10));
  model.add_position(single_voxel(45, 0.2, 0.5, 100));
  model.add_position(single_voxel(60, 0.2, 0.5, 1));
  auto result = model.run_linear_model(3, true);
  // exact observations fit regardless of the weights
  CHECK_THAT(result.paiv.at(0, 0, 0), WithinAbs(0.5, 1e-4));
  CHECK_THAT(result.paih.at(0, 0, 0), WithinAbs(0.2, 1e-4));

  VoxelModel no_counts;
  no_counts.add_position(single_voxel(30, 0.2, 0.5));
  CHECK_THROWS_AS(no_counts.run_linear_model(1, true), ConfigurationError);
}

TEST_CASE("observations from a single direction") {
  VoxelModel model;
  model.add_position(single_voxel(45, 0.3, 0));
  model.add_position(single_voxel(45, 0.3, 0));
  auto result = model.run_linear_model(2);
  CHECK(result.paiv.at(0, 0, 0) == 0);
  CHECK_THAT(result.paih.at(0, 0, 0), WithinAbs(0.3, 1e-5));
}

TEST_CASE("nodata observations are skipped") {
  VoxelModel model;
  model.add_position(single_voxel(30, 0.2, 0.5));
  auto blind = single_voxel(45, 0.2, 0.5);
  blind[LAYER_PGAP].array[0] = blind[LAYER_PGAP].nodataval;
  model.add_position(blind);
  auto result = model.run_linear_model(1);
  CHECK(result.nscans.at(0, 0, 0) == 1);
}

TEST_CASE("inconsistent voxel grids") {
  VoxelModel model;
  CHECK_THROWS_AS(model.run_linear_model(), ConfigurationError);

  GridMap no_zenith;
  no_zenith[LAYER_PGAP] = Grid3D(1, 1, 1);
  CHECK_THROWS_AS(model.add_position(no_zenith), ConfigurationError);

  model.add_position(single_voxel(30, 0, 0));
  GridMap larger;
  larger[LAYER_PGAP] = Grid3D(2, 1, 1);
  larger[LAYER_ZENI] = Grid3D(2, 1, 1);
  CHECK_THROWS_AS(model.add_position(larger), ConfigurationError);
}

TEST_CASE("cover profile accumulates from the top") {
  Grid3D paiv(1, 1, 3, 1);
  auto cover = VoxelModel::cover_profile(paiv);
  REQUIRE(cover.size() == 3);
  CHECK_THAT(cover[2], WithinAbs(1 - std::exp(-0.5), 1e-9));
  CHECK_THAT(cover[1], WithinAbs(1 - std::exp(-1.0), 1e-9));
  CHECK_THAT(cover[0], WithinAbs(1 - std::exp(-1.5), 1e-9));

  paiv.at(0, 0, 1) = paiv.nodataval;
  paiv.at(0, 0, 2) = paiv.nodataval;
  cover = VoxelModel::cover_profile(paiv);
  CHECK(std::isnan(cover[2]));
  CHECK(std::isnan(cover[1]));
  CHECK_THAT(cover[0], WithinAbs(1 - std::exp(-0.5), 1e-9));
}
