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

#include <tlsbatch/analysis/GroundPlane.hpp>
#include <tlsbatch/common/datastructures.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "test_helpers.hpp"

using namespace tlsbatch;
using namespace tlsbatch::analysis;
using Catch::Matchers::WithinAbs;

namespace {
  Return make_return(double x, double y, double z, double range) {
    Return ret;
    ret.position = {x, y, z};
    ret.range = range;
    return ret;
  }
}  // namespace

TEST_CASE("min z grid keeps the lowest return per cell") {
  ScanData scan;
  scan.returns.push_back(make_return(1, 1, 5, 3));
  scan.returns.push_back(make_return(2, 2, 3, 4));
  scan.returns.push_back(make_return(-1, 1, 7, 5));
  // outside of the grid
  scan.returns.push_back(make_return(50, 0, -10, 50));

  auto grid = get_min_z_grid(scan, 10, 5, {0, 0});
  REQUIRE(grid.size() == 2);
  // cells are listed row by row from the lower left
  CHECK(grid.z[0] == 7);
  CHECK(grid.x[0] == -1);
  CHECK(grid.z[1] == 3);
  CHECK(grid.r[1] == 4);
  CHECK(grid.x[1] == 2);

  CHECK_THROWS_AS(get_min_z_grid(scan, 10, 0, {0, 0}), tlsbatchException);
}

TEST_CASE("plane fit recovers an exact plane") {
  vec1d x, y, z;
  for (int i = 0; i < 5; ++i) {
    for (int j = 0; j < 5; ++j) {
      x.push_back(1000 + i * 10);
      y.push_back(2000 + j * 10);
      z.push_back(12 + 0.1 * x.back() - 0.05 * y.back());
    }
  }
  auto fit = plane_fit_hubers(x, y, z);
  CHECK(fit.converged);
  CHECK_THAT(fit.intercept, WithinAbs(12, 1e-6));
  CHECK_THAT(fit.slope_x, WithinAbs(0.1, 1e-9));
  CHECK_THAT(fit.slope_y, WithinAbs(-0.05, 1e-9));
  CHECK_THAT(fit.height_at(1020, 2010), WithinAbs(12 + 102 - 100.5, 1e-6));
}

TEST_CASE("plane fit is robust to an outlier") {
  vec1d x, y, z, w;
  for (int i = -3; i <= 3; ++i) {
    for (int j = -3; j <= 3; ++j) {
      x.push_back(i);
      y.push_back(j);
      // small alternating noise
      z.push_back(2 + ((i + j) % 2 == 0 ? 0.01 : -0.01));
      w.push_back(1);
    }
  }
  // a tree stem in one of the cells
  z[10] = 15;

  auto fit = plane_fit_hubers(x, y, z, w);
  CHECK_THAT(fit.intercept, WithinAbs(2, 0.05));
  CHECK_THAT(fit.slope_x, WithinAbs(0, 0.02));
  CHECK_THAT(fit.slope_y, WithinAbs(0, 0.02));
}

TEST_CASE("plane fit rejects degenerate input") {
  CHECK_THROWS_AS(plane_fit_hubers({0, 1}, {0, 1}, {0, 0}), tlsbatchException);
  CHECK_THROWS_AS(plane_fit_hubers({0, 1, 2}, {0, 1, 2}, {0, 0, 0}),
                  tlsbatchException);
  CHECK_THROWS_AS(plane_fit_hubers({0, 1, 0}, {0, 0, 1}, {0, 0, 0}, {1, 1}),
                  tlsbatchException);
  CHECK_THROWS_AS(plane_fit_hubers({0, 1, 0}, {0, 0, 1}, {0, 0, 0}, {1, -1, 1}),
                  tlsbatchException);
}

TEST_CASE("ground plane of a synthetic scan") {
  auto scan = test::make_canopy_scan({10, 20, 101.5}, 100, 10);
  auto grid = get_min_z_grid(scan, 20, 5, {10, 20});
  REQUIRE(grid.size() == 16);
  for (auto z : grid.z) CHECK_THAT(z, WithinAbs(100, 1e-9));

  vec1d w;
  for (auto r : grid.r) w.push_back(r > 0 ? 1 / r : 1);
  auto fit = plane_fit_hubers(grid.x, grid.y, grid.z, w);
  CHECK_THAT(fit.height_at(10, 20), WithinAbs(100, 1e-6));
}
