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


#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/io/RasterReader.hpp>
#include <tlsbatch/io/RasterWriter.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "test_helpers.hpp"

using namespace tlsbatch;
using Catch::Matchers::WithinAbs;

namespace {
  // 3 x 2 cells, 2 levels, every cell holds its own index
  Grid3D make_grid() {
    Grid3D grid(3, 2, 2);
    grid.min_x = 100;
    grid.min_y = 200;
    grid.min_z = -5.25;
    grid.cellsize = 0.5;
    grid.nodataval = -9999;
    for (size_t i = 0; i < grid.size(); ++i) {
      grid.array[i] = static_cast<float>(i);
    }
    grid.at(2, 1, 1) = grid.nodataval;
    return grid;
  }
}  // namespace

TEST_CASE("GeoTIFF grids read back as written") {
  test::TempDir tmp;
  auto path = (tmp.path() / "grid.tif").string();
  auto grid = make_grid();

  auto writer = io::createRasterWriterGDAL();
  writer->writeGrid(path, grid);

  auto reader = io::createRasterReaderGDAL();
  auto result = reader->readGrid(path);
  CHECK(result.dim_x == 3);
  CHECK(result.dim_y == 2);
  CHECK(result.dim_z == 2);
  CHECK_THAT(result.min_x, WithinAbs(100, 1e-9));
  CHECK_THAT(result.min_y, WithinAbs(200, 1e-9));
  CHECK_THAT(result.min_z, WithinAbs(-5.25, 1e-9));
  CHECK_THAT(result.cellsize, WithinAbs(0.5, 1e-9));
  CHECK(result.nodataval == -9999);
  CHECK(result.array == grid.array);
}

TEST_CASE("single band of a grid as a north-up raster") {
  test::TempDir tmp;
  auto path = (tmp.path() / "grid.tif").string();
  auto grid = make_grid();
  io::createRasterWriterGDAL()->writeGrid(path, grid);

  auto reader = io::createRasterReaderGDAL();
  auto raster = reader->readRaster(path, 2);
  CHECK(raster.dim_x == 3);
  CHECK(raster.dim_y == 2);
  CHECK(raster.geotransform ==
        std::array<double, 6>{100, 0.5, 0, 201, 0, -0.5});
  REQUIRE(raster.nodataval.has_value());
  CHECK(*raster.nodataval == -9999);

  // the first row is the northern one
  CHECK(raster.array[0] == grid.at(0, 1, 1));
  CHECK(raster.array[3] == grid.at(0, 0, 1));

  auto south_west = raster.sample(100.25, 200.25);
  REQUIRE(south_west.has_value());
  CHECK(*south_west == grid.at(0, 0, 1));
  CHECK_FALSE(raster.sample(101.25, 200.75).has_value());
  CHECK_FALSE(raster.sample(99.5, 200.25).has_value());
}

TEST_CASE("raster IO errors") {
  test::TempDir tmp;
  auto reader = io::createRasterReaderGDAL();
  auto writer = io::createRasterWriterGDAL();

  CHECK_THROWS_AS(reader->readRaster((tmp.path() / "missing.tif").string(), 1),
                  tlsbatchException);
  CHECK_THROWS_AS(reader->readGrid((tmp.path() / "missing.tif").string()),
                  tlsbatchException);
  CHECK_THROWS_AS(writer->writeGrid((tmp.path() / "empty.tif").string(),
                                    Grid3D()),
                  tlsbatchException);

  auto path = (tmp.path() / "grid.tif").string();
  writer->writeGrid(path, make_grid());
  CHECK_THROWS_AS(reader->readRaster(path, 0), tlsbatchException);
  CHECK_THROWS_AS(reader->readRaster(path, 3), tlsbatchException);
}
