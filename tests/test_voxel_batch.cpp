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
#include <tlsbatch/batch/VoxelBatch.hpp>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/io/ProjectConfig.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

using namespace tlsbatch;
using namespace tlsbatch::batch;

namespace {
  // Raster factories sharing one in-memory store.
  struct MemoryRasters {
    std::shared_ptr<test::GridStore> store =
        std::make_shared<test::GridStore>();

    RasterWriterFactory writers() const {
      auto s = store;
      return [s]() -> std::unique_ptr<io::RasterWriterInterface> {
        return std::make_unique<test::MemoryRasterWriter>(s);
      };
    }
    RasterReaderFactory readers() const {
      auto s = store;
      return [s]() -> std::unique_ptr<io::RasterReaderInterface> {
        return std::make_unique<test::MemoryRasterReader>(s);
      };
    }
    bool contains(const fs::path& p) const {
      return store->count(p.lexically_normal().string()) > 0;
    }
    const Grid3D& at(const fs::path& p) const {
      return store->at(p.lexically_normal().string());
    }
  };

  fs::path two_position_project(const fs::path& dir) {
    auto root = dir / "forest.RiSCAN";
    test::RiscanProject project(root);
    project.add_position("ScanPos001", "a", {0, 0, 1.5});
    project.add_scan_subdirectory("ScanPos002", "b");
    project.add_position("ScanPos003", "c", {20, 0, 2.5});
    return root;
  }
}  // namespace

TEST_CASE("voxel grid file names") {
  CHECK(voxel_grid_filename("210101_120000", "pgap") ==
        "210101_120000_pgap.tif");
}

TEST_CASE("voxelization of a single position") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  project.add_position("ScanPos001", "s1", {0, 0, 1.5});
  auto located = project::locate_scan_positions(
      tmp.path(), project::ResolveMode::VOXELIZATION);
  REQUIRE(located.positions.size() == 1);

  auto volume = bounds::compute_bounds({{0, 0, 1.5}}, 5, 20);
  VoxelBatchConfig cfg;
  test::SyntheticScanReader reader;
  MemoryRasters rasters;
  auto writer = rasters.writers()();
  auto out = tmp.path() / "out";

  auto result = process_voxel_position(located.positions[0], volume, cfg,
                                       nullptr, out, reader, *writer);
  REQUIRE(result.files.size() == 5);
  CHECK(result.files.at("pgap") == "s1_pgap.tif");
  CHECK(result.files.at("occl") == "s1_occl.tif");
  REQUIRE(rasters.contains(out / "s1_pgap.tif"));
  auto dims = bounds::grid_dimensions(volume, 1);
  const auto& pgap = rasters.at(out / "s1_pgap.tif");
  CHECK(pgap.dim_x == dims.nx);
  CHECK(pgap.dim_z == dims.nz);
  CHECK(pgap.min_x == volume.xmin());

  cfg.save_counts = false;
  result = process_voxel_position(located.positions[0], volume, cfg, nullptr,
                                  out, reader, *writer);
  CHECK(result.files.size() == 2);
}

TEST_CASE("voxel batch writes the project config") {
  test::TempDir tmp;
  auto root = two_position_project(tmp.path());
  auto out = tmp.path() / "voxel_output";
  MemoryRasters rasters;

  auto run = run_voxel_batch(root, out, {}, test::synthetic_reader_factory(),
                             rasters.readers(), rasters.writers());
  CHECK(run.located.skipped.size() == 1);
  CHECK(run.report.succeeded() == 2);
  CHECK_FALSE(run.model_succeeded.has_value());
  CHECK(run.volume.bounds == arr6d{-5, -5, -10, 25, 5, 60});

  auto config_file = out / "forest_config.json";
  REQUIRE(run.written.written.size() == 1);
  CHECK(run.written.written[0] == config_file);
  auto config = io::read_project_config(config_file);
  CHECK(config.bounds == run.volume.bounds);
  CHECK(config.nx == 30);
  CHECK(config.ny == 10);
  CHECK(config.nz == 70);
  CHECK_FALSE(config.dtm.has_value());
  REQUIRE(config.positions.size() == 2);
  CHECK(config.positions[0].first == "a");
  CHECK(config.positions[1].first == "c");
  for (const auto& [layer, file] : config.positions[1].second) {
    CHECK(rasters.contains(out / file));
  }
}

TEST_CASE("voxel batch runs the linear model") {
  test::TempDir tmp;
  auto root = two_position_project(tmp.path());
  auto out = tmp.path() / "voxel_output";
  MemoryRasters rasters;
  VoxelBatchConfig cfg;
  cfg.run_model = true;
  cfg.min_n = 2;

  BatchOptions options;
  options.jobs = 2;
  auto run = run_voxel_batch(root, out, cfg, test::synthetic_reader_factory(),
                             rasters.readers(), rasters.writers(), options);
  REQUIRE(run.model_succeeded.has_value());
  CHECK(*run.model_succeeded);
  CHECK(run.written.written.size() == 5);

  auto model_dir = out / MODEL_OUTPUT_DIR;
  for (auto name : {"paiv.tif", "paih.tif", "nscans.tif", "cover_z.tif"}) {
    CHECK(rasters.contains(model_dir / name));
  }
  const auto& nscans = rasters.at(model_dir / "nscans.tif");
  CHECK(*std::max_element(nscans.array.begin(), nscans.array.end()) == 2);
  const auto& cover = rasters.at(model_dir / "cover_z.tif");
  CHECK(cover.dim_x == 1);
  CHECK(cover.dim_y == 1);
  CHECK(cover.dim_z == 70);
}

TEST_CASE("a failing model keeps the voxel grids") {
  test::TempDir tmp;
  auto root = two_position_project(tmp.path());
  auto out = tmp.path() / "voxel_output";
  MemoryRasters rasters;
  VoxelBatchConfig cfg;
  cfg.run_model = true;
  cfg.weighted = true;
  cfg.save_counts = false;

  auto run = run_voxel_batch(root, out, cfg, test::synthetic_reader_factory(),
                             rasters.readers(), rasters.writers());
  REQUIRE(run.model_succeeded.has_value());
  CHECK_FALSE(*run.model_succeeded);
  CHECK(fs::exists(out / "forest_config.json"));
  CHECK_FALSE(rasters.contains(out / MODEL_OUTPUT_DIR / "paiv.tif"));
}

TEST_CASE("no config without voxelized scans") {
  test::TempDir tmp;
  auto root = two_position_project(tmp.path());
  auto out = tmp.path() / "voxel_output";
  MemoryRasters rasters;
  VoxelBatchConfig cfg;
  cfg.run_model = true;

  auto run = run_voxel_batch(
      root, out, cfg, test::synthetic_reader_factory({"ScanPos001", "ScanPos003"}),
      rasters.readers(), rasters.writers());
  CHECK(run.report.failed() == 2);
  CHECK(run.written.no_work);
  CHECK_FALSE(run.model_succeeded.has_value());
  CHECK(fs::is_directory(out));
  CHECK_FALSE(fs::exists(out / "forest_config.json"));
}

TEST_CASE("voxel batch needs at least one position") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  project.add_scan_subdirectory("ScanPos001", "a");
  MemoryRasters rasters;
  CHECK_THROWS_AS(run_voxel_batch(tmp.path(), tmp.path() / "out", {},
                                  test::synthetic_reader_factory(),
                                  rasters.readers(), rasters.writers()),
                  ConfigurationError);
}

TEST_CASE("voxels below the terrain model") {
  test::TempDir tmp;
  auto root = two_position_project(tmp.path());
  auto out = tmp.path() / "voxel_output";
  MemoryRasters rasters;

  // terrain above the whole volume
  Grid3D dtm(40, 40, 1, 100);
  dtm.min_x = -10;
  dtm.min_y = -10;
  auto dtm_path = (tmp.path() / "dtm.tif").string();
  (*rasters.store)[fs::path(dtm_path).lexically_normal().string()] = dtm;

  VoxelBatchConfig cfg;
  cfg.dtm = dtm_path;
  auto run = run_voxel_batch(root, out, cfg, test::synthetic_reader_factory(),
                             rasters.readers(), rasters.writers());
  REQUIRE(run.report.succeeded() == 2);

  const auto& pgap = rasters.at(out / "a_pgap.tif");
  CHECK(std::all_of(pgap.array.begin(), pgap.array.end(),
                    [&](float v) { return v == pgap.nodataval; }));
  auto config = io::read_project_config(out / "forest_config.json");
  CHECK(config.dtm == dtm_path);
}
