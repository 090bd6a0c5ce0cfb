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
#include <tlsbatch/io/ProjectConfig.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "test_helpers.hpp"

using namespace tlsbatch;
using namespace tlsbatch::io;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {
  VoxelProjectConfig example_config() {
    VoxelProjectConfig config;
    config.bounds = {5, 15, -5, 35, 45, 65};
    config.resolution = 1;
    config.nx = 30;
    config.ny = 30;
    config.nz = 70;
    config.positions.push_back(
        {"210101_120000", {{"pgap", "210101_120000_pgap.tif"},
                           {"zeni", "210101_120000_zeni.tif"}}});
    config.positions.push_back(
        {"200101_120000", {{"pgap", "200101_120000_pgap.tif"},
                           {"zeni", "200101_120000_zeni.tif"}}});
    return config;
  }
}  // namespace

TEST_CASE("config file is named after the project") {
  CHECK(project_config_filename("/data/forest.RiSCAN") ==
        "forest_config.json");
  CHECK(project_config_filename("/data/forest.RiSCAN/") ==
        "forest_config.json");
  CHECK(project_config_filename("plot7") == "plot7_config.json");
}

TEST_CASE("config serialisation") {
  auto text = dump_project_config(example_config());
  CHECK_THAT(text, StartsWith("{\n    \"bounds\": ["));
  CHECK_THAT(text, ContainsSubstring("\"nodata\": -9999"));
  CHECK_THAT(text, ContainsSubstring("\"dtm\": null"));
  CHECK_THAT(text, ContainsSubstring("\"nx\": 30"));
  // positions keep their processing order
  CHECK(text.find("210101_120000") < text.find("200101_120000"));
  CHECK(dump_project_config(example_config()) == text);

  auto with_dtm = example_config();
  with_dtm.dtm = "dtm.tif";
  CHECK_THAT(dump_project_config(with_dtm),
             ContainsSubstring("\"dtm\": \"dtm.tif\""));
}

TEST_CASE("config files are read back") {
  test::TempDir tmp;
  auto path = tmp.path() / "forest_config.json";
  auto config = example_config();
  config.dtm = "/data/dtm.tif";
  write_project_config(path, config);

  auto read = read_project_config(path);
  CHECK(read.bounds == config.bounds);
  CHECK(read.resolution == 1);
  CHECK(read.nz == 70);
  CHECK(read.nodata == -9999);
  CHECK(read.dtm == config.dtm);
  REQUIRE(read.positions.size() == 2);
  CHECK(read.positions[0].first == "210101_120000");
  CHECK(read.positions[0].second.at("zeni") == "210101_120000_zeni.tif");
  CHECK(read.positions[1].first == "200101_120000");

  // rewriting the same config gives the same file
  auto first = test::read_file(path);
  write_project_config(path, read);
  CHECK(test::read_file(path) == first);
}

TEST_CASE("invalid config files") {
  test::TempDir tmp;
  CHECK_THROWS_AS(read_project_config(tmp.path() / "missing.json"),
                  tlsbatchException);

  auto path = tmp.path() / "config.json";
  test::touch(path, "{ not json");
  CHECK_THROWS_AS(read_project_config(path), tlsbatchException);

  test::touch(path, R"({"bounds": [0, 0, 0, 1, 1], "resolution": 1,
    "nx": 1, "ny": 1, "nz": 1, "nodata": -9999, "positions": {}})");
  CHECK_THROWS_AS(read_project_config(path), tlsbatchException);

  test::touch(path, R"({"bounds": [0, 0, 0, 1, 1, 1]})");
  CHECK_THROWS_AS(read_project_config(path), tlsbatchException);

  CHECK_THROWS_AS(write_project_config(tmp.path() / "no" / "dir.json",
                                       example_config()),
                  tlsbatchException);
}
