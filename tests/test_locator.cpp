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
#include <tlsbatch/project/ScanPositionLocator.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

using namespace tlsbatch;
using namespace tlsbatch::project;

TEST_CASE("missing SCANS directory is a project structure error") {
  test::TempDir tmp;
  CHECK_THROWS_AS(list_scan_positions(tmp.path()), ProjectStructureError);
  CHECK_THROWS_AS(locate_scan_positions(tmp.path(), ResolveMode::PROFILE),
                  ProjectStructureError);
}

TEST_CASE("scan positions are listed in lexical order") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  for (auto name : {"ScanPos010", "ScanPos002", "ScanPos001", "matrix",
                    "Other003"}) {
    fs::create_directories(tmp.path() / "SCANS" / name);
  }
  // a file with the prefix is not a position
  test::touch(tmp.path() / "SCANS" / "ScanPos099.txt");

  auto positions = list_scan_positions(tmp.path());
  REQUIRE(positions.size() == 3);
  CHECK(positions[0] == "ScanPos001");
  CHECK(positions[1] == "ScanPos002");
  CHECK(positions[2] == "ScanPos010");
}

TEST_CASE("resolved and skipped positions add up") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  project.add_position("ScanPos001", "a", {0, 0, 0});
  project.add_scan_subdirectory("ScanPos002", "b");  // no transform
  project.add_position("ScanPos003", "c", {10, 0, 0});
  fs::create_directories(tmp.path() / "SCANS" / "ScanPos004");  // empty

  auto located = locate_scan_positions(tmp.path(), ResolveMode::PROFILE);
  CHECK(located.total() == list_scan_positions(tmp.path()).size());
  REQUIRE(located.positions.size() == 2);
  CHECK(located.positions[0].scan_pos == "ScanPos001");
  CHECK(located.positions[1].scan_pos == "ScanPos003");
  REQUIRE(located.skipped.size() == 2);
  CHECK(located.skipped[0].scan_pos == "ScanPos002");
  CHECK(located.skipped[0].missing == FileKind::TRANSFORM);
  CHECK(located.skipped[1].scan_pos == "ScanPos004");
  CHECK(located.skipped[1].missing == FileKind::RAW_SCAN);
}

TEST_CASE("empty SCANS directory yields no positions") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  auto located = locate_scan_positions(tmp.path(), ResolveMode::VOXELIZATION);
  CHECK(located.positions.empty());
  CHECK(located.skipped.empty());
}
