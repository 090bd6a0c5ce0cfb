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
#include <tlsbatch/io/TransformReader.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "test_helpers.hpp"

using namespace tlsbatch;
using Catch::Matchers::WithinAbs;

TEST_CASE("sensor origin is row 3 of the transposed matrix") {
  test::TempDir tmp;
  auto path = tmp.path() / "ScanPos001.DAT";
  test::write_transform(path, 512345.25, 6712345.5, 102.75);

  auto m = io::read_transform_file(path);
  CHECK(m(3, 3) == 1);
  auto origin = io::sensor_origin(m);
  CHECK(origin == arr3d{512345.25, 6712345.5, 102.75});

  auto p = io::apply_transform(m, {1, 2, 3});
  CHECK_THAT(p[0], WithinAbs(512346.25, 1e-9));
  CHECK_THAT(p[1], WithinAbs(6712347.5, 1e-9));
  CHECK_THAT(p[2], WithinAbs(105.75, 1e-9));
}

TEST_CASE("rotation is applied to points") {
  test::TempDir tmp;
  auto path = tmp.path() / "rot.DAT";
  // 90 degrees around z, then translate
  test::touch(path, "0 -1 0 10\n1 0 0 20\n0 0 1 30\n0 0 0 1\n");
  auto m = io::read_transform_file(path);
  auto p = io::apply_transform(m, {1, 0, 0});
  CHECK_THAT(p[0], WithinAbs(10, 1e-12));
  CHECK_THAT(p[1], WithinAbs(21, 1e-12));
  CHECK_THAT(p[2], WithinAbs(30, 1e-12));
}

TEST_CASE("malformed transform files") {
  test::TempDir tmp;
  CHECK_THROWS_AS(io::read_transform_file(tmp.path() / "missing.DAT"),
                  tlsbatchException);

  auto short_file = tmp.path() / "short.DAT";
  test::touch(short_file, "1 0 0 0\n0 1 0 0\n0 0 1 0\n");
  CHECK_THROWS_AS(io::read_transform_file(short_file), tlsbatchException);

  auto text = tmp.path() / "text.DAT";
  test::touch(text, "1 0 0 x\n0 1 0 0\n0 0 1 0\n0 0 0 1\n");
  CHECK_THROWS_AS(io::read_transform_file(text), tlsbatchException);
}
