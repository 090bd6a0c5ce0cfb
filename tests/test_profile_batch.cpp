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
#include <tlsbatch/batch/ProfileBatch.hpp>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/logger/logger.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "test_helpers.hpp"

using namespace tlsbatch;
using namespace tlsbatch::batch;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using Catch::Matchers::WithinAbs;

namespace {
  size_t count_lines(const std::string& s) {
    return static_cast<size_t>(std::count(s.begin(), s.end(), '\n'));
  }

  ProfileResult small_result(double offset) {
    ProfileResult r;
    r.sensor_position = {100 + offset, 200, 10};
    r.ground_plane.intercept = 8.5;
    r.height = {0, 0.5, 1.0};
    r.hinge_pai = {0, 0.1, 0.2};
    r.linear_pai = {0, 0.1, std::numeric_limits<double>::quiet_NaN()};
    r.weighted_pai = {0, 0.1, 0.2};
    r.hinge_pavd = {0.2, 0.2, 0.2};
    r.linear_pavd = {0.2, 0.2, 0.2};
    r.weighted_pavd = {0.2, 0.2, 0.2};
    r.linear_mla = {0, 45, 50};
    r.total_pai_hinge = 0.15;
    return r;
  }

  // the synthetic canopy is only underlain by ground returns close to the
  // sensor
  ProfileBatchConfig near_ground_config() {
    ProfileBatchConfig cfg;
    cfg.ground_grid_extent = 20;
    cfg.ground_grid_resolution = 10;
    return cfg;
  }
}  // namespace

TEST_CASE("csv number formatting") {
  CHECK(format_csv_number(1.5) == "1.500000");
  CHECK(format_csv_number(-2.25) == "-2.250000");
  CHECK(format_csv_number(-0.0) == "0.000000");
  CHECK(format_csv_number(-1e-9) == "0.000000");
  CHECK(format_csv_number(std::numeric_limits<double>::quiet_NaN()).empty());
}

TEST_CASE("total PAI of a profile") {
  CHECK_THAT(total_pai({0.5, 1.0, 1.5}, 0.5), WithinAbs(1.5, 1e-12));
  CHECK(total_pai({}, 0.5) == 0);
  CHECK(std::isnan(
      total_pai({0.5, std::numeric_limits<double>::quiet_NaN(), 1.5}, 0.5)));
}

TEST_CASE("profiles of a synthetic canopy scan") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  project.add_position("ScanPos001", "s1", {500, 600, 21.5});
  auto located = project::locate_scan_positions(tmp.path(),
                                                project::ResolveMode::PROFILE);
  REQUIRE(located.positions.size() == 1);

  auto cfg = near_ground_config();
  test::SyntheticScanReader reader;
  auto result = process_profile_position(located.positions[0], cfg, reader);

  CHECK(result.sensor_position == arr3d{500, 600, 21.5});
  CHECK_THAT(result.ground_plane.height_at(500, 600), WithinAbs(20, 1e-6));
  CHECK_THAT(result.ground_plane.slope_x, WithinAbs(0, 1e-6));
  CHECK_THAT(result.ground_plane.slope_y, WithinAbs(0, 1e-6));

  REQUIRE(result.height.size() == 100);
  CHECK(result.hinge_pai.size() == 100);
  CHECK(result.linear_mla.size() == 100);
  // about half of the pulses are intercepted by the canopy at 10 m
  CHECK_THAT(result.hinge_pai.front(), WithinAbs(0, 1e-9));
  CHECK_THAT(result.hinge_pai.back(), WithinAbs(-1.1 * std::log(0.5), 0.1));
  CHECK_THAT(result.linear_pai.back(), WithinAbs(std::log(2.0), 0.1));
  CHECK_THAT(result.linear_mla.back(), WithinAbs(0, 1e-3));
  CHECK(result.total_pai_hinge > 0);
  CHECK(result.total_pai_weighted > 0);
}

TEST_CASE("undecodable scan fails the position") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  project.add_position("ScanPos001", "s1", {0, 0, 0});
  auto located = project::locate_scan_positions(tmp.path(),
                                                project::ResolveMode::PROFILE);
  REQUIRE(located.positions.size() == 1);

  auto reader = analysis::createScanReaderRiegl();
  CHECK_THROWS_AS(
      process_profile_position(located.positions[0], {}, *reader),
      tlsbatchException);
}

TEST_CASE("nothing is written without successes") {
  test::TempDir tmp;
  BatchReport<ProfileResult> report;
  report.outcomes.push_back(
      {"ScanPos001", "s1", ProcessingFailure{"Error: corrupt"}});
  auto out = tmp.path() / "pavd_output";

  logger::Logger::get_logger().set_level(logger::LogLevel::info);
  std::string stdout_text, stderr_text;
  WriteSummary written;
  {
    test::CapturedOutput captured_out(STDOUT_FILENO);
    test::CapturedOutput captured_err(STDERR_FILENO);
    written = write_profile_results(report, out);
    stderr_text = captured_err.str();
    stdout_text = captured_out.str();
  }
  CHECK(written.no_work);
  CHECK(written.written.empty());
  CHECK_FALSE(fs::exists(out));
  CHECK_THAT(stdout_text, ContainsSubstring("No scans processed successfully"));
  CHECK(stderr_text.empty());
}

namespace {
  // Decodes nothing, readScan() always throws.
  class BrokenScanReader : public analysis::ScanReaderInterface {
   public:
    size_t opened = 0;
    size_t closed = 0;

    void open(const project::ScanPositionFiles&,
              const io::TransformMatrix&) override {
      ++opened;
    }
    void readScan(analysis::ScanData&) override {
      throw tlsbatchException("truncated scan");
    }
    void close() override { ++closed; }
  };
}  // namespace

TEST_CASE("reader is closed when reading the scan fails") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  project.add_position("ScanPos001", "s1", {0, 0, 0});
  auto located = project::locate_scan_positions(tmp.path(),
                                                project::ResolveMode::PROFILE);
  REQUIRE(located.positions.size() == 1);

  BrokenScanReader reader;
  CHECK_THROWS_WITH(process_profile_position(located.positions[0], {}, reader),
                    "Error: truncated scan");
  CHECK(reader.opened == 1);
  CHECK(reader.closed == 1);
}

TEST_CASE("profile results are written and rewritten identically") {
  test::TempDir tmp;
  BatchReport<ProfileResult> report;
  report.outcomes.push_back({"ScanPos001", "s1", small_result(0)});
  report.outcomes.push_back(
      {"ScanPos002", "s2", ProcessingFailure{"Error: corrupt"}});
  report.outcomes.push_back({"ScanPos003", "s3", small_result(5)});
  auto out = tmp.path() / "out";

  auto written = write_profile_results(report, out);
  CHECK_FALSE(written.no_work);
  REQUIRE(written.written.size() == 3);

  auto summary = test::read_file(out / PROFILE_SUMMARY_FILE);
  CHECK(count_lines(summary) == 3);
  CHECK_THAT(summary,
             StartsWith("scan_pos,scan_name,sensor_x,sensor_y,sensor_z,"
                        "ground_intercept,ground_slope_x,ground_slope_y,"
                        "total_pai_hinge,total_pai_linear,"
                        "total_pai_weighted\n"
                        "ScanPos001,s1,100.000000,200.000000,10.000000,"
                        "8.500000,0.000000,0.000000,0.150000,0.000000,"
                        "0.000000\n"));
  CHECK_FALSE(fs::exists(out / profile_table_filename("ScanPos002", "s2")));

  auto table_path = out / profile_table_filename("ScanPos003", "s3");
  CHECK(table_path.filename() == "ScanPos003_s3_profiles.csv");
  auto table = test::read_file(table_path);
  CHECK(count_lines(table) == 4);
  // NaN is written as an empty field
  CHECK(table.find("1.000000,0.200000,,0.200000,") != std::string::npos);

  write_profile_results(report, out);
  CHECK(test::read_file(out / PROFILE_SUMMARY_FILE) == summary);
  CHECK(test::read_file(table_path) == table);
}

TEST_CASE("profile batch over a project") {
  test::TempDir tmp;
  auto root = tmp.path() / "forest.RiSCAN";
  test::RiscanProject project(root);
  project.add_position("ScanPos001", "a", {0, 0, 1.5});
  project.add_scan_subdirectory("ScanPos002", "b");
  project.add_position("ScanPos003", "c", {20, 0, 2.5});
  auto out = tmp.path() / "pavd_output";

  auto run = run_profile_batch(root, out, near_ground_config(), test::synthetic_reader_factory());
  CHECK(run.located.skipped.size() == 1);
  CHECK(run.report.attempted() == 2);
  CHECK(run.report.succeeded() == 2);

  auto summary = test::read_file(out / PROFILE_SUMMARY_FILE);
  CHECK(count_lines(summary) == 3);
  CHECK(summary.find("\nScanPos001,a,") != std::string::npos);
  CHECK(summary.find("\nScanPos003,c,") != std::string::npos);
  CHECK(fs::exists(out / "ScanPos001_a_profiles.csv"));
  CHECK(fs::exists(out / "ScanPos003_c_profiles.csv"));
}

TEST_CASE("profile batch with a failing position") {
  test::TempDir tmp;
  test::RiscanProject project(tmp.path());
  project.add_position("ScanPos001", "a", {0, 0, 1.5});
  project.add_position("ScanPos002", "b", {10, 0, 1.5});
  auto out = tmp.path() / "out";

  BatchOptions options;
  options.jobs = 2;
  auto run = run_profile_batch(tmp.path(), out, near_ground_config(),
                               test::synthetic_reader_factory({"ScanPos001"}),
                               options);
  REQUIRE(run.report.failed() == 1);
  CHECK_THAT(run.report.outcomes[0].failure().message,
             StartsWith("Error: Unable to decode"));
  auto summary = test::read_file(out / PROFILE_SUMMARY_FILE);
  CHECK(count_lines(summary) == 2);
  CHECK_FALSE(fs::exists(out / "ScanPos001_a_profiles.csv"));
}
