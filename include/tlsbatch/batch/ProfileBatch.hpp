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

#pragma once

#include <filesystem>
#include <string>

#include <tlsbatch/analysis/GroundPlane.hpp>
#include <tlsbatch/analysis/ScanReader.hpp>
#include <tlsbatch/analysis/VerticalProfile.hpp>
#include <tlsbatch/batch/BatchExecutor.hpp>
#include <tlsbatch/batch/ResultAggregator.hpp>
#include <tlsbatch/project/ScanPositionLocator.hpp>

namespace tlsbatch::batch {

  inline constexpr const char* PROFILE_SUMMARY_FILE = "pavd_summary.csv";

  struct ProfileBatchConfig {
    analysis::VerticalProfileConfig profile;
    // square grid around the sensor for the ground plane fit, in m
    double ground_grid_extent = 60;
    double ground_grid_resolution = 10;
  };

  /**
   * @brief Profiles of one scan position.
   *
   * All profile vectors have one entry per height bin.
   */
  struct ProfileResult {
    arr3d sensor_position = {0, 0, 0};
    analysis::PlaneFit ground_plane;
    vec1d height;
    vec1d hinge_pai;
    vec1d linear_pai;
    vec1d weighted_pai;
    vec1d hinge_pavd;
    vec1d linear_pavd;
    vec1d weighted_pavd;
    vec1d linear_mla;
    double total_pai_hinge = 0;
    double total_pai_linear = 0;
    double total_pai_weighted = 0;
  };

  // Sum of the profile times the bin height. A NaN bin makes the total NaN.
  double total_pai(const vec1d& pai, double hres);

  /**
   * @brief Fit the ground plane and compute the vertical profiles of one
   * position.
   *
   * Reads the transform, decodes the scan with reader and throws on any
   * failure.
   */
  ProfileResult process_profile_position(
      const project::ScanPositionFiles& files, const ProfileBatchConfig& cfg,
      analysis::ScanReaderInterface& reader);

  PositionProcessor<ProfileResult> make_profile_processor(
      const ProfileBatchConfig& cfg, analysis::ScanReaderFactory reader_factory);

  // pavd_summary.csv content, one row per successful outcome
  std::string format_profile_summary(const BatchReport<ProfileResult>& report);

  // <scan_pos>_<scan_name>_profiles.csv content
  std::string format_profile_table(const ProfileResult& result);

  std::string profile_table_filename(const std::string& scan_pos,
                                     const std::string& scan_name);

  /**
   * @brief Write the summary and the per position profile tables.
   *
   * Nothing is written when no position succeeded. Existing files are
   * overwritten.
   */
  WriteSummary write_profile_results(const BatchReport<ProfileResult>& report,
                                     const fs::path& output_dir);

  struct ProfileRunSummary {
    project::LocatedPositions located;
    BatchReport<ProfileResult> report;
    WriteSummary written;
  };

  // Locate, process and write all positions of a project.
  ProfileRunSummary run_profile_batch(
      const fs::path& project_root, const fs::path& output_dir,
      const ProfileBatchConfig& cfg,
      const analysis::ScanReaderFactory& reader_factory,
      const BatchOptions& options = {});

}  // namespace tlsbatch::batch
