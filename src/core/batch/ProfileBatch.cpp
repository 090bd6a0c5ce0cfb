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

#include <tlsbatch/batch/ProfileBatch.hpp>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/common/formatters.hpp>
#include <tlsbatch/io/TransformReader.hpp>
#include <tlsbatch/logger/logger.h>

#include "fmt/format.h"

namespace tlsbatch::batch {

  double total_pai(const vec1d& pai, double hres) {
    double sum = 0;
    for (auto v : pai) sum += v;
    return sum * hres;
  }

  ProfileResult process_profile_position(
      const project::ScanPositionFiles& files, const ProfileBatchConfig& cfg,
      analysis::ScanReaderInterface& reader) {
    auto& logger = logger::Logger::get_logger();
    ProfileResult result;

    auto transform = io::read_transform_file(files.transform);
    result.sensor_position = io::sensor_origin(transform);
    logger.debug("{}: sensor origin {}", files.scan_pos,
                 result.sensor_position);

    analysis::ScanData scan;
    analysis::read_scan(reader, files, transform, scan);
    logger.debug("{}: {} pulses, {} returns", files.scan_pos,
                 scan.pulses.size(), scan.returns.size());

    auto ground = analysis::get_min_z_grid(
        scan, cfg.ground_grid_extent, cfg.ground_grid_resolution,
        {result.sensor_position[0], result.sensor_position[1]});
    vec1d weights(ground.size());
    for (size_t i = 0; i < ground.size(); ++i) {
      weights[i] = ground.r[i] > 0 ? 1.0 / ground.r[i] : 1.0;
    }
    result.ground_plane =
        analysis::plane_fit_hubers(ground.x, ground.y, ground.z, weights);
    if (!result.ground_plane.converged) {
      logger.warning("{}: ground plane fit did not converge", files.scan_pos);
    }

    analysis::VerticalProfile profile(cfg.profile, result.ground_plane);
    profile.add_scan(scan);
    profile.compute_pgap();

    result.height = profile.height_bins();
    result.hinge_pai = profile.hinge_profile();
    result.weighted_pai = profile.solid_angle_profile();
    result.linear_pai = profile.linear_profile(&result.linear_mla);
    result.hinge_pavd = profile.pavd(result.hinge_pai);
    result.linear_pavd = profile.pavd(result.linear_pai);
    result.weighted_pavd = profile.pavd(result.weighted_pai);

    const double hres = cfg.profile.hres;
    result.total_pai_hinge = total_pai(result.hinge_pai, hres);
    result.total_pai_linear = total_pai(result.linear_pai, hres);
    result.total_pai_weighted = total_pai(result.weighted_pai, hres);
    return result;
  }

  PositionProcessor<ProfileResult> make_profile_processor(
      const ProfileBatchConfig& cfg,
      analysis::ScanReaderFactory reader_factory) {
    return [cfg, reader_factory](const project::ScanPositionFiles& files) {
      auto reader = reader_factory();
      return process_profile_position(files, cfg, *reader);
    };
  }

  std::string format_profile_summary(const BatchReport<ProfileResult>& report) {
    std::string csv =
        "scan_pos,scan_name,sensor_x,sensor_y,sensor_z,ground_intercept,"
        "ground_slope_x,ground_slope_y,total_pai_hinge,total_pai_linear,"
        "total_pai_weighted\n";
    for (const auto* outcome : report.successes()) {
      const auto& r = outcome->value();
      csv += fmt::format(
          "{},{},{},{},{},{},{},{},{},{},{}\n", outcome->scan_pos,
          outcome->scan_name, format_csv_number(r.sensor_position[0]),
          format_csv_number(r.sensor_position[1]),
          format_csv_number(r.sensor_position[2]),
          format_csv_number(r.ground_plane.intercept),
          format_csv_number(r.ground_plane.slope_x),
          format_csv_number(r.ground_plane.slope_y),
          format_csv_number(r.total_pai_hinge),
          format_csv_number(r.total_pai_linear),
          format_csv_number(r.total_pai_weighted));
    }
    return csv;
  }

  std::string format_profile_table(const ProfileResult& r) {
    const size_t n = r.height.size();
    for (const auto* column :
         {&r.hinge_pai, &r.linear_pai, &r.weighted_pai, &r.hinge_pavd,
          &r.linear_pavd, &r.weighted_pavd, &r.linear_mla}) {
      if (column->size() != n) {
        throw tlsbatchException("Profile columns differ in length");
      }
    }
    std::string csv =
        "height,hinge_pai,linear_pai,weighted_pai,hinge_pavd,linear_pavd,"
        "weighted_pavd,linear_mla\n";
    for (size_t i = 0; i < n; ++i) {
      csv += fmt::format(
          "{},{},{},{},{},{},{},{}\n", format_csv_number(r.height[i]),
          format_csv_number(r.hinge_pai[i]), format_csv_number(r.linear_pai[i]),
          format_csv_number(r.weighted_pai[i]),
          format_csv_number(r.hinge_pavd[i]),
          format_csv_number(r.linear_pavd[i]),
          format_csv_number(r.weighted_pavd[i]),
          format_csv_number(r.linear_mla[i]));
    }
    return csv;
  }

  std::string profile_table_filename(const std::string& scan_pos,
                                     const std::string& scan_name) {
    return fmt::format("{}_{}_profiles.csv", scan_pos, scan_name);
  }

  WriteSummary write_profile_results(const BatchReport<ProfileResult>& report,
                                     const fs::path& output_dir) {
    auto& logger = logger::Logger::get_logger();
    WriteSummary summary;
    if (report.no_work()) {
      logger.warning("No scans processed successfully");
      return summary;
    }
    summary.no_work = false;
    fs::create_directories(output_dir);

    auto summary_path = output_dir / PROFILE_SUMMARY_FILE;
    write_text_file(summary_path, format_profile_summary(report));
    summary.written.push_back(summary_path);
    logger.info("Saved summary to {}", summary_path.string());

    size_t tables = 0;
    for (const auto* outcome : report.successes()) {
      auto path = output_dir / profile_table_filename(outcome->scan_pos,
                                                      outcome->scan_name);
      write_text_file(path, format_profile_table(outcome->value()));
      summary.written.push_back(path);
      ++tables;
    }
    logger.info("Saved {} detailed profile files to {}", tables,
                output_dir.string());
    return summary;
  }

  ProfileRunSummary run_profile_batch(
      const fs::path& project_root, const fs::path& output_dir,
      const ProfileBatchConfig& cfg,
      const analysis::ScanReaderFactory& reader_factory,
      const BatchOptions& options) {
    auto& logger = logger::Logger::get_logger();
    logger.info("Scanning RISCAN project: {}", project_root.string());

    ProfileRunSummary run;
    run.located = project::locate_scan_positions(project_root,
                                                 project::ResolveMode::PROFILE);
    logger.info("Processing {} scans with valid file sets",
                run.located.positions.size());

    run.report = run_batch<ProfileResult>(
        run.located.positions, make_profile_processor(cfg, reader_factory),
        options);
    run.written = write_profile_results(run.report, output_dir);
    return run;
  }

}  // namespace tlsbatch::batch
