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

#include <string>

#include "../common/config_handler.hpp"
#include <tlsbatch/batch/ProfileBatch.hpp>

struct PavdConfig {
  std::string output_path = "pavd_output";

  double hres = 0.5;
  double zres = 5;
  double ares = 90;
  double min_zenith = 35;
  double max_zenith = 70;
  double min_height = 0;
  double max_height = 50;
  double reflectance_threshold = -20;
  std::string method = "WEIGHTED";

  double ground_grid_extent = 60;
  double ground_grid_resolution = 10;

  tlsbatch::batch::ProfileBatchConfig to_batch_config() const {
    tlsbatch::batch::ProfileBatchConfig cfg;
    cfg.profile.hres = hres;
    cfg.profile.zres = zres;
    cfg.profile.ares = ares;
    cfg.profile.min_zenith = min_zenith;
    cfg.profile.max_zenith = max_zenith;
    cfg.profile.min_height = min_height;
    cfg.profile.max_height = max_height;
    cfg.profile.reflectance_threshold = reflectance_threshold;
    cfg.profile.method = tlsbatch::analysis::pgap_method_from_string(method);
    cfg.ground_grid_extent = ground_grid_extent;
    cfg.ground_grid_resolution = ground_grid_resolution;
    return cfg;
  }
};

struct PavdConfigHandler : public ConfigHandler {
  PavdConfig cfg_;

  PavdConfigHandler() {
    ParameterVector output, profile, ground;

    output.add("output", 'o', "Output directory for the results.",
               cfg_.output_path, {check::DirIsWritable});

    profile.add("hres", "Vertical height bin resolution in meters.",
                cfg_.hres, {check::HigherThan<double>(0)});
    profile.add("zres", "Zenith angle bin resolution in degrees.", cfg_.zres,
                {check::HigherThan<double>(0)});
    profile.add("ares", "Azimuth angle bin resolution in degrees.", cfg_.ares,
                {check::InRange<double>(1e-3, 360)});
    profile.add("min-zenith", "Minimum zenith angle in degrees.",
                cfg_.min_zenith, {check::InRange<double>(0, 90)});
    profile.add("max-zenith", "Maximum zenith angle in degrees.",
                cfg_.max_zenith, {check::InRange<double>(0, 90)});
    profile.add("min-height", "Minimum height above ground in meters.",
                cfg_.min_height);
    profile.add("max-height", "Maximum height above ground in meters.",
                cfg_.max_height);
    profile.add("reflectance-threshold",
                "Returns with a reflectance (dB) at or below this value are "
                "ignored.",
                cfg_.reflectance_threshold);
    profile.add("method",
                "Pgap estimation method. `WEIGHTED`: every return counts "
                "1/n of the shot. `FIRST`: only first returns count. `ALL`: "
                "every return counts as a shot.",
                cfg_.method,
                {check::OneOf<std::string>({"WEIGHTED", "FIRST", "ALL"})});

    ground.add("ground-extent",
               "Size in meters of the square area around the scanner used to "
               "fit the ground plane.",
               cfg_.ground_grid_extent, {check::HigherThan<double>(0)});
    ground.add("ground-resolution",
               "Cell size in meters of the lowest point grid for the ground "
               "plane fit.",
               cfg_.ground_grid_resolution, {check::HigherThan<double>(0)});

    param_groups_.emplace_back("Output", std::move(output));
    param_groups_.emplace_back("Profile", std::move(profile));
    param_groups_.emplace_back("Ground plane", std::move(ground));
    build_index();
  }

  std::string summary() const override {
    return "Vertical plant area volume density (PAVD) profiles for all scan "
           "positions of a RISCAN project";
  }

  void validate_combinations() override {
    if (cfg_.min_zenith >= cfg_.max_zenith) {
      throw std::runtime_error(
          "min-zenith must be lower than max-zenith.");
    }
    if (cfg_.max_zenith >= 90) {
      throw std::runtime_error("max-zenith must be lower than 90 degrees.");
    }
    if (cfg_.min_height >= cfg_.max_height) {
      throw std::runtime_error("min-height must be lower than max-height.");
    }
  }
};
