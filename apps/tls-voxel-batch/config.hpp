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

#include <optional>
#include <string>

#include "../common/config_handler.hpp"
#include <tlsbatch/batch/VoxelBatch.hpp>

struct VoxelConfig {
  std::string output_path = "voxel_output";
  tlsbatch::batch::VoxelBatchConfig batch;
};

struct VoxelConfigHandler : public ConfigHandler {
  VoxelConfig cfg_;

  VoxelConfigHandler() {
    ParameterVector output, voxel, model;

    output.add("output", 'o', "Output directory for the voxel grids.",
               cfg_.output_path, {check::DirIsWritable});
    output.add("counts",
               "Save the hits, miss and occl count grids of every position.",
               cfg_.batch.save_counts);

    voxel.add("voxelsize", "Voxel grid resolution in meters.",
              cfg_.batch.voxelsize, {check::HigherThan<double>(0)});
    voxel.add("buffer", "Buffer to extend the voxel bounds in meters.",
              cfg_.batch.buffer, {check::HigherThan<double>(0)});
    voxel.add("hmax", "Maximum tree height in meters.", cfg_.batch.hmax,
              {check::HigherOrEqualTo<double>(0)});
    voxel.add("dtm",
              "Terrain model raster in the coordinate system of the scans. "
              "Voxels below the terrain are set to nodata.",
              cfg_.batch.dtm, {check::OptionalPathExists});

    model.add("run-model",
              "Run the linear model to derive PAI and cover profiles after "
              "voxelization.",
              cfg_.batch.run_model);
    model.add("min-n",
              "Minimum number of Pgap observations required to estimate PAI.",
              cfg_.batch.min_n, {check::HigherThan<size_t>(0)});
    model.add("weighted",
              "Weight the observations of the linear model by the number of "
              "pulses through the voxel.",
              cfg_.batch.weighted);

    param_groups_.emplace_back("Output", std::move(output));
    param_groups_.emplace_back("Voxelization", std::move(voxel));
    param_groups_.emplace_back("Model", std::move(model));
    build_index();
  }

  std::string summary() const override {
    return "Voxelization of all scan positions of a RISCAN project on a "
           "shared grid";
  }

  void validate_combinations() override {
    if (cfg_.batch.weighted && !cfg_.batch.save_counts) {
      throw std::runtime_error(
          "The weighted model needs the count grids, do not combine "
          "--weighted with --no-counts.");
    }
  }
};
