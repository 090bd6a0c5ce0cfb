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
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <tlsbatch/common/common.hpp>

namespace tlsbatch::io {

  /**
   * @brief Project configuration of a voxelization run.
   *
   * Describes the shared grid and, per scan name, the files of the grid
   * layers. File names are relative to the directory of the configuration
   * file.
   */
  struct VoxelProjectConfig {
    // xmin, ymin, zmin, xmax, ymax, zmax
    arr6d bounds = {0, 0, 0, 0, 0, 0};
    double resolution = 1;
    size_t nx = 0;
    size_t ny = 0;
    size_t nz = 0;
    int nodata = -9999;
    std::optional<std::string> dtm;
    // in processing order
    std::vector<std::pair<std::string, FileMap>> positions;
  };

  // <project stem>_config.json, eg. forest_config.json for forest.RiSCAN
  std::string project_config_filename(const std::filesystem::path& project_root);

  // Serialises with a fixed key order, identical configs give identical files.
  std::string dump_project_config(const VoxelProjectConfig& config);

  void write_project_config(const std::filesystem::path& path,
                            const VoxelProjectConfig& config);

  VoxelProjectConfig read_project_config(const std::filesystem::path& path);

}  // namespace tlsbatch::io
