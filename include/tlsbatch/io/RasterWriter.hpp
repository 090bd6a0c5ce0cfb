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

#include <memory>
#include <string>

#include <tlsbatch/common/common.hpp>

namespace tlsbatch::io {

  /**
   * @brief Writes voxel grids as multi band rasters, one band per z level.
   *
   * Band 1 holds the lowest level. Rows run from north to south.
   */
  struct RasterWriterInterface {
    // GDAL driver short name
    std::string driver = "GTiff";

    virtual ~RasterWriterInterface() = default;

    virtual void writeGrid(const std::string& path, const Grid3D& grid) = 0;
  };

  std::unique_ptr<RasterWriterInterface> createRasterWriterGDAL();

}  // namespace tlsbatch::io
