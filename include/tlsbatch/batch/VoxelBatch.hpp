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

#include <tlsbatch/analysis/ScanReader.hpp>
#include <tlsbatch/analysis/VoxelGrid.hpp>
#include <tlsbatch/analysis/VoxelModel.hpp>
#include <tlsbatch/batch/BatchExecutor.hpp>
#include <tlsbatch/batch/ResultAggregator.hpp>
#include <tlsbatch/bounds/BoundsAggregator.hpp>
#include <tlsbatch/io/ProjectConfig.hpp>
#include <tlsbatch/io/RasterReader.hpp>
#include <tlsbatch/io/RasterWriter.hpp>
#include <tlsbatch/project/ScanPositionLocator.hpp>

namespace tlsbatch::batch {

  inline constexpr const char* MODEL_OUTPUT_DIR = "model_output";
  inline constexpr const char* GRID_EXT = ".tif";

  struct VoxelBatchConfig {
    double voxelsize = 1.0;
    double buffer = 5;
    double hmax = 50;
    std::optional<std::string> dtm;
    bool save_counts = true;
    size_t min_n = 3;
    bool run_model = false;
    bool weighted = false;
  };

  // layer name -> grid file name, relative to the output directory
  struct VoxelPositionResult {
    FileMap files;
  };

  typedef std::function<std::unique_ptr<io::RasterWriterInterface>()>
      RasterWriterFactory;
  typedef std::function<std::unique_ptr<io::RasterReaderInterface>()>
      RasterReaderFactory;

  // <scan_name>_<layer>.tif
  std::string voxel_grid_filename(const std::string& scan_name,
                                  const std::string& layer);

  /**
   * @brief Voxelize one position and write its grids to output_dir.
   *
   * dtm may be null. Throws on any failure, grids that were already written
   * are left in place.
   */
  VoxelPositionResult process_voxel_position(
      const project::ScanPositionFiles& files,
      const bounds::BoundingVolume& volume, const VoxelBatchConfig& cfg,
      const Raster* dtm, const fs::path& output_dir,
      analysis::ScanReaderInterface& reader,
      io::RasterWriterInterface& writer);

  PositionProcessor<VoxelPositionResult> make_voxel_processor(
      const bounds::BoundingVolume& volume, const VoxelBatchConfig& cfg,
      const Raster* dtm, const fs::path& output_dir,
      analysis::ScanReaderFactory reader_factory,
      RasterWriterFactory writer_factory);

  // Grid description plus the files of every successful outcome.
  io::VoxelProjectConfig make_project_config(
      const BatchReport<VoxelPositionResult>& report,
      const bounds::BoundingVolume& volume, const VoxelBatchConfig& cfg);

  /**
   * @brief Write <project stem>_config.json to output_dir.
   *
   * Nothing is written when no position succeeded.
   */
  WriteSummary write_voxel_results(
      const BatchReport<VoxelPositionResult>& report,
      const bounds::BoundingVolume& volume, const VoxelBatchConfig& cfg,
      const fs::path& project_root, const fs::path& output_dir);

  /**
   * @brief Run the linear model over the grids listed in a project
   * configuration.
   *
   * Writes paiv, paih, nscans and cover_z to model_dir. cover_z is stored as
   * a grid of a single column.
   *
   * @throws tlsbatchException if a grid cannot be read or the model cannot
   * be fitted.
   */
  WriteSummary run_voxel_model(const fs::path& config_file,
                               const fs::path& model_dir, size_t min_n,
                               bool weighted,
                               io::RasterReaderInterface& reader,
                               io::RasterWriterInterface& writer);

  struct VoxelRunSummary {
    project::LocatedPositions located;
    bounds::BoundingVolume volume;
    BatchReport<VoxelPositionResult> report;
    WriteSummary written;
    // set when the model was requested and there was something to model
    std::optional<bool> model_succeeded;
  };

  /**
   * @brief Locate, bound, voxelize and optionally model a project.
   *
   * A model failure is logged and reported through model_succeeded, the
   * per position grids and the configuration are kept.
   */
  VoxelRunSummary run_voxel_batch(
      const fs::path& project_root, const fs::path& output_dir,
      const VoxelBatchConfig& cfg,
      const analysis::ScanReaderFactory& reader_factory,
      const RasterReaderFactory& raster_reader_factory,
      const RasterWriterFactory& raster_writer_factory,
      const BatchOptions& options = {});

}  // namespace tlsbatch::batch
