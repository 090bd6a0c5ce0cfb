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

#include <cmath>
#include <utility>
#include <vector>
#include <tlsbatch/batch/VoxelBatch.hpp>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/io/TransformReader.hpp>
#include <tlsbatch/logger/logger.h>

#include "fmt/format.h"

namespace tlsbatch::batch {

  std::string voxel_grid_filename(const std::string& scan_name,
                                  const std::string& layer) {
    return fmt::format("{}_{}{}", scan_name, layer, GRID_EXT);
  }

  VoxelPositionResult process_voxel_position(
      const project::ScanPositionFiles& files,
      const bounds::BoundingVolume& volume, const VoxelBatchConfig& cfg,
      const Raster* dtm, const fs::path& output_dir,
      analysis::ScanReaderInterface& reader,
      io::RasterWriterInterface& writer) {
    auto& logger = logger::Logger::get_logger();
    auto transform = io::read_transform_file(files.transform);

    analysis::ScanData scan;
    analysis::read_scan(reader, files, transform, scan);
    logger.debug("{}: {} pulses, {} returns", files.scan_pos,
                 scan.pulses.size(), scan.returns.size());

    analysis::VoxelGrid vgrid(volume, cfg.voxelsize, dtm);
    vgrid.add_scan(scan);
    auto layers = vgrid.compute(cfg.save_counts);

    VoxelPositionResult result;
    for (const auto& [layer, grid] : layers) {
      auto filename = voxel_grid_filename(files.scan_name, layer);
      writer.writeGrid((output_dir / filename).string(), grid);
      result.files[layer] = filename;
    }
    return result;
  }

  PositionProcessor<VoxelPositionResult> make_voxel_processor(
      const bounds::BoundingVolume& volume, const VoxelBatchConfig& cfg,
      const Raster* dtm, const fs::path& output_dir,
      analysis::ScanReaderFactory reader_factory,
      RasterWriterFactory writer_factory) {
    return [volume, cfg, dtm, output_dir, reader_factory,
            writer_factory](const project::ScanPositionFiles& files) {
      auto reader = reader_factory();
      auto writer = writer_factory();
      return process_voxel_position(files, volume, cfg, dtm, output_dir,
                                    *reader, *writer);
    };
  }

  io::VoxelProjectConfig make_project_config(
      const BatchReport<VoxelPositionResult>& report,
      const bounds::BoundingVolume& volume, const VoxelBatchConfig& cfg) {
    auto dims = bounds::grid_dimensions(volume, cfg.voxelsize);
    io::VoxelProjectConfig config;
    config.bounds = volume.bounds;
    config.resolution = cfg.voxelsize;
    config.nx = dims.nx;
    config.ny = dims.ny;
    config.nz = dims.nz;
    config.dtm = cfg.dtm;
    for (const auto* outcome : report.successes()) {
      config.positions.emplace_back(outcome->scan_name,
                                    outcome->value().files);
    }
    return config;
  }

  WriteSummary write_voxel_results(
      const BatchReport<VoxelPositionResult>& report,
      const bounds::BoundingVolume& volume, const VoxelBatchConfig& cfg,
      const fs::path& project_root, const fs::path& output_dir) {
    auto& logger = logger::Logger::get_logger();
    WriteSummary summary;
    if (report.no_work()) {
      logger.warning("No scans voxelized successfully");
      return summary;
    }
    summary.no_work = false;
    fs::create_directories(output_dir);
    auto config_file = output_dir / io::project_config_filename(project_root);
    io::write_project_config(config_file,
                             make_project_config(report, volume, cfg));
    summary.written.push_back(config_file);
    logger.info("Saved configuration to {}", config_file.string());
    return summary;
  }

  WriteSummary run_voxel_model(const fs::path& config_file,
                               const fs::path& model_dir, size_t min_n,
                               bool weighted,
                               io::RasterReaderInterface& reader,
                               io::RasterWriterInterface& writer) {
    auto& logger = logger::Logger::get_logger();
    auto config = io::read_project_config(config_file);
    auto base_dir = config_file.parent_path();

    analysis::VoxelModel model;
    for (const auto& [scan_name, files] : config.positions) {
      analysis::GridMap layers;
      for (const auto& [layer, file] : files) {
        layers[layer] = reader.readGrid((base_dir / file).string());
      }
      logger.debug("Loaded {} grids of {}", layers.size(), scan_name);
      model.add_position(std::move(layers));
    }

    auto result = model.run_linear_model(min_n, weighted);
    auto cover = analysis::VoxelModel::cover_profile(result.paiv);

    Grid3D cover_z(1, 1, cover.size(), result.paiv.nodataval);
    cover_z.min_x = result.paiv.min_x;
    cover_z.min_y = result.paiv.min_y;
    cover_z.min_z = result.paiv.min_z;
    cover_z.cellsize = result.paiv.cellsize;
    for (size_t iz = 0; iz < cover.size(); ++iz) {
      if (!std::isnan(cover[iz])) cover_z.at(0, 0, iz) = cover[iz];
    }

    fs::create_directories(model_dir);
    WriteSummary summary;
    summary.no_work = false;
    const std::vector<std::pair<std::string, const Grid3D*>> outputs{
        {"paiv", &result.paiv},
        {"paih", &result.paih},
        {"nscans", &result.nscans},
        {"cover_z", &cover_z}};
    for (const auto& [name, grid] : outputs) {
      auto path = model_dir / (name + GRID_EXT);
      writer.writeGrid(path.string(), *grid);
      summary.written.push_back(path);
    }
    logger.info("Saved model outputs to {}", model_dir.string());
    logger.info("PAI grids: {} x {} x {}, cover profile: {} levels",
                result.paiv.dim_x, result.paiv.dim_y, result.paiv.dim_z,
                cover.size());
    return summary;
  }

  VoxelRunSummary run_voxel_batch(
      const fs::path& project_root, const fs::path& output_dir,
      const VoxelBatchConfig& cfg,
      const analysis::ScanReaderFactory& reader_factory,
      const RasterReaderFactory& raster_reader_factory,
      const RasterWriterFactory& raster_writer_factory,
      const BatchOptions& options) {
    auto& logger = logger::Logger::get_logger();
    fs::create_directories(output_dir);

    logger.info("Scanning RISCAN project: {}", project_root.string());
    VoxelRunSummary run;
    run.located = project::locate_scan_positions(
        project_root, project::ResolveMode::VOXELIZATION);
    logger.info("Processing {} scans with valid file sets",
                run.located.positions.size());

    std::vector<fs::path> transform_files;
    for (const auto& files : run.located.positions) {
      transform_files.push_back(files.transform);
    }
    logger.info("Computing voxelization bounds...");
    run.volume = bounds::compute_bounds_from_transforms(
        transform_files, cfg.buffer, cfg.hmax);

    std::optional<Raster> dtm;
    if (cfg.dtm.has_value()) {
      dtm = raster_reader_factory()->readRaster(*cfg.dtm);
      logger.info("Loaded terrain model {} ({} x {})", *cfg.dtm, dtm->dim_x,
                  dtm->dim_y);
    }

    run.report = run_batch<VoxelPositionResult>(
        run.located.positions,
        make_voxel_processor(run.volume, cfg, dtm ? &*dtm : nullptr,
                             output_dir, reader_factory,
                             raster_writer_factory),
        options);
    run.written = write_voxel_results(run.report, run.volume, cfg,
                                      project_root, output_dir);

    if (cfg.run_model && !run.written.no_work) {
      logger.info("Running linear model to derive PAI and cover profiles...");
      try {
        auto raster_reader = raster_reader_factory();
        auto raster_writer = raster_writer_factory();
        auto model_written = run_voxel_model(
            run.written.written.front(), output_dir / MODEL_OUTPUT_DIR,
            cfg.min_n, cfg.weighted, *raster_reader, *raster_writer);
        run.written.written.insert(run.written.written.end(),
                                   model_written.written.begin(),
                                   model_written.written.end());
        run.model_succeeded = true;
      } catch (const std::exception& e) {
        logger.error("Error running model: {}", e.what());
        run.model_succeeded = false;
      }
    }
    return run;
  }

}  // namespace tlsbatch::batch
