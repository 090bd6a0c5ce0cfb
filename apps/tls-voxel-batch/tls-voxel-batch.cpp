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

#include <cstdlib>
#include <filesystem>
#include <string>

#include <tlsbatch/analysis/ScanReader.hpp>
#include <tlsbatch/batch/VoxelBatch.hpp>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/io/RasterReader.hpp>
#include <tlsbatch/io/RasterWriter.hpp>
#include <tlsbatch/logger/logger.h>

#include "config.hpp"

int main(int argc, const char* argv[]) {
  auto& logger = tlsbatch::logger::Logger::get_logger();

  CLIArgs cli_args(argc, argv);
  VoxelConfigHandler handler;
  if (auto exit_code = handle_cli(handler, cli_args)) {
    return *exit_code;
  }

  tlsbatch::batch::BatchOptions options;
  options.jobs = handler._jobs;

  tlsbatch::batch::VoxelRunSummary run;
  try {
    run = tlsbatch::batch::run_voxel_batch(
        handler.project_path, handler.cfg_.output_path, handler.cfg_.batch,
        tlsbatch::analysis::createScanReaderRiegl,
        tlsbatch::io::createRasterReaderGDAL,
        tlsbatch::io::createRasterWriterGDAL, options);
  } catch (const tlsbatch::ProjectStructureError& e) {
    logger.error("{}", e.what());
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    logger.error("Batch processing stopped. {}", e.what());
    return EXIT_FAILURE;
  }

  logger.info("Voxelization complete: {} successful, {} failed, {} skipped",
              run.report.succeeded(), run.report.failed(),
              run.located.skipped.size());
  if (run.report.no_work()) {
    return EXIT_FAILURE;
  }
  if (run.model_succeeded.has_value() && !*run.model_succeeded) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
