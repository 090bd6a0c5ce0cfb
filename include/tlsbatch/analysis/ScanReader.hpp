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

#include <functional>
#include <memory>

#include <tlsbatch/analysis/ScanData.hpp>
#include <tlsbatch/io/TransformReader.hpp>
#include <tlsbatch/project/ScanPosition.hpp>

namespace tlsbatch::analysis {

  /**
   * @brief Source of the pulses and returns of one scan position.
   *
   * Implementations decode the raw scan, or the decimated scan when it is
   * available, and apply the position transform so that all coordinates are
   * in the project coordinate system.
   */
  struct ScanReaderInterface {
    virtual ~ScanReaderInterface() = default;

    virtual void open(const project::ScanPositionFiles& files,
                      const io::TransformMatrix& transform) = 0;

    virtual void readScan(ScanData& scan) = 0;

    virtual void close() = 0;
  };

  /**
   * @brief Open, read and close in one go.
   *
   * The reader is closed again when open() succeeded but readScan() throws.
   */
  void read_scan(ScanReaderInterface& reader,
                 const project::ScanPositionFiles& files,
                 const io::TransformMatrix& transform, ScanData& scan);

  using ScanReaderFactory =
      std::function<std::unique_ptr<ScanReaderInterface>()>;

  /**
   * @brief Reader for RIEGL .rxp scans.
   *
   * Built with TB_USE_RIVLIB the raw scan is decoded with RiVLib. Without it
   * open() throws a tlsbatchException naming the scan that could not be
   * decoded.
   */
  std::unique_ptr<ScanReaderInterface> createScanReaderRiegl();

}  // namespace tlsbatch::analysis
