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

#include <tlsbatch/analysis/ScanReader.hpp>
#include <tlsbatch/common/datastructures.hpp>

#include "fmt/format.h"

namespace tlsbatch::analysis {

  class ScanReaderRiegl : public ScanReaderInterface {
   public:
    void open(const project::ScanPositionFiles& files,
              const io::TransformMatrix& transform) override {
      const auto& source = files.has_decimated_scan() ? *files.decimated_scan
                                                      : files.raw_scan;
      throw tlsbatchException(fmt::format(
          "RIEGL decoding is unavailable in this build, cannot read {}",
          source.string()));
    }

    void readScan(ScanData& scan) override {
      throw tlsbatchException("No scan opened");
    }

    void close() override {}
  };

  std::unique_ptr<ScanReaderInterface> createScanReaderRiegl() {
    return std::make_unique<ScanReaderRiegl>();
  }

}  // namespace tlsbatch::analysis
