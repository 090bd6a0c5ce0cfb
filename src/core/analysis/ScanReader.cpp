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

namespace tlsbatch::analysis {

  void read_scan(ScanReaderInterface& reader,
                 const project::ScanPositionFiles& files,
                 const io::TransformMatrix& transform, ScanData& scan) {
    reader.open(files, transform);
    try {
      reader.readScan(scan);
    } catch (...) {
      reader.close();
      throw;
    }
    reader.close();
  }

}  // namespace tlsbatch::analysis
