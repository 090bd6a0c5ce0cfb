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
#include <vector>

#include <tlsbatch/project/PathConventionResolver.hpp>
#include <tlsbatch/project/ScanPosition.hpp>

namespace tlsbatch::project {

  struct LocatedPositions {
    std::vector<ScanPositionFiles> positions;
    std::vector<PositionSkipped> skipped;

    size_t total() const { return positions.size() + skipped.size(); }
  };

  /**
   * @brief List the scan position identifiers of a project.
   *
   * Returns the names of all directories directly under SCANS/ that start
   * with the ScanPos prefix, in ascending lexical order.
   *
   * @throws ProjectStructureError if the SCANS directory does not exist.
   */
  std::vector<std::string> list_scan_positions(const fs::path& project_root);

  /**
   * @brief Enumerate and resolve all scan positions of a project.
   *
   * Each skipped position is reported with a warning. The resolved positions
   * keep the order of list_scan_positions().
   */
  LocatedPositions locate_scan_positions(const fs::path& project_root,
                                         const PathConventionResolver& resolver);

  LocatedPositions locate_scan_positions(const fs::path& project_root,
                                         ResolveMode mode);

}  // namespace tlsbatch::project
