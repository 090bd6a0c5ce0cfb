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

#include <algorithm>
#include <system_error>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/logger/logger.h>
#include <tlsbatch/project/ScanPositionLocator.hpp>

namespace tlsbatch::project {

  std::vector<std::string> list_scan_positions(const fs::path& project_root) {
    auto scans_dir = project_root / SCANS_DIR;
    std::error_code ec;
    if (!fs::is_directory(scans_dir, ec)) {
      throw ProjectStructureError(fmt::format(
          "{} directory not found in {}", SCANS_DIR, project_root.string()));
    }

    std::vector<std::string> names;
    const std::string prefix = SCAN_POSITION_PREFIX;
    for (auto it = fs::directory_iterator(scans_dir, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
      std::error_code type_ec;
      if (!it->is_directory(type_ec)) continue;
      auto name = it->path().filename().string();
      if (name.compare(0, prefix.size(), prefix) == 0) {
        names.push_back(name);
      }
    }
    if (ec) {
      throw ProjectStructureError(fmt::format("Unable to read {}. {}",
                                              scans_dir.string(), ec.message()));
    }
    std::sort(names.begin(), names.end());
    return names;
  }

  LocatedPositions locate_scan_positions(
      const fs::path& project_root, const PathConventionResolver& resolver) {
    auto& logger = logger::Logger::get_logger();
    LocatedPositions located;

    auto identifiers = list_scan_positions(project_root);
    logger.info("Found {} scan positions", identifiers.size());

    for (const auto& scan_pos : identifiers) {
      auto result = resolver.resolve(project_root, scan_pos);
      if (auto* files = std::get_if<ScanPositionFiles>(&result)) {
        located.positions.push_back(std::move(*files));
      } else {
        auto& skipped = std::get<PositionSkipped>(result);
        logger.warning("Skipping {}, missing {} file", skipped.scan_pos,
                       to_string(skipped.missing));
        located.skipped.push_back(std::move(skipped));
      }
    }
    logger.info("{} scan positions with valid file sets, {} skipped",
                located.positions.size(), located.skipped.size());
    return located;
  }

  LocatedPositions locate_scan_positions(const fs::path& project_root,
                                         ResolveMode mode) {
    PathConventionResolver resolver(mode);
    return locate_scan_positions(project_root, resolver);
  }

}  // namespace tlsbatch::project
