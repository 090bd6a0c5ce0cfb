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
#include <variant>

namespace tlsbatch::project {

  namespace fs = std::filesystem;

  // Directory and file naming conventions of a RISCAN project.
  inline constexpr const char* SCANS_DIR = "SCANS";
  inline constexpr const char* SINGLESCANS_DIR = "SINGLESCANS";
  inline constexpr const char* DAT_DIR = "DAT";
  inline constexpr const char* MATRIX_DIR = "matrix";
  inline constexpr const char* DATABASE_DIR = "project.rdb";
  inline constexpr const char* SCAN_POSITION_PREFIX = "ScanPos";
  inline constexpr const char* RAW_SCAN_EXT = ".rxp";
  inline constexpr const char* RESIDUAL_SCAN_SUFFIX = ".residual.rxp";
  inline constexpr const char* DECIMATED_SCAN_EXT = ".rdbx";
  inline constexpr const char* TRANSFORM_EXT = ".DAT";
  // '#' matches one digit, eg. 240611_101502.rxp
  inline constexpr const char* TIMESTAMP_SCAN_PATTERN = "######_######.rxp";

  /**
   * @brief Selects which layout conventions are tried during resolution.
   *
   * The voxelization batch accepts two additional legacy layouts.
   */
  enum class ResolveMode { PROFILE, VOXELIZATION };

  enum class FileKind { RAW_SCAN, DECIMATED_SCAN, TRANSFORM };

  /**
   * @brief Resolved files of a single scan position.
   *
   * Raw scan and transform are guaranteed to have existed at resolution time.
   * The decimated scan is only set when it exists on disk.
   */
  struct ScanPositionFiles {
    std::string scan_pos;
    std::string scan_name;
    fs::path raw_scan;
    std::optional<fs::path> decimated_scan;
    fs::path transform;

    bool has_decimated_scan() const { return decimated_scan.has_value(); }
  };

  /**
   * @brief Signals that a position was excluded from the work list because a
   * required file could not be resolved.
   */
  struct PositionSkipped {
    std::string scan_pos;
    FileKind missing;
  };

  using ResolveResult = std::variant<ScanPositionFiles, PositionSkipped>;

  std::string to_string(FileKind kind);

}  // namespace tlsbatch::project
