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

#include <cmath>
#include <cstdint>
#include <vector>

#include <tlsbatch/common/common.hpp>

namespace tlsbatch::analysis {

  /**
   * @brief One emitted laser pulse in world coordinates.
   *
   * Zenith is measured from the vertical, azimuth clockwise from the y axis,
   * both in radians.
   */
  struct Pulse {
    arr3d origin;
    double zenith = 0;
    double azimuth = 0;
    std::uint8_t target_count = 0;

    arr3d direction() const {
      return {std::sin(zenith) * std::sin(azimuth),
              std::sin(zenith) * std::cos(azimuth), std::cos(zenith)};
    }
  };

  // A single return of a pulse. target_index starts at 1.
  struct Return {
    arr3d position;
    size_t pulse_index = 0;
    std::uint8_t target_index = 1;
    std::uint8_t target_count = 1;
    double range = 0;
    float reflectance = 0;
  };

  struct ScanData {
    std::vector<Pulse> pulses;
    std::vector<Return> returns;
    arr3d sensor_origin = {0, 0, 0};

    void clear() {
      pulses.clear();
      returns.clear();
    }
  };

}  // namespace tlsbatch::analysis
