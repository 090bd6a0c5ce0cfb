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

#include <cctype>
#include <cmath>
#include <tlsbatch/common/common.hpp>

namespace tlsbatch {

  std::optional<float> Raster::sample(double x, double y) const {
    const auto& gt = geotransform;
    if (gt[1] == 0 || gt[5] == 0) return std::nullopt;
    // rotation terms are assumed to be zero
    double col = std::floor((x - gt[0]) / gt[1]);
    double row = std::floor((y - gt[3]) / gt[5]);
    if (col < 0 || row < 0 || col >= static_cast<double>(dim_x) ||
        row >= static_cast<double>(dim_y)) {
      return std::nullopt;
    }
    float value = array[static_cast<size_t>(row) * dim_x +
                        static_cast<size_t>(col)];
    if (nodataval.has_value() && value == *nodataval) return std::nullopt;
    if (std::isnan(value)) return std::nullopt;
    return value;
  }

  bool match_pattern(const std::string& s, const std::string& pattern) {
    if (s.size() != pattern.size()) return false;
    for (size_t i = 0; i < s.size(); ++i) {
      const char p = pattern[i];
      const unsigned char c = static_cast<unsigned char>(s[i]);
      if (p == '?') continue;
      if (p == '#') {
        if (!std::isdigit(c)) return false;
        continue;
      }
      if (s[i] != p) return false;
    }
    return true;
  }

}  // namespace tlsbatch
