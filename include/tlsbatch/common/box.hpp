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

#include <algorithm>
#include <array>
#include <initializer_list>
#include <vector>

namespace tlsbatch {

  /**
   * @brief Axis aligned box in three dimensions.
   *
   * A freshly constructed or cleared box is empty; the first point added
   * initialises both corners.
   */
  template <typename T>
  struct TBox {
    std::array<T, 3> pmin, pmax;
    bool just_cleared;

    TBox() { clear(); };

    TBox(const TBox& otherBox)
        : pmin(otherBox.min()),
          pmax(otherBox.max()),
          just_cleared(otherBox.just_cleared){};

    TBox& operator=(const TBox& otherBox) = default;

    // xmin, ymin, zmin, xmax, ymax, zmax
    TBox(std::initializer_list<T> initList) {
      clear();
      auto it = initList.begin();
      pmin[0] = *it++;
      pmin[1] = *it++;
      pmin[2] = *it++;
      pmax[0] = *it++;
      pmax[1] = *it++;
      pmax[2] = *it;
      just_cleared = false;
    }

    std::array<T, 3> min() const { return pmin; };
    std::array<T, 3> max() const { return pmax; };
    void add(const T p[]) {
      if (just_cleared) {
        pmin[0] = p[0];
        pmin[1] = p[1];
        pmin[2] = p[2];
        pmax[0] = p[0];
        pmax[1] = p[1];
        pmax[2] = p[2];
        just_cleared = false;
      }
      pmin[0] = std::min(p[0], pmin[0]);
      pmin[1] = std::min(p[1], pmin[1]);
      pmin[2] = std::min(p[2], pmin[2]);
      pmax[0] = std::max(p[0], pmax[0]);
      pmax[1] = std::max(p[1], pmax[1]);
      pmax[2] = std::max(p[2], pmax[2]);
    };
    void add(const std::array<T, 3>& a) { add(a.data()); };
    void add(const std::vector<std::array<T, 3>>& vec) {
      for (auto& p : vec) add(p);
    };
    void clear() {
      pmin.fill(0);
      pmax.fill(0);
      just_cleared = true;
    };
    bool isEmpty() const { return just_cleared; };
  };

}  // namespace tlsbatch
