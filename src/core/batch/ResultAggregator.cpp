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

#include <cmath>
#include <fstream>
#include <tlsbatch/batch/ResultAggregator.hpp>
#include <tlsbatch/common/datastructures.hpp>

#include "fmt/format.h"

namespace tlsbatch::batch {

  std::string format_csv_number(double value) {
    if (std::isnan(value)) return "";
    auto text = fmt::format("{:.6f}", value);
    if (text == "-0.000000") return "0.000000";
    return text;
  }

  void write_text_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw tlsbatchException(
          fmt::format("Unable to open {} for writing", path.string()));
    }
    out << content;
    out.close();
    if (!out) {
      throw tlsbatchException(fmt::format("Unable to write {}", path.string()));
    }
  }

}  // namespace tlsbatch::batch
