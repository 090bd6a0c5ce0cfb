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
#include <string>
#include <vector>

#include <tlsbatch/batch/BatchExecutor.hpp>

namespace tlsbatch::batch {

  namespace fs = std::filesystem;

  struct WriteSummary {
    // true when there were no successful outcomes and nothing was written
    bool no_work = true;
    std::vector<fs::path> written;
  };

  // Fixed notation with six decimals, NaN is written as an empty field.
  std::string format_csv_number(double value);

  // Replace the file at path with content.
  void write_text_file(const fs::path& path, const std::string& content);

}  // namespace tlsbatch::batch
