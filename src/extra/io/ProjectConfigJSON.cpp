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

#include <fstream>
#include <nlohmann/json.hpp>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/io/ProjectConfig.hpp>

#include "fmt/format.h"

namespace tlsbatch::io {

  namespace fs = std::filesystem;
  using json = nlohmann::ordered_json;

  std::string project_config_filename(const fs::path& project_root) {
    fs::path root = project_root;
    if (!root.has_filename()) root = root.parent_path();
    return root.stem().string() + "_config.json";
  }

  std::string dump_project_config(const VoxelProjectConfig& config) {
    json j;
    j["bounds"] = config.bounds;
    j["resolution"] = config.resolution;
    j["nx"] = config.nx;
    j["ny"] = config.ny;
    j["nz"] = config.nz;
    j["nodata"] = config.nodata;
    if (config.dtm.has_value()) {
      j["dtm"] = *config.dtm;
    } else {
      j["dtm"] = nullptr;
    }
    j["positions"] = json::object();
    for (const auto& [scan_name, files] : config.positions) {
      auto& jfiles = j["positions"][scan_name];
      jfiles = json::object();
      for (const auto& [layer, file] : files) {
        jfiles[layer] = file;
      }
    }
    return j.dump(4) + "\n";
  }

  void write_project_config(const fs::path& path,
                            const VoxelProjectConfig& config) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw tlsbatchException(
          fmt::format("Unable to open {} for writing", path.string()));
    }
    out << dump_project_config(config);
    if (!out) {
      throw tlsbatchException(fmt::format("Unable to write {}", path.string()));
    }
  }

  VoxelProjectConfig read_project_config(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
      throw tlsbatchException(
          fmt::format("Unable to open project config {}", path.string()));
    }
    VoxelProjectConfig config;
    try {
      json j = json::parse(in);
      auto bounds = j.at("bounds").get<std::vector<double>>();
      if (bounds.size() != 6) {
        throw tlsbatchException("bounds must hold 6 values");
      }
      std::copy(bounds.begin(), bounds.end(), config.bounds.begin());
      config.resolution = j.at("resolution").get<double>();
      config.nx = j.at("nx").get<size_t>();
      config.ny = j.at("ny").get<size_t>();
      config.nz = j.at("nz").get<size_t>();
      config.nodata = j.at("nodata").get<int>();
      if (j.contains("dtm") && !j["dtm"].is_null()) {
        config.dtm = j["dtm"].get<std::string>();
      }
      for (const auto& [scan_name, jfiles] : j.at("positions").items()) {
        FileMap files;
        for (const auto& [layer, file] : jfiles.items()) {
          files[layer] = file.get<std::string>();
        }
        config.positions.emplace_back(scan_name, std::move(files));
      }
    } catch (const nlohmann::json::exception& e) {
      throw tlsbatchException(fmt::format("Invalid project config {}. {}",
                                          path.string(), e.what()));
    }
    return config;
  }

}  // namespace tlsbatch::io
