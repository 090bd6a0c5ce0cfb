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
#include <concepts>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "fmt/format.h"

template <typename T>
using Validator = std::function<std::optional<std::string>(const T&)>;

namespace tlsbatch::validators {
  // Concept to ensure types are comparable
  template <typename T>
  concept Comparable = requires(T a, T b) {
    { a < b } -> std::convertible_to<bool>;
    { a > b } -> std::convertible_to<bool>;
  };

  // Generator function for range validators
  template <typename T>
    requires Comparable<T>
  auto InRange(T min, T max) {
    return [min, max](const T& val) -> std::optional<std::string> {
      if (val < min || val > max) {
        return fmt::format("Value {} is out of range <{}, {}>.", val, min, max);
      }
      return std::nullopt;
    };
  };

  // Generator function for validator to check if a value is higher than a given
  // value
  template <typename T>
    requires Comparable<T>
  auto HigherThan(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val <= min) {
        return fmt::format("Value must be higher than {}.", min);
      }
      return std::nullopt;
    };
  };

  // Generator function for validator to check if a value is higher than or
  // equal to a given value
  template <typename T>
    requires Comparable<T>
  auto HigherOrEqualTo(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val < min) {
        return fmt::format(
            "Value must be higher than or equal to {}. But is {}.", min, val);
      }
      return std::nullopt;
    };
  };

  // Generator function for validator to check if the value is one of the given
  // values
  template <typename T>
  auto OneOf(std::vector<T> values) {
    return [values](const T& val) -> std::optional<std::string> {
      if (std::find(values.begin(), values.end(), val) == values.end()) {
        return fmt::format("Value {} is not one of the allowed values.", val);
      }
      return std::nullopt;
    };
  };

  // Path exists validator
  inline auto PathExists =
      [](const std::string& path) -> std::optional<std::string> {
    if (!std::filesystem::exists(path)) {
      return fmt::format("Path {} does not exist.", path);
    }
    return std::nullopt;
  };

  // Optional path exists validator, an unset path is valid
  inline auto OptionalPathExists = [](const std::optional<std::string>& path)
      -> std::optional<std::string> {
    if (path.has_value()) return PathExists(*path);
    return std::nullopt;
  };

  // Create a validator for file path writeability
  inline auto DirIsWritable =
      [](const std::string& path) -> std::optional<std::string> {
    std::filesystem::path fs_path(path);

    // convert to absolute path
    auto abs_path = std::filesystem::absolute(fs_path);

    // find the first parent folders that already exists
    auto parent = abs_path;
    while (!std::filesystem::exists(parent)) {
      parent = parent.parent_path();
    }

    // check if parent is a directory
    if (!std::filesystem::is_directory(parent)) {
      return fmt::format("Path {} is not a directory.", parent.string());
    }

    // Try to create a temporary file in parent
    auto testPath = parent / "write_test_tmp";
    {
      std::ofstream test_file(testPath);
      if (test_file) {
        test_file.close();
        std::error_code ec;
        std::filesystem::remove(testPath, ec);
        return std::nullopt;
      }
    }
    return fmt::format("Could not write to directory {}.", parent.string());
  };
}  // namespace tlsbatch::validators
