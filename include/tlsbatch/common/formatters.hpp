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

#include <optional>

#include "fmt/format.h"
#include <tlsbatch/common/common.hpp>

template <typename T>
struct fmt::formatter<tlsbatch::TBox<T>> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

  template <typename Context>
  auto format(const tlsbatch::TBox<T>& box, Context& ctx) const {
    if (box.isEmpty()) return fmt::format_to(ctx.out(), "[]");
    return fmt::format_to(ctx.out(), "[{},{},{},{},{},{}]", box.pmin[0],
                          box.pmin[1], box.pmin[2], box.pmax[0], box.pmax[1],
                          box.pmax[2]);
  }
};

template <>
struct fmt::formatter<tlsbatch::arr3d> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

  template <typename Context>
  auto format(const tlsbatch::arr3d& arr, Context& ctx) const {
    return fmt::format_to(ctx.out(), "[{},{},{}]", arr[0], arr[1], arr[2]);
  }
};

template <>
struct fmt::formatter<std::optional<std::string>> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

  template <typename Context>
  auto format(const std::optional<std::string>& str, Context& ctx) const {
    if (!str.has_value()) {
      return fmt::format_to(ctx.out(), "");
    } else {
      return fmt::format_to(ctx.out(), "{}", *str);
    }
  }
};
