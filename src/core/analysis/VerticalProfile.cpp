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
#include <cmath>
#include <limits>
#include <numbers>
#include <tlsbatch/analysis/VerticalProfile.hpp>
#include <tlsbatch/common/datastructures.hpp>

#include "fmt/format.h"

namespace tlsbatch::analysis {

  namespace {
    constexpr double MIN_PGAP = 1e-6;
    constexpr double HINGE_ANGLE = 57.5;
    constexpr double EPS = 1e-9;

    size_t bin_count(double lo, double hi, double step) {
      return static_cast<size_t>(std::ceil((hi - lo) / step - EPS));
    }

    double to_degrees(double rad) { return rad * 180.0 / std::numbers::pi; }
    double to_radians(double deg) { return deg * std::numbers::pi / 180.0; }
  }  // namespace

  std::string to_string(PgapMethod method) {
    switch (method) {
      case PgapMethod::WEIGHTED:
        return "WEIGHTED";
      case PgapMethod::FIRST:
        return "FIRST";
      case PgapMethod::ALL:
        return "ALL";
    }
    return "unknown";
  }

  PgapMethod pgap_method_from_string(const std::string& name) {
    if (name == "WEIGHTED") return PgapMethod::WEIGHTED;
    if (name == "FIRST") return PgapMethod::FIRST;
    if (name == "ALL") return PgapMethod::ALL;
    throw tlsbatchException(fmt::format("Unknown Pgap method {}", name));
  }

  VerticalProfile::VerticalProfile(const VerticalProfileConfig& config,
                                   const PlaneFit& ground_plane)
      : cfg_(config), ground_plane_(ground_plane) {
    if (!(cfg_.hres > 0) || !(cfg_.zres > 0) || !(cfg_.ares > 0)) {
      throw ConfigurationError("Profile resolutions must be higher than 0");
    }
    if (cfg_.ares > 360) {
      throw ConfigurationError("Azimuth resolution must not exceed 360");
    }
    if (!(cfg_.max_zenith > cfg_.min_zenith) || cfg_.min_zenith < 0 ||
        cfg_.max_zenith >= 90) {
      throw ConfigurationError(fmt::format(
          "Invalid zenith range <{}, {}>", cfg_.min_zenith, cfg_.max_zenith));
    }
    if (!(cfg_.max_height > cfg_.min_height)) {
      throw ConfigurationError(fmt::format(
          "Invalid height range <{}, {}>", cfg_.min_height, cfg_.max_height));
    }

    size_t n_height = bin_count(cfg_.min_height, cfg_.max_height, cfg_.hres);
    for (size_t i = 0; i < n_height; ++i) {
      height_bin_.push_back(cfg_.min_height + i * cfg_.hres);
    }
    size_t n_zenith = bin_count(cfg_.min_zenith, cfg_.max_zenith, cfg_.zres);
    for (size_t i = 0; i < n_zenith; ++i) {
      zenith_bin_.push_back(cfg_.min_zenith + (i + 0.5) * cfg_.zres);
    }
    n_azimuth_ = std::max<size_t>(1, bin_count(0, 360, cfg_.ares));

    shots_.assign(n_zenith, vec1d(n_azimuth_, 0));
    hits_.assign(n_zenith,
                 std::vector<vec1d>(n_azimuth_, vec1d(n_height, 0)));
  }

  void VerticalProfile::add_scan(const ScanData& scan) {
    const size_t n_zenith = zenith_bin_.size();
    const size_t n_height = height_bin_.size();
    // flat zenith/azimuth bin of every pulse, -1 when outside the zenith range
    std::vector<long> pulse_bin(scan.pulses.size(), -1);

    for (size_t pi = 0; pi < scan.pulses.size(); ++pi) {
      const auto& pulse = scan.pulses[pi];
      double zenith = to_degrees(pulse.zenith);
      if (zenith < cfg_.min_zenith || zenith >= cfg_.max_zenith) continue;
      size_t zi = std::min(
          n_zenith - 1,
          static_cast<size_t>((zenith - cfg_.min_zenith) / cfg_.zres));

      double azimuth = std::fmod(to_degrees(pulse.azimuth), 360.0);
      if (azimuth < 0) azimuth += 360.0;
      size_t ai =
          std::min(n_azimuth_ - 1, static_cast<size_t>(azimuth / cfg_.ares));

      double shot_weight = 1;
      if (cfg_.method == PgapMethod::ALL && pulse.target_count > 1) {
        shot_weight = pulse.target_count;
      }
      shots_[zi][ai] += shot_weight;
      pulse_bin[pi] = static_cast<long>(zi * n_azimuth_ + ai);
    }

    for (const auto& ret : scan.returns) {
      if (ret.pulse_index >= pulse_bin.size()) {
        throw tlsbatchException(fmt::format(
            "Return refers to pulse {} of {}", ret.pulse_index,
            pulse_bin.size()));
      }
      long bin = pulse_bin[ret.pulse_index];
      if (bin < 0) continue;
      if (cfg_.reflectance_threshold.has_value() &&
          ret.reflectance <= *cfg_.reflectance_threshold) {
        continue;
      }

      double weight = 1;
      switch (cfg_.method) {
        case PgapMethod::WEIGHTED:
          weight = ret.target_count > 0 ? 1.0 / ret.target_count : 1.0;
          break;
        case PgapMethod::FIRST:
          if (ret.target_index != 1) continue;
          break;
        case PgapMethod::ALL:
          break;
      }

      const auto& p = ret.position;
      double height = p[2] - ground_plane_.height_at(p[0], p[1]);
      if (height >= cfg_.min_height + n_height * cfg_.hres) continue;
      // returns below the lowest bin intercept the beam before every bin
      size_t hi = 0;
      if (height > cfg_.min_height) {
        hi = std::min(n_height - 1, static_cast<size_t>(
                                        (height - cfg_.min_height) / cfg_.hres));
      }
      size_t zi = static_cast<size_t>(bin) / n_azimuth_;
      size_t ai = static_cast<size_t>(bin) % n_azimuth_;
      hits_[zi][ai][hi] += weight;
    }
    computed_ = false;
  }

  size_t VerticalProfile::shot_count() const {
    double total = 0;
    for (const auto& ring : shots_)
      for (auto s : ring) total += s;
    return static_cast<size_t>(total);
  }

  void VerticalProfile::compute_pgap() {
    if (shot_count() == 0) {
      throw tlsbatchException(
          fmt::format("No pulses within the zenith range <{}, {}>",
                      cfg_.min_zenith, cfg_.max_zenith));
    }
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    const size_t n_height = height_bin_.size();
    pgap_theta_z_.assign(zenith_bin_.size(), vec1d(n_height, nan));

    for (size_t zi = 0; zi < zenith_bin_.size(); ++zi) {
      vec1d sum(n_height, 0);
      size_t sectors = 0;
      for (size_t ai = 0; ai < n_azimuth_; ++ai) {
        double shots = shots_[zi][ai];
        if (shots <= 0) continue;
        ++sectors;
        double cumulative = 0;
        for (size_t hi = 0; hi < n_height; ++hi) {
          cumulative += hits_[zi][ai][hi];
          sum[hi] += std::clamp(1.0 - cumulative / shots, MIN_PGAP, 1.0);
        }
      }
      if (sectors == 0) continue;
      for (size_t hi = 0; hi < n_height; ++hi) {
        pgap_theta_z_[zi][hi] = sum[hi] / sectors;
      }
    }
    computed_ = true;
  }

  void VerticalProfile::require_pgap() const {
    if (!computed_) {
      throw tlsbatchException("Pgap has not been computed");
    }
  }

  vec1d VerticalProfile::hinge_profile() const {
    require_pgap();
    size_t hinge = 0;
    for (size_t zi = 1; zi < zenith_bin_.size(); ++zi) {
      if (std::abs(zenith_bin_[zi] - HINGE_ANGLE) <
          std::abs(zenith_bin_[hinge] - HINGE_ANGLE)) {
        hinge = zi;
      }
    }
    if (std::isnan(pgap_theta_z_[hinge].front())) {
      throw tlsbatchException(fmt::format(
          "No shots in the hinge zenith ring at {} degrees",
          zenith_bin_[hinge]));
    }
    vec1d pai(height_bin_.size());
    for (size_t hi = 0; hi < pai.size(); ++hi) {
      pai[hi] = -1.1 * std::log(pgap_theta_z_[hinge][hi]);
    }
    return pai;
  }

  vec1d VerticalProfile::solid_angle_profile() const {
    require_pgap();
    vec1d pai(height_bin_.size(), 0);
    for (size_t hi = 0; hi < pai.size(); ++hi) {
      double num = 0, den = 0;
      for (size_t zi = 0; zi < zenith_bin_.size(); ++zi) {
        double p = pgap_theta_z_[zi][hi];
        if (std::isnan(p)) continue;
        double theta = to_radians(zenith_bin_[zi]);
        num += -std::log(p) * std::cos(theta) * std::sin(theta);
        den += std::sin(theta);
      }
      pai[hi] = den > 0 ? 2 * num / den : 0;
    }
    return pai;
  }

  vec1d VerticalProfile::linear_profile(vec1d* mla) const {
    require_pgap();
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    vec1d pai(height_bin_.size(), nan);
    if (mla) mla->assign(height_bin_.size(), nan);

    for (size_t hi = 0; hi < pai.size(); ++hi) {
      // -ln(Pgap) = Lh + Lv * 2/pi * tan(theta)
      vec1d xs, ys;
      for (size_t zi = 0; zi < zenith_bin_.size(); ++zi) {
        double p = pgap_theta_z_[zi][hi];
        if (std::isnan(p)) continue;
        xs.push_back(2.0 / std::numbers::pi *
                     std::tan(to_radians(zenith_bin_[zi])));
        ys.push_back(-std::log(p));
      }
      if (xs.size() < 2) continue;

      double xm = 0, ym = 0;
      for (size_t i = 0; i < xs.size(); ++i) {
        xm += xs[i];
        ym += ys[i];
      }
      xm /= xs.size();
      ym /= ys.size();
      double sxy = 0, sxx = 0;
      for (size_t i = 0; i < xs.size(); ++i) {
        sxy += (xs[i] - xm) * (ys[i] - ym);
        sxx += (xs[i] - xm) * (xs[i] - xm);
      }
      if (sxx <= 0) continue;
      double lv = sxy / sxx;
      double lh = ym - lv * xm;
      pai[hi] = lh + lv;
      if (mla) (*mla)[hi] = to_degrees(std::atan2(lv, lh));
    }
    return pai;
  }

  vec1d VerticalProfile::pavd(const vec1d& pai) const {
    const auto& h = height_bin_;
    if (pai.size() != h.size()) {
      throw tlsbatchException("Profile and height bins differ in length");
    }
    vec1d result(pai.size(), 0);
    if (pai.size() < 2) return result;
    const size_t n = pai.size();
    result[0] = (pai[1] - pai[0]) / (h[1] - h[0]);
    result[n - 1] = (pai[n - 1] - pai[n - 2]) / (h[n - 1] - h[n - 2]);
    for (size_t i = 1; i + 1 < n; ++i) {
      result[i] = (pai[i + 1] - pai[i - 1]) / (h[i + 1] - h[i - 1]);
    }
    return result;
  }

}  // namespace tlsbatch::analysis
