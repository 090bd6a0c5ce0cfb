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
#include <string>
#include <vector>

#include <tlsbatch/analysis/GroundPlane.hpp>
#include <tlsbatch/analysis/ScanData.hpp>
#include <tlsbatch/common/common.hpp>

namespace tlsbatch::analysis {

  /**
   * @brief How returns are counted when estimating the gap probability.
   *
   * - WEIGHTED: every return counts 1 / target_count
   * - FIRST: only first returns count
   * - ALL: every return counts, every extra return adds to the shot count
   */
  enum class PgapMethod { WEIGHTED, FIRST, ALL };

  std::string to_string(PgapMethod method);
  // Throws tlsbatchException for unknown names. Names are upper case.
  PgapMethod pgap_method_from_string(const std::string& name);

  struct VerticalProfileConfig {
    // height bin size in m
    double hres = 0.5;
    // zenith and azimuth bin size in degrees
    double zres = 5;
    double ares = 90;
    double min_zenith = 35;
    double max_zenith = 70;
    double min_height = 0;
    double max_height = 50;
    // returns with a reflectance at or below are ignored
    std::optional<double> reflectance_threshold;
    PgapMethod method = PgapMethod::WEIGHTED;
  };

  /**
   * @brief Vertical plant profiles of a single scan position following
   * Jupp et al. (2009).
   *
   * Heights are taken relative to the fitted ground plane. Pgap is computed
   * per zenith ring and height bin and averaged over the azimuth sectors that
   * received shots.
   */
  class VerticalProfile {
   public:
    VerticalProfile(const VerticalProfileConfig& config,
                    const PlaneFit& ground_plane);

    void add_scan(const ScanData& scan);

    // Compute Pgap by zenith and height from the accumulated counts.
    void compute_pgap();

    const vec1d& height_bins() const { return height_bin_; }
    // zenith bin centers in degrees
    const vec1d& zenith_bins() const { return zenith_bin_; }
    // [zenith][height]
    const std::vector<vec1d>& pgap_theta_z() const { return pgap_theta_z_; }

    vec1d hinge_profile() const;
    vec1d solid_angle_profile() const;
    // Returns PAI and fills mla with the mean leaf angle in degrees if given.
    vec1d linear_profile(vec1d* mla = nullptr) const;
    // Derivative of a PAI profile with respect to height.
    vec1d pavd(const vec1d& pai) const;

    size_t shot_count() const;

   private:
    VerticalProfileConfig cfg_;
    PlaneFit ground_plane_;
    vec1d height_bin_;
    vec1d zenith_bin_;
    size_t n_azimuth_ = 1;
    bool computed_ = false;

    // [zenith][azimuth]
    std::vector<vec1d> shots_;
    // [zenith][azimuth][height]
    std::vector<std::vector<vec1d>> hits_;
    std::vector<vec1d> pgap_theta_z_;

    void require_pgap() const;
  };

}  // namespace tlsbatch::analysis
