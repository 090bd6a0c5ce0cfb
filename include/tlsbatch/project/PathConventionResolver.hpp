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

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <tlsbatch/project/ScanPosition.hpp>

namespace tlsbatch::project {

  /**
   * @brief One directory layout convention for locating a single file kind.
   *
   * `resolve` returns a path only if that path exists on disk.
   */
  struct ResolverRule {
    std::string name;
    std::function<std::optional<fs::path>(const fs::path& project_root,
                                          const std::string& scan_pos)>
        resolve;
  };
  typedef std::vector<ResolverRule> RuleList;

  namespace rules {
    // SCANS/<pos>/SINGLESCANS
    fs::path scan_container(const fs::path& project_root,
                            const std::string& scan_pos);

    // SCANS/<pos>/SINGLESCANS/<name>/<name>.rxp, first subdirectory by name
    std::optional<fs::path> singlescan_subdirectory(
        const fs::path& project_root, const std::string& scan_pos);

    // SCANS/<pos>/SINGLESCANS/*.rxp without *.residual.rxp, first by name
    std::optional<fs::path> singlescans_direct(const fs::path& project_root,
                                               const std::string& scan_pos);

    /**
     * @brief SCANS/<pos>/SINGLESCANS/YYMMDD_hhmmss.rxp
     *
     * When several files match, the one with the most recent status change
     * time wins. Equal times are broken by file name, highest first. The
     * timestamps come from the filesystem, so the choice is deterministic for
     * a given tree but may differ after copying the project.
     */
    std::optional<fs::path> timestamp_pattern(const fs::path& project_root,
                                              const std::string& scan_pos);

    // DAT/<pos>.DAT
    std::optional<fs::path> dat_directory(const fs::path& project_root,
                                          const std::string& scan_pos);

    // project.rdb/SCANS/<pos>.DAT
    std::optional<fs::path> database_mirror(const fs::path& project_root,
                                            const std::string& scan_pos);

    // SCANS/matrix/<pos>.DAT
    std::optional<fs::path> matrix_directory(const fs::path& project_root,
                                             const std::string& scan_pos);

    // project.rdb/SCANS/<pos>/SINGLESCANS/<scan>/<scan>.rdbx, never searched
    fs::path decimated_scan_path(const fs::path& project_root,
                                 const std::string& scan_pos,
                                 const std::string& scan_name);
  }  // namespace rules

  /**
   * @brief Resolves the raw scan, decimated scan and transform of a scan
   * position by trying an ordered list of layout conventions per file kind.
   *
   * For each kind the first rule that yields an existing file wins. Kinds are
   * resolved independently, so the winning conventions need not agree.
   */
  class PathConventionResolver {
   public:
    explicit PathConventionResolver(ResolveMode mode = ResolveMode::PROFILE);
    PathConventionResolver(RuleList raw_scan_rules, RuleList transform_rules);

    /**
     * @brief Resolve the file set of one position.
     *
     * Never throws for missing files. Returns PositionSkipped when the raw
     * scan or the transform cannot be found.
     */
    ResolveResult resolve(const fs::path& project_root,
                          const std::string& scan_pos) const;

    const RuleList& raw_scan_rules() const { return raw_scan_rules_; }
    const RuleList& transform_rules() const { return transform_rules_; }

    static RuleList default_raw_scan_rules(ResolveMode mode);
    static RuleList default_transform_rules(ResolveMode mode);

   private:
    RuleList raw_scan_rules_;
    RuleList transform_rules_;

    std::optional<fs::path> first_match(const RuleList& rule_list,
                                        const fs::path& project_root,
                                        const std::string& scan_pos,
                                        FileKind kind) const;
  };

}  // namespace tlsbatch::project
