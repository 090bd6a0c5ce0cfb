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

#include <sys/stat.h>

#include <algorithm>
#include <cstdint>
#include <system_error>
#include <tlsbatch/common/common.hpp>
#include <tlsbatch/logger/logger.h>
#include <tlsbatch/project/PathConventionResolver.hpp>

namespace tlsbatch::project {

  namespace {
    bool is_file(const fs::path& p) {
      std::error_code ec;
      return fs::is_regular_file(p, ec);
    }

    bool is_dir(const fs::path& p) {
      std::error_code ec;
      return fs::is_directory(p, ec);
    }

    bool ends_with(const std::string& s, const std::string& suffix) {
      return s.size() >= suffix.size() &&
             s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Entries of a directory sorted by file name. Unreadable directories give
    // an empty list.
    std::vector<fs::directory_entry> sorted_entries(const fs::path& dir) {
      std::vector<fs::directory_entry> entries;
      std::error_code ec;
      for (auto it = fs::directory_iterator(dir, ec);
           !ec && it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(*it);
      }
      std::sort(entries.begin(), entries.end(),
                [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
                });
      return entries;
    }

    // nanoseconds since the epoch, 0 when the file cannot be stat'ed
    std::int64_t status_change_time(const fs::path& p) {
      struct stat st;
      if (::stat(p.string().c_str(), &st) != 0) return 0;
      return static_cast<std::int64_t>(st.st_ctim.tv_sec) * 1000000000 +
             st.st_ctim.tv_nsec;
    }

    std::optional<fs::path> existing(const fs::path& p) {
      if (is_file(p)) return p;
      return std::nullopt;
    }
  }  // namespace

  std::string to_string(FileKind kind) {
    switch (kind) {
      case FileKind::RAW_SCAN:
        return "raw scan";
      case FileKind::DECIMATED_SCAN:
        return "decimated scan";
      case FileKind::TRANSFORM:
        return "transform";
    }
    return "unknown";
  }

  namespace rules {
    fs::path scan_container(const fs::path& project_root,
                            const std::string& scan_pos) {
      return project_root / SCANS_DIR / scan_pos / SINGLESCANS_DIR;
    }

    std::optional<fs::path> singlescan_subdirectory(
        const fs::path& project_root, const std::string& scan_pos) {
      auto container = scan_container(project_root, scan_pos);
      if (!is_dir(container)) return std::nullopt;
      for (const auto& entry : sorted_entries(container)) {
        if (!is_dir(entry.path())) continue;
        // only the first subdirectory is considered
        auto name = entry.path().filename().string();
        return existing(entry.path() / (name + RAW_SCAN_EXT));
      }
      return std::nullopt;
    }

    std::optional<fs::path> singlescans_direct(const fs::path& project_root,
                                               const std::string& scan_pos) {
      auto container = scan_container(project_root, scan_pos);
      if (!is_dir(container)) return std::nullopt;
      for (const auto& entry : sorted_entries(container)) {
        auto name = entry.path().filename().string();
        if (!is_file(entry.path())) continue;
        if (entry.path().extension() != RAW_SCAN_EXT) continue;
        if (ends_with(name, RESIDUAL_SCAN_SUFFIX)) continue;
        return entry.path();
      }
      return std::nullopt;
    }

    std::optional<fs::path> timestamp_pattern(const fs::path& project_root,
                                              const std::string& scan_pos) {
      auto container = scan_container(project_root, scan_pos);
      if (!is_dir(container)) return std::nullopt;
      std::optional<fs::path> newest;
      std::int64_t newest_time = 0;
      for (const auto& entry : sorted_entries(container)) {
        auto name = entry.path().filename().string();
        if (!is_file(entry.path())) continue;
        if (!match_pattern(name, TIMESTAMP_SCAN_PATTERN)) continue;
        auto ctime = status_change_time(entry.path());
        // entries are sorted ascending, so >= keeps the highest name on ties
        if (!newest.has_value() || ctime >= newest_time) {
          newest = entry.path();
          newest_time = ctime;
        }
      }
      return newest;
    }

    std::optional<fs::path> dat_directory(const fs::path& project_root,
                                          const std::string& scan_pos) {
      return existing(project_root / DAT_DIR / (scan_pos + TRANSFORM_EXT));
    }

    std::optional<fs::path> database_mirror(const fs::path& project_root,
                                            const std::string& scan_pos) {
      return existing(project_root / DATABASE_DIR / SCANS_DIR /
                      (scan_pos + TRANSFORM_EXT));
    }

    std::optional<fs::path> matrix_directory(const fs::path& project_root,
                                             const std::string& scan_pos) {
      return existing(project_root / SCANS_DIR / MATRIX_DIR /
                      (scan_pos + TRANSFORM_EXT));
    }

    fs::path decimated_scan_path(const fs::path& project_root,
                                 const std::string& scan_pos,
                                 const std::string& scan_name) {
      return project_root / DATABASE_DIR / SCANS_DIR / scan_pos /
             SINGLESCANS_DIR / scan_name / (scan_name + DECIMATED_SCAN_EXT);
    }
  }  // namespace rules

  PathConventionResolver::PathConventionResolver(ResolveMode mode)
      : raw_scan_rules_(default_raw_scan_rules(mode)),
        transform_rules_(default_transform_rules(mode)) {}

  PathConventionResolver::PathConventionResolver(RuleList raw_scan_rules,
                                                 RuleList transform_rules)
      : raw_scan_rules_(std::move(raw_scan_rules)),
        transform_rules_(std::move(transform_rules)) {}

  RuleList PathConventionResolver::default_raw_scan_rules(ResolveMode mode) {
    RuleList list{
        {"singlescan-subdirectory", rules::singlescan_subdirectory},
    };
    // the newest timestamped scan wins over the lexically first *.rxp
    if (mode == ResolveMode::VOXELIZATION) {
      list.push_back({"timestamp-pattern", rules::timestamp_pattern});
    }
    list.push_back({"singlescans-direct", rules::singlescans_direct});
    return list;
  }

  RuleList PathConventionResolver::default_transform_rules(ResolveMode mode) {
    RuleList list{
        {"dat-directory", rules::dat_directory},
        {"database-mirror", rules::database_mirror},
    };
    if (mode == ResolveMode::VOXELIZATION) {
      list.push_back({"matrix-directory", rules::matrix_directory});
    }
    return list;
  }

  std::optional<fs::path> PathConventionResolver::first_match(
      const RuleList& rule_list, const fs::path& project_root,
      const std::string& scan_pos, FileKind kind) const {
    auto& logger = logger::Logger::get_logger();
    for (const auto& rule : rule_list) {
      if (auto path = rule.resolve(project_root, scan_pos)) {
        logger.debug("{}: {} resolved by {} to {}", scan_pos, to_string(kind),
                     rule.name, path->string());
        return path;
      }
    }
    return std::nullopt;
  }

  ResolveResult PathConventionResolver::resolve(
      const fs::path& project_root, const std::string& scan_pos) const {
    auto raw_scan =
        first_match(raw_scan_rules_, project_root, scan_pos, FileKind::RAW_SCAN);
    if (!raw_scan.has_value()) {
      return PositionSkipped{scan_pos, FileKind::RAW_SCAN};
    }
    auto transform = first_match(transform_rules_, project_root, scan_pos,
                                 FileKind::TRANSFORM);
    if (!transform.has_value()) {
      return PositionSkipped{scan_pos, FileKind::TRANSFORM};
    }

    ScanPositionFiles files;
    files.scan_pos = scan_pos;
    files.scan_name = raw_scan->stem().string();
    files.raw_scan = *raw_scan;
    files.transform = *transform;

    auto decimated =
        rules::decimated_scan_path(project_root, scan_pos, files.scan_name);
    if (is_file(decimated)) {
      files.decimated_scan = decimated;
    }
    return files;
  }

}  // namespace tlsbatch::project
