//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "app/restore_config.hpp"
#include "diagnostics/diagnostics_sink.hpp"
#include "matcher/match_types.hpp"
#include "scan/album_scanner.hpp"
#include "type/type.hpp"

namespace takeoutrestore {
struct RestoreStats {
  size_t                              albums_              = 0;
  size_t                              media_found_         = 0;
  size_t                              media_matched_       = 0;
  size_t                              sidecars_found_      = 0;
  size_t                              injected_            = 0;
  // Matched, but the sidecar carried nothing worth writing
  size_t                              no_metadata_         = 0;
  size_t                              injection_failed_    = 0;
  size_t                              sidecars_deleted_    = 0;
  size_t                              cleanup_failed_      = 0;
  double                              duration_seconds_    = 0.0;
  std::map<MatchStrategyKind, size_t> by_strategy_{};

  // For manual review
  std::vector<media_path_t>           unmatched_media_{};
  std::vector<sidecar_path_t>         unconsumed_sidecars_{};
  std::vector<UnreadableSidecar>      unreadable_sidecars_{};
  std::vector<media_path_t>           failed_media_{};

  auto ExitCode() const -> int { return injection_failed_ > 0 ? 1 : 0; }
};

/**
 * @brief The whole run: scan the input tree, match every album, write the metadata, delete the
 * sidecars that were used, and summarize.
 */
class RestoreService {
 public:
  RestoreService(RestoreConfig config, DiagnosticsSink& sink);

  /**
   * @throws std::invalid_argument on an unusable configuration
   * @throws std::runtime_error when the input folder cannot be read
   */
  auto Run() -> RestoreStats;

  /**
   * @brief Match every album, on a thread pool when more than one job is configured. Reports
   * come back in album order.
   */
  auto MatchAll(const ScanResult& scan) const -> std::vector<AlbumMatchReport>;

  void LogSummary(const RestoreStats& stats) const;

  auto GetConfig() const -> const RestoreConfig& { return config_; }

 private:
  void Inject(const std::vector<AlbumMatchReport>& reports, RestoreStats& stats,
              std::vector<sidecar_path_t>& processed) const;

  RestoreConfig    config_;
  DiagnosticsSink& sink_;
};
};  // namespace takeoutrestore
