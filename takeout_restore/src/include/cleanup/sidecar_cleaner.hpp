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
#include <string>
#include <utility>
#include <vector>

#include "diagnostics/diagnostics_sink.hpp"
#include "type/type.hpp"

namespace takeoutrestore {
struct CleanupResult {
  size_t                                              total_   = 0;
  size_t                                              deleted_ = 0;
  size_t                                              skipped_ = 0;
  std::vector<sidecar_path_t>                         deleted_files_{};
  std::vector<std::pair<sidecar_path_t, std::string>> failed_{};

  auto FailedCount() const -> size_t { return failed_.size(); }
};

/**
 * @brief Removes sidecars once their metadata lives in the media file
 */
class SidecarCleaner {
 public:
  SidecarCleaner(bool dry_run, DiagnosticsSink& sink) : dry_run_(dry_run), sink_(sink) {}

  /**
   * @brief Delete one sidecar. Files that are already gone count as deleted, anything that is
   * not a .json file is skipped.
   */
  void Delete(const sidecar_path_t& path, CleanupResult& result) const;

  auto DeleteAll(const std::vector<sidecar_path_t>& paths) const -> CleanupResult;

 private:
  bool             dry_run_;
  DiagnosticsSink& sink_;
};
};  // namespace takeoutrestore
