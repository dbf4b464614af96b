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
#include <filesystem>
#include <vector>

#include "diagnostics/diagnostics_sink.hpp"
#include "matcher/naming_rules.hpp"
#include "type/type.hpp"

namespace takeoutrestore {
/**
 * @brief One directory of the export. Google writes the sidecars next to their media, so every
 * directory is matched on its own.
 */
struct Album {
  file_path_t                 directory_{};
  // Sorted by file name
  std::vector<media_path_t>   media_{};
  std::vector<sidecar_path_t> sidecars_{};

  auto                        Empty() const -> bool { return media_.empty() && sidecars_.empty(); }
};

struct ScanResult {
  // Sorted by directory path
  std::vector<Album> albums_{};
  size_t             media_count_   = 0;
  size_t             sidecar_count_ = 0;
  // Files that are neither media nor sidecars
  size_t             ignored_count_ = 0;
  size_t             skipped_dirs_  = 0;
};

class AlbumScanner {
 public:
  AlbumScanner(const NamingRules& rules, DiagnosticsSink& sink) : rules_(rules), sink_(sink) {}

  /**
   * @brief Walk root and group its files per directory
   *
   * @param root
   * @param recursive descend into sub-directories
   * @return ScanResult, albums without media and sidecars are dropped
   * @throws std::runtime_error when root is not a readable directory
   */
  auto Scan(const file_path_t& root, bool recursive = true) const -> ScanResult;

  /**
   * @brief Classify the files of a single directory, non-recursive
   */
  auto ScanDirectory(const file_path_t& directory, ScanResult& result) const -> Album;

 private:
  const NamingRules& rules_;
  DiagnosticsSink&   sink_;
};
};  // namespace takeoutrestore
