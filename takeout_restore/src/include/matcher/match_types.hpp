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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sidecar/sidecar_metadata.hpp"
#include "type/type.hpp"

namespace takeoutrestore {
struct MediaEntry {
  media_path_t  path_{};
  file_name_t   file_name_{};
  // File name minus the final extension
  std::string   base_name_{};
  // Final extension as written, including the dot
  std::string   extension_{};
  // Trailing "(n)" of the base name, empty if none
  std::string   counter_{};
  std::string   counterless_base_{};
  // Matched edit suffix ("-edited", ...), empty if none
  std::string   edit_suffix_{};
  std::string   unedited_base_{};
  std::string   logical_name_{};
  MediaKind     kind_  = MediaKind::UNKNOWN;
  entry_index_t index_ = 0;

  auto          IsVariant() const -> bool { return !counter_.empty() || !edit_suffix_.empty(); }
};

struct SidecarEntry {
  sidecar_path_t                         path_{};
  file_name_t                            file_name_{};
  // Media file name the sidecar name stands for: ".json", a trailing "(n)" and a possibly
  // truncated ".supplemental-metadata" removed
  std::string                            described_name_{};
  std::string                            counter_{};
  bool                                   supplemental_ = false;
  std::string                            logical_name_{};
  std::string                            title_logical_name_{};
  std::shared_ptr<const SidecarMetadata> metadata_     = nullptr;
  entry_index_t                          index_        = 0;

  auto Title() const -> std::string { return metadata_ ? metadata_->title_ : std::string{}; }
};

enum class MatchStrategyKind : uint8_t {
  NONE = 0,
  EXACT,
  SUPPLEMENTAL,
  TRUNCATED,
  DUPLICATE_SUFFIX,
  EDITED,
  LOGICAL_NAME
};

auto StrategyKindToString(MatchStrategyKind kind) -> const char*;

struct MatchResult {
  MediaEntry                          media_{};
  std::shared_ptr<const SidecarEntry> sidecar_    = nullptr;
  MatchStrategyKind                   strategy_   = MatchStrategyKind::NONE;
  float                               confidence_ = 0.0f;

  auto IsMatched() const -> bool { return sidecar_ != nullptr; }
};

struct UnreadableSidecar {
  sidecar_path_t path_{};
  std::string    reason_{};
};

struct AlbumMatchReport {
  file_path_t                                      directory_{};
  // One per media file, in media input order
  std::vector<MatchResult>                         results_{};
  // In sidecar input order
  std::vector<std::shared_ptr<const SidecarEntry>> unconsumed_sidecars_{};
  std::vector<UnreadableSidecar>                   unreadable_sidecars_{};

  auto MatchedCount() const -> size_t;
  auto UnmatchedCount() const -> size_t;
  auto CountBy(MatchStrategyKind kind) const -> size_t;
};
};  // namespace takeoutrestore
