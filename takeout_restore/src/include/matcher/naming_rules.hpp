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
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "matcher/match_types.hpp"
#include "type/supported_file_type.hpp"
#include "type/type.hpp"

namespace takeoutrestore {
struct SidecarNameParts {
  std::string described_name_{};
  std::string counter_{};
  bool        supplemental_ = false;
};

/**
 * @brief The naming conventions Google Takeout applies to exported files. Google has changed
 * these over time, so every table here can be overridden from the configuration file.
 */
class NamingRules {
 public:
  // Suffixes Google appends to edited or derived copies, compared case-insensitively
  std::vector<std::string>        edit_suffixes_        = {
      "-edited",  "-bearbeitet", "-modifié",   "-editado", "-modificato",
      "-編集済み", "-EFFECTS",    "-ANIMATION", "-COLLAGE", "-PANO",
      "-MOTION"};

  // Segment inserted between the media name and ".json"; Google may cut it anywhere
  std::vector<std::string>        supplemental_markers_ = {"supplemental-metadata"};

  // Shortest described name, in code points, accepted as a truncated prefix
  size_t                          min_truncated_prefix_ = 20;

  std::unordered_set<std::string> image_extensions_     = default_image_extensions;
  std::unordered_set<std::string> video_extensions_     = default_video_extensions;

  static auto                     Defaults() -> NamingRules { return NamingRules{}; }

  /**
   * @brief Overlay the keys present in a "naming_rules" object onto this table
   *
   * @throws std::invalid_argument when a known key has the wrong type
   */
  void                            MergeJson(const nlohmann::json& node);
  auto                            ToJson() const -> nlohmann::json;

  auto                            ClassifyMedia(const media_path_t& path) const -> MediaKind;
  auto IsMedia(const media_path_t& path) const -> bool {
    return ClassifyMedia(path) != MediaKind::UNKNOWN;
  }
  auto IsKnownMediaExtension(const std::string& extension) const -> bool;

  /**
   * @brief "IMG_1.jpg" -> {"IMG_1", ".jpg"}. A leading dot is part of the base name.
   */
  static auto SplitExtension(const std::string& file_name) -> std::pair<std::string, std::string>;

  /**
   * @brief "photo(12)" -> {"photo", "(12)"}; names without a trailing counter come back whole
   */
  static auto SplitCounter(const std::string& name) -> std::pair<std::string, std::string>;

  /**
   * @brief Remove one known edit suffix from the end of a base name
   *
   * @return {unedited base, suffix as written} or nullopt
   */
  auto        SplitEditSuffix(const std::string& base_name) const
      -> std::optional<std::pair<std::string, std::string>>;

  auto        ParseSidecarName(const file_name_t& file_name) const -> SidecarNameParts;

  /**
   * @brief Strip counters and edit suffixes from a base name until none is left, then fold case
   */
  auto        NormalizeBase(const std::string& base_name) const -> std::string;
  auto        MediaLogicalName(const file_name_t& file_name) const -> std::string;
  // Like MediaLogicalName, but the extension is only dropped when it is a known media one
  auto        DescribedLogicalName(const std::string& described_name) const -> std::string;

  auto        IsTruncatedPrefix(const std::string& prefix, const std::string& full) const -> bool;

  auto        MakeMediaEntry(const media_path_t& path, entry_index_t index) const -> MediaEntry;
  auto        MakeSidecarEntry(const sidecar_path_t&                  path,
                               std::shared_ptr<const SidecarMetadata> metadata,
                               entry_index_t index) const -> SidecarEntry;
};
};  // namespace takeoutrestore
