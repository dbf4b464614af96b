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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace takeoutrestore {
struct GeoLocation {
  double latitude_  = 0.0;
  double longitude_ = 0.0;
  double altitude_  = 0.0;

  // Google writes 0/0 when it has no location
  auto   IsValid() const -> bool { return !(latitude_ == 0.0 && longitude_ == 0.0); }
};

/**
 * @brief Typed view of a Google Takeout sidecar. Only the title is mandatory, everything else
 * stays empty when the sidecar does not carry it.
 */
struct SidecarMetadata {
  std::string                 title_{};
  std::string                 description_{};
  std::optional<epoch_time_t> photo_taken_time_{};
  std::optional<epoch_time_t> creation_time_{};
  GeoLocation                 geo_data_{};
  GeoLocation                 geo_data_exif_{};
  std::vector<std::string>    people_{};
  std::string                 url_{};

  /**
   * @brief Photo taken time if present, creation time otherwise
   */
  auto                        BestDate() const -> std::optional<epoch_time_t>;

  /**
   * @brief The EXIF-sourced location wins over the one Google inferred
   */
  auto                        BestGeoLocation() const -> GeoLocation;

  auto                        HasUsefulMetadata() const -> bool;

  auto                        ToJson() const -> nlohmann::json;
};
};  // namespace takeoutrestore
