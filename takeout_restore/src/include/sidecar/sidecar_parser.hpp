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
#include <stdexcept>
#include <string>

#include "sidecar/sidecar_metadata.hpp"
#include "type/type.hpp"

namespace takeoutrestore {
class SidecarParseError : public std::runtime_error {
 public:
  explicit SidecarParseError(const std::string& what) : std::runtime_error(what) {}
};

class SidecarParser {
 public:
  /**
   * @brief Read and parse a sidecar file
   *
   * @param sidecar_path
   * @return SidecarMetadata
   * @throws SidecarParseError when the file cannot be read, is not a JSON object or carries no
   * string title
   */
  static auto ParseFile(const sidecar_path_t& sidecar_path) -> SidecarMetadata;
  static auto ParseString(const std::string& content) -> SidecarMetadata;
  static auto ParseJson(const nlohmann::json& payload) -> SidecarMetadata;

  /**
   * @brief Parse a {"timestamp": "...", "formatted": "..."} object. The numeric timestamp may be
   * a string or a number; "formatted" is only consulted when it is missing or unusable.
   */
  static auto ParseTimestamp(const nlohmann::json& node) -> std::optional<epoch_time_t>;

  /**
   * @brief Parse Google's "Jan 1, 2021, 12:00:00 AM UTC" rendering
   */
  static auto ParseFormattedTime(const std::string& formatted) -> std::optional<epoch_time_t>;

  static auto ParseGeoData(const nlohmann::json& node) -> GeoLocation;
};
};  // namespace takeoutrestore
