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
#include <nlohmann/json.hpp>

#include "diagnostics/diagnostics_sink.hpp"
#include "matcher/naming_rules.hpp"
#include "type/type.hpp"

namespace takeoutrestore {
/**
 * @brief Everything one run needs. Built from defaults, then the JSON file, then the command
 * line, each layer overriding the previous one.
 */
struct RestoreConfig {
  file_path_t     input_folder_{};
  bool            recursive_         = true;
  bool            delete_json_       = true;
  bool            update_file_dates_ = true;
  bool            dry_run_           = false;
  // Albums matched in parallel, 1 matches inline
  size_t          jobs_              = 1;
  DiagnosticLevel log_level_         = DiagnosticLevel::INFO;
  file_path_t     log_file_{};
  NamingRules     naming_rules_{};

  /**
   * @brief Overlay the keys present in node. Unknown keys are ignored.
   *
   * @throws std::invalid_argument when a known key has the wrong type or value
   */
  void            MergeJson(const nlohmann::json& node);

  /**
   * @brief Defaults overlaid with a JSON configuration file
   *
   * @throws std::runtime_error when the file cannot be read
   * @throws std::invalid_argument when it is not valid JSON or carries bad values
   */
  static auto     LoadFile(const file_path_t& path) -> RestoreConfig;

  auto            ToJson() const -> nlohmann::json;

  /**
   * @throws std::invalid_argument when the configuration cannot run
   */
  void            Validate() const;
};
};  // namespace takeoutrestore
