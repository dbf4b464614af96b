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
#include <optional>
#include <string>

#include "app/restore_config.hpp"

namespace takeoutrestore {
constexpr const char* kTakeoutRestoreVersion = "1.0.0";

/**
 * @brief Command line of the takeout_restore executable. Only options actually given are set,
 * so they can be laid over a configuration file.
 */
class Args {
 public:
  /**
   * @throws std::runtime_error on an unknown option or a missing or malformed value
   */
  Args(int argc, const char* argv[]);

  std::optional<std::string>     config_path_{};
  std::optional<std::string>     input_folder_{};
  std::optional<bool>            delete_json_{};
  std::optional<bool>            update_file_dates_{};
  std::optional<bool>            dry_run_{};
  std::optional<bool>            recursive_{};
  std::optional<size_t>          jobs_{};
  std::optional<DiagnosticLevel> log_level_{};
  std::optional<std::string>     log_file_{};
  bool                           print_help_    = false;
  bool                           print_version_ = false;

  void                           ApplyTo(RestoreConfig& config) const;

  static auto                    HelpText(const std::string& program) -> std::string;
};
};  // namespace takeoutrestore
