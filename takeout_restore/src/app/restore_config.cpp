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

#include "app/restore_config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "utils/string/convert.hpp"

namespace takeoutrestore {
namespace {
auto ReadBool(const nlohmann::json& node, const char* key, bool fallback) -> bool {
  if (!node.contains(key)) {
    return fallback;
  }
  if (!node[key].is_boolean()) {
    throw std::invalid_argument(std::string(key) + " must be true or false");
  }
  return node[key].get<bool>();
}

auto ReadString(const nlohmann::json& node, const char* key) -> std::string {
  if (!node[key].is_string()) {
    throw std::invalid_argument(std::string(key) + " must be a string");
  }
  return node[key].get<std::string>();
}
}  // namespace

void RestoreConfig::MergeJson(const nlohmann::json& node) {
  if (!node.is_object()) {
    throw std::invalid_argument("configuration must be a JSON object");
  }
  if (node.contains("input_folder")) {
    input_folder_ = conv::Utf8ToPath(ReadString(node, "input_folder"));
  }
  recursive_         = ReadBool(node, "recursive", recursive_);
  delete_json_       = ReadBool(node, "delete_json_after_processing", delete_json_);
  update_file_dates_ = ReadBool(node, "update_file_dates", update_file_dates_);
  dry_run_           = ReadBool(node, "dry_run", dry_run_);

  if (node.contains("jobs")) {
    if (!node["jobs"].is_number_unsigned() || node["jobs"].get<size_t>() == 0) {
      throw std::invalid_argument("jobs must be a positive integer");
    }
    jobs_ = node["jobs"].get<size_t>();
  }
  if (node.contains("log_level")) {
    log_level_ = ParseLevel(ReadString(node, "log_level"));
  }
  if (node.contains("log_file")) {
    if (node["log_file"].is_null()) {
      log_file_.clear();
    } else {
      log_file_ = conv::Utf8ToPath(ReadString(node, "log_file"));
    }
  }
  if (node.contains("naming_rules")) {
    naming_rules_.MergeJson(node["naming_rules"]);
  }
}

auto RestoreConfig::LoadFile(const file_path_t& path) -> RestoreConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file for reading: " + conv::PathToUtf8(path));
  }

  nlohmann::json payload;
  try {
    file >> payload;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("invalid JSON in config file " + conv::PathToUtf8(path) + ": " +
                                e.what());
  }

  RestoreConfig config;
  config.MergeJson(payload);
  return config;
}

auto RestoreConfig::ToJson() const -> nlohmann::json {
  nlohmann::json out;
  out["input_folder"]                 = conv::PathToUtf8(input_folder_);
  out["recursive"]                    = recursive_;
  out["delete_json_after_processing"] = delete_json_;
  out["update_file_dates"]            = update_file_dates_;
  out["dry_run"]                      = dry_run_;
  out["jobs"]                         = jobs_;
  out["log_level"]                    = LevelToString(log_level_);
  if (!log_file_.empty()) {
    out["log_file"] = conv::PathToUtf8(log_file_);
  }
  out["naming_rules"] = naming_rules_.ToJson();
  return out;
}

void RestoreConfig::Validate() const {
  if (input_folder_.empty()) {
    throw std::invalid_argument("no input folder given, use --input or input_folder");
  }
  if (jobs_ == 0) {
    throw std::invalid_argument("jobs must be a positive integer");
  }
  if (naming_rules_.min_truncated_prefix_ == 0) {
    throw std::invalid_argument("naming_rules.min_truncated_prefix must be a positive integer");
  }
}
};  // namespace takeoutrestore
