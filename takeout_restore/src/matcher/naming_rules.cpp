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

#include "matcher/naming_rules.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace takeoutrestore {
namespace {
auto ReadStringList(const nlohmann::json& node, const char* key) -> std::vector<std::string> {
  const auto& value = node[key];
  if (!value.is_array()) {
    throw std::invalid_argument(std::string("naming_rules.") + key + " must be an array");
  }
  std::vector<std::string> out;
  for (const auto& item : value) {
    if (!item.is_string()) {
      throw std::invalid_argument(std::string("naming_rules.") + key +
                                  " must only contain strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

auto ReadExtensionSet(const nlohmann::json& node, const char* key)
    -> std::unordered_set<std::string> {
  std::unordered_set<std::string> out;
  for (auto ext : ReadStringList(node, key)) {
    if (ext.empty()) continue;
    if (ext.front() != '.') ext.insert(ext.begin(), '.');
    out.insert(conv::FoldCase(ext));
  }
  return out;
}

auto SortedList(const std::unordered_set<std::string>& set) -> std::vector<std::string> {
  std::vector<std::string> out(set.begin(), set.end());
  std::sort(out.begin(), out.end());
  return out;
}

auto TrimTrailingSpace(std::string value) -> std::string {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.pop_back();
  }
  return value;
}
}  // namespace

void NamingRules::MergeJson(const nlohmann::json& node) {
  if (node.is_null()) {
    return;
  }
  if (!node.is_object()) {
    throw std::invalid_argument("naming_rules must be an object");
  }
  if (node.contains("edit_suffixes")) {
    edit_suffixes_ = ReadStringList(node, "edit_suffixes");
  }
  if (node.contains("supplemental_markers")) {
    supplemental_markers_ = ReadStringList(node, "supplemental_markers");
  }
  if (node.contains("min_truncated_prefix")) {
    const auto& value = node["min_truncated_prefix"];
    if (!value.is_number_unsigned()) {
      throw std::invalid_argument("naming_rules.min_truncated_prefix must be a positive integer");
    }
    min_truncated_prefix_ = value.get<size_t>();
  }
  if (node.contains("image_extensions")) {
    image_extensions_ = ReadExtensionSet(node, "image_extensions");
  }
  if (node.contains("video_extensions")) {
    video_extensions_ = ReadExtensionSet(node, "video_extensions");
  }
}

auto NamingRules::ToJson() const -> nlohmann::json {
  nlohmann::json out;
  out["edit_suffixes"]        = edit_suffixes_;
  out["supplemental_markers"] = supplemental_markers_;
  out["min_truncated_prefix"] = min_truncated_prefix_;
  out["image_extensions"]     = SortedList(image_extensions_);
  out["video_extensions"]     = SortedList(video_extensions_);
  return out;
}

auto NamingRules::ClassifyMedia(const media_path_t& path) const -> MediaKind {
  const std::string ext = LowercaseExtension(path);
  if (image_extensions_.count(ext) > 0) return MediaKind::IMAGE;
  if (video_extensions_.count(ext) > 0) return MediaKind::VIDEO;
  return MediaKind::UNKNOWN;
}

auto NamingRules::IsKnownMediaExtension(const std::string& extension) const -> bool {
  const std::string folded = conv::FoldCase(extension);
  return image_extensions_.count(folded) > 0 || video_extensions_.count(folded) > 0;
}

auto NamingRules::SplitExtension(const std::string& file_name)
    -> std::pair<std::string, std::string> {
  const auto dot = file_name.find_last_of('.');
  if (dot == std::string::npos || dot == 0) {
    return {file_name, std::string{}};
  }
  return {file_name.substr(0, dot), file_name.substr(dot)};
}

auto NamingRules::SplitCounter(const std::string& name) -> std::pair<std::string, std::string> {
  if (name.size() < 3 || name.back() != ')') {
    return {name, std::string{}};
  }
  const auto open = name.find_last_of('(');
  if (open == std::string::npos || open == 0 || open + 2 > name.size() - 1) {
    return {name, std::string{}};
  }
  for (size_t i = open + 1; i + 1 < name.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
      return {name, std::string{}};
    }
  }
  return {name.substr(0, open), name.substr(open)};
}

auto NamingRules::SplitEditSuffix(const std::string& base_name) const
    -> std::optional<std::pair<std::string, std::string>> {
  for (const auto& suffix : edit_suffixes_) {
    if (suffix.empty() || base_name.size() <= suffix.size()) {
      continue;
    }
    if (conv::EndsWithIgnoreCase(base_name, suffix)) {
      const size_t cut = base_name.size() - suffix.size();
      return std::make_pair(base_name.substr(0, cut), base_name.substr(cut));
    }
  }
  return std::nullopt;
}

auto NamingRules::ParseSidecarName(const file_name_t& file_name) const -> SidecarNameParts {
  SidecarNameParts parts;
  std::string      stem = file_name;
  if (conv::EndsWithIgnoreCase(stem, ".json")) {
    stem.resize(stem.size() - 5);
  }

  // "photo.jpg.supplemental-metadata(1).json": the counter goes after everything else
  auto [without_counter, counter] = SplitCounter(stem);
  parts.counter_                  = counter;
  stem                            = without_counter;

  const auto dot                  = stem.find_last_of('.');
  if (dot != std::string::npos && dot > 0) {
    const std::string segment = conv::FoldCase(stem.substr(dot + 1));
    for (const auto& marker : supplemental_markers_) {
      const std::string folded_marker = conv::FoldCase(marker);
      if (segment.size() <= folded_marker.size() &&
          folded_marker.compare(0, segment.size(), segment) == 0) {
        parts.supplemental_ = true;
        stem.resize(dot);
        break;
      }
    }
  }

  if (parts.supplemental_ && parts.counter_.empty()) {
    auto [inner, inner_counter] = SplitCounter(stem);
    if (!inner_counter.empty()) {
      parts.counter_ = inner_counter;
      stem           = inner;
    }
  }

  parts.described_name_ = stem;
  return parts;
}

auto NamingRules::NormalizeBase(const std::string& base_name) const -> std::string {
  std::string current = TrimTrailingSpace(base_name);
  bool        changed = true;
  while (changed && !current.empty()) {
    changed                 = false;
    auto [rest, counter]    = SplitCounter(current);
    if (!counter.empty()) {
      current = TrimTrailingSpace(rest);
      changed = true;
    }
    if (auto edit = SplitEditSuffix(current)) {
      current = TrimTrailingSpace(edit->first);
      changed = true;
    }
  }
  return conv::FoldCase(current);
}

auto NamingRules::MediaLogicalName(const file_name_t& file_name) const -> std::string {
  return NormalizeBase(SplitExtension(file_name).first);
}

auto NamingRules::DescribedLogicalName(const std::string& described_name) const -> std::string {
  auto [base, ext] = SplitExtension(described_name);
  if (!ext.empty() && IsKnownMediaExtension(ext)) {
    return NormalizeBase(base);
  }
  return NormalizeBase(described_name);
}

auto NamingRules::IsTruncatedPrefix(const std::string& prefix, const std::string& full) const
    -> bool {
  if (prefix.empty() || prefix.size() >= full.size()) {
    return false;
  }
  if (full.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  return conv::Utf8Length(prefix) >= min_truncated_prefix_;
}

auto NamingRules::MakeMediaEntry(const media_path_t& path, entry_index_t index) const
    -> MediaEntry {
  MediaEntry entry;
  entry.path_                = path;
  entry.file_name_           = conv::PathToUtf8(path.filename());
  entry.index_               = index;
  entry.kind_                = ClassifyMedia(path);

  auto [base, ext]           = SplitExtension(entry.file_name_);
  entry.base_name_           = base;
  entry.extension_           = ext;

  auto [counterless, counter] = SplitCounter(base);
  entry.counter_              = counter;
  entry.counterless_base_     = counterless;

  if (auto edit = SplitEditSuffix(counterless)) {
    entry.unedited_base_ = edit->first;
    entry.edit_suffix_   = edit->second;
  } else {
    entry.unedited_base_ = counterless;
  }
  entry.logical_name_ = NormalizeBase(base);
  return entry;
}

auto NamingRules::MakeSidecarEntry(const sidecar_path_t&                  path,
                                   std::shared_ptr<const SidecarMetadata> metadata,
                                   entry_index_t index) const -> SidecarEntry {
  SidecarEntry entry;
  entry.path_             = path;
  entry.file_name_        = conv::PathToUtf8(path.filename());
  entry.index_            = index;

  SidecarNameParts parts  = ParseSidecarName(entry.file_name_);
  entry.described_name_   = parts.described_name_;
  entry.counter_          = parts.counter_;
  entry.supplemental_     = parts.supplemental_;
  entry.logical_name_     = DescribedLogicalName(parts.described_name_);

  if (metadata && !metadata->title_.empty()) {
    entry.title_logical_name_ = MediaLogicalName(metadata->title_);
  }
  entry.metadata_ = std::move(metadata);
  return entry;
}
};  // namespace takeoutrestore
