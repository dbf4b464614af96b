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

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

namespace takeoutrestore {
// Default allow-lists, lowercase. NamingRules copies them and may be overridden by config.
static const std::unordered_set<std::string> default_image_extensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif", ".webp", ".heic", ".heif",
    ".raw", ".cr2",  ".nef", ".arw", ".dng", ".orf",  ".rw2", ".pef",  ".srw"};

static const std::unordered_set<std::string> default_video_extensions = {
    ".mp4", ".mov", ".avi", ".mkv", ".wmv", ".flv",  ".webm", ".m4v",
    ".3gp", ".3g2", ".mts", ".m2ts", ".mpg", ".mpeg"};

// Formats Exiv2 can write metadata back into
static const std::unordered_set<std::string> exiv2_writable_extensions = {
    ".jpg", ".jpeg", ".png", ".tiff", ".tif", ".webp", ".dng", ".nef",
    ".cr2", ".arw",  ".orf", ".pef",  ".srw"};

inline auto LowercaseExtension(const fs::path& path) -> std::string {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

inline bool is_sidecar_file(const fs::path& path) { return LowercaseExtension(path) == ".json"; }

inline bool is_exiv2_writable(const fs::path& path) {
  return exiv2_writable_extensions.count(LowercaseExtension(path)) > 0;
}
};  // namespace takeoutrestore
