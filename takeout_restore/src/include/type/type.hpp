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
#include <cstdint>
#include <filesystem>
#include <string>

namespace takeoutrestore {

// Paths handed around the pipeline
#define media_path_t   std::filesystem::path
#define sidecar_path_t std::filesystem::path
#define file_path_t    std::filesystem::path

// UTF-8 encoded file name (no directory part)
#define file_name_t    std::string

// Position of an entry inside its album listing, used for tie-breaking
#define entry_index_t  size_t

// Seconds since the unix epoch, as stored by Google Takeout
#define epoch_time_t   int64_t

enum class MediaKind : uint8_t { UNKNOWN = 0, IMAGE, VIDEO };
};  // namespace takeoutrestore
