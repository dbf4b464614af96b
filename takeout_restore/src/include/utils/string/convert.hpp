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
#include <filesystem>
#include <string>

namespace conv {
auto PathToUtf8(const std::filesystem::path& path) -> std::string;
auto Utf8ToPath(const std::string& str) -> std::filesystem::path;

auto IsValidUtf8(const std::string& str) -> bool;
// Invalid sequences are replaced with U+FFFD
auto SanitizeUtf8(const std::string& str) -> std::string;

/**
 * @brief Number of code points in a UTF-8 string. Invalid input is counted byte-wise.
 */
auto Utf8Length(const std::string& str) -> size_t;

/**
 * @brief Simple case folding: ASCII and the Latin-1 supplement letters. Other code points are
 * copied unchanged.
 */
auto FoldCase(const std::string& str) -> std::string;

auto EndsWithIgnoreCase(const std::string& text, const std::string& suffix) -> bool;
};  // namespace conv
