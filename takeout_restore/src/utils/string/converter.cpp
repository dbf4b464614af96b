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

#include <utf8.h>

#include <cstdint>
#include <iterator>
#include <string>

#include "utils/string/convert.hpp"

namespace conv {
namespace {
auto FoldCodePoint(uint32_t cp) -> uint32_t {
  if (cp >= 'A' && cp <= 'Z') {
    return cp + 0x20;
  }
  // Latin-1 supplement capitals, except the multiplication sign
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
    return cp + 0x20;
  }
  return cp;
}
}  // namespace

auto PathToUtf8(const std::filesystem::path& path) -> std::string {
  auto u8 = path.u8string();
  return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
}

auto Utf8ToPath(const std::string& str) -> std::filesystem::path {
  std::u8string u8(reinterpret_cast<const char8_t*>(str.data()), str.size());
  return std::filesystem::path(u8);
}

auto IsValidUtf8(const std::string& str) -> bool { return utf8::is_valid(str.begin(), str.end()); }

auto SanitizeUtf8(const std::string& str) -> std::string {
  std::string out;
  utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(out));
  return out;
}

auto Utf8Length(const std::string& str) -> size_t {
  if (!IsValidUtf8(str)) {
    return str.size();
  }
  return static_cast<size_t>(utf8::distance(str.begin(), str.end()));
}

auto FoldCase(const std::string& str) -> std::string {
  if (!IsValidUtf8(str)) {
    std::string out = str;
    for (char& c : out) {
      if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 0x20);
    }
    return out;
  }
  std::string out;
  out.reserve(str.size());
  auto it = str.begin();
  while (it != str.end()) {
    const uint32_t cp = utf8::next(it, str.end());
    utf8::append(static_cast<char32_t>(FoldCodePoint(cp)), std::back_inserter(out));
  }
  return out;
}

auto EndsWithIgnoreCase(const std::string& text, const std::string& suffix) -> bool {
  if (suffix.empty()) return false;
  const std::string folded_text   = FoldCase(text);
  const std::string folded_suffix = FoldCase(suffix);
  if (folded_suffix.size() > folded_text.size()) return false;
  return folded_text.compare(folded_text.size() - folded_suffix.size(), folded_suffix.size(),
                             folded_suffix) == 0;
}
};  // namespace conv
