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

#include "sidecar/sidecar_parser.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

#include "utils/clock/time_provider.hpp"
#include "utils/string/convert.hpp"

namespace takeoutrestore {
namespace {
constexpr std::array<const char*, 12> kMonthNames = {"jan", "feb", "mar", "apr", "may", "jun",
                                                     "jul", "aug", "sep", "oct", "nov", "dec"};

auto MonthFromName(const std::string& name) -> unsigned {
  const std::string folded = conv::FoldCase(name.substr(0, 3));
  for (size_t i = 0; i < kMonthNames.size(); ++i) {
    if (folded == kMonthNames[i]) {
      return static_cast<unsigned>(i + 1);
    }
  }
  return 0;
}

auto IsPlausibleDate(int year, unsigned month, unsigned day, unsigned hour, unsigned minute,
                     unsigned second) -> bool {
  return year >= 1800 && year <= 9999 && month >= 1 && month <= 12 && day >= 1 && day <= 31 &&
         hour <= 23 && minute <= 59 && second <= 60;
}

auto ReadDouble(const nlohmann::json& node, const char* key) -> double {
  if (!node.contains(key)) {
    return 0.0;
  }
  const auto& value = node[key];
  if (value.is_number()) {
    const double out = value.get<double>();
    return std::isfinite(out) ? out : 0.0;
  }
  if (value.is_string()) {
    try {
      const double out = std::stod(value.get<std::string>());
      return std::isfinite(out) ? out : 0.0;
    } catch (const std::exception&) {
      return 0.0;
    }
  }
  return 0.0;
}

auto ReadOptionalString(const nlohmann::json& payload, const char* key) -> std::string {
  if (payload.contains(key) && payload[key].is_string()) {
    return conv::SanitizeUtf8(payload[key].get<std::string>());
  }
  return {};
}
}  // namespace

auto SidecarParser::ParseFile(const sidecar_path_t& sidecar_path) -> SidecarMetadata {
  std::ifstream ifs(sidecar_path, std::ios::binary);
  if (!ifs.is_open()) {
    throw SidecarParseError("cannot open sidecar for reading");
  }
  std::ostringstream content;
  content << ifs.rdbuf();
  if (ifs.bad()) {
    throw SidecarParseError("I/O error while reading sidecar");
  }
  return ParseString(content.str());
}

auto SidecarParser::ParseString(const std::string& content) -> SidecarMetadata {
  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& e) {
    throw SidecarParseError(std::string("invalid JSON: ") + e.what());
  }
  return ParseJson(payload);
}

auto SidecarParser::ParseJson(const nlohmann::json& payload) -> SidecarMetadata {
  if (!payload.is_object()) {
    throw SidecarParseError("sidecar is not a JSON object");
  }
  if (!payload.contains("title") || !payload["title"].is_string()) {
    throw SidecarParseError("sidecar has no string \"title\" field");
  }

  SidecarMetadata metadata;
  metadata.title_       = conv::SanitizeUtf8(payload["title"].get<std::string>());
  metadata.description_ = ReadOptionalString(payload, "description");
  metadata.url_         = ReadOptionalString(payload, "url");

  if (payload.contains("photoTakenTime")) {
    metadata.photo_taken_time_ = ParseTimestamp(payload["photoTakenTime"]);
  }
  if (payload.contains("creationTime")) {
    metadata.creation_time_ = ParseTimestamp(payload["creationTime"]);
  }
  if (payload.contains("geoData")) {
    metadata.geo_data_ = ParseGeoData(payload["geoData"]);
  }
  if (payload.contains("geoDataExif")) {
    metadata.geo_data_exif_ = ParseGeoData(payload["geoDataExif"]);
  }

  if (payload.contains("people") && payload["people"].is_array()) {
    for (const auto& person : payload["people"]) {
      if (person.is_object() && person.contains("name") && person["name"].is_string()) {
        metadata.people_.push_back(conv::SanitizeUtf8(person["name"].get<std::string>()));
      }
    }
  }
  return metadata;
}

auto SidecarParser::ParseTimestamp(const nlohmann::json& node) -> std::optional<epoch_time_t> {
  if (!node.is_object()) {
    return std::nullopt;
  }

  if (node.contains("timestamp")) {
    const auto&                 value = node["timestamp"];
    std::optional<epoch_time_t> parsed;
    if (value.is_number_unsigned()) {
      const auto ts = value.get<uint64_t>();
      if (ts <= static_cast<uint64_t>(TimeProvider::kMaxSupportedTime)) {
        parsed = static_cast<epoch_time_t>(ts);
      }
    } else if (value.is_number_integer()) {
      parsed = value.get<epoch_time_t>();
    } else if (value.is_number_float()) {
      // Casting a double outside the integer range is undefined
      const double ts = value.get<double>();
      if (std::isfinite(ts) && ts > 0.0 &&
          ts <= static_cast<double>(TimeProvider::kMaxSupportedTime)) {
        parsed = static_cast<epoch_time_t>(ts);
      }
    } else if (value.is_string()) {
      try {
        size_t            consumed = 0;
        const std::string text     = value.get<std::string>();
        const long long   ts       = std::stoll(text, &consumed);
        if (consumed == text.size()) {
          parsed = static_cast<epoch_time_t>(ts);
        }
      } catch (const std::exception&) {
        parsed.reset();
      }
    }
    // Takeout writes "0" for unknown dates
    if (parsed.has_value() && *parsed > 0 && TimeProvider::IsSupportedTime(*parsed)) {
      return parsed;
    }
  }

  if (node.contains("formatted") && node["formatted"].is_string()) {
    return ParseFormattedTime(node["formatted"].get<std::string>());
  }
  return std::nullopt;
}

auto SidecarParser::ParseFormattedTime(const std::string& formatted)
    -> std::optional<epoch_time_t> {
  // "Jan 1, 2021, 12:00:00 AM UTC", the space before AM may be a U+202F
  char     month_name[16] = {};
  unsigned day = 0, hour = 0, minute = 0, second = 0;
  int      year     = 0;
  int      consumed = 0;
  if (std::sscanf(formatted.c_str(), "%15s %u, %d, %u:%u:%u%n", month_name, &day, &year, &hour,
                  &minute, &second, &consumed) == 6) {
    const unsigned month = MonthFromName(month_name);
    std::string    rest  = conv::FoldCase(formatted.substr(static_cast<size_t>(consumed)));
    if (rest.find("pm") != std::string::npos && hour < 12) {
      hour += 12;
    } else if (rest.find("am") != std::string::npos && hour == 12) {
      hour = 0;
    }
    if (month != 0 && IsPlausibleDate(year, month, day, hour, minute, second)) {
      return TimeProvider::FromCivil(year, month, day, hour, minute, second);
    }
    return std::nullopt;
  }

  // "2021-01-01 12:00:00"
  unsigned month = 0;
  if (std::sscanf(formatted.c_str(), "%d-%u-%u %u:%u:%u", &year, &month, &day, &hour, &minute,
                  &second) == 6 &&
      IsPlausibleDate(year, month, day, hour, minute, second)) {
    return TimeProvider::FromCivil(year, month, day, hour, minute, second);
  }
  return std::nullopt;
}

auto SidecarParser::ParseGeoData(const nlohmann::json& node) -> GeoLocation {
  GeoLocation location;
  if (!node.is_object()) {
    return location;
  }
  location.latitude_  = ReadDouble(node, "latitude");
  location.longitude_ = ReadDouble(node, "longitude");
  location.altitude_  = ReadDouble(node, "altitude");
  if (location.latitude_ < -90.0 || location.latitude_ > 90.0 || location.longitude_ < -180.0 ||
      location.longitude_ > 180.0) {
    return GeoLocation{};
  }
  return location;
}
};  // namespace takeoutrestore
