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

#include "sidecar/sidecar_metadata.hpp"

namespace takeoutrestore {
auto SidecarMetadata::BestDate() const -> std::optional<epoch_time_t> {
  if (photo_taken_time_.has_value()) {
    return photo_taken_time_;
  }
  return creation_time_;
}

auto SidecarMetadata::BestGeoLocation() const -> GeoLocation {
  if (geo_data_exif_.IsValid()) {
    return geo_data_exif_;
  }
  return geo_data_;
}

auto SidecarMetadata::HasUsefulMetadata() const -> bool {
  return BestDate().has_value() || BestGeoLocation().IsValid() || !description_.empty() ||
         !people_.empty();
}

auto SidecarMetadata::ToJson() const -> nlohmann::json {
  nlohmann::json out;
  out["title"] = title_;
  if (!description_.empty()) {
    out["description"] = description_;
  }
  if (auto date = BestDate()) {
    out["date"] = *date;
  }
  const GeoLocation geo = BestGeoLocation();
  if (geo.IsValid()) {
    out["geo"] = {{"latitude", geo.latitude_},
                  {"longitude", geo.longitude_},
                  {"altitude", geo.altitude_}};
  }
  if (!people_.empty()) {
    out["people"] = people_;
  }
  return out;
}
};  // namespace takeoutrestore
