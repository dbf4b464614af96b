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

#include "inject/metadata_injector.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include "type/supported_file_type.hpp"
#include "utils/clock/time_provider.hpp"

namespace takeoutrestore {
namespace {
// 1/10000 of an arc second
constexpr long long kDmsUnitsPerDegree = 3600LL * 10000LL;

auto CanWrite(const Exiv2::Image& image, Exiv2::MetadataId id) -> bool {
  return (image.checkMode(id) & Exiv2::amWrite) != 0;
}

void Append(std::vector<std::string>& into, const std::vector<std::string>& from) {
  into.insert(into.end(), from.begin(), from.end());
}
}  // namespace

auto MetadataInjector::ToDmsRational(double degrees) -> std::string {
  const long long units =
      std::llround(std::fabs(degrees) * static_cast<double>(kDmsUnitsPerDegree));
  const long long deg     = units / kDmsUnitsPerDegree;
  const long long rest    = units % kDmsUnitsPerDegree;
  const long long minutes = rest / (60LL * 10000LL);
  const long long seconds = rest % (60LL * 10000LL);
  return std::to_string(deg) + "/1 " + std::to_string(minutes) + "/1 " + std::to_string(seconds) +
         "/10000";
}

auto MetadataInjector::FillExif(const SidecarMetadata& metadata, Exiv2::ExifData& exif)
    -> std::vector<std::string> {
  std::vector<std::string> keys;
  auto                     set = [&](const std::string& key, const std::string& value) {
    exif[key] = value;
    keys.push_back(key);
  };

  if (auto date = metadata.BestDate()) {
    const std::string stamp = TimeProvider::FormatExifDateTime(*date);
    set("Exif.Photo.DateTimeOriginal", stamp);
    set("Exif.Photo.DateTimeDigitized", stamp);
    set("Exif.Image.DateTime", stamp);
    // Takeout timestamps are UTC
    set("Exif.Photo.OffsetTimeOriginal", "+00:00");
  }

  const GeoLocation geo = metadata.BestGeoLocation();
  if (geo.IsValid()) {
    set("Exif.GPSInfo.GPSVersionID", "2 2 0 0");
    set("Exif.GPSInfo.GPSLatitudeRef", geo.latitude_ >= 0.0 ? "N" : "S");
    set("Exif.GPSInfo.GPSLatitude", ToDmsRational(geo.latitude_));
    set("Exif.GPSInfo.GPSLongitudeRef", geo.longitude_ >= 0.0 ? "E" : "W");
    set("Exif.GPSInfo.GPSLongitude", ToDmsRational(geo.longitude_));
    if (geo.altitude_ != 0.0) {
      set("Exif.GPSInfo.GPSAltitudeRef", geo.altitude_ >= 0.0 ? "0" : "1");
      set("Exif.GPSInfo.GPSAltitude",
          std::to_string(std::llround(std::fabs(geo.altitude_) * 100.0)) + "/100");
    }
  }

  if (!metadata.description_.empty()) {
    set("Exif.Image.ImageDescription", metadata.description_);
  }
  return keys;
}

auto MetadataInjector::FillIptc(const SidecarMetadata& metadata, Exiv2::IptcData& iptc)
    -> std::vector<std::string> {
  std::vector<std::string> keys;
  auto                     set = [&](const std::string& key, const std::string& value) {
    iptc[key] = value;
    keys.push_back(key);
  };

  if (auto date = metadata.BestDate()) {
    set("Iptc.Application2.DateCreated", TimeProvider::FormatIptcDate(*date));
    set("Iptc.Application2.TimeCreated", TimeProvider::FormatIptcTime(*date));
  }
  if (!metadata.description_.empty()) {
    // ESC % G: the IPTC records are UTF-8
    set("Iptc.Envelope.CharacterSet", "\x1b%G");
    set("Iptc.Application2.Caption", metadata.description_);
  }
  return keys;
}

auto MetadataInjector::FillXmp(const SidecarMetadata& metadata, Exiv2::XmpData& xmp)
    -> std::vector<std::string> {
  std::vector<std::string> keys;

  if (auto date = metadata.BestDate()) {
    xmp["Xmp.photoshop.DateCreated"] = TimeProvider::FormatIso8601(*date);
    keys.emplace_back("Xmp.photoshop.DateCreated");
  }
  if (!metadata.description_.empty()) {
    // A plain string lands in the x-default language slot
    xmp["Xmp.dc.description"] = metadata.description_;
    keys.emplace_back("Xmp.dc.description");
  }
  if (!metadata.people_.empty()) {
    const Exiv2::XmpKey key("Xmp.iptcExt.PersonInImage");
    auto                pos = xmp.findKey(key);
    if (pos != xmp.end()) {
      xmp.erase(pos);
    }
    Exiv2::XmpArrayValue people(Exiv2::xmpBag);
    for (const auto& name : metadata.people_) {
      people.read(name);
    }
    xmp.add(key, &people);
    keys.push_back(key.key());
  }
  return keys;
}

auto MetadataInjector::SetFileTime(const media_path_t& path, epoch_time_t time)
    -> std::error_code {
  if (!TimeProvider::IsSupportedTime(time)) {
    return std::make_error_code(std::errc::value_too_large);
  }
  const auto sys_time  = std::chrono::sys_seconds{std::chrono::seconds{time}};
  // Still whole seconds here; the narrower file_time_type range is checked before converting
  const auto file_time = std::chrono::file_clock::from_sys(sys_time);
  if (file_time < std::chrono::time_point_cast<std::chrono::seconds>(fs::file_time_type::min()) ||
      file_time > std::chrono::time_point_cast<std::chrono::seconds>(fs::file_time_type::max())) {
    return std::make_error_code(std::errc::value_too_large);
  }
  std::error_code ec;
  fs::last_write_time(path, file_time, ec);
  return ec;
}

auto MetadataInjector::WriteEmbedded(const media_path_t& media_path,
                                     const SidecarMetadata& metadata,
                                     InjectionResult&       result) const -> bool {
  try {
    Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(media_path.string());
    image->readMetadata();

    std::vector<std::string> keys;
    if (CanWrite(*image, Exiv2::mdExif)) {
      Append(keys, FillExif(metadata, image->exifData()));
    }
    if (CanWrite(*image, Exiv2::mdIptc)) {
      Append(keys, FillIptc(metadata, image->iptcData()));
    }
    if (CanWrite(*image, Exiv2::mdXmp)) {
      Append(keys, FillXmp(metadata, image->xmpData()));
    }
    if (!keys.empty()) {
      image->writeMetadata();
    }
    result.tags_written_ = std::move(keys);
    return true;
  } catch (const Exiv2::Error& e) {
    result.message_ = std::string("Exiv2: ") + e.what();
    return false;
  }
}

auto MetadataInjector::Inject(const media_path_t&    media_path,
                              const SidecarMetadata& metadata) const -> InjectionResult {
  InjectionResult result;
  result.media_path_ = media_path;

  std::error_code ec;
  if (!fs::is_regular_file(media_path, ec)) {
    result.message_ = "file does not exist";
    sink_.Report({DiagnosticLevel::ERROR, DiagnosticKind::INJECTION_FAILED, media_path,
                  result.message_});
    return result;
  }
  if (!metadata.HasUsefulMetadata()) {
    result.success_ = true;
    result.message_ = "no useful metadata to inject";
    sink_.Debug(result.message_, media_path);
    return result;
  }

  const bool writable = is_exiv2_writable(media_path);
  const auto date     = metadata.BestDate();
  if (date && !TimeProvider::IsSupportedTime(*date)) {
    result.message_ = "date " + std::to_string(*date) + " is out of range";
    sink_.Report({DiagnosticLevel::ERROR, DiagnosticKind::INJECTION_FAILED, media_path,
                  result.message_});
    return result;
  }

  if (options_.dry_run_) {
    if (writable) {
      Exiv2::ExifData exif;
      Exiv2::IptcData iptc;
      Exiv2::XmpData  xmp;
      Append(result.tags_written_, FillExif(metadata, exif));
      Append(result.tags_written_, FillIptc(metadata, iptc));
      Append(result.tags_written_, FillXmp(metadata, xmp));
    }
    result.success_ = true;
    result.message_ = "dry run: would write " + std::to_string(result.tags_written_.size()) +
                      " tag(s)" +
                      (options_.update_file_dates_ && date ? " and update file dates" : "");
    sink_.Debug(result.message_, media_path);
    sink_.Debug("sidecar metadata " +
                    metadata.ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                media_path);
    return result;
  }

  if (writable && !WriteEmbedded(media_path, metadata, result)) {
    sink_.Report({DiagnosticLevel::ERROR, DiagnosticKind::INJECTION_FAILED, media_path,
                  result.message_});
    return result;
  }

  if (options_.update_file_dates_ && date) {
    // After the Exiv2 write, which touches the modification time itself
    ec = SetFileTime(media_path, *date);
    if (ec) {
      sink_.Warning("could not update file dates: " + ec.message(), media_path);
    } else {
      result.file_dates_updated_ = true;
    }
  }

  result.success_ = true;
  if (writable) {
    result.message_ = "wrote " + std::to_string(result.tags_written_.size()) + " tag(s)";
  } else if (result.file_dates_updated_) {
    result.message_ = "updated file dates only";
  } else {
    result.message_ = "format cannot carry embedded metadata, nothing written";
  }
  sink_.Debug(result.message_, media_path);
  return result;
}
};  // namespace takeoutrestore
