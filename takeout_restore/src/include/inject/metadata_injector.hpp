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

#include <exiv2/exiv2.hpp>
#include <string>
#include <system_error>
#include <vector>

#include "diagnostics/diagnostics_sink.hpp"
#include "sidecar/sidecar_metadata.hpp"
#include "type/type.hpp"

namespace takeoutrestore {
struct InjectionOptions {
  bool dry_run_           = false;
  // Set the file modification time to the best date of the sidecar
  bool update_file_dates_ = true;
};

struct InjectionResult {
  media_path_t             media_path_{};
  bool                     success_            = false;
  std::string              message_{};
  // Exiv2 keys written (or that would be written in a dry run)
  std::vector<std::string> tags_written_{};
  bool                     file_dates_updated_ = false;
};

class MetadataInjector {
 public:
  MetadataInjector(InjectionOptions options, DiagnosticsSink& sink)
      : options_(options), sink_(sink) {}

  /**
   * @brief Write the sidecar metadata into one media file. Formats Exiv2 cannot write only get
   * their file dates updated. Never throws for per-file problems, they end up in the result.
   *
   * @param media_path
   * @param metadata
   * @return InjectionResult
   */
  auto        Inject(const media_path_t& media_path, const SidecarMetadata& metadata) const
      -> InjectionResult;

  /**
   * @brief Date, GPS and description tags
   *
   * @return the keys that were set
   */
  static auto FillExif(const SidecarMetadata& metadata, Exiv2::ExifData& exif)
      -> std::vector<std::string>;
  static auto FillIptc(const SidecarMetadata& metadata, Exiv2::IptcData& iptc)
      -> std::vector<std::string>;
  static auto FillXmp(const SidecarMetadata& metadata, Exiv2::XmpData& xmp)
      -> std::vector<std::string>;

  /**
   * @brief Unsigned decimal degrees as an EXIF rational triple, "52/1 31/1 123456/10000"
   */
  static auto ToDmsRational(double degrees) -> std::string;

  static auto SetFileTime(const media_path_t& path, epoch_time_t time) -> std::error_code;

 private:
  auto WriteEmbedded(const media_path_t& media_path, const SidecarMetadata& metadata,
                     InjectionResult& result) const -> bool;

  InjectionOptions options_;
  DiagnosticsSink& sink_;
};
};  // namespace takeoutrestore
