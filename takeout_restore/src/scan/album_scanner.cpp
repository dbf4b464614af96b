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

#include "scan/album_scanner.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "type/supported_file_type.hpp"
#include "utils/string/convert.hpp"

namespace takeoutrestore {
namespace {
auto ByFileName(const fs::path& lhs, const fs::path& rhs) -> bool {
  return lhs.filename() < rhs.filename();
}
}  // namespace

auto AlbumScanner::ScanDirectory(const file_path_t& directory, ScanResult& result) const
    -> Album {
  Album album;
  album.directory_ = directory;

  std::error_code ec;
  fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    sink_.Warning("cannot list directory: " + ec.message(), directory);
    ++result.skipped_dirs_;
    return album;
  }

  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      sink_.Warning("directory listing interrupted: " + ec.message(), directory);
      ++result.skipped_dirs_;
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }
    const fs::path& path = it->path();
    if (is_sidecar_file(path)) {
      album.sidecars_.push_back(path);
    } else if (rules_.IsMedia(path)) {
      album.media_.push_back(path);
    } else {
      ++result.ignored_count_;
      sink_.Debug("ignoring file of unknown type", path);
    }
  }

  std::sort(album.media_.begin(), album.media_.end(), ByFileName);
  std::sort(album.sidecars_.begin(), album.sidecars_.end(), ByFileName);
  result.media_count_ += album.media_.size();
  result.sidecar_count_ += album.sidecars_.size();
  return album;
}

auto AlbumScanner::Scan(const file_path_t& root, bool recursive) const -> ScanResult {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw std::runtime_error("input folder is not a directory: " + conv::PathToUtf8(root));
  }

  std::vector<fs::path> directories{root};
  if (recursive) {
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      throw std::runtime_error("cannot read input folder " + conv::PathToUtf8(root) + ": " +
                               ec.message());
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
      if (ec) {
        sink_.Warning("directory walk interrupted: " + ec.message(), root);
        break;
      }
      std::error_code type_ec;
      if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
        directories.push_back(it->path());
      }
    }
  }
  std::sort(directories.begin(), directories.end());

  ScanResult result;
  for (const auto& directory : directories) {
    Album album = ScanDirectory(directory, result);
    if (!album.Empty()) {
      result.albums_.push_back(std::move(album));
    }
  }
  sink_.Info("scanned " + std::to_string(result.albums_.size()) + " album(s): " +
             std::to_string(result.media_count_) + " media, " +
             std::to_string(result.sidecar_count_) + " sidecar(s)");
  return result;
}
};  // namespace takeoutrestore
