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

#include "cleanup/sidecar_cleaner.hpp"

#include <system_error>

#include "type/supported_file_type.hpp"

namespace takeoutrestore {
void SidecarCleaner::Delete(const sidecar_path_t& path, CleanupResult& result) const {
  ++result.total_;
  if (!is_sidecar_file(path)) {
    sink_.Warning("not a JSON file, skipping", path);
    ++result.skipped_;
    return;
  }

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      result.failed_.emplace_back(path, ec.message());
      sink_.Report({DiagnosticLevel::WARNING, DiagnosticKind::CLEANUP_FAILED, path, ec.message()});
      return;
    }
    sink_.Debug("already gone", path);
    ++result.deleted_;
    result.deleted_files_.push_back(path);
    return;
  }

  if (dry_run_) {
    sink_.Debug("would delete", path);
    ++result.deleted_;
    result.deleted_files_.push_back(path);
    return;
  }

  if (!fs::remove(path, ec) && ec) {
    result.failed_.emplace_back(path, ec.message());
    sink_.Report({DiagnosticLevel::WARNING, DiagnosticKind::CLEANUP_FAILED, path,
                  "could not delete sidecar: " + ec.message()});
    return;
  }
  sink_.Debug("deleted", path);
  ++result.deleted_;
  result.deleted_files_.push_back(path);
}

auto SidecarCleaner::DeleteAll(const std::vector<sidecar_path_t>& paths) const -> CleanupResult {
  sink_.Info(std::string(dry_run_ ? "would delete " : "deleting ") + std::to_string(paths.size()) +
             " sidecar(s)");
  CleanupResult result;
  for (const auto& path : paths) {
    Delete(path, result);
  }
  sink_.Info("cleanup complete: " + std::to_string(result.deleted_) + " deleted, " +
             std::to_string(result.FailedCount()) + " failed, " + std::to_string(result.skipped_) +
             " skipped");
  return result;
}
};  // namespace takeoutrestore
