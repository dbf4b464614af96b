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

#include "app/restore_service.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "cleanup/sidecar_cleaner.hpp"
#include "concurrency/thread_pool.hpp"
#include "inject/metadata_injector.hpp"
#include "matcher/sidecar_matcher.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/string/convert.hpp"

namespace takeoutrestore {
namespace {
const std::string kRule(60, '=');
const std::string kStepRule(40, '-');
}  // namespace

RestoreService::RestoreService(RestoreConfig config, DiagnosticsSink& sink)
    : config_(std::move(config)), sink_(sink) {}

auto RestoreService::MatchAll(const ScanResult& scan) const -> std::vector<AlbumMatchReport> {
  const SidecarMatcher          matcher(config_.naming_rules_, sink_);
  std::vector<AlbumMatchReport> reports(scan.albums_.size());

  if (config_.jobs_ <= 1 || scan.albums_.size() <= 1) {
    for (size_t i = 0; i < scan.albums_.size(); ++i) {
      reports[i] = matcher.MatchAlbum(scan.albums_[i]);
    }
    return reports;
  }

  std::vector<std::exception_ptr> errors(scan.albums_.size());
  {
    ThreadPool pool(std::min(config_.jobs_, scan.albums_.size()));
    for (size_t i = 0; i < scan.albums_.size(); ++i) {
      pool.Submit([&, i]() {
        try {
          reports[i] = matcher.MatchAlbum(scan.albums_[i]);
        } catch (...) {
          errors[i] = std::current_exception();
        }
      });
    }
    pool.WaitIdle();
  }
  for (const auto& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
  return reports;
}

void RestoreService::Inject(const std::vector<AlbumMatchReport>& reports, RestoreStats& stats,
                            std::vector<sidecar_path_t>& processed) const {
  const MetadataInjector injector({config_.dry_run_, config_.update_file_dates_}, sink_);
  for (const auto& report : reports) {
    for (const auto& result : report.results_) {
      if (!result.IsMatched() || !result.sidecar_->metadata_) continue;

      const SidecarMetadata& metadata = *result.sidecar_->metadata_;
      if (!metadata.HasUsefulMetadata()) {
        ++stats.no_metadata_;
        processed.push_back(result.sidecar_->path_);
        continue;
      }

      InjectionResult injection = injector.Inject(result.media_.path_, metadata);
      if (injection.success_) {
        ++stats.injected_;
        processed.push_back(result.sidecar_->path_);
      } else {
        ++stats.injection_failed_;
        stats.failed_media_.push_back(result.media_.path_);
        sink_.Warning("failed: " + injection.message_, result.media_.path_);
      }
    }
  }
}

auto RestoreService::Run() -> RestoreStats {
  config_.Validate();
  TimeProvider::Refresh();

  RestoreStats stats;
  sink_.Info(kRule);
  sink_.Info("Google Takeout metadata restore");
  sink_.Info(kRule);
  if (config_.dry_run_) {
    sink_.Info("DRY RUN: no file will be changed");
  }

  sink_.Info(kStepRule);
  sink_.Info("Step 1: scanning " + conv::PathToUtf8(config_.input_folder_));
  const AlbumScanner scanner(config_.naming_rules_, sink_);
  const ScanResult   scan = scanner.Scan(config_.input_folder_, config_.recursive_);
  stats.albums_         = scan.albums_.size();
  stats.media_found_    = scan.media_count_;
  stats.sidecars_found_ = scan.sidecar_count_;

  sink_.Info(kStepRule);
  sink_.Info("Step 2: matching media files with sidecars");
  const auto reports = MatchAll(scan);
  for (const auto& report : reports) {
    stats.media_matched_ += report.MatchedCount();
    for (const auto& result : report.results_) {
      if (result.IsMatched()) {
        ++stats.by_strategy_[result.strategy_];
      } else {
        stats.unmatched_media_.push_back(result.media_.path_);
      }
    }
    for (const auto& sidecar : report.unconsumed_sidecars_) {
      stats.unconsumed_sidecars_.push_back(sidecar->path_);
    }
    stats.unreadable_sidecars_.insert(stats.unreadable_sidecars_.end(),
                                      report.unreadable_sidecars_.begin(),
                                      report.unreadable_sidecars_.end());
  }
  sink_.Info("matched " + std::to_string(stats.media_matched_) + " of " +
             std::to_string(stats.media_found_) + " media file(s)");

  sink_.Info(kStepRule);
  sink_.Info("Step 3: injecting metadata");
  std::vector<sidecar_path_t> processed;
  Inject(reports, stats, processed);

  if (config_.delete_json_ && !processed.empty()) {
    sink_.Info(kStepRule);
    sink_.Info("Step 4: cleaning up sidecars");
    const SidecarCleaner cleaner(config_.dry_run_, sink_);
    const CleanupResult  cleanup = cleaner.DeleteAll(processed);
    stats.sidecars_deleted_      = cleanup.deleted_;
    stats.cleanup_failed_        = cleanup.FailedCount();
  }

  stats.duration_seconds_ = TimeProvider::ElapsedSeconds();
  LogSummary(stats);
  return stats;
}

void RestoreService::LogSummary(const RestoreStats& stats) const {
  sink_.Info(kRule);
  sink_.Info("SUMMARY");
  sink_.Info(kRule);
  sink_.Info("Duration: " + TimeProvider::FormatDuration(stats.duration_seconds_));
  sink_.Info("Albums: " + std::to_string(stats.albums_));
  sink_.Info("Media files found: " + std::to_string(stats.media_found_));
  sink_.Info("Media files matched: " + std::to_string(stats.media_matched_));
  for (const auto& [kind, count] : stats.by_strategy_) {
    sink_.Info(std::string("  ") + StrategyKindToString(kind) + ": " + std::to_string(count));
  }
  sink_.Info("Media files without sidecar: " + std::to_string(stats.unmatched_media_.size()));
  sink_.Info("Unconsumed sidecars: " + std::to_string(stats.unconsumed_sidecars_.size()));
  sink_.Info("Unreadable sidecars: " + std::to_string(stats.unreadable_sidecars_.size()));
  sink_.Info(std::string(config_.dry_run_ ? "Metadata that would be injected: "
                                          : "Metadata injected: ") +
             std::to_string(stats.injected_));
  if (stats.no_metadata_ > 0) {
    sink_.Info("Sidecars without useful metadata: " + std::to_string(stats.no_metadata_));
  }
  if (stats.injection_failed_ > 0) {
    sink_.Info("Metadata injection failed: " + std::to_string(stats.injection_failed_));
  }
  if (config_.delete_json_) {
    sink_.Info(std::string(config_.dry_run_ ? "Sidecars that would be deleted: "
                                            : "Sidecars deleted: ") +
               std::to_string(stats.sidecars_deleted_));
  }

  if (!stats.unmatched_media_.empty()) {
    sink_.Info("Media files without sidecar:");
    for (const auto& path : stats.unmatched_media_) {
      sink_.Info("  " + conv::PathToUtf8(path));
    }
  }
  if (!stats.unconsumed_sidecars_.empty()) {
    sink_.Info("Sidecars not matched to any media file:");
    for (const auto& path : stats.unconsumed_sidecars_) {
      sink_.Info("  " + conv::PathToUtf8(path));
    }
  }
  if (!stats.unreadable_sidecars_.empty()) {
    sink_.Info("Unreadable sidecars:");
    for (const auto& unreadable : stats.unreadable_sidecars_) {
      sink_.Info("  " + conv::PathToUtf8(unreadable.path_) + ": " + unreadable.reason_);
    }
  }
  if (!stats.failed_media_.empty()) {
    sink_.Info("Media files where injection failed:");
    for (const auto& path : stats.failed_media_) {
      sink_.Info("  " + conv::PathToUtf8(path));
    }
  }
  sink_.Info(kRule);
}
};  // namespace takeoutrestore
