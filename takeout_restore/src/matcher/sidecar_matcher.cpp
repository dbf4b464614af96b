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

#include "matcher/sidecar_matcher.hpp"

#include <stdexcept>
#include <utility>

#include "sidecar/sidecar_parser.hpp"

namespace takeoutrestore {
SidecarMatcher::SidecarMatcher(NamingRules rules, DiagnosticsSink& sink)
    : SidecarMatcher(std::move(rules), sink, MakeDefaultStrategyChain()) {}

SidecarMatcher::SidecarMatcher(NamingRules rules, DiagnosticsSink& sink, StrategyChain chain)
    : rules_(std::move(rules)), sink_(sink), chain_(std::move(chain)) {
  for (const auto& strategy : chain_) {
    if (!strategy) {
      throw std::invalid_argument("SidecarMatcher: null strategy in chain");
    }
  }
}

auto SidecarMatcher::BuildMediaEntries(const std::vector<media_path_t>& paths) const
    -> std::vector<MediaEntry> {
  std::vector<MediaEntry> entries;
  entries.reserve(paths.size());
  for (size_t i = 0; i < paths.size(); ++i) {
    entries.push_back(rules_.MakeMediaEntry(paths[i], i));
  }
  return entries;
}

auto SidecarMatcher::BuildSidecarEntries(const std::vector<sidecar_path_t>& paths,
                                         std::vector<UnreadableSidecar>&    unreadable) const
    -> std::vector<std::shared_ptr<const SidecarEntry>> {
  std::vector<std::shared_ptr<const SidecarEntry>> entries;
  entries.reserve(paths.size());
  for (size_t i = 0; i < paths.size(); ++i) {
    try {
      auto metadata = std::make_shared<const SidecarMetadata>(SidecarParser::ParseFile(paths[i]));
      entries.push_back(
          std::make_shared<const SidecarEntry>(rules_.MakeSidecarEntry(paths[i], metadata, i)));
    } catch (const SidecarParseError& e) {
      unreadable.push_back({paths[i], e.what()});
      sink_.Report({DiagnosticLevel::WARNING, DiagnosticKind::UNREADABLE_SIDECAR, paths[i],
                    std::string("unreadable sidecar: ") + e.what()});
    }
  }
  return entries;
}

auto SidecarMatcher::Match(const file_path_t& directory, const std::vector<MediaEntry>& media,
                           const std::vector<std::shared_ptr<const SidecarEntry>>& sidecars) const
    -> AlbumMatchReport {
  AlbumMatchReport report;
  report.directory_ = directory;
  report.results_.reserve(media.size());

  AlbumContext context{rules_, {}};
  for (const auto& entry : media) {
    context.media_names_.insert(entry.file_name_);
    MatchResult result;
    result.media_ = entry;
    report.results_.push_back(std::move(result));
  }

  SidecarPool pool(sidecars);
  for (const auto& strategy : chain_) {
    // Originals are offered each strategy before their edited and numbered copies
    for (const bool variants : {false, true}) {
      if (pool.ClaimedCount() == pool.Size()) break;
      for (auto& result : report.results_) {
        if (result.IsMatched() || result.media_.IsVariant() != variants) continue;
        PoolCandidate candidate = strategy->Find(result.media_, pool, context);
        if (!candidate.Found()) continue;

        const size_t slot = *candidate.slot_;
        pool.Claim(slot);
        result.sidecar_    = pool.Get(slot);
        result.strategy_   = strategy->Kind();
        result.confidence_ = strategy->Confidence();

        if (candidate.tie_count_ > 1) {
          sink_.Report({DiagnosticLevel::INFO, DiagnosticKind::AMBIGUOUS_MATCH,
                        result.media_.path_,
                        std::to_string(candidate.tie_count_) + " sidecars fit " +
                            StrategyKindToString(strategy->Kind()) + ", took " +
                            result.sidecar_->file_name_});
        }
        sink_.Report({DiagnosticLevel::DEBUG, DiagnosticKind::MATCHED, result.media_.path_,
                      "matched " + result.sidecar_->file_name_ + " [" +
                          StrategyKindToString(strategy->Kind()) + "]"});
      }
    }
  }

  for (const auto& result : report.results_) {
    if (!result.IsMatched()) {
      sink_.Report({DiagnosticLevel::WARNING, DiagnosticKind::NO_MATCH, result.media_.path_,
                    "no sidecar found for " + result.media_.file_name_});
    }
  }
  report.unconsumed_sidecars_ = pool.Unclaimed();
  for (const auto& sidecar : report.unconsumed_sidecars_) {
    // Album-level files such as metadata.json describe no media file
    const DiagnosticLevel level =
        DescribesMedia(*sidecar) ? DiagnosticLevel::WARNING : DiagnosticLevel::DEBUG;
    sink_.Report({level, DiagnosticKind::UNCONSUMED_SIDECAR, sidecar->path_,
                  "sidecar was not matched to any media file"});
  }
  return report;
}

auto SidecarMatcher::DescribesMedia(const SidecarEntry& sidecar) const -> bool {
  const auto has_media_extension = [this](const std::string& name) {
    const std::string extension = NamingRules::SplitExtension(name).second;
    return !extension.empty() && rules_.IsKnownMediaExtension(extension);
  };
  return has_media_extension(sidecar.described_name_) || has_media_extension(sidecar.Title());
}

auto SidecarMatcher::MatchAlbum(const Album& album) const -> AlbumMatchReport {
  std::vector<UnreadableSidecar> unreadable;
  auto                           sidecars = BuildSidecarEntries(album.sidecars_, unreadable);
  auto report = Match(album.directory_, BuildMediaEntries(album.media_), sidecars);
  report.unreadable_sidecars_ = std::move(unreadable);
  return report;
}
};  // namespace takeoutrestore
