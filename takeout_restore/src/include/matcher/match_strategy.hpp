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

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "matcher/match_types.hpp"
#include "matcher/naming_rules.hpp"
#include "matcher/sidecar_pool.hpp"

namespace takeoutrestore {
/**
 * @brief What a strategy may know about the album besides the media file it is asked about
 */
struct AlbumContext {
  const NamingRules&              rules_;
  std::unordered_set<std::string> media_names_{};

  auto HasMedia(const std::string& file_name) const -> bool {
    return media_names_.count(file_name) > 0;
  }
};

class IMatchStrategy {
 public:
  virtual ~IMatchStrategy()                    = default;

  virtual auto Kind() const -> MatchStrategyKind = 0;
  virtual auto Confidence() const -> float       = 0;

  /**
   * @brief Look for an unclaimed sidecar for one media file. Must not claim anything.
   */
  virtual auto Find(const MediaEntry& media, const SidecarPool& pool,
                    const AlbumContext& context) const -> PoolCandidate = 0;
};

// "photo.jpg" <- "photo.jpg.json"
class ExactStrategy final : public IMatchStrategy {
 public:
  auto Kind() const -> MatchStrategyKind override { return MatchStrategyKind::EXACT; }
  auto Confidence() const -> float override { return 1.0f; }
  auto Find(const MediaEntry& media, const SidecarPool& pool, const AlbumContext& context) const
      -> PoolCandidate override;
};

// "photo.jpg" <- "photo.jpg.supplemental-metadata.json", "photo.jpg.supp.json", ...
class SupplementalStrategy final : public IMatchStrategy {
 public:
  auto Kind() const -> MatchStrategyKind override { return MatchStrategyKind::SUPPLEMENTAL; }
  auto Confidence() const -> float override { return 1.0f; }
  auto Find(const MediaEntry& media, const SidecarPool& pool, const AlbumContext& context) const
      -> PoolCandidate override;
};

/**
 * @brief Long names are cut before ".json" is appended, so the sidecar only carries a prefix of
 * the media file name. Duplicates and edited copies are left to their own strategies.
 */
class TruncatedStrategy final : public IMatchStrategy {
 public:
  auto Kind() const -> MatchStrategyKind override { return MatchStrategyKind::TRUNCATED; }
  auto Confidence() const -> float override { return 0.8f; }
  auto Find(const MediaEntry& media, const SidecarPool& pool, const AlbumContext& context) const
      -> PoolCandidate override;
};

/**
 * @brief "photo(1).jpg" <- "photo.jpg(1).json", then "photo(1).json", then a truncated name with
 * the same counter, and last the plain "photo.jpg.json" when "photo.jpg" itself is absent.
 */
class DuplicateSuffixStrategy final : public IMatchStrategy {
 public:
  auto Kind() const -> MatchStrategyKind override { return MatchStrategyKind::DUPLICATE_SUFFIX; }
  auto Confidence() const -> float override { return 0.85f; }
  auto Find(const MediaEntry& media, const SidecarPool& pool, const AlbumContext& context) const
      -> PoolCandidate override;

  /**
   * @brief The counter-aware lookups without the fallback to the un-suffixed sidecar
   */
  static auto FindNumbered(const MediaEntry& media, const SidecarPool& pool,
                           const NamingRules& rules) -> PoolCandidate;
};

/**
 * @brief "photo-edited.jpg" <- the sidecar of "photo.jpg", unless "photo.jpg" is in the album
 */
class EditedStrategy final : public IMatchStrategy {
 public:
  auto Kind() const -> MatchStrategyKind override { return MatchStrategyKind::EDITED; }
  auto Confidence() const -> float override { return 0.9f; }
  auto Find(const MediaEntry& media, const SidecarPool& pool, const AlbumContext& context) const
      -> PoolCandidate override;
};

class LogicalNameStrategy final : public IMatchStrategy {
 public:
  auto Kind() const -> MatchStrategyKind override { return MatchStrategyKind::LOGICAL_NAME; }
  auto Confidence() const -> float override { return 0.6f; }
  auto Find(const MediaEntry& media, const SidecarPool& pool, const AlbumContext& context) const
      -> PoolCandidate override;
};

using StrategyChain = std::vector<std::unique_ptr<IMatchStrategy>>;

auto MakeDefaultStrategyChain() -> StrategyChain;
};  // namespace takeoutrestore
