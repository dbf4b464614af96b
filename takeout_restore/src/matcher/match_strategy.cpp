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

#include "matcher/match_strategy.hpp"

#include "utils/string/convert.hpp"

namespace takeoutrestore {
namespace {
/**
 * @brief Every sidecar whose described name is a long enough proper prefix of full_name. Only
 * prefixes ending on a code point boundary are looked up.
 */
auto FindTruncated(const std::string& full_name, const SidecarPool& pool,
                   const NamingRules& rules, const std::string& counter) -> PoolCandidate {
  PoolCandidate candidate;
  for (size_t len = 1; len < full_name.size(); ++len) {
    // Skip UTF-8 continuation bytes
    if ((static_cast<unsigned char>(full_name[len]) & 0xC0) == 0x80) continue;
    const std::string prefix = full_name.substr(0, len);
    const auto&       slots  = pool.ByDescribedName(prefix);
    if (slots.empty() || !rules.IsTruncatedPrefix(prefix, full_name)) continue;
    candidate.Merge(pool.Select(
        slots, [&counter](const SidecarEntry& sidecar) { return sidecar.counter_ == counter; }));
  }
  return candidate;
}
}  // namespace

auto ExactStrategy::Find(const MediaEntry& media, const SidecarPool& pool,
                         const AlbumContext&) const -> PoolCandidate {
  const std::string sidecar_name = media.file_name_ + ".json";
  PoolCandidate     candidate    = pool.Select(pool.ByFileName(sidecar_name));
  if (candidate.Found()) return candidate;
  // Takeout does not keep the extension's case consistent between media and sidecar
  return pool.Select(pool.ByFileNameIgnoreCase(sidecar_name));
}

auto SupplementalStrategy::Find(const MediaEntry& media, const SidecarPool& pool,
                                const AlbumContext&) const -> PoolCandidate {
  auto unnumbered_supplemental = [](const SidecarEntry& sidecar) {
    return sidecar.supplemental_ && sidecar.counter_.empty();
  };
  PoolCandidate candidate =
      pool.Select(pool.ByDescribedName(media.file_name_), unnumbered_supplemental);
  if (candidate.Found()) return candidate;
  return pool.Select(pool.ByDescribedNameIgnoreCase(media.file_name_), unnumbered_supplemental);
}

auto TruncatedStrategy::Find(const MediaEntry& media, const SidecarPool& pool,
                             const AlbumContext& context) const -> PoolCandidate {
  if (media.IsVariant()) {
    return {};
  }
  return FindTruncated(media.file_name_, pool, context.rules_, std::string{});
}

auto DuplicateSuffixStrategy::FindNumbered(const MediaEntry& media, const SidecarPool& pool,
                                           const NamingRules& rules) -> PoolCandidate {
  if (media.counter_.empty()) {
    return {};
  }
  const std::string original_name = media.counterless_base_ + media.extension_;
  auto              same_counter  = [&media](const SidecarEntry& sidecar) {
    return sidecar.counter_ == media.counter_;
  };

  // photo.jpg(1).json, photo.jpg.supplemental-metadata(1).json
  PoolCandidate     candidate = pool.Select(pool.ByDescribedName(original_name), same_counter);
  if (candidate.Found()) return candidate;

  // photo(1).json
  candidate = pool.Select(pool.ByDescribedName(media.counterless_base_), same_counter);
  if (candidate.Found()) return candidate;

  return FindTruncated(original_name, pool, rules, media.counter_);
}

auto DuplicateSuffixStrategy::Find(const MediaEntry& media, const SidecarPool& pool,
                                   const AlbumContext& context) const -> PoolCandidate {
  if (media.counter_.empty()) {
    return {};
  }
  PoolCandidate candidate = FindNumbered(media, pool, context.rules_);
  if (candidate.Found()) return candidate;

  const std::string original_name = media.counterless_base_ + media.extension_;
  if (context.HasMedia(original_name)) {
    return {};
  }
  return pool.Select(pool.ByDescribedName(original_name),
                     [](const SidecarEntry& sidecar) { return sidecar.counter_.empty(); });
}

auto EditedStrategy::Find(const MediaEntry& media, const SidecarPool& pool,
                          const AlbumContext& context) const -> PoolCandidate {
  if (media.edit_suffix_.empty()) {
    return {};
  }
  // "photo-edited(1).jpg" is the edited copy of "photo(1).jpg"
  const std::string original_name = media.unedited_base_ + media.counter_ + media.extension_;
  if (context.HasMedia(original_name)) {
    return {};
  }

  const MediaEntry original =
      context.rules_.MakeMediaEntry(media.path_.parent_path() / conv::Utf8ToPath(original_name),
                                    media.index_);
  if (!original.counter_.empty()) {
    return DuplicateSuffixStrategy::FindNumbered(original, pool, context.rules_);
  }

  PoolCandidate candidate = pool.Select(pool.ByFileName(original_name + ".json"));
  if (candidate.Found()) return candidate;

  candidate = pool.Select(pool.ByDescribedName(original_name),
                          [](const SidecarEntry& sidecar) { return sidecar.counter_.empty(); });
  if (candidate.Found()) return candidate;

  return FindTruncated(original_name, pool, context.rules_, std::string{});
}

auto LogicalNameStrategy::Find(const MediaEntry& media, const SidecarPool& pool,
                               const AlbumContext&) const -> PoolCandidate {
  if (media.logical_name_.empty()) {
    return {};
  }
  return pool.Select(pool.ByLogicalName(media.logical_name_));
}

auto MakeDefaultStrategyChain() -> StrategyChain {
  StrategyChain chain;
  chain.push_back(std::make_unique<ExactStrategy>());
  chain.push_back(std::make_unique<SupplementalStrategy>());
  chain.push_back(std::make_unique<TruncatedStrategy>());
  chain.push_back(std::make_unique<DuplicateSuffixStrategy>());
  chain.push_back(std::make_unique<EditedStrategy>());
  chain.push_back(std::make_unique<LogicalNameStrategy>());
  return chain;
}
};  // namespace takeoutrestore
