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

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "matcher/match_types.hpp"

namespace takeoutrestore {
struct PoolCandidate {
  // Slot of the earliest eligible sidecar, in sidecar input order
  std::optional<size_t> slot_{};
  // How many unclaimed sidecars were eligible
  size_t                tie_count_ = 0;

  auto                  Found() const -> bool { return slot_.has_value(); }
  void                  Merge(const PoolCandidate& other);
};

/**
 * @brief The sidecars of one album with their claim state. Slots follow the input order, so the
 * lowest eligible slot is always the earliest sidecar of the directory listing.
 */
class SidecarPool {
 public:
  using EntryRef  = std::shared_ptr<const SidecarEntry>;
  using Predicate = std::function<bool(const SidecarEntry&)>;

  explicit SidecarPool(std::vector<EntryRef> entries);

  auto Size() const -> size_t { return entries_.size(); }
  auto Get(size_t slot) const -> const EntryRef& { return entries_.at(slot); }
  auto IsClaimed(size_t slot) const -> bool { return claimed_.at(slot); }

  /**
   * @brief Take a sidecar out of the pool for good
   *
   * @throws std::logic_error when the slot is already claimed
   */
  void Claim(size_t slot);

  auto ClaimedCount() const -> size_t { return claimed_count_; }
  auto Unclaimed() const -> std::vector<EntryRef>;

  // Slot lists, each in input order
  auto ByFileName(const std::string& file_name) const -> const std::vector<size_t>&;
  auto ByDescribedName(const std::string& described_name) const -> const std::vector<size_t>&;
  // Keyed by the case-folded name, so "IMG_1.JPG.json" is found for "IMG_1.jpg"
  auto ByFileNameIgnoreCase(const std::string& file_name) const -> const std::vector<size_t>&;
  auto ByDescribedNameIgnoreCase(const std::string& described_name) const
      -> const std::vector<size_t>&;
  // Matches both the sidecar's own logical name and the one derived from its title
  auto ByLogicalName(const std::string& logical_name) const -> const std::vector<size_t>&;

  /**
   * @brief Pick the first unclaimed slot of a list that satisfies the predicate
   */
  auto Select(const std::vector<size_t>& slots, const Predicate& predicate = nullptr) const
      -> PoolCandidate;

 private:
  using Index = std::unordered_map<std::string, std::vector<size_t>>;

  static auto Lookup(const Index& index, const std::string& key) -> const std::vector<size_t>&;

  std::vector<EntryRef> entries_;
  std::vector<bool>     claimed_;
  size_t                claimed_count_ = 0;

  Index                 by_file_name_;
  Index                 by_described_name_;
  Index                 by_folded_file_name_;
  Index                 by_folded_described_name_;
  Index                 by_logical_name_;
};
};  // namespace takeoutrestore
