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

#include "matcher/sidecar_pool.hpp"

#include <stdexcept>
#include <utility>

#include "utils/string/convert.hpp"

namespace takeoutrestore {
void PoolCandidate::Merge(const PoolCandidate& other) {
  tie_count_ += other.tie_count_;
  if (other.slot_.has_value() && (!slot_.has_value() || *other.slot_ < *slot_)) {
    slot_ = other.slot_;
  }
}

SidecarPool::SidecarPool(std::vector<EntryRef> entries)
    : entries_(std::move(entries)), claimed_(entries_.size(), false) {
  for (size_t slot = 0; slot < entries_.size(); ++slot) {
    const auto& entry = entries_[slot];
    if (!entry) {
      throw std::invalid_argument("SidecarPool: null sidecar entry");
    }
    by_file_name_[entry->file_name_].push_back(slot);
    by_described_name_[entry->described_name_].push_back(slot);
    by_folded_file_name_[conv::FoldCase(entry->file_name_)].push_back(slot);
    by_folded_described_name_[conv::FoldCase(entry->described_name_)].push_back(slot);
    if (!entry->logical_name_.empty()) {
      by_logical_name_[entry->logical_name_].push_back(slot);
    }
    if (!entry->title_logical_name_.empty() &&
        entry->title_logical_name_ != entry->logical_name_) {
      by_logical_name_[entry->title_logical_name_].push_back(slot);
    }
  }
}

void SidecarPool::Claim(size_t slot) {
  if (claimed_.at(slot)) {
    throw std::logic_error("SidecarPool: sidecar " + entries_[slot]->file_name_ +
                           " is already claimed");
  }
  claimed_[slot] = true;
  ++claimed_count_;
}

auto SidecarPool::Unclaimed() const -> std::vector<EntryRef> {
  std::vector<EntryRef> out;
  for (size_t slot = 0; slot < entries_.size(); ++slot) {
    if (!claimed_[slot]) {
      out.push_back(entries_[slot]);
    }
  }
  return out;
}

auto SidecarPool::Lookup(const Index& index, const std::string& key)
    -> const std::vector<size_t>& {
  static const std::vector<size_t> kEmpty;
  auto                             it = index.find(key);
  return it == index.end() ? kEmpty : it->second;
}

auto SidecarPool::ByFileName(const std::string& file_name) const -> const std::vector<size_t>& {
  return Lookup(by_file_name_, file_name);
}

auto SidecarPool::ByDescribedName(const std::string& described_name) const
    -> const std::vector<size_t>& {
  return Lookup(by_described_name_, described_name);
}

auto SidecarPool::ByFileNameIgnoreCase(const std::string& file_name) const
    -> const std::vector<size_t>& {
  return Lookup(by_folded_file_name_, conv::FoldCase(file_name));
}

auto SidecarPool::ByDescribedNameIgnoreCase(const std::string& described_name) const
    -> const std::vector<size_t>& {
  return Lookup(by_folded_described_name_, conv::FoldCase(described_name));
}

auto SidecarPool::ByLogicalName(const std::string& logical_name) const
    -> const std::vector<size_t>& {
  return Lookup(by_logical_name_, logical_name);
}

auto SidecarPool::Select(const std::vector<size_t>& slots, const Predicate& predicate) const
    -> PoolCandidate {
  PoolCandidate candidate;
  for (size_t slot : slots) {
    if (claimed_[slot]) continue;
    if (predicate && !predicate(*entries_[slot])) continue;
    ++candidate.tie_count_;
    if (!candidate.slot_.has_value() || slot < *candidate.slot_) {
      candidate.slot_ = slot;
    }
  }
  return candidate;
}
};  // namespace takeoutrestore
