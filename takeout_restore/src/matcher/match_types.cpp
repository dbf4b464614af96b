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

#include "matcher/match_types.hpp"

#include <algorithm>

namespace takeoutrestore {
auto StrategyKindToString(MatchStrategyKind kind) -> const char* {
  switch (kind) {
    case MatchStrategyKind::NONE:
      return "NONE";
    case MatchStrategyKind::EXACT:
      return "EXACT";
    case MatchStrategyKind::SUPPLEMENTAL:
      return "SUPPLEMENTAL";
    case MatchStrategyKind::TRUNCATED:
      return "TRUNCATED";
    case MatchStrategyKind::DUPLICATE_SUFFIX:
      return "DUPLICATE_SUFFIX";
    case MatchStrategyKind::EDITED:
      return "EDITED";
    case MatchStrategyKind::LOGICAL_NAME:
      return "LOGICAL_NAME";
  }
  return "UNKNOWN";
}

auto AlbumMatchReport::MatchedCount() const -> size_t {
  return static_cast<size_t>(std::count_if(results_.begin(), results_.end(),
                                           [](const MatchResult& r) { return r.IsMatched(); }));
}

auto AlbumMatchReport::UnmatchedCount() const -> size_t {
  return results_.size() - MatchedCount();
}

auto AlbumMatchReport::CountBy(MatchStrategyKind kind) const -> size_t {
  return static_cast<size_t>(std::count_if(results_.begin(), results_.end(),
                                           [kind](const MatchResult& r) {
                                             return r.strategy_ == kind;
                                           }));
}
};  // namespace takeoutrestore
