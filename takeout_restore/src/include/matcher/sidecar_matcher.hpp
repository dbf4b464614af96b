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
#include <vector>

#include "diagnostics/diagnostics_sink.hpp"
#include "matcher/match_strategy.hpp"
#include "matcher/match_types.hpp"
#include "matcher/naming_rules.hpp"
#include "scan/album_scanner.hpp"

namespace takeoutrestore {
/**
 * @brief Pairs the media files of one album with their sidecars.
 *
 * Strategies run one after the other over all still unmatched media files, in media input
 * order, with originals before their edited and numbered copies. A sidecar claimed by any strategy leaves the pool for the rest of the album. Among
 * several eligible sidecars the earliest one in sidecar input order wins, so the result only
 * depends on the two input orders. Match() keeps no state between calls and may be called from
 * several threads as long as the sink is thread-safe.
 */
class SidecarMatcher {
 public:
  SidecarMatcher(NamingRules rules, DiagnosticsSink& sink);
  SidecarMatcher(NamingRules rules, DiagnosticsSink& sink, StrategyChain chain);

  auto GetRules() const -> const NamingRules& { return rules_; }

  auto BuildMediaEntries(const std::vector<media_path_t>& paths) const -> std::vector<MediaEntry>;

  /**
   * @brief Parse every sidecar. Those that cannot be read or parsed are reported, appended to
   * unreadable and left out of the returned list.
   */
  auto BuildSidecarEntries(const std::vector<sidecar_path_t>& paths,
                           std::vector<UnreadableSidecar>&    unreadable) const
      -> std::vector<std::shared_ptr<const SidecarEntry>>;

  auto Match(const file_path_t& directory, const std::vector<MediaEntry>& media,
             const std::vector<std::shared_ptr<const SidecarEntry>>& sidecars) const
      -> AlbumMatchReport;

  auto MatchAlbum(const Album& album) const -> AlbumMatchReport;

 private:
  // False for album files like metadata.json, whose name and title carry no media extension
  auto             DescribesMedia(const SidecarEntry& sidecar) const -> bool;

  NamingRules      rules_;
  DiagnosticsSink& sink_;
  StrategyChain    chain_;
};
};  // namespace takeoutrestore
