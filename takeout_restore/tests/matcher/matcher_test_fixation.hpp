#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "matcher/naming_rules.hpp"
#include "matcher/sidecar_matcher.hpp"
#include "takeout_test_fixation.hpp"

namespace takeoutrestore {
class SidecarMatcherTests : public TakeoutFixtureBase {
 protected:
  NamingRules rules_ = NamingRules::Defaults();

  auto        MakeMedia(const std::vector<std::string>& names) const -> std::vector<MediaEntry> {
    std::vector<MediaEntry> entries;
    for (size_t i = 0; i < names.size(); ++i) {
      entries.push_back(rules_.MakeMediaEntry(PathOf(names[i]), i));
    }
    return entries;
  }

  /**
   * @brief In-memory sidecars. The title is the described name, which is what Google records
   * for untruncated files.
   */
  auto MakeSidecars(const std::vector<std::string>& names) const
      -> std::vector<std::shared_ptr<const SidecarEntry>> {
    std::vector<std::shared_ptr<const SidecarEntry>> entries;
    for (size_t i = 0; i < names.size(); ++i) {
      auto metadata    = std::make_shared<SidecarMetadata>();
      metadata->title_ = rules_.ParseSidecarName(names[i]).described_name_;
      entries.push_back(
          std::make_shared<const SidecarEntry>(rules_.MakeSidecarEntry(PathOf(names[i]), metadata, i)));
    }
    return entries;
  }

  auto MatchNames(const std::vector<std::string>& media, const std::vector<std::string>& sidecars)
      -> AlbumMatchReport {
    SidecarMatcher matcher(rules_, sink_);
    return matcher.Match(album_dir_, MakeMedia(media), MakeSidecars(sidecars));
  }

  auto MatchOnDisk() -> AlbumMatchReport {
    AlbumScanner   scanner(rules_, sink_);
    ScanResult     scan;
    Album          album = scanner.ScanDirectory(album_dir_, scan);
    SidecarMatcher matcher(rules_, sink_);
    return matcher.MatchAlbum(album);
  }

  static auto ResultFor(const AlbumMatchReport& report, const std::string& media_name)
      -> const MatchResult& {
    for (const auto& result : report.results_) {
      if (result.media_.file_name_ == media_name) {
        return result;
      }
    }
    throw std::out_of_range("no result for " + media_name);
  }

  static auto SidecarOf(const AlbumMatchReport& report, const std::string& media_name)
      -> std::string {
    const auto& result = ResultFor(report, media_name);
    return result.IsMatched() ? result.sidecar_->file_name_ : std::string{};
  }
};
};  // namespace takeoutrestore
