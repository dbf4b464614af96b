#include "app/restore_service.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "takeout_test_fixation.hpp"

namespace takeoutrestore {
class RestoreServiceTests : public TakeoutFixtureBase {
 protected:
  auto MakeConfig() const -> RestoreConfig {
    RestoreConfig config;
    config.input_folder_ = album_dir_;
    return config;
  }

  static auto ModifiedAt(const std::filesystem::path& path) -> long long {
    const auto sys_time = std::chrono::file_clock::to_sys(std::filesystem::last_write_time(path));
    return std::chrono::duration_cast<std::chrono::seconds>(sys_time.time_since_epoch()).count();
  }

  // One album exercising matched, unmatched, unconsumed and unreadable entries
  void BuildPhotosAlbum() const {
    WriteMedia("Photos from 2021/IMG_1.jpg");
    WriteSidecar("Photos from 2021/IMG_1.jpg.json", "IMG_1.jpg");
    WriteMedia("Photos from 2021/clip.mp4");
    WriteSidecar("Photos from 2021/clip.mp4.supplemental-metadata.json", "clip.mp4");
    WriteMedia("Photos from 2021/orphan.jpg");
    WriteSidecar("Photos from 2021/leftover.png.json", "leftover.png");
    WriteFile("Photos from 2021/broken.jpg.json", "{not json");
  }
};

TEST_F(RestoreServiceTests, DryRunTest) {
  BuildPhotosAlbum();
  RestoreConfig config = MakeConfig();
  config.dry_run_      = true;

  RestoreService service(config, sink_);
  RestoreStats   stats = service.Run();

  EXPECT_EQ(stats.albums_, 1u);
  EXPECT_EQ(stats.media_found_, 3u);
  EXPECT_EQ(stats.sidecars_found_, 4u);
  EXPECT_EQ(stats.media_matched_, 2u);
  EXPECT_EQ(stats.by_strategy_[MatchStrategyKind::EXACT], 1u);
  EXPECT_EQ(stats.by_strategy_[MatchStrategyKind::SUPPLEMENTAL], 1u);
  ASSERT_EQ(stats.unmatched_media_.size(), 1u);
  EXPECT_EQ(stats.unmatched_media_[0].filename(), "orphan.jpg");
  ASSERT_EQ(stats.unconsumed_sidecars_.size(), 1u);
  EXPECT_EQ(stats.unconsumed_sidecars_[0].filename(), "leftover.png.json");
  ASSERT_EQ(stats.unreadable_sidecars_.size(), 1u);
  EXPECT_EQ(stats.unreadable_sidecars_[0].path_.filename(), "broken.jpg.json");
  EXPECT_EQ(stats.injected_, 2u);
  EXPECT_EQ(stats.sidecars_deleted_, 2u);
  EXPECT_EQ(stats.ExitCode(), 0);

  // Nothing on disk changed
  EXPECT_TRUE(std::filesystem::exists(PathOf("Photos from 2021/IMG_1.jpg.json")));
  EXPECT_TRUE(
      std::filesystem::exists(PathOf("Photos from 2021/clip.mp4.supplemental-metadata.json")));
  EXPECT_NE(ModifiedAt(PathOf("Photos from 2021/clip.mp4")), 1609459200);
}

TEST_F(RestoreServiceTests, OnlyInjectedSidecarsAreDeletedTest) {
  WriteMedia("clip.mp4");
  WriteSidecar("clip.mp4.json", "clip.mp4");
  // Not a real JPEG, Exiv2 refuses it
  WriteMedia("IMG_2.jpg");
  WriteSidecar("IMG_2.jpg.json", "IMG_2.jpg");

  RestoreService service(MakeConfig(), sink_);
  RestoreStats   stats = service.Run();

  EXPECT_EQ(stats.media_matched_, 2u);
  EXPECT_EQ(stats.injected_, 1u);
  EXPECT_EQ(stats.injection_failed_, 1u);
  ASSERT_EQ(stats.failed_media_.size(), 1u);
  EXPECT_EQ(stats.failed_media_[0].filename(), "IMG_2.jpg");
  EXPECT_EQ(stats.sidecars_deleted_, 1u);
  EXPECT_EQ(stats.ExitCode(), 1);

  EXPECT_FALSE(std::filesystem::exists(PathOf("clip.mp4.json")));
  EXPECT_TRUE(std::filesystem::exists(PathOf("IMG_2.jpg.json")));
  EXPECT_EQ(ModifiedAt(PathOf("clip.mp4")), 1609459200);
}

TEST_F(RestoreServiceTests, KeepJsonTest) {
  WriteMedia("clip.mp4");
  WriteSidecar("clip.mp4.json", "clip.mp4");

  RestoreConfig config = MakeConfig();
  config.delete_json_  = false;
  RestoreService service(config, sink_);
  RestoreStats   stats = service.Run();

  EXPECT_EQ(stats.injected_, 1u);
  EXPECT_EQ(stats.sidecars_deleted_, 0u);
  EXPECT_TRUE(std::filesystem::exists(PathOf("clip.mp4.json")));
}

TEST_F(RestoreServiceTests, SidecarWithoutMetadataIsCleanedUpTest) {
  WriteMedia("clip.mp4");
  WriteFile("clip.mp4.json", R"({"title": "clip.mp4"})");

  RestoreService service(MakeConfig(), sink_);
  RestoreStats   stats = service.Run();

  EXPECT_EQ(stats.media_matched_, 1u);
  EXPECT_EQ(stats.injected_, 0u);
  EXPECT_EQ(stats.no_metadata_, 1u);
  EXPECT_EQ(stats.sidecars_deleted_, 1u);
  EXPECT_FALSE(std::filesystem::exists(PathOf("clip.mp4.json")));
}

TEST_F(RestoreServiceTests, PeopleOnlySidecarIsWrittenBeforeCleanupTest) {
  const auto path = PathOf("IMG_1.jpg");
  ASSERT_NE(Exiv2::ImageFactory::create(Exiv2::ImageType::jpeg, path.string()), nullptr);
  WriteFile("IMG_1.jpg.json", R"({"title": "IMG_1.jpg", "people": [{"name": "Alice"}]})");

  RestoreService service(MakeConfig(), sink_);
  RestoreStats   stats = service.Run();

  EXPECT_EQ(stats.media_matched_, 1u);
  EXPECT_EQ(stats.injected_, 1u);
  EXPECT_EQ(stats.no_metadata_, 0u);
  EXPECT_EQ(stats.sidecars_deleted_, 1u);
  EXPECT_FALSE(std::filesystem::exists(PathOf("IMG_1.jpg.json")));

  auto image = Exiv2::ImageFactory::open(path.string());
  image->readMetadata();
  auto& xmp    = image->xmpData();
  auto  people = xmp.findKey(Exiv2::XmpKey("Xmp.iptcExt.PersonInImage"));
  ASSERT_NE(people, xmp.end());
  EXPECT_EQ(people->toString(0), "Alice");
}

TEST_F(RestoreServiceTests, AlbumsAreMatchedSeparatelyTest) {
  // Same file name in two albums, each sidecar stays with its own album
  WriteMedia("Trip/IMG_1.jpg");
  WriteSidecar("Trip/IMG_1.jpg.json", "IMG_1.jpg");
  WriteMedia("Home/IMG_1.jpg");
  WriteSidecar("Home/IMG_1.jpg.json", "IMG_1.jpg");
  WriteSidecar("Other/IMG_9.jpg.json", "IMG_9.jpg");

  RestoreConfig config = MakeConfig();
  config.dry_run_      = true;
  RestoreService service(config, sink_);
  RestoreStats   stats = service.Run();

  EXPECT_EQ(stats.albums_, 3u);
  EXPECT_EQ(stats.media_matched_, 2u);
  ASSERT_EQ(stats.unconsumed_sidecars_.size(), 1u);
  EXPECT_EQ(stats.unconsumed_sidecars_[0].filename(), "IMG_9.jpg.json");
}

TEST_F(RestoreServiceTests, ParallelMatchingGivesSameResultTest) {
  for (int album = 0; album < 6; ++album) {
    const std::string dir = "Album " + std::to_string(album) + "/";
    WriteMedia(dir + "photo.jpg");
    WriteMedia(dir + "photo(1).jpg");
    WriteMedia(dir + "photo-edited.jpg");
    WriteMedia(dir + "unmatched.png");
    WriteSidecar(dir + "photo.jpg.json", "photo.jpg");
    WriteSidecar(dir + "photo(1).json", "photo.jpg");
    WriteSidecar(dir + "stray.gif.json", "stray.gif");
  }

  RestoreConfig serial_config = MakeConfig();
  serial_config.dry_run_      = true;
  RestoreConfig parallel_config = serial_config;
  parallel_config.jobs_         = 4;

  RestoreStats serial   = RestoreService(serial_config, sink_).Run();
  RestoreStats parallel = RestoreService(parallel_config, sink_).Run();

  EXPECT_EQ(serial.albums_, 6u);
  EXPECT_EQ(parallel.media_matched_, serial.media_matched_);
  EXPECT_EQ(parallel.by_strategy_, serial.by_strategy_);
  EXPECT_EQ(parallel.unmatched_media_, serial.unmatched_media_);
  EXPECT_EQ(parallel.unconsumed_sidecars_, serial.unconsumed_sidecars_);
}

TEST_F(RestoreServiceTests, BadInputFolderTest) {
  RestoreService no_input(RestoreConfig{}, sink_);
  EXPECT_THROW(no_input.Run(), std::invalid_argument);

  RestoreConfig config = MakeConfig();
  config.input_folder_ = PathOf("does not exist");
  RestoreService missing(config, sink_);
  EXPECT_THROW(missing.Run(), std::runtime_error);
}
};  // namespace takeoutrestore
