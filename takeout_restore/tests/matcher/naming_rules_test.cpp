#include "matcher/naming_rules.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace takeoutrestore {
TEST(NamingRulesTests, SplitExtensionTest) {
  EXPECT_EQ(NamingRules::SplitExtension("IMG_1.jpg"),
            std::make_pair(std::string("IMG_1"), std::string(".jpg")));
  EXPECT_EQ(NamingRules::SplitExtension("archive.tar.gz"),
            std::make_pair(std::string("archive.tar"), std::string(".gz")));
  EXPECT_EQ(NamingRules::SplitExtension("README"),
            std::make_pair(std::string("README"), std::string()));
  EXPECT_EQ(NamingRules::SplitExtension(".hidden"),
            std::make_pair(std::string(".hidden"), std::string()));
}

TEST(NamingRulesTests, SplitCounterTest) {
  EXPECT_EQ(NamingRules::SplitCounter("photo(12)"),
            std::make_pair(std::string("photo"), std::string("(12)")));
  EXPECT_EQ(NamingRules::SplitCounter("photo.jpg(1)"),
            std::make_pair(std::string("photo.jpg"), std::string("(1)")));
  // Not counters
  EXPECT_EQ(NamingRules::SplitCounter("photo()").second, "");
  EXPECT_EQ(NamingRules::SplitCounter("photo(a)").second, "");
  EXPECT_EQ(NamingRules::SplitCounter("(1)").second, "");
  EXPECT_EQ(NamingRules::SplitCounter("photo(1)x").second, "");
}

TEST(NamingRulesTests, SplitEditSuffixTest) {
  NamingRules rules;

  auto        edited = rules.SplitEditSuffix("IMG_1-edited");
  ASSERT_TRUE(edited.has_value());
  EXPECT_EQ(edited->first, "IMG_1");
  EXPECT_EQ(edited->second, "-edited");

  auto upper = rules.SplitEditSuffix("IMG_1-EDITED");
  ASSERT_TRUE(upper.has_value());
  EXPECT_EQ(upper->first, "IMG_1");

  auto japanese = rules.SplitEditSuffix("写真-編集済み");
  ASSERT_TRUE(japanese.has_value());
  EXPECT_EQ(japanese->first, "写真");

  EXPECT_FALSE(rules.SplitEditSuffix("IMG_1").has_value());
  // A bare suffix has no base name to return to
  EXPECT_FALSE(rules.SplitEditSuffix("-edited").has_value());
}

TEST(NamingRulesTests, ParseSidecarNameTest) {
  NamingRules rules;

  auto        plain = rules.ParseSidecarName("photo.jpg.json");
  EXPECT_EQ(plain.described_name_, "photo.jpg");
  EXPECT_EQ(plain.counter_, "");
  EXPECT_FALSE(plain.supplemental_);

  auto supplemental = rules.ParseSidecarName("photo.jpg.supplemental-metadata.json");
  EXPECT_EQ(supplemental.described_name_, "photo.jpg");
  EXPECT_TRUE(supplemental.supplemental_);

  auto cut = rules.ParseSidecarName("photo.jpg.suppl.json");
  EXPECT_EQ(cut.described_name_, "photo.jpg");
  EXPECT_TRUE(cut.supplemental_);

  auto numbered = rules.ParseSidecarName("photo.jpg.supplemental-metadata(3).json");
  EXPECT_EQ(numbered.described_name_, "photo.jpg");
  EXPECT_EQ(numbered.counter_, "(3)");
  EXPECT_TRUE(numbered.supplemental_);

  auto inner = rules.ParseSidecarName("photo.jpg(2).supplemental-metadata.json");
  EXPECT_EQ(inner.described_name_, "photo.jpg");
  EXPECT_EQ(inner.counter_, "(2)");

  auto bare = rules.ParseSidecarName("photo(1).json");
  EXPECT_EQ(bare.described_name_, "photo");
  EXPECT_EQ(bare.counter_, "(1)");
  EXPECT_FALSE(bare.supplemental_);

  auto upper = rules.ParseSidecarName("PHOTO.JPG.JSON");
  EXPECT_EQ(upper.described_name_, "PHOTO.JPG");
}

TEST(NamingRulesTests, LogicalNameTest) {
  NamingRules rules;

  EXPECT_EQ(rules.MediaLogicalName("IMG_1(2)-edited.JPG"), "img_1");
  EXPECT_EQ(rules.MediaLogicalName("IMG_1-edited(2).jpg"), "img_1");
  EXPECT_EQ(rules.MediaLogicalName("Été.jpg"), "été");
  EXPECT_EQ(rules.DescribedLogicalName("IMG_1.jpg"), "img_1");
  // Only media extensions are dropped from described names
  EXPECT_EQ(rules.DescribedLogicalName("notes.txt"), "notes.txt");
  EXPECT_EQ(rules.DescribedLogicalName("IMG_1"), "img_1");
}

TEST(NamingRulesTests, TruncatedPrefixCountsCodePointsTest) {
  NamingRules       rules;
  const std::string full = "ÄÖÜäöüÄÖÜäöüÄÖÜäöüÄÖÜäöü.jpg";

  // 20 code points but 40 bytes
  EXPECT_TRUE(rules.IsTruncatedPrefix("ÄÖÜäöüÄÖÜäöüÄÖÜäöüÄÖ", full));
  EXPECT_FALSE(rules.IsTruncatedPrefix("ÄÖÜäöüÄÖÜäöüÄÖÜäöüÄ", full));
  // A full name is not a truncation of itself
  EXPECT_FALSE(rules.IsTruncatedPrefix(full, full));
  EXPECT_FALSE(rules.IsTruncatedPrefix("", full));
}

TEST(NamingRulesTests, MakeMediaEntryTest) {
  NamingRules rules;
  auto        entry = rules.MakeMediaEntry("/album/photo-edited(1).jpg", 4);

  EXPECT_EQ(entry.file_name_, "photo-edited(1).jpg");
  EXPECT_EQ(entry.base_name_, "photo-edited(1)");
  EXPECT_EQ(entry.extension_, ".jpg");
  EXPECT_EQ(entry.counter_, "(1)");
  EXPECT_EQ(entry.counterless_base_, "photo-edited");
  EXPECT_EQ(entry.edit_suffix_, "-edited");
  EXPECT_EQ(entry.unedited_base_, "photo");
  EXPECT_EQ(entry.logical_name_, "photo");
  EXPECT_EQ(entry.kind_, MediaKind::IMAGE);
  EXPECT_EQ(entry.index_, 4u);
  EXPECT_TRUE(entry.IsVariant());
}

TEST(NamingRulesTests, ClassifyMediaTest) {
  NamingRules rules;
  EXPECT_EQ(rules.ClassifyMedia("a/IMG_1.JPG"), MediaKind::IMAGE);
  EXPECT_EQ(rules.ClassifyMedia("a/clip.mp4"), MediaKind::VIDEO);
  EXPECT_EQ(rules.ClassifyMedia("a/clip.MOV"), MediaKind::VIDEO);
  EXPECT_EQ(rules.ClassifyMedia("a/notes.txt"), MediaKind::UNKNOWN);
  EXPECT_EQ(rules.ClassifyMedia("a/photo.jpg.json"), MediaKind::UNKNOWN);
}

TEST(NamingRulesTests, MergeJsonTest) {
  NamingRules rules;
  rules.MergeJson(nlohmann::json::parse(R"({
    "min_truncated_prefix": 12,
    "edit_suffixes": ["-retouched"],
    "video_extensions": ["MTS", ".avi"]
  })"));

  EXPECT_EQ(rules.min_truncated_prefix_, 12u);
  ASSERT_EQ(rules.edit_suffixes_.size(), 1u);
  EXPECT_TRUE(rules.SplitEditSuffix("IMG_1-retouched").has_value());
  EXPECT_FALSE(rules.SplitEditSuffix("IMG_1-edited").has_value());
  EXPECT_EQ(rules.ClassifyMedia("clip.mts"), MediaKind::VIDEO);
  EXPECT_EQ(rules.ClassifyMedia("clip.mp4"), MediaKind::UNKNOWN);
  // Untouched keys keep their defaults
  EXPECT_EQ(rules.supplemental_markers_, NamingRules::Defaults().supplemental_markers_);

  auto dumped = rules.ToJson();
  EXPECT_EQ(dumped["min_truncated_prefix"], 12);
  EXPECT_EQ(dumped["video_extensions"], nlohmann::json::parse(R"([".avi", ".mts"])"));
}

TEST(NamingRulesTests, MergeJsonRejectsWrongTypesTest) {
  NamingRules rules;
  EXPECT_THROW(rules.MergeJson(nlohmann::json::parse(R"({"min_truncated_prefix": "20"})")),
               std::invalid_argument);
  EXPECT_THROW(rules.MergeJson(nlohmann::json::parse(R"({"edit_suffixes": "-edited"})")),
               std::invalid_argument);
  EXPECT_THROW(rules.MergeJson(nlohmann::json::parse(R"({"edit_suffixes": [1, 2]})")),
               std::invalid_argument);
  EXPECT_THROW(rules.MergeJson(nlohmann::json::parse("[]")), std::invalid_argument);
  EXPECT_NO_THROW(rules.MergeJson(nlohmann::json()));
}
};  // namespace takeoutrestore
