#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "utils/clock/time_provider.hpp"
#include "utils/string/convert.hpp"

namespace takeoutrestore {
TEST(StringConvertTests, FoldCaseTest) {
  EXPECT_EQ(conv::FoldCase("IMG_0001.JPG"), "img_0001.jpg");
  EXPECT_EQ(conv::FoldCase("ÉTÉ À PARIS"), "été à paris");
  // Outside Latin-1 nothing is folded
  EXPECT_EQ(conv::FoldCase("ΑΘΗΝΑ"), "ΑΘΗΝΑ");
  EXPECT_EQ(conv::FoldCase("×"), "×");
}

TEST(StringConvertTests, Utf8LengthTest) {
  EXPECT_EQ(conv::Utf8Length(""), 0u);
  EXPECT_EQ(conv::Utf8Length("abc"), 3u);
  EXPECT_EQ(conv::Utf8Length("été"), 3u);
  EXPECT_EQ(conv::Utf8Length("写真"), 2u);
  // Invalid input is counted in bytes
  EXPECT_EQ(conv::Utf8Length(std::string("a\xFF") + "b"), 3u);
}

TEST(StringConvertTests, SanitizeUtf8Test) {
  EXPECT_TRUE(conv::IsValidUtf8("写真.jpg"));
  const std::string broken = std::string("caf") + static_cast<char>(0xE9);
  EXPECT_FALSE(conv::IsValidUtf8(broken));
  const std::string fixed = conv::SanitizeUtf8(broken);
  EXPECT_TRUE(conv::IsValidUtf8(fixed));
  EXPECT_EQ(fixed, "caf\xEF\xBF\xBD");
}

TEST(StringConvertTests, EndsWithIgnoreCaseTest) {
  EXPECT_TRUE(conv::EndsWithIgnoreCase("IMG_1-EDITED", "-edited"));
  EXPECT_TRUE(conv::EndsWithIgnoreCase("Plage-MODIFIÉ", "-modifié"));
  EXPECT_FALSE(conv::EndsWithIgnoreCase("edited", "-edited"));
  EXPECT_FALSE(conv::EndsWithIgnoreCase("IMG_1", ""));
}

TEST(StringConvertTests, PathRoundTripTest) {
  const std::string name = "Été à Paris 写真.jpg";
  EXPECT_EQ(conv::PathToUtf8(conv::Utf8ToPath(name)), name);
  EXPECT_EQ(conv::PathToUtf8(conv::Utf8ToPath("album/" + name).filename()), name);
}

TEST(TimeProviderTests, FromCivilTest) {
  EXPECT_EQ(TimeProvider::FromCivil(1970, 1, 1), 0);
  EXPECT_EQ(TimeProvider::FromCivil(2021, 1, 1), 1609459200);
  EXPECT_EQ(TimeProvider::FromCivil(2000, 2, 29, 12, 0, 0), 951825600);
  EXPECT_EQ(TimeProvider::FromCivil(1969, 12, 31, 23, 59, 59), -1);
}

TEST(TimeProviderTests, FormattingTest) {
  const epoch_time_t time = TimeProvider::FromCivil(2019, 3, 5, 15, 4, 5);
  EXPECT_EQ(TimeProvider::FormatExifDateTime(time), "2019:03:05 15:04:05");
  EXPECT_EQ(TimeProvider::FormatIptcDate(time), "2019-03-05");
  EXPECT_EQ(TimeProvider::FormatIptcTime(time), "15:04:05+00:00");
  EXPECT_EQ(TimeProvider::FormatIso8601(time), "2019-03-05T15:04:05Z");
}

TEST(TimeProviderTests, SupportedRangeTest) {
  EXPECT_EQ(TimeProvider::kMinSupportedTime, TimeProvider::FromCivil(1800, 1, 1));
  EXPECT_EQ(TimeProvider::kMaxSupportedTime, TimeProvider::FromCivil(9999, 12, 31, 23, 59, 59));
  EXPECT_TRUE(TimeProvider::IsSupportedTime(0));
  EXPECT_FALSE(TimeProvider::IsSupportedTime(TimeProvider::kMaxSupportedTime + 1));
  EXPECT_FALSE(TimeProvider::IsSupportedTime(TimeProvider::kMinSupportedTime - 1));

  EXPECT_EQ(TimeProvider::FormatExifDateTime(TimeProvider::kMaxSupportedTime),
            "9999:12:31 23:59:59");
  EXPECT_THROW(TimeProvider::FormatExifDateTime(std::numeric_limits<epoch_time_t>::max()),
               std::out_of_range);
}

TEST(TimeProviderTests, FormatDurationTest) {
  EXPECT_EQ(TimeProvider::FormatDuration(12.34), "12.3s");
  EXPECT_EQ(TimeProvider::FormatDuration(245.0), "4m 5s");
  EXPECT_EQ(TimeProvider::FormatDuration(3723.0), "1h 2m 3s");
}
};  // namespace takeoutrestore
