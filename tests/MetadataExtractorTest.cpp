#include <gtest/gtest.h>
#include <limits>

#include "TestSupport.hpp"
#include "core/metadata/HeaderMetadataExtractor.hpp"

using namespace testing_support;

namespace {

const std::vector<std::string> kDefaultFields = {
  "Make", "Model", "Date/Time Original", "Image Width", "Image Height",
  "Exposure Time", "F-Number"};

} // namespace

class HeaderMetadataExtractorTest : public ::testing::Test {
protected:
  std::optional<ImageMetadata> extract(const std::string& name, const std::string& bytes,
                                       const std::vector<std::string>& fields = kDefaultFields) {
    write_file(dir.file(name), bytes);
    return extractor.extract(dir.file(name), fields, CancellationToken());
  }

  TempDir dir;
  LocalFSBackend fs;
  HeaderMetadataExtractor extractor{fs};
};

TEST_F(HeaderMetadataExtractorTest, PngDimensions) {
  auto md = extract("a.png", png_bytes(1920, 1080));
  ASSERT_TRUE(md);
  EXPECT_EQ(md->width, 1920);
  EXPECT_EQ(md->height, 1080);
  EXPECT_EQ(md->tags["Image Width"], "1920 pixels");
}

TEST_F(HeaderMetadataExtractorTest, GifDimensions) {
  auto md = extract("a.gif", gif_bytes(320, 200));
  ASSERT_TRUE(md);
  EXPECT_EQ(md->width, 320);
  EXPECT_EQ(md->height, 200);
}

TEST_F(HeaderMetadataExtractorTest, BmpTopDownHeightIsPositive) {
  auto md = extract("a.bmp", bmp_bytes(64, -32));
  ASSERT_TRUE(md);
  EXPECT_EQ(md->width, 64);
  EXPECT_EQ(md->height, 32);
}

TEST_F(HeaderMetadataExtractorTest, OutOfRangeDimensionsAreRejected) {
  EXPECT_FALSE(extract("min.bmp", bmp_bytes(std::numeric_limits<int32_t>::min(), 5)));
  EXPECT_FALSE(extract("minh.bmp", bmp_bytes(5, std::numeric_limits<int32_t>::min())));
  EXPECT_FALSE(extract("huge.png", png_bytes(0x80000000u, 1)));
  EXPECT_FALSE(extract("tall.png", png_bytes(1, 0xFFFFFFFFu)));

  auto widest = extract("max.bmp", bmp_bytes(std::numeric_limits<int32_t>::max(), -1));
  ASSERT_TRUE(widest);
  EXPECT_EQ(widest->width, std::numeric_limits<int>::max());
  EXPECT_EQ(widest->height, 1);
}

TEST_F(HeaderMetadataExtractorTest, Latin1ExifTextIsKeptAsRead) {
  auto md = extract("cam.jpg", jpeg_bytes(8, 8, "Caf\xE9", "Caf\xE9 Cam", "2021:06:01 12:30:45"));
  ASSERT_TRUE(md);
  EXPECT_EQ(md->tags["Model"], "Caf\xE9 Cam");
}

TEST_F(HeaderMetadataExtractorTest, JpegFrameAndExifTags) {
  auto md = extract("a.jpg", jpeg_bytes(4000, 3000, "FUJIFILM", "X100V", "2021:06:01 12:30:45"));
  ASSERT_TRUE(md);
  EXPECT_EQ(md->width, 4000);
  EXPECT_EQ(md->height, 3000);
  EXPECT_EQ(md->tags["Make"], "FUJIFILM");
  EXPECT_EQ(md->tags["Model"], "X100V");
  EXPECT_EQ(md->tags["Date/Time Original"], "2021:06:01 12:30:45");
  EXPECT_EQ(md->tags["F-Number"], "f/2.8");
}

TEST_F(HeaderMetadataExtractorTest, KeepsOnlyRequestedFields) {
  auto md = extract("a.jpg", jpeg_bytes(10, 10, "Canon", "EOS R5", "2020:01:02 03:04:05"), {"model"});
  ASSERT_TRUE(md);
  EXPECT_EQ(md->tags.size(), 1u);
  EXPECT_EQ(md->tags.count("Model"), 1u);
  // Dimensions are reported regardless of the tag filter.
  EXPECT_EQ(md->width, 10);
}

TEST_F(HeaderMetadataExtractorTest, WildcardKeepsEverything) {
  auto md = extract("a.jpg", jpeg_bytes(10, 10, "Canon", "EOS R5", "2020:01:02 03:04:05"), {"*"});
  ASSERT_TRUE(md);
  EXPECT_EQ(md->tags.count("Make"), 1u);
  EXPECT_EQ(md->tags.count("Image Height"), 1u);
}

TEST_F(HeaderMetadataExtractorTest, UnrecognizedOrTruncatedInputFails) {
  EXPECT_FALSE(extract("notes.png", "this is not an image"));
  EXPECT_FALSE(extract("short.png", "x"));
  EXPECT_FALSE(extract("cut.jpg", std::string("\xFF\xD8\xFF\xE1\x00", 5)));
  EXPECT_FALSE(extractor.extract(dir.file("missing.png"), kDefaultFields, CancellationToken()));
}

TEST(MetadataHelpers, ParsesExifDateTimeAsUtc) {
  EXPECT_EQ(parse_exif_datetime("2021:06:01 12:30:45").value_or(0), 1622550645);
  EXPECT_FALSE(parse_exif_datetime("June 1st"));
  EXPECT_FALSE(parse_exif_datetime(""));
}

TEST(MetadataHelpers, FieldMatchingIsCaseInsensitive) {
  EXPECT_TRUE(field_requested({"f-number"}, "F-Number"));
  EXPECT_TRUE(field_requested({"*"}, "Anything"));
  EXPECT_FALSE(field_requested({}, "Make"));
}
