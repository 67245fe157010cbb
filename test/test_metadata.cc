/*
	Copyright 2024-2024 Ian Tester

	This file is part of Photo Postcard.

	Photo Postcard is free software: you can redistribute it and/or modify
	it under the terms of the GNU General Public License as published by
	the Free Software Foundation, either version 3 of the License, or
	(at your option) any later version.

	Photo Postcard is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
	GNU General Public License for more details.

	You should have received a copy of the GNU General Public License
	along with Photo Postcard.  If not, see <http://www.gnu.org/licenses/>.
*/
#include <string>
#include <gtest/gtest.h>
#include <exiv2/exiv2.hpp>
#include "Metadata.hh"

using namespace PhotoPostcard;

TEST(FormatCaptureDate, ReformatsExifTimestamp) {
  auto date = format_capture_date("2024:03:15 10:30:00");
  ASSERT_TRUE(date.defined());
  EXPECT_EQ(date.get(), "Mar 15, 2024");
}

TEST(FormatCaptureDate, PadsDayAndNamesEveryMonth) {
  EXPECT_EQ(format_capture_date("2024:01:05 00:00:00").get(), "Jan 05, 2024");
  EXPECT_EQ(format_capture_date("1999:12:31 23:59:59").get(), "Dec 31, 1999");
  EXPECT_EQ(format_capture_date("2021:07:04 12:00:00").get(), "Jul 04, 2021");
}

TEST(FormatCaptureDate, IgnoresTrailingPadding) {
  EXPECT_EQ(format_capture_date(std::string("2024:03:15 10:30:00\0", 20)).get(), "Mar 15, 2024");
  EXPECT_EQ(format_capture_date("2024:03:15 10:30:00  ").get(), "Mar 15, 2024");
}

TEST(FormatCaptureDate, ChecksTheCalendar) {
  EXPECT_TRUE(format_capture_date("2024:02:29 10:00:00").defined());
  EXPECT_TRUE(format_capture_date("2000:02:29 10:00:00").defined());
  EXPECT_FALSE(format_capture_date("2023:02:29 10:00:00").defined());
  EXPECT_FALSE(format_capture_date("1900:02:29 10:00:00").defined());
  EXPECT_FALSE(format_capture_date("2024:13:01 00:00:00").defined());
  EXPECT_FALSE(format_capture_date("2024:00:10 00:00:00").defined());
  EXPECT_FALSE(format_capture_date("2024:04:31 00:00:00").defined());
  EXPECT_FALSE(format_capture_date("2024:03:15 24:00:00").defined());
  EXPECT_FALSE(format_capture_date("2024:03:15 10:60:00").defined());
  EXPECT_FALSE(format_capture_date("0000:01:01 00:00:00").defined());
}

TEST(FormatCaptureDate, RejectsOtherLayouts) {
  EXPECT_FALSE(format_capture_date("").defined());
  EXPECT_FALSE(format_capture_date("2024-03-15 10:30:00").defined());
  EXPECT_FALSE(format_capture_date("2024:03:15").defined());
  EXPECT_FALSE(format_capture_date("2024:03:15 10:30:00 extra").defined());
  EXPECT_FALSE(format_capture_date("    :  :     :  :  ").defined());
  EXPECT_FALSE(format_capture_date("2024:3:15 10:30:00x").defined());
}

class MetadataTest : public ::testing::Test {
protected:
  PostcardConfig config;
  MetadataExtractor extractor;
  Exiv2::ExifData exif;

  MetadataTest() :
    extractor(config)
  {}
};

TEST_F(MetadataTest, EmptyTableGivesFallbacks) {
  CaptureMetadata metadata = extractor.extract(exif);
  EXPECT_EQ(metadata.date_text, "2024.01.01");
  EXPECT_EQ(metadata.location_text, "SHENZHEN");
}

TEST_F(MetadataTest, CaptureDateIsFormatted) {
  exif["Exif.Photo.DateTimeOriginal"] = std::string("2024:03:15 10:30:00");
  CaptureMetadata metadata = extractor.extract(exif);
  EXPECT_EQ(metadata.date_text, "Mar 15, 2024");
  EXPECT_EQ(metadata.location_text, "SHENZHEN");
}

TEST_F(MetadataTest, OnlyOriginalTimestampCounts) {
  exif["Exif.Image.DateTime"] = std::string("2020:01:01 00:00:00");
  EXPECT_FALSE(extractor.capture_date(exif).defined());
  EXPECT_EQ(extractor.extract(exif).date_text, "2024.01.01");
}

TEST_F(MetadataTest, UnparseableDatePassesThrough) {
  exif["Exif.Photo.DateTimeOriginal"] = std::string("last summer");
  EXPECT_EQ(extractor.extract(exif).date_text, "last summer");
}

TEST_F(MetadataTest, BlankDateGivesFallback) {
  exif["Exif.Photo.DateTimeOriginal"] = std::string(20, '\0');
  EXPECT_FALSE(extractor.capture_date(exif).defined());
  EXPECT_EQ(extractor.extract(exif).date_text, "2024.01.01");

  exif["Exif.Photo.DateTimeOriginal"] = std::string("    ");
  EXPECT_EQ(extractor.extract(exif).date_text, "2024.01.01");
}

TEST_F(MetadataTest, GPSGivesPlaceholder) {
  exif["Exif.GPSInfo.GPSLatitudeRef"] = std::string("N");
  CaptureMetadata metadata = extractor.extract(exif);
  EXPECT_EQ(metadata.location_text, "LOCATION");
  EXPECT_EQ(metadata.date_text, "2024.01.01");
}

TEST_F(MetadataTest, NonGPSTagsGiveFallbackLocation) {
  exif["Exif.Image.Make"] = std::string("Nikon");
  exif["Exif.Photo.DateTimeOriginal"] = std::string("2024:03:15 10:30:00");
  EXPECT_FALSE(extractor.location(exif).defined());
  EXPECT_EQ(extractor.extract(exif).location_text, "SHENZHEN");
}

TEST_F(MetadataTest, ExtractIsRepeatable) {
  exif["Exif.Photo.DateTimeOriginal"] = std::string("2024:03:15 10:30:00");
  exif["Exif.GPSInfo.GPSLatitudeRef"] = std::string("N");
  CaptureMetadata first = extractor.extract(exif);
  CaptureMetadata second = extractor.extract(exif);
  EXPECT_EQ(first.date_text, second.date_text);
  EXPECT_EQ(first.location_text, second.location_text);
}

TEST(MetadataConfigTest, FallbacksFromConfig) {
  PostcardConfig config;
  config.read_config(YAML::Load("{ fallback: { date: 'undated', location: 'Somewhere' }, location_placeholder: 'GPS' }"));
  MetadataExtractor extractor(config);

  Exiv2::ExifData exif;
  CaptureMetadata metadata = extractor.extract(exif);
  EXPECT_EQ(metadata.date_text, "undated");
  EXPECT_EQ(metadata.location_text, "Somewhere");

  exif["Exif.GPSInfo.GPSLatitudeRef"] = std::string("S");
  EXPECT_EQ(extractor.extract(exif).location_text, "GPS");
}
