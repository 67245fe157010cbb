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
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <exiv2/exiv2.hpp>
#include "Composer.hh"
#include "ImageFile.hh"
#include "Exception.hh"
#include "test_helpers.hh"

using namespace PhotoPostcard;

//! A font that always fails
class BrokenFont : public Font {
public:
  std::string name(void) const { return "broken"; }
  unsigned int ascent(void) const { return 10; }
  unsigned int draw(Image::ptr img, int x, int y, const std::string& text, const Colour& colour) const {
    throw LibraryError("FreeType", "no glyphs today");
  }
};

//! A font that draws one line, then fails
class OneLineFont : public BuiltinFont {
private:
  mutable unsigned int _lines;

public:
  OneLineFont() : BuiltinFont(32), _lines(0) {}

  unsigned int draw(Image::ptr img, int x, int y, const std::string& text, const Colour& colour) const {
    if (_lines++ > 0)
      throw LibraryError("FreeType", "out of glyphs");
    return BuiltinFont::draw(img, x, y, text, colour);
  }
};

class ComposerTest : public TempDirTest {
protected:
  PostcardConfig config;
  PostcardComposer composer;
  const Colour background;

  ComposerTest() :
    composer(config, std::make_shared<BuiltinFont>(32)),
    background(248, 246, 240)
  {}

  void SetUp() override {
    TempDirTest::SetUp();
    lcms2_error_adaptor();
  }
};

TEST_F(ComposerTest, RenderLaysOutLandscapePhoto) {
  CaptureMetadata metadata;
  metadata.date_text = "Mar 15, 2024";
  metadata.location_text = "LOCATION";

  auto canvas = composer.render(make_test_image(800, 600), metadata);
  ASSERT_EQ(canvas->width(), 1240u);
  ASSERT_EQ(canvas->height(), 1748u);
  EXPECT_EQ(canvas->format(), CMS::Format::RGB8());

  // Rotated to 1074×1433, centred at x = 83
  EXPECT_EQ(count_differing(canvas, background, 0, 0, 0, 83, 1433), 0u);
  EXPECT_EQ(count_differing(canvas, background, 0, 83 + 1074, 0, 1240 - 83 - 1074, 1433), 0u);
  EXPECT_GT(count_differing(canvas, background, 0, 83, 0, 1074, 1433), 1000000u);

  // Caption lines start a quarter and a half of the strip down
  EXPECT_EQ(count_differing(canvas, background, 0, 0, 1433, 1240, 78), 0u);
  EXPECT_GT(count_differing(canvas, background, 0, 40, 1511, 400, 28), 0u);
  EXPECT_GT(count_differing(canvas, background, 0, 40, 1589, 400, 28), 0u);
  EXPECT_EQ(count_differing(canvas, background, 0, 0, 1433, 40, 315), 0u);
  EXPECT_EQ(count_differing(canvas, background, 0, 0, 1617, 1240, 131), 0u);
  EXPECT_EQ(canvas->pixel(40, 1511), config.text_colour());
}

TEST_F(ComposerTest, RenderConvertsGreyscale) {
  auto grey = std::make_shared<Image>(300, 400, CMS::Format::Grey8());
  for (unsigned int y = 0; y < 400; y++) {
    grey->check_row_alloc(y);
    for (unsigned int x = 0; x < 300; x++)
      grey->row(y)->data()[x] = 100;
  }

  CaptureMetadata metadata;
  auto canvas = composer.render(grey, metadata);
  ASSERT_EQ(canvas->width(), 1240u);
  Colour c = canvas->pixel(620, 700);
  EXPECT_NEAR(c.r, c.g, 2);
  EXPECT_NEAR(c.g, c.b, 2);
}

TEST_F(ComposerTest, CaptionFailureLeavesBlankStrip) {
  PostcardComposer broken(config, std::make_shared<BrokenFont>());
  CaptureMetadata metadata;
  metadata.date_text = "Mar 15, 2024";
  metadata.location_text = "SHENZHEN";

  auto canvas = broken.render(make_test_image(600, 800), metadata);
  ASSERT_EQ(canvas->height(), 1748u);
  EXPECT_EQ(count_differing(canvas, background, 0, 0, 1433, 1240, 315), 0u);
}

TEST_F(ComposerTest, SecondLineFailureLeavesBlankStrip) {
  auto font = std::make_shared<OneLineFont>();
  PostcardComposer half(config, font);
  CaptureMetadata metadata;
  metadata.date_text = "Mar 15, 2024";
  metadata.location_text = "SHENZHEN";

  auto canvas = half.render(make_test_image(600, 800), metadata);
  ASSERT_EQ(canvas->height(), 1748u);
  EXPECT_EQ(count_differing(canvas, background, 0, 0, 1433, 1240, 315), 0u);
}

TEST_F(ComposerTest, ComposesLandscapeJPEG) {
  fs::path source = _dir / "holiday.jpg";
  fs::path output = _dir / "holiday_postcard.jpg";
  write_test_jpeg(source, 4000, 3000, "2024:03:15 10:30:00", true);
  std::string before = slurp(source);

  ASSERT_TRUE(composer.compose(source, output));
  ASSERT_TRUE(fs::exists(output));
  EXPECT_EQ(slurp(source), before);
  EXPECT_FALSE(fs::exists(_dir / ".holiday_postcard.jpg.tmp"));

  auto postcard = JPEGreader(output).read();
  ASSERT_EQ(postcard->width(), 1240u);
  ASSERT_EQ(postcard->height(), 1748u);
  ASSERT_TRUE(postcard->xres().defined());
  EXPECT_DOUBLE_EQ(postcard->xres().get(), 300);

  auto& exif = postcard->EXIFtags();
  auto xres = exif.findKey(Exiv2::ExifKey("Exif.Image.XResolution"));
  ASSERT_NE(xres, exif.end());
  EXPECT_FLOAT_EQ(xres->toFloat(), 300);
  auto software = exif.findKey(Exiv2::ExifKey("Exif.Image.Software"));
  ASSERT_NE(software, exif.end());
  EXPECT_EQ(software->toString(), "Photo Postcard");

  // Background strip below the photo, allowing for JPEG error
  EXPECT_EQ(count_differing(postcard, background, 8, 0, 1448, 1240, 52), 0u);
  EXPECT_EQ(count_differing(postcard, background, 8, 0, 1630, 1240, 110), 0u);
  EXPECT_EQ(count_differing(postcard, background, 8, 0, 0, 75, 1425), 0u);
  // Caption pixels
  EXPECT_GT(count_differing(postcard, background, 60, 40, 1511, 400, 28), 50u);
  EXPECT_GT(count_differing(postcard, background, 60, 40, 1589, 400, 28), 50u);
}

TEST_F(ComposerTest, ComposesPNG) {
  fs::path source = _dir / "scan.png";
  fs::path output = _dir / "scan_postcard.jpg";
  write_test_png(source, 300, 200);

  ASSERT_TRUE(composer.compose(source, output));
  auto postcard = JPEGreader(output).read();
  EXPECT_EQ(postcard->width(), 1240u);
  EXPECT_EQ(postcard->height(), 1748u);
}

TEST_F(ComposerTest, UndecodableSourceFails) {
  fs::path source = _dir / "broken.jpg";
  {
    fs::ofstream ofs(source);
    ofs << "not really a JPEG";
  }
  fs::path output = _dir / "broken_postcard.jpg";

  EXPECT_FALSE(composer.compose(source, output));
  EXPECT_FALSE(fs::exists(output));
  EXPECT_FALSE(fs::exists(_dir / ".broken_postcard.jpg.tmp"));
  EXPECT_EQ(slurp(source), "not really a JPEG");
}

TEST_F(ComposerTest, MissingSourceFails) {
  EXPECT_FALSE(composer.compose(_dir / "nothing.jpg", _dir / "nothing_postcard.jpg"));
  EXPECT_FALSE(fs::exists(_dir / "nothing_postcard.jpg"));
}

TEST_F(ComposerTest, UnwritableOutputFails) {
  fs::path source = _dir / "small.jpg";
  write_test_jpeg(source, 200, 100);
  EXPECT_FALSE(composer.compose(source, _dir / "no" / "such" / "dir" / "small_postcard.jpg"));
}

#ifdef HAZ_TIFF
TEST_F(ComposerTest, ComposesTIFF) {
  fs::path source = _dir / "scan.tiff";
  fs::path output = _dir / "scan_postcard.jpg";
  write_test_tiff(source, 400, 300);

  ASSERT_TRUE(composer.compose(source, output));
  auto postcard = JPEGreader(output).read();
  EXPECT_EQ(postcard->width(), 1240u);
  EXPECT_EQ(postcard->height(), 1748u);
}

TEST_F(ComposerTest, ReadsSixteenBitTIFFWithAlpha) {
  fs::path source = _dir / "deep.tif";
  write_test_tiff(source, 64, 48, 16, true);

  auto img = TIFFreader(source).read();
  ASSERT_EQ(img->width(), 64u);
  ASSERT_EQ(img->height(), 48u);
  EXPECT_EQ(img->format().colour_model(), CMS::ColourModel::RGB);
  EXPECT_EQ(img->format().bytes_per_channel(), 2u);
  EXPECT_EQ(img->format().extra_channels(), 1u);
  ASSERT_TRUE(img->xres().defined());
  EXPECT_DOUBLE_EQ(img->xres().get(), 150);

  // The transparent alpha channel is ignored
  auto rgb = img->transform_colour(CMS::Profile::sRGB(), CMS::Format::RGB8());
  Colour left = rgb->pixel(0, 0), right = rgb->pixel(63, 0);
  EXPECT_NEAR(left.r, 0, 2);
  EXPECT_NEAR(right.r, 255, 2);
  EXPECT_NEAR(left.b, 40, 2);

  CaptureMetadata metadata;
  auto canvas = composer.render(img, metadata);
  EXPECT_EQ(canvas->width(), 1240u);
  EXPECT_EQ(canvas->height(), 1748u);
}
#endif
