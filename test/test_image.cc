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
#include <string.h>
#include <gtest/gtest.h>
#include "Image.hh"
#include "Frame.hh"
#include "Resampler.hh"
#include "Exception.hh"
#include "test_helpers.hh"

using namespace PhotoPostcard;

TEST(ImageTest, FillSetsEveryPixel) {
  auto img = std::make_shared<Image>(7, 5, CMS::Format::RGB8());
  img->fill(Colour(248, 246, 240));
  EXPECT_EQ(count_differing(img, Colour(248, 246, 240), 0, 0, 0, 7, 5), 0u);
}

TEST(ImageTest, FillNeedsRGB8) {
  auto img = std::make_shared<Image>(7, 5, CMS::Format::Grey8());
  EXPECT_THROW(img->fill(Colour(1, 2, 3)), cmsTypeError);
}

TEST(ImageTest, PasteClipsAtEdges) {
  auto canvas = make_solid_image(10, 10, Colour(0, 0, 0));
  auto patch = make_solid_image(4, 4, Colour(255, 0, 0));

  canvas->paste(patch, 8, -2);
  EXPECT_EQ(canvas->pixel(8, 0), Colour(255, 0, 0));
  EXPECT_EQ(canvas->pixel(9, 1), Colour(255, 0, 0));
  EXPECT_EQ(canvas->pixel(9, 2), Colour(0, 0, 0));
  EXPECT_EQ(canvas->pixel(7, 0), Colour(0, 0, 0));
  EXPECT_EQ(count_differing(canvas, Colour(0, 0, 0), 0, 0, 0, 10, 10), 4u);

  // Entirely outside
  canvas->paste(patch, 20, 20);
  EXPECT_EQ(count_differing(canvas, Colour(0, 0, 0), 0, 0, 0, 10, 10), 4u);
}

TEST(ImageTest, BlendPixel) {
  auto img = make_solid_image(3, 3, Colour(200, 200, 200));

  img->blend_pixel(0, 0, Colour(0, 100, 250), 255);
  EXPECT_EQ(img->pixel(0, 0), Colour(0, 100, 250));

  img->blend_pixel(1, 1, Colour(0, 100, 250), 0);
  EXPECT_EQ(img->pixel(1, 1), Colour(200, 200, 200));

  img->blend_pixel(2, 2, Colour(0, 0, 0), 128);
  Colour half = img->pixel(2, 2);
  EXPECT_NEAR(half.r, 100, 1);

  // Outside the image, nothing happens
  img->blend_pixel(-1, 0, Colour(0, 0, 0), 255);
  img->blend_pixel(3, 3, Colour(0, 0, 0), 255);
  EXPECT_EQ(count_differing(img, Colour(200, 200, 200), 0, 0, 0, 3, 3), 2u);
}

TEST(ImageTest, RotateIsCounterClockwise) {
  auto img = std::make_shared<Image>(3, 2, CMS::Format::RGB8());
  img->fill(Colour(0, 0, 0));
  for (unsigned int y = 0; y < 2; y++)
    for (unsigned int x = 0; x < 3; x++)
      img->blend_pixel(x, y, Colour(x * 10, y * 10, 77), 255);
  img->set_resolution(100, 200);

  auto rotated = img->rotate_90();
  ASSERT_EQ(rotated->width(), 2u);
  ASSERT_EQ(rotated->height(), 3u);

  // The top-right corner ends up top-left
  EXPECT_EQ(rotated->pixel(0, 0), Colour(20, 0, 77));
  EXPECT_EQ(rotated->pixel(1, 0), Colour(20, 10, 77));
  EXPECT_EQ(rotated->pixel(0, 2), Colour(0, 0, 77));
  EXPECT_EQ(rotated->pixel(1, 2), Colour(0, 10, 77));
  for (unsigned int y = 0; y < 2; y++)
    for (unsigned int x = 0; x < 3; x++)
      EXPECT_EQ(rotated->pixel(y, 2 - x), img->pixel(x, y));

  EXPECT_DOUBLE_EQ(rotated->xres().get(), 200);
  EXPECT_DOUBLE_EQ(rotated->yres().get(), 100);
}

TEST(ResamplerTest, WeightsSumToOne) {
  Filter::ptr filter = std::make_shared<Lanczos>();
  for (unsigned int to : { 1u, 7u, 50u, 333u }) {
    Resampler r(filter, 0, 100, 100, to);
    ASSERT_EQ(r.size(), to);
    for (unsigned int i = 0; i < to; i++) {
      SAMPLE total = 0;
      for (unsigned int j = 0; j < r.N(i); j++)
	total += r.Weight(i)[j];
      EXPECT_NEAR(total, 1.0, 1e-4);
      EXPECT_LT(r.Start(i) + r.N(i), 101u);
    }
  }
}

TEST(FrameTest, SolidColourStaysSolid) {
  auto img = make_solid_image(100, 80, Colour(10, 200, 30));
  auto resized = Frame(37, 29).resize(img);
  ASSERT_EQ(resized->width(), 37u);
  ASSERT_EQ(resized->height(), 29u);
  EXPECT_EQ(count_differing(resized, Colour(10, 200, 30), 0, 0, 0, 37, 29), 0u);

  auto enlarged = Frame(250, 200).resize(img);
  EXPECT_EQ(count_differing(enlarged, Colour(10, 200, 30), 0, 0, 0, 250, 200), 0u);
}

TEST(FrameTest, KeepsGradientDirection) {
  auto img = make_test_image(400, 300);
  auto resized = Frame(100, 75).resize(img);
  EXPECT_LT(resized->pixel(5, 37).r, resized->pixel(94, 37).r);
  EXPECT_LT(resized->pixel(50, 5).g, resized->pixel(50, 70).g);
}

TEST(FrameTest, CanFreeReleasesSourceRows) {
  auto img = make_solid_image(40, 40, Colour(1, 2, 3));
  Frame(10, 10).resize(img, nullptr, true);
  EXPECT_EQ(img->row(0), nullptr);
}

TEST(FrameTest, EmptyTargetIsRejected) {
  auto img = make_solid_image(40, 40, Colour(1, 2, 3));
  EXPECT_THROW(Frame(0, 10).resize(img), GeometryError);
}

TEST(TransformTest, GreyBecomesNeutralRGB) {
  auto grey = std::make_shared<Image>(4, 4, CMS::Format::Grey8());
  for (unsigned int y = 0; y < 4; y++) {
    grey->check_row_alloc(y);
    for (unsigned int x = 0; x < 4; x++)
      grey->row(y)->data()[x] = 128;
  }

  auto rgb = grey->transform_colour(CMS::Profile::sRGB(), CMS::Format::RGB8());
  ASSERT_EQ(rgb->format(), CMS::Format::RGB8());
  Colour c = rgb->pixel(2, 2);
  EXPECT_NEAR(c.r, 128, 3);
  EXPECT_NEAR(c.g, c.r, 2);
  EXPECT_NEAR(c.b, c.r, 2);
}

TEST(TransformTest, MismatchedProfileIsIgnored) {
  auto grey = std::make_shared<Image>(2, 2, CMS::Format::Grey8());
  for (unsigned int y = 0; y < 2; y++) {
    grey->check_row_alloc(y);
    grey->row(y)->data()[0] = grey->row(y)->data()[1] = 200;
  }
  grey->set_profile(CMS::Profile::sRGB());
  EXPECT_EQ(grey->profile()->colour_model(), CMS::ColourModel::RGB);

  auto rgb = grey->transform_colour(CMS::Profile::sRGB(), CMS::Format::RGB8());
  Colour c = rgb->pixel(1, 1);
  EXPECT_NEAR(c.r, 200, 3);
  EXPECT_NEAR(c.b, c.r, 2);
}

static Image::ptr make_cmyk_image(bool inverted, const unsigned char (*pixels)[4], unsigned int count) {
  CMS::Format format;
  format.set_8bit();
  format.set_colour_model(CMS::ColourModel::CMYK);
  format.set_vanilla(inverted);
  auto img = std::make_shared<Image>(count, 1, format);
  img->check_row_alloc(0);
  memcpy(img->row(0)->data(), pixels, count * 4);
  return img;
}

TEST(TransformTest, ProfilelessCMYKIsConverted) {
  const unsigned char pixels[3][4] = { { 0, 0, 0, 0 }, { 255, 0, 0, 0 }, { 0, 0, 0, 128 } };
  auto rgb = make_cmyk_image(false, pixels, 3)->transform_colour(CMS::Profile::sRGB(), CMS::Format::RGB8());
  ASSERT_EQ(rgb->format(), CMS::Format::RGB8());
  EXPECT_EQ(rgb->pixel(0, 0), Colour(255, 255, 255));
  EXPECT_EQ(rgb->pixel(1, 0), Colour(0, 255, 255));
  EXPECT_EQ(rgb->pixel(2, 0), Colour(127, 127, 127));
}

TEST(TransformTest, InvertedCMYKIsConverted) {
  const unsigned char pixels[2][4] = { { 255, 255, 255, 255 }, { 255, 0, 255, 255 } };
  auto rgb = make_cmyk_image(true, pixels, 2)->transform_colour(CMS::Profile::sRGB(), CMS::Format::RGB8());
  EXPECT_EQ(rgb->pixel(0, 0), Colour(255, 255, 255));
  EXPECT_EQ(rgb->pixel(1, 0), Colour(255, 0, 255));
}
