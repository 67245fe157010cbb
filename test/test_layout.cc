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
#include "Layout.hh"
#include "Exception.hh"

using namespace PhotoPostcard;

class LayoutTest : public ::testing::Test {
protected:
  PostcardConfig config;
  LayoutPlanner planner;

  LayoutTest() :
    planner(config)
  {}
};

TEST_F(LayoutTest, StripAndPhotoHeights) {
  EXPECT_EQ(planner.strip_height(), 314u);
  EXPECT_EQ(planner.available_height(), 1433u);
}

TEST_F(LayoutTest, RotationNeedsMoreThanTenPercent) {
  // Rotated fit is exactly 10% larger
  EXPECT_FALSE(planner.plan_rotation(1100, 1000));
  EXPECT_TRUE(planner.plan_rotation(1101, 1000));
}

TEST_F(LayoutTest, WideLandscapeRotates) {
  EXPECT_TRUE(planner.plan_rotation(4000, 3000));
  EXPECT_TRUE(planner.plan_rotation(6000, 4000));
}

TEST_F(LayoutTest, PortraitAndSquareNeverRotate) {
  EXPECT_FALSE(planner.plan_rotation(3000, 4000));
  EXPECT_FALSE(planner.plan_rotation(1000, 1000));
  EXPECT_FALSE(planner.plan_rotation(1, 10000));
  EXPECT_FALSE(planner.plan_rotation(1240, 1748));
}

TEST_F(LayoutTest, HeightLimitedContent) {
  auto size = planner.plan_content_size(3000, 4000);
  EXPECT_EQ(size.first, 1074u);
  EXPECT_EQ(size.second, 1433u);
}

TEST_F(LayoutTest, WidthLimitedContent) {
  auto size = planner.plan_content_size(4000, 3000);
  EXPECT_EQ(size.first, 1240u);
  EXPECT_EQ(size.second, 930u);
}

TEST_F(LayoutTest, SmallImagesAreUpscaled) {
  auto size = planner.plan_content_size(100, 100);
  EXPECT_EQ(size.first, 1240u);
  EXPECT_EQ(size.second, 1240u);

  size = planner.plan_content_size(10, 20);
  EXPECT_EQ(size.first, 716u);
  EXPECT_EQ(size.second, 1433u);
}

TEST_F(LayoutTest, ContentKeepsAspectWithinBounds) {
  const unsigned int sizes[][2] = {
    { 4000, 3000 }, { 3000, 4000 }, { 1, 1 }, { 1240, 1433 }, { 1241, 1434 },
    { 7, 3 }, { 3, 7 }, { 6016, 4016 }, { 4016, 6016 }, { 1920, 1080 },
    { 999, 1001 }, { 12345, 678 }, { 678, 12345 },
  };

  for (auto& s : sizes) {
    unsigned long long w = s[0], h = s[1];
    auto size = planner.plan_content_size(w, h);
    unsigned long long nw = size.first, nh = size.second;
    SCOPED_TRACE(std::to_string(w) + "×" + std::to_string(h));

    EXPECT_LE(nw, 1240u);
    EXPECT_LE(nh, 1433u);
    EXPECT_TRUE((nw == 1240) || (nh == 1433));

    // The other side is the exact scaled value rounded down
    if (nw == 1240) {
      EXPECT_LE(nh * w, h * 1240);
      EXPECT_GT((nh + 1) * w, h * 1240);
    } else {
      EXPECT_LE(nw * h, w * 1433);
      EXPECT_GT((nw + 1) * h, w * 1433);
    }
  }
}

TEST_F(LayoutTest, ZeroDimensionIsRejected) {
  EXPECT_THROW(planner.plan_content_size(0, 100), GeometryError);
  EXPECT_THROW(planner.plan_content_size(100, 0), GeometryError);
  EXPECT_THROW(planner.plan(0, 0), GeometryError);
}

TEST_F(LayoutTest, ExtremeAspectKeepsOnePixel) {
  auto size = planner.plan_content_size(100000, 1);
  EXPECT_EQ(size.first, 1240u);
  EXPECT_EQ(size.second, 1u);

  size = planner.plan_content_size(1, 100000);
  EXPECT_EQ(size.first, 1u);
  EXPECT_EQ(size.second, 1433u);
}

TEST_F(LayoutTest, ContentIsCentred) {
  CanvasPlan plan = planner.plan_canvas(1074, 1433);
  EXPECT_EQ(plan.content_x, 83u);
  EXPECT_EQ(plan.content_y, 0u);
  EXPECT_EQ(plan.strip_top, 1433u);
  EXPECT_EQ(plan.strip_height, 314u);
  EXPECT_EQ(plan.canvas_width, 1240u);
  EXPECT_EQ(plan.canvas_height, 1748u);

  EXPECT_EQ(planner.plan_canvas(1240, 930).content_x, 0u);
  EXPECT_EQ(planner.plan_canvas(1, 1433).content_x, 619u);
}

TEST_F(LayoutTest, OversizedContentIsNotOffsetNegatively) {
  CanvasPlan plan = planner.plan_canvas(1300, 1433);
  EXPECT_EQ(plan.content_x, 0u);
}

TEST_F(LayoutTest, FullPlanForLandscapePhoto) {
  CanvasPlan plan = planner.plan(4000, 3000);
  EXPECT_TRUE(plan.rotated);
  EXPECT_EQ(plan.content_width, 1074u);
  EXPECT_EQ(plan.content_height, 1433u);
  EXPECT_EQ(plan.content_x, 83u);
  EXPECT_EQ(plan.strip_top, 1433u);
  EXPECT_LE(plan.content_height + plan.strip_height, plan.canvas_height);
}

TEST_F(LayoutTest, FullPlanForPortraitPhoto) {
  CanvasPlan plan = planner.plan(3000, 4000);
  EXPECT_FALSE(plan.rotated);
  EXPECT_EQ(plan.content_width, 1074u);
  EXPECT_EQ(plan.content_height, 1433u);
}

TEST(LayoutConfigTest, ThresholdAndStripFromConfig) {
  PostcardConfig config;
  config.read_config(YAML::Load("{ strip_ratio: 0.25, rotate_threshold: 1.0 }"));
  LayoutPlanner planner(config);

  EXPECT_EQ(planner.strip_height(), 437u);
  EXPECT_EQ(planner.available_height(), 1311u);
  // Any gain at all is enough now
  EXPECT_TRUE(planner.plan_rotation(1100, 1000));
}
