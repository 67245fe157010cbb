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
#include <boost/filesystem/fstream.hpp>
#include "Config.hh"
#include "Exception.hh"
#include "test_helpers.hh"

using namespace PhotoPostcard;

TEST(ConfigTest, DefaultsAreA6At300DPI) {
  PostcardConfig config;
  EXPECT_EQ(config.canvas_width(), 1240u);
  EXPECT_EQ(config.canvas_height(), 1748u);
  EXPECT_DOUBLE_EQ(config.dpi(), 300);
  EXPECT_EQ(config.background(), Colour(248, 246, 240));
  EXPECT_EQ(config.text_colour(), Colour(90, 90, 90));
  EXPECT_DOUBLE_EQ(config.strip_ratio(), 0.18);
  EXPECT_DOUBLE_EQ(config.rotate_threshold(), 1.1);
  EXPECT_EQ(config.margin(), 40u);
  EXPECT_EQ(config.font_size(), 32u);
  ASSERT_EQ(config.font_paths().size(), 3u);
  EXPECT_EQ(config.font_paths()[2], "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
  EXPECT_EQ(config.jpeg().quality(), 95);
  EXPECT_EQ(config.jpeg().sample(), std::make_pair(2, 2));
  EXPECT_FALSE(config.jpeg().progressive());
  EXPECT_EQ(config.fallback_date(), "2024.01.01");
  EXPECT_EQ(config.fallback_location(), "SHENZHEN");
  EXPECT_EQ(config.location_placeholder(), "LOCATION");
  EXPECT_EQ(config.suffix(), "_postcard");
  EXPECT_EQ(config.extensions().size(), 6u);
}

TEST(ConfigTest, OverridesPresentKeysOnly) {
  PostcardConfig config;
  config.read_config(YAML::Load(
    "canvas: { width: 600 }\n"
    "background: [255, 255, 255]\n"
    "font: { size: 20, paths: [ 'a.ttf' ] }\n"
    "jpeg: { qual: 80, sample: '1x1', pro: true }\n"
    "suffix: _card\n"
    "something_else: 42\n"));

  EXPECT_EQ(config.canvas_width(), 600u);
  EXPECT_EQ(config.canvas_height(), 1748u);
  EXPECT_EQ(config.background(), Colour(255, 255, 255));
  EXPECT_EQ(config.text_colour(), Colour(90, 90, 90));
  EXPECT_EQ(config.font_size(), 20u);
  ASSERT_EQ(config.font_paths().size(), 1u);
  EXPECT_EQ(config.jpeg().quality(), 80);
  EXPECT_EQ(config.jpeg().sample(), std::make_pair(1, 1));
  EXPECT_TRUE(config.jpeg().progressive());
  EXPECT_EQ(config.suffix(), "_card");
}

TEST(ConfigTest, InvalidValuesAreRejected) {
  const char* bad[] = {
    "strip_ratio: 1.5",
    "strip_ratio: -0.1",
    "background: [300, 0, 0]",
    "background: [1, 2]",
    "text_colour: grey",
    "canvas: { width: 0 }",
    "dpi: 0",
    "rotate_threshold: 0",
    "margin: 5000",
    "font: { size: 0 }",
    "jpeg: { qual: 0 }",
    "jpeg: { qual: 101 }",
    "jpeg: { sample: '3' }",
    "jpeg: { sample: '5x1' }",
    "suffix: 'a/b'",
    "dpi: lots",
  };

  for (auto text : bad) {
    SCOPED_TRACE(text);
    PostcardConfig config;
    EXPECT_THROW(config.read_config(YAML::Load(text)), ConfigError);
  }
}

class ConfigFileTest : public TempDirTest {};

TEST_F(ConfigFileTest, LoadsFromFile) {
  fs::path filepath = _dir / "postcard.yml";
  {
    fs::ofstream ofs(filepath);
    ofs << "dpi: 150\nfallback:\n  location: HOME\n";
  }

  PostcardConfig config = PostcardConfig::load(filepath);
  EXPECT_DOUBLE_EQ(config.dpi(), 150);
  EXPECT_EQ(config.fallback_location(), "HOME");
  EXPECT_EQ(config.fallback_date(), "2024.01.01");
}

TEST_F(ConfigFileTest, EmptyFileKeepsDefaults) {
  fs::path filepath = _dir / "empty.yml";
  { fs::ofstream ofs(filepath); }

  PostcardConfig config = PostcardConfig::load(filepath);
  EXPECT_EQ(config.canvas_width(), 1240u);
}

TEST_F(ConfigFileTest, MissingFile) {
  EXPECT_THROW(PostcardConfig::load(_dir / "nope.yml"), FileOpenError);
}

TEST_F(ConfigFileTest, MalformedFile) {
  fs::path filepath = _dir / "broken.yml";
  {
    fs::ofstream ofs(filepath);
    ofs << "dpi: [300\n";
  }
  EXPECT_THROW(PostcardConfig::load(filepath), FileContentError);

  {
    fs::ofstream ofs(filepath, std::ios_base::trunc);
    ofs << "- just\n- a list\n";
  }
  EXPECT_THROW(PostcardConfig::load(filepath), FileContentError);
}
