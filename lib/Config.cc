/*
	Copyright 2014-2024 Ian Tester

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
#include <iostream>
#include <fstream>
#include <boost/lexical_cast.hpp>
#include "Config.hh"

namespace PhotoPostcard {

  //! Convert a YAML node, reporting failures against the field's path
  template <typename T>
  T read_value(const YAML::Node& node, const std::string& path) {
    try {
      return node.as<T>();
    } catch (YAML::Exception& ex) {
      throw ConfigError(path, YAML::Dump(node));
    }
  }

  //! Read an [R, G, B] sequence
  Colour read_colour(const YAML::Node& node, const std::string& path) {
    if (!node.IsSequence() || (node.size() != 3))
      throw ConfigError(path, YAML::Dump(node));

    int c[3];
    for (int i = 0; i < 3; i++) {
      c[i] = read_value<int>(node[i], path);
      if ((c[i] < 0) || (c[i] > 255))
	throw ConfigError(path, YAML::Dump(node));
    }
    return Colour(c[0], c[1], c[2]);
  }



  JPEGsettings::JPEGsettings() :
    _quality(95),
    _sample(2, 2),
    _progressive(false)
  {}

  JPEGsettings::JPEGsettings(int q, int h, int v, bool p) :
    _quality(q),
    _sample(h, v),
    _progressive(p)
  {}

  void JPEGsettings::read_config(const YAML::Node& node) {
    if (node["qual"]) {
      _quality = read_value<int>(node["qual"], "jpeg.qual");
      if ((_quality < 1) || (_quality > 100))
	throw ConfigError("jpeg.qual", std::to_string(_quality));
    }

    if (node["sample"]) {
      std::string sample = read_value<std::string>(node["sample"], "jpeg.sample");
      size_t x = sample.find_first_of("x×");
      size_t y = sample.find_first_not_of("x×", x);
      if ((x == std::string::npos) || (y == std::string::npos))
	throw ConfigError("jpeg.sample", sample);
      try {
	int h = boost::lexical_cast<int>(sample.substr(0, x));
	int v = boost::lexical_cast<int>(sample.substr(y));
	if ((h < 1) || (h > 4) || (v < 1) || (v > 4))
	  throw ConfigError("jpeg.sample", sample);
	_sample = std::pair<int, int>(h, v);
      } catch (boost::bad_lexical_cast &ex) {
	throw ConfigError("jpeg.sample", sample);
      }
    }

    if (node["pro"])
      _progressive = read_value<bool>(node["pro"], "jpeg.pro");
  }



  PostcardConfig::PostcardConfig() :
    _canvas_width(1240), _canvas_height(1748),
    _dpi(300),
    _background(248, 246, 240),
    _text_colour(90, 90, 90),
    _strip_ratio(0.18),
    _rotate_threshold(1.1),
    _margin(40),
    _font_size(32),
    _font_paths({ "arial.ttf",
	  "/System/Library/Fonts/Arial.ttf",
	  "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf" }),
    _fallback_date("2024.01.01"),
    _fallback_location("SHENZHEN"),
    _location_placeholder("LOCATION"),
    _suffix("_postcard"),
    _extensions({ ".jpg", ".jpeg", ".nef", ".raw", ".tiff", ".png" })
  {}

  PostcardConfig PostcardConfig::load(const fs::path& filepath) {
    std::cerr << "Loading configuration from " << filepath << "..." << std::endl;
    std::ifstream fin(filepath.native());
    if (fin.fail())
      throw FileOpenError(filepath.native());

    YAML::Node doc;
    try {
      doc = YAML::Load(fin);
    } catch (YAML::Exception& ex) {
      throw FileContentError(filepath.native(), ex.what());
    }

    PostcardConfig config;
    if (doc.IsMap())
      config.read_config(doc);
    else if (!doc.IsNull())
      throw FileContentError(filepath.native(), "not a map of settings");

    return config;
  }

  void PostcardConfig::read_config(const YAML::Node& node) {
    if (node["canvas"]) {
      YAML::Node canvas = node["canvas"];
      if (canvas["width"])
	_canvas_width = read_value<unsigned int>(canvas["width"], "canvas.width");
      if (canvas["height"])
	_canvas_height = read_value<unsigned int>(canvas["height"], "canvas.height");
    }

    if (node["dpi"])
      _dpi = read_value<double>(node["dpi"], "dpi");

    if (node["background"])
      _background = read_colour(node["background"], "background");

    if (node["text_colour"])
      _text_colour = read_colour(node["text_colour"], "text_colour");

    if (node["strip_ratio"])
      _strip_ratio = read_value<double>(node["strip_ratio"], "strip_ratio");

    if (node["rotate_threshold"])
      _rotate_threshold = read_value<double>(node["rotate_threshold"], "rotate_threshold");

    if (node["margin"])
      _margin = read_value<unsigned int>(node["margin"], "margin");

    if (node["font"]) {
      YAML::Node font = node["font"];
      if (font["size"])
	_font_size = read_value<unsigned int>(font["size"], "font.size");
      if (font["paths"])
	_font_paths = read_value<std::vector<std::string>>(font["paths"], "font.paths");
    }

    if (node["jpeg"])
      _jpeg.read_config(node["jpeg"]);

    if (node["fallback"]) {
      YAML::Node fallback = node["fallback"];
      if (fallback["date"])
	_fallback_date = read_value<std::string>(fallback["date"], "fallback.date");
      if (fallback["location"])
	_fallback_location = read_value<std::string>(fallback["location"], "fallback.location");
    }

    if (node["location_placeholder"])
      _location_placeholder = read_value<std::string>(node["location_placeholder"], "location_placeholder");

    if (node["suffix"])
      _suffix = read_value<std::string>(node["suffix"], "suffix");

    _validate();
  }

  void PostcardConfig::_validate(void) const {
    if ((_canvas_width == 0) || (_canvas_width > 65500))
      throw ConfigError("canvas.width", std::to_string(_canvas_width));
    if ((_canvas_height == 0) || (_canvas_height > 65500))
      throw ConfigError("canvas.height", std::to_string(_canvas_height));
    if ((_dpi <= 0) || (_dpi > 65535))
      throw ConfigError("dpi", std::to_string(_dpi));
    if ((_strip_ratio < 0) || (_strip_ratio >= 1.0))
      throw ConfigError("strip_ratio", std::to_string(_strip_ratio));
    if (_canvas_height * (1.0 - _strip_ratio) < 1.0)
      throw ConfigError("strip_ratio", std::to_string(_strip_ratio));
    if (_rotate_threshold <= 0)
      throw ConfigError("rotate_threshold", std::to_string(_rotate_threshold));
    if (_margin >= _canvas_width)
      throw ConfigError("margin", std::to_string(_margin));
    if (_font_size == 0)
      throw ConfigError("font.size", std::to_string(_font_size));
    if (_suffix.find('/') != std::string::npos)
      throw ConfigError("suffix", _suffix);
  }

}
