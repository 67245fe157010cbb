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
#include <stdlib.h>
#include <string.h>
#include "Image.hh"
#include "Benchmark.hh"

namespace PhotoPostcard {

  std::ostream& operator<< (std::ostream& out, const Colour& c) {
    out << "(" << (int)c.r << ", " << (int)c.g << ", " << (int)c.b << ")";
    return out;
  }

  Image::Image(unsigned int w, unsigned int h, CMS::Format f) :
    _width(w),
    _height(h),
    _format(f),
    _row_size(0),
    _rows(h, nullptr)
  {
    _pixel_size = _format.bytes_per_pixel();
    _row_size = _width * _pixel_size;
  }

  Image::~Image() {
    _rows.clear();
  }

  CMS::Profile::ptr Image::default_profile(CMS::ColourModel default_colourmodel, std::string for_desc) {
    switch (default_colourmodel) {
    case CMS::ColourModel::RGB:
      std::cerr << "\tUsing default sRGB profile for " << for_desc << "." << std::endl;
      return CMS::Profile::sRGB();
      break;

    case CMS::ColourModel::Greyscale:
      std::cerr << "\tUsing default greyscale profile for " << for_desc << "." << std::endl;
      return CMS::Profile::sGrey();
      break;

    default:
      std::cerr << "** Cannot assign a default profile for colour model " << default_colourmodel << " **" << std::endl;
    }

    return nullptr;
  }

  Image::ptr Image::transform_colour(CMS::Profile::ptr dest_profile, CMS::Format dest_format, CMS::Intent intent, bool can_free) {
    CMS::Profile::ptr profile = _profile;
    if (profile && (profile->colour_model() != _format.colour_model())) {
      std::cerr << "** Embedded profile is " << profile->colour_model() << " but the pixels are " << _format.colour_model() << ", ignoring it **" << std::endl;
      profile = nullptr;
    }
    if (!profile && (_format.colour_model() == CMS::ColourModel::CMYK) && (_format.bytes_per_channel() == 1)) {
      Image::ptr rgb = _plain_cmyk_to_rgb(can_free);
      if (dest_format == CMS::Format::RGB8())
	return rgb;
      return rgb->transform_colour(dest_profile, dest_format, intent, true);
    }
    if (!profile)
      profile = default_profile(_format, "source");
    if (!profile)
      throw cmsTypeError("No profile for the source colour model", _format);
    if (!dest_profile)
      dest_profile = profile;

    std::cerr << "Transforming colour from \"" << profile->description() << "\" (" << _format << ") to \"" << dest_profile->description() << "\" (" << dest_format << ")..." << std::endl;
    CMS::Transform transform(profile, _format, dest_profile, dest_format, intent);

    auto dest = std::make_shared<Image>(_width, _height, dest_format);
    dest->set_profile(dest_profile);
    dest->set_resolution(_xres, _yres);
    dest->_EXIFtags = _EXIFtags;

    Timer timer;
    timer.start();

    for (unsigned int y = 0; y < _height; y++) {
      if (_rows[y] == nullptr)
	throw Uninitialised("Image", "row " + std::to_string(y));
      dest->check_row_alloc(y);
      transform.apply(row(y)->data(), dest->row(y)->data(), _width);

      if (can_free)
	this->free_row(y);

      std::cerr << "\r\tTransformed " << y + 1 << " of " << _height << " rows";
    }
    timer.stop();
    std::cerr << "\r\tTransformed " << _height << " of " << _height << " rows." << std::endl;

    long long pixel_count = (long long)_width * _height;
    benchmark_report("Transformed colourspace of " + std::to_string(pixel_count) + " pixels", timer, pixel_count);

    return dest;
  }

  Image::ptr Image::_plain_cmyk_to_rgb(bool can_free) {
    std::cerr << "** No profile for CMYK pixels, using a plain conversion to sRGB **" << std::endl;
    auto dest = std::make_shared<Image>(_width, _height, CMS::Format::RGB8());
    dest->set_profile(CMS::Profile::sRGB());
    dest->set_resolution(_xres, _yres);
    dest->_EXIFtags = _EXIFtags;

    // Inverted (Adobe) CMYK stores 0 for full ink
    int invert = _format.is_vanilla() ? 255 : 0;
    for (unsigned int y = 0; y < _height; y++) {
      if (_rows[y] == nullptr)
	throw Uninitialised("Image", "row " + std::to_string(y));
      dest->check_row_alloc(y);
      const unsigned char *in = row(y)->data();
      unsigned char *out = dest->row(y)->data();
      for (unsigned int x = 0; x < _width; x++, in += _pixel_size, out += 3) {
	int white = 255 - abs(invert - in[3]);
	for (int c = 0; c < 3; c++)
	  out[c] = ((255 - abs(invert - in[c])) * white + 127) / 255;
      }

      if (can_free)
	this->free_row(y);
    }

    return dest;
  }

  void Image::_check_RGB8(const char* method) const {
    if (_format != CMS::Format::RGB8())
      throw cmsTypeError(std::string("Image::") + method + " needs 8-bit RGB", _format);
  }

  void Image::fill(const Colour& c) {
    _check_RGB8("fill");

    for (unsigned int y = 0; y < _height; y++) {
      check_row_alloc(y);
      unsigned char *out = row(y)->data();
      for (unsigned int x = 0; x < _width; x++, out += 3) {
	out[0] = c.r;
	out[1] = c.g;
	out[2] = c.b;
      }
    }
  }

  void Image::paste(Image::ptr src, int x, int y) {
    _check_RGB8("paste");
    src->_check_RGB8("paste");

    int left = x < 0 ? -x : 0;
    int right = (int)src->width();
    if (x + right > (int)_width)
      right = (int)_width - x;
    if (right <= left)
      return;

    for (int sy = 0; sy < (int)src->height(); sy++) {
      int dy = y + sy;
      if ((dy < 0) || (dy >= (int)_height))
	continue;
      if (src->row(sy) == nullptr)
	throw Uninitialised("Image", "row " + std::to_string(sy));
      check_row_alloc(dy);
      memcpy(row(dy)->data(x + left), src->row(sy)->data(left), (right - left) * 3);
    }
  }

  void Image::blend_pixel(int x, int y, const Colour& c, unsigned char alpha) {
    if ((x < 0) || (y < 0) || (x >= (int)_width) || (y >= (int)_height) || (alpha == 0))
      return;

    check_row_alloc(y);
    unsigned char *out = row(y)->data(x);
    out[0] = out[0] + (((int)c.r - out[0]) * alpha + 127) / 255;
    out[1] = out[1] + (((int)c.g - out[1]) * alpha + 127) / 255;
    out[2] = out[2] + (((int)c.b - out[2]) * alpha + 127) / 255;
  }

  Colour Image::pixel(unsigned int x, unsigned int y) const {
    _check_RGB8("pixel");
    if ((x >= _width) || (y >= _height) || (_rows[y] == nullptr))
      throw Uninitialised("Image", "pixel");

    const unsigned char *in = row(y)->data(x);
    return Colour(in[0], in[1], in[2]);
  }

  Image::ptr Image::rotate_90(bool can_free) {
    std::cerr << "Rotating " << _width << "×" << _height << " image 90° anti-clockwise..." << std::endl;
    auto dest = std::make_shared<Image>(_height, _width, _format);
    dest->set_profile(_profile);
    dest->set_resolution(_yres, _xres);
    dest->_EXIFtags = _EXIFtags;

    for (unsigned int dy = 0; dy < _width; dy++)
      dest->check_row_alloc(dy);

    // Source row y becomes destination column y, read from right to left
    for (unsigned int y = 0; y < _height; y++) {
      if (_rows[y] == nullptr)
	throw Uninitialised("Image", "row " + std::to_string(y));
      const unsigned char *in = row(y)->data();
      for (unsigned int x = 0; x < _width; x++, in += _pixel_size)
	memcpy(dest->row(_width - 1 - x)->data(y), in, _pixel_size);

      if (can_free)
	free_row(y);
    }

    return dest;
  }

} // namespace PhotoPostcard
