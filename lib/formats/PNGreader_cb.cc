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
#include "PNGreader_cb.hh"
#include "Exception.hh"

namespace PhotoPostcard {

  PNGreader_cb::PNGreader_cb() :
    _finished(false)
  {}

  void PNGreader_cb::info(png_structp png, png_infop info) {
    // Palette, sub-byte greyscale and tRNS all come out as plain 8-bit channels
    png_set_expand(png);
    png_set_gamma(png, 1.0, 1.0);
#ifdef PNG_READ_ALPHA_MODE_SUPPORTED
    png_set_alpha_mode(png, PNG_ALPHA_PNG, 1.0);
#endif
    png_set_swap(png);
    png_set_interlace_handling(png);
    png_read_update_info(png, info);

    png_uint_32 width, height;
    int bit_depth, colour_type;
    png_get_IHDR(png, info, &width, &height, &bit_depth, &colour_type, nullptr, nullptr, nullptr);
    std::cerr << "\t" << width << "×" << height << ", " << bit_depth << " bpp, type " << colour_type << "." << std::endl;

    CMS::Format format;
    switch (bit_depth >> 3) {
    case 1: format.set_8bit();
      break;

    case 2: format.set_16bit();
      break;

    default:
      std::cerr << "** Unknown depth " << bit_depth << " **" << std::endl;
      throw LibraryError("libpng", "Unsupported bit depth " + std::to_string(bit_depth));
    }

    if (colour_type & PNG_COLOR_MASK_COLOR)
      format.set_colour_model(CMS::ColourModel::RGB);
    else
      format.set_colour_model(CMS::ColourModel::Greyscale);

    // Alpha is carried as an extra channel and ignored by the colour transform
    if (colour_type & PNG_COLOR_MASK_ALPHA)
      format.set_extra_channels(1);

    _image = std::make_shared<Image>(width, height, format);

    {
      png_uint_32 xres, yres;
      int unit_type;
      if (png_get_pHYs(png, info, &xres, &yres, &unit_type)) {
	switch (unit_type) {
	case PNG_RESOLUTION_METER:
	  _image->set_resolution(xres * 0.0254, yres * 0.0254);
	  break;

	case PNG_RESOLUTION_UNKNOWN:
	  break;

	default:
	  std::cerr << "** unknown unit type " << unit_type << " **" << std::endl;
	}
	if (_image->xres().defined() && _image->yres().defined())
	  std::cerr << "\tImage has resolution of " << _image->xres() << "×" << _image->yres() << " PPI." << std::endl;
      }
    }

    if (png_get_valid(png, info, PNG_INFO_iCCP)) {
      std::cerr << "\tImage has iCCP chunk." << std::endl;
      png_charp profile_name;
      int compression_type;
      png_bytep profile_data;
      png_uint_32 profile_len;
#if PNG_LIBPNG_VER < 10500
      if (png_get_iCCP(png, info, &profile_name, &compression_type, (png_charpp)&profile_data, &profile_len) == PNG_INFO_iCCP) {
#else
      if (png_get_iCCP(png, info, &profile_name, &compression_type, &profile_data, &profile_len) == PNG_INFO_iCCP) {
#endif
	std::cerr << "\tLoading ICC profile \"" << profile_name << "\" from file..." << std::endl;
	try {
	  auto profile = std::make_shared<CMS::Profile>(profile_data, profile_len);
	  if (profile->valid())
	    _image->set_profile(profile);
	  else
	    std::cerr << "** Ignoring unreadable ICC profile **" << std::endl;
	} catch (LibraryError& ex) {
	  std::cerr << "** Ignoring unusable ICC profile: " << ex.what() << " **" << std::endl;
	}
      }
    }
  }

  void png_info_cb(png_structp png, png_infop info) {
    PNGreader_cb *cb = (PNGreader_cb*)png_get_progressive_ptr(png);
    cb->info(png, info);
  }

  void PNGreader_cb::row(png_structp png, png_bytep row_data, png_uint_32 row_num, int pass) {
    if (row_data == nullptr)
      return;

    _image->check_row_alloc(row_num);
    // Interlaced passes only fill in some of the pixels of each row
    png_progressive_combine_row(png, _image->row(row_num)->data(), row_data);
    std::cerr << "\r\tRead " << (row_num + 1) << " of " << _image->height() << " rows";
  }

  void png_row_cb(png_structp png, png_bytep row_data, png_uint_32 row_num, int pass) {
    PNGreader_cb *cb = (PNGreader_cb*)png_get_progressive_ptr(png);
    cb->row(png, row_data, row_num, pass);
  }

  void PNGreader_cb::end(png_structp png, png_infop info) {
    std::cerr << "\r\tRead " << _image->height() << " of " << _image->height() << " rows." << std::endl;
    _finished = true;
  }

  void png_end_cb(png_structp png, png_infop info) {
    PNGreader_cb *cb = (PNGreader_cb*)png_get_progressive_ptr(png);
    cb->end(png, info);
  }

} // namespace PhotoPostcard
