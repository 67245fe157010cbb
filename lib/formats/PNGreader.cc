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
#include <errno.h>
#include <png.h>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <iostream>
#include "ImageFile.hh"
#include "Image.hh"
#include "PNGreader_cb.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  PNGreader::PNGreader(const fs::path filepath) :
    ImageReader(filepath),
    _png(NULL), _info(NULL)
  {}

  Image::ptr PNGreader::read(void) {
    if (_is_open)
      throw FileOpenError(_filepath.native(), "already open");
    _is_open = true;

    std::cerr << "Opening file " << _filepath << "..." << std::endl;
    fs::ifstream ifs(_filepath, std::ios_base::in | std::ios_base::binary);
    if (ifs.fail()) {
      _is_open = false;
      throw FileOpenError(_filepath.native());
    }

    {
      unsigned char header[8];
      ifs.read((char*)header, 8);
      if ((ifs.gcount() < 8) || png_sig_cmp(header, 0, 8)) {
	_is_open = false;
	throw FileContentError(_filepath.string(), "is not a PNG file");
      }
      ifs.seekg(0, std::ios_base::beg);
    }

    _png = png_create_read_struct(PNG_LIBPNG_VER_STRING,
				  NULL, NULL, NULL);
    if (!_png) {
      _is_open = false;
      throw LibraryError("libpng", "Could not create PNG read structure");
    }

    _info = png_create_info_struct(_png);
    if (!_info) {
      png_destroy_read_struct(&_png, (png_infopp)NULL, (png_infopp)NULL);
      _is_open = false;
      throw LibraryError("libpng", "Could not create PNG info structure");
    }

    PNGreader_cb cb;
    std::vector<png_byte> buffer(1048576);

    if (setjmp(png_jmpbuf(_png))) {
      png_destroy_read_struct(&_png, &_info, NULL);
      _is_open = false;
      throw LibraryError("libpng", "Something went wrong reading the PNG");
    }

    std::cerr << "\tReading PNG image..." << std::endl;
    try {
      png_set_progressive_read_fn(_png, (void *)&cb, png_info_cb, png_row_cb, png_end_cb);
      size_t length;
      do {
	ifs.read((char*)buffer.data(), buffer.size());
	length = ifs.gcount();
	if (length > 0)
	  png_process_data(_png, _info, buffer.data(), length);
      } while (length > 0);
    } catch (std::exception& ex) {
      png_destroy_read_struct(&_png, &_info, NULL);
      _is_open = false;
      throw;
    }

    png_destroy_read_struct(&_png, &_info, NULL);
    ifs.close();
    _is_open = false;

    if (!cb._finished)
      throw FileContentError(_filepath.string(), "PNG data is truncated");

    std::cerr << "\tExtracting tags..." << std::endl;
    extract_tags(cb._image);

    std::cerr << "Done." << std::endl;
    return cb._image;
  }

}
