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
#include <iostream>
#include <memory>
#include <string.h>
#include <libraw/libraw.h>
#include <boost/filesystem.hpp>
#include "ImageFile.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  RAWreader::RAWreader(const fs::path filepath) :
    ImageReader(filepath)
  {}

#define RAWcheck(x) if ((rc = raw->x) != LIBRAW_SUCCESS) throw LibraryError("LibRaw", #x ": " + std::string(libraw_strerror(rc)))

  Image::ptr RAWreader::read(void) {
    if (_is_open)
      throw FileOpenError(_filepath.native(), "already open");

    std::cerr << "Opening file " << _filepath << "..." << std::endl;
    // LibRaw is too large for the stack
    std::unique_ptr<LibRaw> raw(new LibRaw);
    int rc;
    if ((rc = raw->open_file(_filepath.c_str())) != LIBRAW_SUCCESS) {
      if (rc == LIBRAW_IO_ERROR)
	throw FileOpenError(_filepath.native(), libraw_strerror(rc));
      throw FileContentError(_filepath.native(), libraw_strerror(rc));
    }
    _is_open = true;

    Image::ptr img;
    try {
      std::cerr << "\t" << raw->imgdata.idata.make << " " << raw->imgdata.idata.model
		<< ", " << raw->imgdata.sizes.raw_width << "×" << raw->imgdata.sizes.raw_height << " sensor." << std::endl;

      std::cerr << "\tUnpacking sensor data..." << std::endl;
      RAWcheck(unpack());

      raw->imgdata.params.output_bps = 8;
      raw->imgdata.params.output_color = 1;	// sRGB
      raw->imgdata.params.use_camera_wb = 1;

      std::cerr << "\tDemosaicing..." << std::endl;
      RAWcheck(dcraw_process());

      libraw_processed_image_t *processed = raw->dcraw_make_mem_image(&rc);
      if (processed == nullptr)
	throw LibraryError("LibRaw", "dcraw_make_mem_image: " + std::string(libraw_strerror(rc)));

      if ((processed->type != LIBRAW_IMAGE_BITMAP) || (processed->bits != 8)
	  || ((processed->colors != 1) && (processed->colors != 3))) {
	LibRaw::dcraw_clear_mem(processed);
	throw FileContentError(_filepath.native(), "unexpected decoded image layout");
      }

      CMS::Format format;
      format.set_8bit();
      if (processed->colors == 3)
	format.set_colour_model(CMS::ColourModel::RGB);
      else
	format.set_colour_model(CMS::ColourModel::Greyscale);

      img = std::make_shared<Image>(processed->width, processed->height, format);
      img->set_profile(Image::default_profile(format, "decoded raw data"));

      const unsigned char *in = processed->data;
      for (unsigned int y = 0; y < processed->height; y++, in += img->row_size()) {
	img->check_row_alloc(y);
	memcpy(img->row(y)->data(), in, img->row_size());
      }
      std::cerr << "\tDecoded " << img->width() << "×" << img->height() << " pixels." << std::endl;

      LibRaw::dcraw_clear_mem(processed);
    } catch (std::exception& ex) {
      raw->recycle();
      _is_open = false;
      throw;
    }

    raw->recycle();
    _is_open = false;

    std::cerr << "\tExtracting tags..." << std::endl;
    extract_tags(img);

    std::cerr << "Done." << std::endl;
    return img;
  }

}
