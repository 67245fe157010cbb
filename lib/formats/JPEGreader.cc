/*
	Copyright 2012-2024 Ian Tester

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
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <stdlib.h>
#include <stdio.h>
#include <jpeglib.h>
#include "ImageFile.hh"
#include "Image.hh"
#include "JPEG.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  JPEGreader::JPEGreader(const fs::path filepath) :
    ImageReader(filepath)
  {}

  Image::ptr JPEGreader::read(void) {
    if (_is_open)
      throw FileOpenError(_filepath.native(), "already open");

    std::cerr << "Opening file " << _filepath << "..." << std::endl;
    fs::ifstream ifs(_filepath, std::ios_base::in | std::ios_base::binary);
    if (ifs.fail())
      throw FileOpenError(_filepath.native());
    _is_open = true;

    jpeg_decompress_struct *dinfo = (jpeg_decompress_struct*)malloc(sizeof(jpeg_decompress_struct));
    if (dinfo == nullptr)
      throw MemAllocError("Out of memory?");
    jpeg_error_mgr jerr;
    dinfo->err = jpeg_std_error(&jerr);
    jerr.error_exit = jpeg_error_exit;
    jpeg_create_decompress(dinfo);

    Image::ptr img;
    try {
      jpeg_istream_src(dinfo, &ifs);

      jpeg_save_markers(dinfo, JPEG_APP0 + 2, 0xFFFF);

      jpeg_read_header(dinfo, TRUE);
      dinfo->dct_method = JDCT_FLOAT;

      CMS::Format format;
      format.set_8bit();
      switch (dinfo->jpeg_color_space) {
      case JCS_GRAYSCALE:
	format.set_colour_model(CMS::ColourModel::Greyscale, dinfo->num_components);
	break;

      case JCS_YCbCr:
	dinfo->out_color_space = JCS_RGB;
      case JCS_RGB:
	format.set_colour_model(CMS::ColourModel::RGB, dinfo->num_components);
	break;

      case JCS_YCCK:
	dinfo->out_color_space = JCS_CMYK;
      case JCS_CMYK:
	format.set_colour_model(CMS::ColourModel::CMYK, dinfo->num_components);
	if (dinfo->saw_Adobe_marker)
	  format.set_vanilla();
	break;

      default:
	throw FileContentError(_filepath.native(), "unsupported JPEG colour space " + std::to_string(dinfo->jpeg_color_space));
      }

      jpeg_start_decompress(dinfo);

      img = std::make_shared<Image>(dinfo->output_width, dinfo->output_height, format);
      std::cerr << "\t" << img->width() << "×" << img->height() << ", " << format << "." << std::endl;

      if (dinfo->saw_JFIF_marker) {
	switch (dinfo->density_unit) {
	case 1:	// pixels per inch (yuck)
	  img->set_resolution(dinfo->X_density, dinfo->Y_density);
	  break;

	case 2:	// pixels per centimetre
	  img->set_resolution(dinfo->X_density * 2.54, dinfo->Y_density * 2.54);
	  break;

	default:
	  break;
	}
      }

      CMS::Profile::ptr profile = jpeg_read_profile(dinfo);
      if (profile)
	img->set_profile(profile);

      JSAMPROW jpeg_row[1];
      while (dinfo->output_scanline < dinfo->output_height) {
	img->check_row_alloc(dinfo->output_scanline);
	jpeg_row[0] = img->row(dinfo->output_scanline)->data();
	jpeg_read_scanlines(dinfo, jpeg_row, 1);
	std::cerr << "\r\tRead " << dinfo->output_scanline << " of " << img->height() << " rows";
      }
      std::cerr << "\r\tRead " << img->height() << " of " << img->height() << " rows." << std::endl;

      jpeg_finish_decompress(dinfo);
    } catch (std::exception& ex) {
      // jpeg_error_exit has already destroyed the decompressor when libjpeg failed
      jpeg_destroy_decompress(dinfo);
      jpeg_istream_src_free(dinfo);
      free(dinfo);
      _is_open = false;
      throw;
    }

    jpeg_destroy_decompress(dinfo);
    jpeg_istream_src_free(dinfo);
    free(dinfo);
    ifs.close();
    _is_open = false;

    std::cerr << "\tExtracting tags..." << std::endl;
    extract_tags(img);

    std::cerr << "Done." << std::endl;
    return img;
  }

}
