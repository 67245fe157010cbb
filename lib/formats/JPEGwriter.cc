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
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <stdlib.h>
#include <stdio.h>
#include <math.h>
#include <jpeglib.h>
#include "ImageFile.hh"
#include "Image.hh"
#include "Tags.hh"
#include "JPEG.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  void jpeg_error_exit(j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    jpeg_destroy(cinfo);
    throw LibraryError("libjpeg", buffer);
  }

  JPEGwriter::JPEGwriter(const fs::path filepath) :
    ImageWriter(filepath)
  {}

  void JPEGwriter::write(std::ostream& os, Image::ptr img, const JPEGsettings& js, double dpi, bool can_free) {
    CMS::Format format = img->format();
    if ((format.bytes_per_channel() != 1) || (format.extra_channels() > 0))
      throw cmsTypeError("Not 8-bit without alpha", format);

    J_COLOR_SPACE colour_space;
    switch (format.colour_model()) {
    case CMS::ColourModel::Greyscale:
      colour_space = JCS_GRAYSCALE;
      break;

    case CMS::ColourModel::RGB:
      colour_space = JCS_RGB;
      break;

    default:
      throw cmsTypeError("JPEG output needs greyscale or RGB", format);
    }

    jpeg_compress_struct *cinfo = (jpeg_compress_struct*)malloc(sizeof(jpeg_compress_struct));
    if (cinfo == nullptr)
      throw MemAllocError("Out of memory?");
    jpeg_error_mgr jerr;
    cinfo->err = jpeg_std_error(&jerr);
    jerr.error_exit = jpeg_error_exit;
    jpeg_create_compress(cinfo);

    try {
      jpeg_ostream_dest(cinfo, &os);

      cinfo->image_width = img->width();
      cinfo->image_height = img->height();
      cinfo->in_color_space = colour_space;
      cinfo->input_components = format.channels();

      jpeg_set_defaults(cinfo);

      std::cerr << "\tJPEG quality of " << js.quality() << "." << std::endl;
      jpeg_set_quality(cinfo, js.quality(), TRUE);

      if (js.progressive()) {
	std::cerr << "\tProgressive JPEG." << std::endl;
	jpeg_simple_progression(cinfo);
      }

      if (format.colour_model() != CMS::ColourModel::Greyscale) {
	std::cerr << "\tJPEG chroma sub-sampling of " << js.sample().first << "×" << js.sample().second << "." << std::endl;
	cinfo->comp_info[0].h_samp_factor = js.sample().first;
	cinfo->comp_info[0].v_samp_factor = js.sample().second;
      }

      cinfo->write_JFIF_header = TRUE;
      cinfo->density_unit = 1;	// PPI
      cinfo->X_density = round(dpi);
      cinfo->Y_density = round(dpi);

      cinfo->dct_method = JDCT_FLOAT;

      jpeg_start_compress(cinfo, TRUE);

      JSAMPROW jpeg_row[1];
      std::cerr << "\tWriting " << img->width() << "×" << img->height() << " JPEG image..." << std::endl;
      while (cinfo->next_scanline < cinfo->image_height) {
	unsigned int y = cinfo->next_scanline;
	if (img->row(y) == nullptr)
	  throw Uninitialised("Image", "row " + std::to_string(y));
	jpeg_row[0] = img->row(y)->data();
	jpeg_write_scanlines(cinfo, jpeg_row, 1);

	if (can_free)
	  img->free_row(y);

	std::cerr << "\r\tWritten " << y + 1 << " of " << img->height() << " rows";
      }
      std::cerr << "\r\tWritten " << img->height() << " of " << img->height() << " rows." << std::endl;

      jpeg_finish_compress(cinfo);
    } catch (std::exception& ex) {
      jpeg_destroy_compress(cinfo);
      jpeg_ostream_dest_free(cinfo);
      free(cinfo);
      throw;
    }

    jpeg_destroy_compress(cinfo);
    jpeg_ostream_dest_free(cinfo);
    free(cinfo);
  }

  void JPEGwriter::write(Image::ptr img, const PostcardConfig& config, bool can_free) {
    if (_is_open)
      throw FileOpenError(_filepath.native(), "already open");

    std::cerr << "Opening file " << _filepath << "..." << std::endl;
    fs::ofstream ofs(_filepath, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (ofs.fail())
      throw FileOpenError(_filepath.native());
    _is_open = true;

    try {
      write(ofs, img, config.jpeg(), config.dpi(), can_free);
      ofs.close();
      if (ofs.fail())
	throw FileOpenError(_filepath.native(), "could not finish writing");
    } catch (std::exception& ex) {
      _is_open = false;
      throw;
    }
    _is_open = false;

    std::cerr << "\tEmbedding tags..." << std::endl;
    Tags tags;
    tags.add_resolution(config.dpi());
    tags.add_software();
    tags.copy_to(img);
    embed_tags(img);

    std::cerr << "Done." << std::endl;
  }

}
