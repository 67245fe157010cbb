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
#include <string>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <tiffio.h>
#include <tiffio.hxx>
#include "ImageFile.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  TIFFreader::TIFFreader(const fs::path filepath) :
    ImageReader(filepath)
  {}

#define TIFFcheck(x) if ((rc = TIFF##x) != 1) throw LibraryError("libtiff", "TIFF" #x " returned " + std::to_string(rc))

  //! Closes the TIFF handle however the read ends
  class TIFFhandle {
  private:
    TIFF *_tiff;

  public:
    TIFFhandle(TIFF *t) : _tiff(t) {}
    ~TIFFhandle() { if (_tiff != nullptr) TIFFClose(_tiff); }

    inline operator TIFF*() const { return _tiff; }
  };

  Image::ptr TIFFreader::read(void) {
    if (_is_open)
      throw FileOpenError(_filepath.native(), "already open");

    std::cerr << "Opening file " << _filepath << "..." << std::endl;
    fs::ifstream fb(_filepath, std::ios_base::in | std::ios_base::binary);
    if (fb.fail())
      throw FileOpenError(_filepath.native());

    TIFFhandle tiff(TIFFStreamOpen("", (std::istream*)&fb));
    if ((TIFF*)tiff == nullptr)
      throw FileContentError(_filepath.native(), "libtiff could not open the file");
    _is_open = true;

    Image::ptr img;
    try {
      int rc;
      uint32_t width, height;
      TIFFcheck(GetField(tiff, TIFFTAG_IMAGEWIDTH, &width));
      TIFFcheck(GetField(tiff, TIFFTAG_IMAGELENGTH, &height));
      std::cerr << "\tImage is " << width << "×" << height << std::endl;

      uint16_t bit_depth = 1, channels = 1, photometric, planar = PLANARCONFIG_CONTIG;
      TIFFGetFieldDefaulted(tiff, TIFFTAG_BITSPERSAMPLE, &bit_depth);
      std::cerr << "\tImage has a depth of " << bit_depth << std::endl;

      TIFFGetFieldDefaulted(tiff, TIFFTAG_SAMPLESPERPIXEL, &channels);
      TIFFGetFieldDefaulted(tiff, TIFFTAG_PLANARCONFIG, &planar);
      if (planar != PLANARCONFIG_CONTIG)
	throw FileContentError(_filepath.native(), "separate colour planes are not supported");

      CMS::Format format;
      switch (bit_depth) {
      case 8: format.set_8bit();
	break;

      case 16: format.set_16bit();
	break;

      default:
	throw FileContentError(_filepath.native(), "unsupported bit depth " + std::to_string(bit_depth));
      }

      {
	uint16_t extra_count, *extra_types;
	if (TIFFGetField(tiff, TIFFTAG_EXTRASAMPLES, &extra_count, &extra_types) == 1) {
	  format.set_extra_channels(extra_count & 0x07);
	  std::cerr << "\tImage has " << extra_count << " extra channel(s), ignoring them." << std::endl;
	  channels -= extra_count;
	}
      }
      std::cerr << "\tImage has " << channels << " channels." << std::endl;

      TIFFcheck(GetField(tiff, TIFFTAG_PHOTOMETRIC, &photometric));
      switch (photometric) {
      case PHOTOMETRIC_MINISWHITE:
	format.set_vanilla();
      case PHOTOMETRIC_MINISBLACK:
	format.set_colour_model(CMS::ColourModel::Greyscale, channels);
	break;

      case PHOTOMETRIC_RGB:
	format.set_colour_model(CMS::ColourModel::RGB, channels);
	break;

      case PHOTOMETRIC_SEPARATED:
	format.set_colour_model(CMS::ColourModel::CMYK, channels);
	break;

      default:
	throw FileContentError(_filepath.native(), "unsupported photometric interpretation " + std::to_string(photometric));
      }
      img = std::make_shared<Image>(width, height, format);

      {
	float xres, yres;
	uint16_t resunit;
	if ((TIFFGetField(tiff, TIFFTAG_XRESOLUTION, &xres) == 1)
	    && (TIFFGetField(tiff, TIFFTAG_YRESOLUTION, &yres) == 1)
	    && (TIFFGetField(tiff, TIFFTAG_RESOLUTIONUNIT, &resunit) == 1)) {
	  switch (resunit) {
	  case RESUNIT_INCH:
	    img->set_resolution(xres, yres);
	    break;
	  case RESUNIT_CENTIMETER:
	    img->set_resolution((double)xres * 2.54, (double)yres * 2.54);
	    break;
	  default:
	    std::cerr << "** unknown resolution unit " << resunit << " **" << std::endl;
	  }
	  if (img->xres().defined() && img->yres().defined())
	    std::cerr << "\tImage has resolution of " << img->xres() << "×" << img->yres() << " PPI." << std::endl;
	}
      }

      {
	uint32_t profile_len;
	unsigned char *profile_data;
	if (TIFFGetField(tiff, TIFFTAG_ICCPROFILE, &profile_len, &profile_data) == 1) {
	  try {
	    auto profile = std::make_shared<CMS::Profile>(profile_data, profile_len);
	    if (!profile->valid())
	      throw LibraryError("LCMS2", "unreadable ICC profile");
	    img->set_profile(profile);
	    std::cerr << "\tRead embedded profile \"" << profile->description() << "\" (" << profile_len << " bytes)" << std::endl;
	  } catch (LibraryError& ex) {
	    std::cerr << "** Ignoring unusable ICC profile: " << ex.what() << " **" << std::endl;
	  }
	}
      }

      std::cerr << "\tReading TIFF image..." << std::endl;
      for (unsigned int y = 0; y < height; y++) {
	img->check_row_alloc(y);
	if (TIFFReadScanline(tiff, img->row(y)->data(), y) != 1)
	  throw FileContentError(_filepath.native(), "could not read row " + std::to_string(y));
	std::cerr << "\r\tRead " << (y + 1) << " of " << height << " rows";
      }
      std::cerr << "\r\tRead " << height << " of " << height << " rows." << std::endl;
    } catch (std::exception& ex) {
      _is_open = false;
      throw;
    }

    _is_open = false;

    std::cerr << "\tExtracting tags..." << std::endl;
    extract_tags(img);

    std::cerr << "Done." << std::endl;
    return img;
  }

}
