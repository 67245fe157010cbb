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
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include "ImageFile.hh"
#include "Exception.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  ImageFilepath::ImageFilepath(const fs::path filepath, const std::string format) :
    _filepath(filepath),
    _format(format)
  {}

  //! File extensions and the format name each one maps to
  static const struct {
    const char *extension, *format;
  } known_extensions[] = {
    { "jpg", "jpeg" }, { "jpeg", "jpeg" },
    { "png", "png" },
    { "tif", "tiff" }, { "tiff", "tiff" },
    { "nef", "raw" }, { "raw", "raw" },
  };

  ImageFilepath::ImageFilepath(const fs::path filepath) :
    _filepath(filepath)
  {
    std::string ext = filepath.extension().generic_string();
    if (ext.length() > 0)
      ext = ext.substr(1);

    for (auto& known : known_extensions)
      if (boost::iequals(ext, known.extension)) {
	_format = known.format;
	break;
      }

    if (_format.length() == 0)
      throw UnknownFileType(filepath.generic_string());
  }



  ImageReader::ImageReader(const fs::path fp) :
    _filepath(fp),
    _is_open(false)
  {}

  void ImageReader::extract_tags(Image::ptr img) {
    if (_is_open)
      throw FileOpenError(_filepath.native(), "already open");

    try {
      auto imagefile = Exiv2::ImageFactory::open(_filepath.native());
      if (imagefile.get() == 0) {
	std::cerr << "** Exiv2 could not open " << _filepath << " **" << std::endl;
	return;
      }
      imagefile->readMetadata();

      for (auto ei : imagefile->exifData())
	img->EXIFtags().add(ei);
    } catch (Exiv2::Error& e) {
      std::cerr << "** Could not read tags: " << e.what() << " **" << std::endl;
    }
  }

  ImageReader::ptr ImageReader::open(const ImageFilepath& ifp) {
    const std::string& format = ifp.format();
#ifdef HAZ_JPEG
    if (format == "jpeg")
      return std::make_shared<JPEGreader>(ifp.filepath());
#endif
#ifdef HAZ_PNG
    if (format == "png")
      return std::make_shared<PNGreader>(ifp.filepath());
#endif
#ifdef HAZ_TIFF
    if (format == "tiff")
      return std::make_shared<TIFFreader>(ifp.filepath());
#endif
#ifdef HAZ_RAW
    if (format == "raw")
      return std::make_shared<RAWreader>(ifp.filepath());
#endif

    throw UnknownFileType(ifp.filepath().generic_string(), "no reader for format \"" + format + "\"");
  }



  ImageWriter::ImageWriter(const fs::path fp) :
    _filepath(fp),
    _is_open(false)
  {}

  void ImageWriter::embed_tags(Image::ptr img) const {
    if (_is_open)
      throw FileOpenError(_filepath.native(), "already open");

    try {
      auto imagefile = Exiv2::ImageFactory::open(_filepath.native());
      if (imagefile.get() == 0)
	throw FileOpenError(_filepath.native(), "Exiv2 could not open the file");

      imagefile->setExifData(img->EXIFtags());
      imagefile->writeMetadata();
    } catch (Exiv2::Error& e) {
      throw LibraryError("Exiv2", e.what());
    }
  }

  ImageWriter::ptr ImageWriter::open(const ImageFilepath& ifp) {
#ifdef HAZ_JPEG
    if (ifp.format() == "jpeg")
      return std::make_shared<JPEGwriter>(ifp.filepath());
#endif

    throw UnknownFileType(ifp.filepath().generic_string(), "no writer for format \"" + ifp.format() + "\"");
  }

}
