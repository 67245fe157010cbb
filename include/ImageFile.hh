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
#ifndef __IMAGEFILE_HH__
#define __IMAGEFILE_HH__

#include <string>
#include <memory>
#include <ostream>
#include <boost/filesystem.hpp>

#ifdef HAZ_PNG
#include <png.h>
#endif

#include "CMS.hh"
#include "Image.hh"
#include "Config.hh"
#include "Exception.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  //! Class for holding filename and the image format
  class ImageFilepath {
  private:
    fs::path _filepath;
    std::string _format;

  public:
    //! Constructor
    /*!
      \param filepath The path of the image file
      \param format Format of the image file
    */
    ImageFilepath(const fs::path filepath, const std::string format);

    //! Constructor
    /*!
      Guess the format from the file extension.
      \param filepath The path of the image file
    */
    ImageFilepath(const fs::path filepath);

    //! File path of this image file
    inline const fs::path filepath(void) const { return _filepath; }

    //! Format of this image file
    inline std::string format(void) const { return _format; }

    inline friend std::ostream& operator << (std::ostream& out, const ImageFilepath& fp) {
      out << fp._filepath << "(" << fp._format << ")";
      return out;
    }

  }; // class ImageFilepath

  //! Abstract base class for reading image files
  class ImageReader {
  protected:
    const fs::path _filepath;
    bool _is_open;

    //! Private constructor
    ImageReader(const fs::path fp);

    //! Extract tags from file
    /*!
      A file without readable metadata is not an error, the image is left with an empty tag table.
    */
    void extract_tags(Image::ptr img);

  public:
    //! Shared pointer for an ImageReader
    typedef std::shared_ptr<ImageReader> ptr;

    virtual ~ImageReader() {}

    //! Named constructor
    /*! Use the format of the file path to decide what class to use
      \param ifp File path and format
    */
    static ImageReader::ptr open(const ImageFilepath& ifp);

    //! Read the file into an image
    /*!
      \return A new Image object
    */
    virtual Image::ptr read(void) = 0;

  }; // class ImageReader



  //! Abstract base class for writing image files
  class ImageWriter {
  protected:
    const fs::path _filepath;
    bool _is_open;

    //! Private constructor
    ImageWriter(const fs::path fp);

    void embed_tags(Image::ptr img) const;

  public:
    //! Shared pointer for an ImageWriter
    typedef std::shared_ptr<ImageWriter> ptr;

    virtual ~ImageWriter() {}

    //! Named constructor
    /*! Use the format of the file path to decide what class to use
      \param ifp File path and format
    */
    static ImageWriter::ptr open(const ImageFilepath& ifp);

    //! Write an image to the file
    /*!
      \param img The Image object to write
      \param config Supplies the encoder parameters
      \param can_free Can each row of the image be freed after it is written?
    */
    virtual void write(Image::ptr img, const PostcardConfig& config, bool can_free = false) = 0;

  }; // class ImageWriter



#ifdef HAZ_PNG
  //! PNG file reader
  class PNGreader : public ImageReader {
  private:
    png_structp _png;
    png_infop _info;

  public:
    PNGreader(const fs::path filepath);

    Image::ptr read(void);
  }; // class PNGreader
#endif // HAZ_PNG

#ifdef HAZ_JPEG
  //! JPEG file reader
  class JPEGreader : public ImageReader {
  public:
    JPEGreader(const fs::path filepath);

    Image::ptr read(void);
  }; // class JPEGreader


  //! JPEG file writer
  class JPEGwriter : public ImageWriter {
  public:
    JPEGwriter(const fs::path filepath);

    //! Special version of write() that takes an open ostream object
    void write(std::ostream& ofs, Image::ptr img, const JPEGsettings& js, double dpi, bool can_free = false);
    void write(Image::ptr img, const PostcardConfig& config, bool can_free = false);
  }; // class JPEGwriter
#endif // HAZ_JPEG

#ifdef HAZ_TIFF
  //! TIFF file reader
  class TIFFreader : public ImageReader {
  public:
    TIFFreader(const fs::path filepath);

    Image::ptr read(void);
  }; // class TIFFreader
#endif // HAZ_TIFF

#ifdef HAZ_RAW
  //! Camera raw file reader
  /*!
    Decodes the sensor data with LibRaw into 8-bit sRGB.
  */
  class RAWreader : public ImageReader {
  public:
    RAWreader(const fs::path filepath);

    Image::ptr read(void);
  }; // class RAWreader
#endif // HAZ_RAW

}

#endif // __IMAGEFILE_HH__
