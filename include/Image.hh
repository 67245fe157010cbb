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
#ifndef __IMAGE_HH__
#define __IMAGE_HH__

#include <memory>
#include <vector>
#include <math.h>
#include <exiv2/exiv2.hpp>
#include "Definable.hh"
#include "CMS.hh"

namespace PhotoPostcard {

  class ImageRow;

  //! An 8-bit RGB colour
  struct Colour {
    unsigned char r, g, b;

    Colour() :
      r(0), g(0), b(0)
    {}

    Colour(unsigned char red, unsigned char green, unsigned char blue) :
      r(red), g(green), b(blue)
    {}

    inline bool operator ==(const Colour& other) const { return (r == other.r) && (g == other.g) && (b == other.b); }
  };

  std::ostream& operator<< (std::ostream& out, const Colour& c);

  //! An image class
  class Image {
  private:
    unsigned int _width, _height;
    CMS::Profile::ptr _profile;
    CMS::Format _format;
    size_t _pixel_size, _row_size;
    std::vector<std::shared_ptr<ImageRow>> _rows;
    definable<double> _xres, _yres;		// PPI

    Exiv2::ExifData _EXIFtags;

    //! Throw unless the pixels are packed 8-bit RGB
    void _check_RGB8(const char* method) const;

    //! Profile-less CMYK to sRGB, R = (255 - C)(255 - K) / 255
    ptr _plain_cmyk_to_rgb(bool can_free);

  public:
    //! Shared pointer for an Image
    typedef std::shared_ptr<Image> ptr;

    //! Constructor
    /*!
      \param w,h Width and height of the image
      \param f LCMS2 pixel format
    */
    Image(unsigned int w, unsigned int h, CMS::Format f);

    //! Destructor
    ~Image();

    //! The width of this image
    inline const unsigned int width(void) const { return _width; }

    //! The height of this image
    inline const unsigned int height(void) const { return _height; }

    inline bool has_profile(void) const { return _profile == NULL ? false : true; }

    //! Get the ICC profile
    inline const CMS::Profile::ptr profile(void) const { return _profile; }

    //! Set the ICC profile
    inline void set_profile(CMS::Profile::ptr p) { _profile = p; }

    //! Get the CMS format
    inline CMS::Format format(void) const { return _format; }

    //! The X resolution of this image (PPI)
    inline const definable<double> xres(void) const { return _xres; }

    //! The Y resolution of this image (PPI)
    inline const definable<double> yres(void) const { return _yres; }

    //! Set both the X and Y resolution (PPI)
    inline void set_resolution(double r) { _xres = _yres = r; }

    //! Set the X and Y resolutions (PPI)
    inline void set_resolution(double xr, double yr) { _xres = xr; _yres = yr; }

    //! Copy the resolution, defined or not
    inline void set_resolution(definable<double> xr, definable<double> yr) { _xres = xr; _yres = yr; }

    //! Return the size of a pixel in bytes
    inline size_t pixel_size(void) const { return _pixel_size; }

    //! Retun the size of a row in bytes
    inline size_t row_size(void) const { return _row_size; }

    inline void check_row_alloc(unsigned int y) {
      if (_rows[y] == nullptr)
	_rows[y] = std::make_shared<ImageRow>(this, y);
    }

    //! Row holder at a y value
    std::shared_ptr<ImageRow> row(unsigned int y) const { return _rows[y]; }

    //! Free the memory storing row 'y'
    inline void free_row(unsigned int y) {
      if (_rows[y] != NULL)
	_rows[y].reset();
    }

    //! The Exiv2::ExifData object.
    inline Exiv2::ExifData& EXIFtags(void) { return _EXIFtags; }

    //! The Exiv2::ExifData object, const version.
    inline const Exiv2::ExifData& EXIFtags(void) const { return _EXIFtags; }

    //! Create either an sRGB or greyscale profile depending on image format
    static CMS::Profile::ptr default_profile(CMS::ColourModel default_colourmodel, std::string for_desc);

    inline static CMS::Profile::ptr default_profile(CMS::Format format, std::string for_desc) { return default_profile(format.colour_model(), for_desc); }

    //! Transform this image into a different colour space and/or ICC profile, making a new image
    /*!
      \param dest_profile The ICC profile of the destination. If NULL, uses image's profile.
      \param dest_format The LCMS2 pixel format.
      \param intent The ICC intent of the transform, defaults to perceptual.
      \param can_free Can each row of this image be freed after it is transformed?
      \return A new image
     */
    ptr transform_colour(CMS::Profile::ptr dest_profile, CMS::Format dest_format, CMS::Intent intent = CMS::Intent::Perceptual, bool can_free = false);

    //! Allocate every row and set every pixel to one colour
    void fill(const Colour& c);

    //! Copy another image into this one with its top-left corner at (x, y)
    /*!
      Pixels falling outside this image are clipped. Both images must be 8-bit RGB.
    */
    void paste(ptr src, int x, int y);

    //! Blend a colour over the pixel at (x, y)
    /*!
      \param alpha Coverage of the colour, 0 leaves the pixel as is, 255 replaces it
      Coordinates outside the image are ignored.
    */
    void blend_pixel(int x, int y, const Colour& c, unsigned char alpha);

    //! Read back a pixel of an 8-bit RGB image
    Colour pixel(unsigned int x, unsigned int y) const;

    //! Rotate 90° counter-clockwise into a new image
    ptr rotate_90(bool can_free = false);

  };


  //! Class for holding a row of image data
  class ImageRow {
  private:
    const Image *_image;
    const unsigned int _y;
    unsigned char *_data;

    friend class Image;

  public:
    typedef std::shared_ptr<ImageRow> ptr;

    //! Constructor
    ImageRow(const Image* img, unsigned int y) :
      _image(img),
      _y(y),
      _data(new unsigned char[_image->width() * _image->pixel_size()])
    {}

    ImageRow(const ImageRow& other) = delete;
    ImageRow& operator=(const ImageRow& other) = delete;

    ~ImageRow() {
      if (_data != nullptr)
	delete [] _data;
    }

    //! The width of the image
    inline const unsigned int width(void) const { return _image->width(); }

    inline const unsigned int y(void) const { return _y; }

    //! Get the CMS format
    inline CMS::Format format(void) const { return _image->format(); }

    template <typename T = unsigned char>
    inline T* data(unsigned int x = 0) const { return (T*)&_data[x * _image->pixel_size()]; }

  };

}

#endif // __IMAGE_HH__
