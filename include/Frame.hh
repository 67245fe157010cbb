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
#ifndef __FRAME_HH__
#define __FRAME_HH__

#include <memory>
#include "Image.hh"
#include "Resampler.hh"

namespace PhotoPostcard {

  //! Target size of a whole-image resize
  class Frame {
  private:
    unsigned int _width, _height;

  public:
    /*!
      \param tw,th Size (width, height) of the output
    */
    Frame(unsigned int tw, unsigned int th);

    //! Resize the whole of an image
    /*!
      Resamples the width of every row, then the height of every column.
      \param img The source image, 8-bit RGB
      \param filter Supplies the basis function, Lanczos-3 if null
      \param can_free Can each row of the image be freed after it is convolved?
      \return A new image of width() × height()
    */
    Image::ptr resize(Image::ptr img, Filter::ptr filter = nullptr, bool can_free = false);

    inline unsigned int width(void) const { return _width; }
    inline unsigned int height(void) const { return _height; }

  };

}

#endif /* __FRAME_HH__ */
