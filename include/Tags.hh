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
#pragma once

#include <exiv2/exiv2.hpp>
#include <climits>
#include <math.h>
#include "Image.hh"

namespace PhotoPostcard {

  //! Holds the tags written into output files
  class Tags {
  private:
    Exiv2::ExifData _EXIFtags;

  public:
    //! Empty Constructor
    Tags();

    //! The Exiv2::ExifData object.
    inline Exiv2::ExifData& EXIFtags(void) { return _EXIFtags; }

    //! Set the X and Y resolution tags (pixels per inch)
    void add_resolution(double ppi);

    //! Name this program as the software that made the file
    void add_software(void);

    //! Copy EXIF tags to an image
    void copy_to(Image::ptr img) const;

  };

  //! Find a close rational fraction given a floating-point value
  template <typename Num_type, typename R_type>
  R_type closest_Rational(double value) {
    double margin = fabs(value) * 1e-6;
    Num_type num = 0;
    Num_type den;
    for (den = 1; den < INT_MAX; den++) {
      double numf = value * den;
      if ((numf < INT_MIN) || (numf > INT_MAX))
	break;

      num = round(numf);
      double error = fabs(num - numf);
      if (error <= margin * den)
	break;
    }

    return R_type(num, den);
  }

}
