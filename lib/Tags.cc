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
#include <string>
#include <exiv2/exiv2.hpp>
#include "Image.hh"
#include "Tags.hh"
#include "Exception.hh"

namespace PhotoPostcard {

  Tags::Tags() {
  }

  void Tags::add_resolution(double ppi) {
    Exiv2::URationalValue v;
    v.value_.push_back(closest_Rational<unsigned int, Exiv2::URational>(ppi));
    std::cerr << "\tSetting resolution to " << v.value_[0].first << " ÷ " << v.value_[0].second << " (" << ppi << ") ppi." << std::endl;
    try {
      _EXIFtags["Exif.Image.XResolution"] = v;
      _EXIFtags["Exif.Image.YResolution"] = v;
      _EXIFtags["Exif.Image.ResolutionUnit"] = uint16_t(2);	// Inches (yuck)
    } catch (Exiv2::Error& e) {
      std::cerr << "** EXIF resolution keys not accepted: " << e.what() << " **" << std::endl;
    }
  }

  void Tags::add_software(void) {
    _EXIFtags["Exif.Image.Software"] = std::string("Photo Postcard");
  }

  void Tags::copy_to(Image::ptr img) const {
    for (auto ei : _EXIFtags)
      img->EXIFtags()[ei.key()] = ei.value();
  }

}
