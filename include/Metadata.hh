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
#ifndef __METADATA_HH__
#define __METADATA_HH__

#include <string>
#include <exiv2/exiv2.hpp>
#include "Definable.hh"
#include "Config.hh"

namespace PhotoPostcard {

  //! The two caption lines of a postcard
  struct CaptureMetadata {
    std::string date_text, location_text;
  };

  //! Reformat an EXIF "YYYY:MM:DD HH:MM:SS" timestamp as e.g "Mar 15, 2024"
  /*!
    Trailing NULs and whitespace are ignored.
    \return Undefined if the text is not a valid timestamp
  */
  definable<std::string> format_capture_date(const std::string& raw);

  //! Reads the capture date and location from an EXIF tag table
  class MetadataExtractor {
  private:
    const PostcardConfig& _config;

  public:
    //! Constructor
    MetadataExtractor(const PostcardConfig& config);

    //! Formatted capture date, or the raw text if it cannot be parsed
    /*!
      \return Undefined if the tag is absent or unreadable
    */
    definable<std::string> capture_date(const Exiv2::ExifData& tags) const;

    //! Location text if the photo carries GPS data
    /*!
      GPS coordinates are not resolved to a place name.
      \return Undefined if there is no GPS data
    */
    definable<std::string> location(const Exiv2::ExifData& tags) const;

    //! Both caption lines, with fallbacks for anything missing
    CaptureMetadata extract(const Exiv2::ExifData& tags) const;

  }; // class MetadataExtractor

}

#endif // __METADATA_HH__
