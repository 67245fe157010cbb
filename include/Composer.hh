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
#ifndef __COMPOSER_HH__
#define __COMPOSER_HH__

#include <boost/filesystem.hpp>
#include "Image.hh"
#include "Config.hh"
#include "Layout.hh"
#include "Metadata.hh"
#include "Font.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  //! Turns one photo into one postcard
  class PostcardComposer {
  private:
    const PostcardConfig& _config;
    LayoutPlanner _planner;
    MetadataExtractor _extractor;
    Font::ptr _font;

    //! Encode the canvas beside the output path, then move it into place
    void _write(Image::ptr canvas, const fs::path& output_path) const;

  public:
    //! Constructor
    /*!
      \param config Postcard constants
      \param font Caption font, loaded from the configured font list if null
    */
    PostcardComposer(const PostcardConfig& config, Font::ptr font = nullptr);

    inline const LayoutPlanner& planner(void) const { return _planner; }
    inline const MetadataExtractor& extractor(void) const { return _extractor; }
    inline Font::ptr font(void) const { return _font; }

    //! Lay out a decoded photo and its caption on a new canvas
    /*!
      \param img Decoded photo in any format Little CMS can convert to sRGB
      \param metadata Caption lines
      \param can_free Can rows of the photo be freed as they are used?
      \return An 8-bit RGB canvas of the configured size
      Caption failures are logged and leave the strip blank.
    */
    Image::ptr render(Image::ptr img, const CaptureMetadata& metadata, bool can_free = false) const;

    //! Read a photo and write its postcard
    /*!
      Never modifies the source file. Nothing is left at output_path on failure.
      \return true if the postcard was written
    */
    bool compose(const fs::path& source_path, const fs::path& output_path) const;

  }; // class PostcardComposer

}

#endif // __COMPOSER_HH__
