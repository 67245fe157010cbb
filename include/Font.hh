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
#ifndef __FONT_HH__
#define __FONT_HH__

#include <memory>
#include <string>
#include <vector>
#include <ft2build.h>
#include FT_FREETYPE_H
#include "Image.hh"

namespace PhotoPostcard {

  //! Decode UTF-8 text into code points
  /*!
    Malformed sequences become U+FFFD.
  */
  std::vector<char32_t> decode_utf8(const std::string& text);

  //! Abstract base class for fonts that draw onto 8-bit RGB images
  class Font {
  public:
    //! Shared pointer for a Font
    typedef std::shared_ptr<Font> ptr;

    virtual ~Font() {}

    //! Name of the font for log messages
    virtual std::string name(void) const = 0;

    //! Distance from the top of a line to its baseline, in pixels
    virtual unsigned int ascent(void) const = 0;

    //! Draw a line of text
    /*!
      \param img Destination image, must be 8-bit RGB
      \param x,y Top-left corner of the line
      \param text UTF-8 text
      \param colour Text colour, blended by glyph coverage
      \return Width of the text drawn, in pixels
      Pixels falling outside the image are clipped.
    */
    virtual unsigned int draw(Image::ptr img, int x, int y, const std::string& text, const Colour& colour) const = 0;

  }; // class Font

  //! A scalable font rendered by FreeType
  class FreeTypeFont : public Font {
  private:
    std::string _filepath;
    FT_Library _library;
    FT_Face _face;

  public:
    //! Constructor
    /*!
      \param filepath Font file
      \param size Height of the em square in pixels
      Throws FileOpenError if the file does not exist and LibraryError if FreeType cannot use it.
    */
    FreeTypeFont(const std::string& filepath, unsigned int size);

    FreeTypeFont(const FreeTypeFont& other) = delete;
    FreeTypeFont& operator=(const FreeTypeFont& other) = delete;

    ~FreeTypeFont();

    std::string name(void) const;
    unsigned int ascent(void) const;
    unsigned int draw(Image::ptr img, int x, int y, const std::string& text, const Colour& colour) const;

  }; // class FreeTypeFont

  //! A 5×7 bitmap font covering printable ASCII, scaled by whole pixels
  /*!
    Needs no files so it can always be loaded. Other characters are drawn as '?'.
   */
  class BuiltinFont : public Font {
  private:
    unsigned int _scale;

  public:
    //! Constructor
    /*!
      \param size Requested line height in pixels, rounded down to a multiple of 8
    */
    BuiltinFont(unsigned int size);

    std::string name(void) const;
    unsigned int ascent(void) const;
    unsigned int draw(Image::ptr img, int x, int y, const std::string& text, const Colour& colour) const;

  }; // class BuiltinFont

  //! Load the first usable font from a list of files
  /*!
    Falls back to the built-in bitmap font if none can be loaded.
  */
  Font::ptr load_font(const std::vector<std::string>& filepaths, unsigned int size);

}

#endif // __FONT_HH__
