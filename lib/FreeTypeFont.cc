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
#include <iostream>
#include <boost/filesystem.hpp>
#include "Font.hh"
#include "Exception.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  FreeTypeFont::FreeTypeFont(const std::string& filepath, unsigned int size) :
    _filepath(filepath),
    _library(nullptr),
    _face(nullptr)
  {
    if (!fs::exists(filepath))
      throw FileOpenError(filepath, "no such file");

    FT_Error err;
    if ((err = FT_Init_FreeType(&_library)) != 0)
      throw LibraryError("FreeType", "FT_Init_FreeType returned " + std::to_string(err));

    if ((err = FT_New_Face(_library, filepath.c_str(), 0, &_face)) != 0) {
      FT_Done_FreeType(_library);
      throw LibraryError("FreeType", "FT_New_Face returned " + std::to_string(err));
    }

    if ((err = FT_Set_Pixel_Sizes(_face, 0, size)) != 0) {
      FT_Done_Face(_face);
      FT_Done_FreeType(_library);
      throw LibraryError("FreeType", "FT_Set_Pixel_Sizes returned " + std::to_string(err));
    }
  }

  FreeTypeFont::~FreeTypeFont() {
    if (_face != nullptr)
      FT_Done_Face(_face);
    if (_library != nullptr)
      FT_Done_FreeType(_library);
  }

  std::string FreeTypeFont::name(void) const {
    std::string n = _face->family_name != nullptr ? _face->family_name : fs::path(_filepath).stem().string();
    if (_face->style_name != nullptr)
      n += std::string(" ") + _face->style_name;
    return n;
  }

  unsigned int FreeTypeFont::ascent(void) const {
    return (_face->size->metrics.ascender + 63) >> 6;
  }

  unsigned int FreeTypeFont::draw(Image::ptr img, int x, int y, const std::string& text, const Colour& colour) const {
    int baseline = y + ascent();
    long int pen = x;
    bool kerning = FT_HAS_KERNING(_face);
    FT_UInt previous = 0;

    for (auto cp : decode_utf8(text)) {
      FT_UInt index = FT_Get_Char_Index(_face, cp);

      if (kerning && previous && index) {
	FT_Vector delta;
	if (FT_Get_Kerning(_face, previous, index, FT_KERNING_DEFAULT, &delta) == 0)
	  pen += delta.x >> 6;
      }

      FT_Error err;
      if ((err = FT_Load_Glyph(_face, index, FT_LOAD_RENDER)) != 0)
	throw LibraryError("FreeType", "FT_Load_Glyph returned " + std::to_string(err) + " for U+" + std::to_string((unsigned long)cp));

      FT_GlyphSlot slot = _face->glyph;
      const FT_Bitmap& bitmap = slot->bitmap;
      int left = pen + slot->bitmap_left;
      int top = baseline - slot->bitmap_top;

      for (unsigned int r = 0; r < bitmap.rows; r++) {
	const unsigned char *in = bitmap.buffer + (r * bitmap.pitch);
	for (unsigned int c = 0; c < bitmap.width; c++) {
	  unsigned char coverage;
	  switch (bitmap.pixel_mode) {
	  case FT_PIXEL_MODE_GRAY:
	    coverage = in[c];
	    break;

	  case FT_PIXEL_MODE_MONO:
	    coverage = (in[c >> 3] & (0x80 >> (c & 7))) ? 255 : 0;
	    break;

	  default:
	    throw LibraryError("FreeType", "unsupported glyph pixel mode " + std::to_string(bitmap.pixel_mode));
	  }
	  img->blend_pixel(left + c, top + r, colour, coverage);
	}
      }

      pen += slot->advance.x >> 6;
      previous = index;
    }

    return pen - x;
  }

}
