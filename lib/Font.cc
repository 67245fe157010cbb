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
#include "Font.hh"
#include "Exception.hh"

namespace PhotoPostcard {

  std::vector<char32_t> decode_utf8(const std::string& text) {
    std::vector<char32_t> code_points;
    code_points.reserve(text.length());

    size_t i = 0;
    while (i < text.length()) {
      unsigned char lead = text[i];
      unsigned int extra;
      char32_t cp;
      if (lead < 0x80) {
	code_points.push_back(lead);
	i++;
	continue;
      } else if ((lead & 0xe0) == 0xc0) {
	extra = 1;
	cp = lead & 0x1f;
      } else if ((lead & 0xf0) == 0xe0) {
	extra = 2;
	cp = lead & 0x0f;
      } else if ((lead & 0xf8) == 0xf0) {
	extra = 3;
	cp = lead & 0x07;
      } else {
	code_points.push_back(0xfffd);
	i++;
	continue;
      }

      size_t j;
      for (j = 1; j <= extra; j++) {
	if ((i + j >= text.length()) || ((text[i + j] & 0xc0) != 0x80))
	  break;
	cp = (cp << 6) | (text[i + j] & 0x3f);
      }
      if (j <= extra) {
	// Truncated sequence, resume at the byte that broke it
	code_points.push_back(0xfffd);
	i += j;
	continue;
      }

      // Reject overlong forms, surrogates and anything past U+10FFFF
      static const char32_t min_cp[4] = { 0, 0x80, 0x800, 0x10000 };
      if ((cp < min_cp[extra]) || ((cp >= 0xd800) && (cp <= 0xdfff)) || (cp > 0x10ffff))
	cp = 0xfffd;
      code_points.push_back(cp);
      i += extra + 1;
    }

    return code_points;
  }

  Font::ptr load_font(const std::vector<std::string>& filepaths, unsigned int size) {
    for (auto& filepath : filepaths) {
      try {
	auto font = std::make_shared<FreeTypeFont>(filepath, size);
	std::cerr << "Using font \"" << font->name() << "\" from " << filepath << "." << std::endl;
	return font;
      } catch (FileError& ex) {
	std::cerr << "\tFont " << filepath << " not usable: " << ex.what() << std::endl;
      } catch (LibraryError& ex) {
	std::cerr << "\tFont " << filepath << " not usable: " << ex.what() << std::endl;
      }
    }

    std::cerr << "** No scalable font found, using the built-in bitmap font **" << std::endl;
    return std::make_shared<BuiltinFont>(size);
  }

}
