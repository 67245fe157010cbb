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
#include <iostream>
#include <math.h>
#include <vector>
#include "Frame.hh"
#include "Resampler.hh"
#include "Benchmark.hh"
#include "Exception.hh"

namespace PhotoPostcard {

  static inline unsigned char to_byte(SAMPLE v) {
    if (v >= 255.0)
      return 255;
    if (v <= 0)
      return 0;
    return (unsigned char)lrint(v);
  }

  Frame::Frame(unsigned int tw, unsigned int th) :
    _width(tw), _height(th)
  {}

  Image::ptr Frame::resize(Image::ptr img, Filter::ptr filter, bool can_free) {
    if ((_width == 0) || (_height == 0))
      throw GeometryError(_width, _height, "the output has no area");
    if ((img->width() == 0) || (img->height() == 0))
      throw GeometryError(img->width(), img->height(), "the source has no area");
    if (img->format() != CMS::Format::RGB8())
      throw cmsTypeError("Frame::resize needs 8-bit RGB", img->format());

    if (filter == nullptr)
      filter = std::make_shared<Lanczos>(3.0);

    std::cerr << "Resizing image " << img->width() << "×" << img->height()
	      << " => " << _width << "×" << _height << "..." << std::endl;

    Timer timer;
    timer.start();

    Resampler across(filter, 0, img->width(), img->width(), _width);
    Resampler down(filter, 0, img->height(), img->height(), _height);

    // Horizontal pass into a floating-point buffer, only for rows the vertical pass reads
    std::vector<std::vector<SAMPLE>> rows(img->height());
    unsigned int first_row = down.Start(0);
    unsigned int last_row = down.Start(_height - 1) + down.N(_height - 1) - 1;
    for (unsigned int y = first_row; y <= last_row; y++) {
      auto in_row = img->row(y);
      if (in_row == nullptr)
	throw Uninitialised("Image", "row " + std::to_string(y));

      const unsigned char *in = in_row->data();
      std::vector<SAMPLE>& out = rows[y];
      out.assign(_width * 3, 0.0);
      for (unsigned int nx = 0; nx < _width; nx++) {
	const SAMPLE *weight = across.Weight(nx);
	const unsigned char *pixel = &in[across.Start(nx) * 3];
	SAMPLE r = 0, g = 0, b = 0;
	for (unsigned int j = 0; j < across.N(nx); j++, weight++, pixel += 3) {
	  r += pixel[0] * *weight;
	  g += pixel[1] * *weight;
	  b += pixel[2] * *weight;
	}
	out[nx * 3] = r;
	out[nx * 3 + 1] = g;
	out[nx * 3 + 2] = b;
      }

      if (can_free)
	img->free_row(y);

      std::cerr << "\r\tResized width of " << y + 1 - first_row << " of " << last_row + 1 - first_row << " rows";
    }
    std::cerr << std::endl;

    // Vertical pass into the new image
    auto dest = std::make_shared<Image>(_width, _height, CMS::Format::RGB8());
    dest->set_profile(img->profile());
    dest->EXIFtags() = img->EXIFtags();

    for (unsigned int ny = 0; ny < _height; ny++) {
      dest->check_row_alloc(ny);
      unsigned char *out = dest->row(ny)->data();
      const SAMPLE *weight = down.Weight(ny);
      unsigned int start = down.Start(ny);

      for (unsigned int i = 0; i < _width * 3; i++) {
	SAMPLE sum = 0;
	for (unsigned int j = 0; j < down.N(ny); j++)
	  sum += rows[start + j][i] * weight[j];
	out[i] = to_byte(sum);
      }
      std::cerr << "\r\tResized height of " << ny + 1 << " of " << _height << " rows";
    }
    std::cerr << std::endl;
    timer.stop();

    long long pixel_count = (long long)_width * _height;
    benchmark_report("Resized image to " + std::to_string(pixel_count) + " pixels", timer, pixel_count);

    std::cerr << "Done." << std::endl;
    return dest;
  }

}
