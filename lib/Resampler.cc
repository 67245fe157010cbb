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
#include <math.h>
#include "Resampler.hh"

namespace PhotoPostcard {

  Lanczos::Lanczos(double radius) :
    _radius(radius)
  {}

  SAMPLE Lanczos::eval(double x) const {
    x = fabs(x);
    if (x < 1e-6)
      return 1.0;
    if (x >= _radius)
      return 0.0;
    double pix = M_PI * x;
    return _radius * sin(pix) * sin(pix / _radius) / (pix * pix);
  }

  Resampler::Resampler(Filter::ptr filter, double from_start, double from_size, unsigned int from_max, unsigned int to_size) :
    _start(to_size, 0),
    _weight(to_size)
  {
    double scale = from_size / to_size;

    // When shrinking, stretch the filter to cover every input pixel
    double range = filter->range();
    double norm_fact = 1.0;
    if (scale >= 1.0) {
      range = filter->range() * scale;
      norm_fact = 1.0 / scale;
    }

    for (unsigned int i = 0; i < to_size; i++) {
      // Align pixel centres
      double centre = from_start + ((i + 0.5) * scale) - 0.5;
      long int left = floor(centre - range);
      if (left < 0)
	left = 0;
      long int right = ceil(centre + range);
      if (right >= (long int)from_max)
	right = from_max - 1;
      if (right < left)
	right = left;

      _start[i] = left;
      std::vector<SAMPLE>& weight = _weight[i];
      weight.reserve(right + 1 - left);
      for (long int j = left; j <= right; j++)
	weight.push_back(filter->eval((centre - j) * norm_fact));

      SAMPLE tot = 0.0;
      for (auto w : weight)
	tot += w;
      if (fabs(tot) > 1e-5) {
	tot = 1.0 / tot;
	for (auto& w : weight)
	  w *= tot;
      } else {
	// Nothing under the filter, take the nearest pixel
	long int nearest = round(centre);
	if (nearest < left)
	  nearest = left;
	if (nearest > right)
	  nearest = right;
	for (long int j = left; j <= right; j++)
	  weight[j - left] = (j == nearest) ? 1.0 : 0.0;
      }
    }
  }

}
