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
#ifndef __RESAMPLER_HH__
#define __RESAMPLER_HH__

#include <memory>
#include <vector>

//! Precision of the resampling weights and intermediate rows
#ifndef SAMPLE
#define SAMPLE float
#endif

namespace PhotoPostcard {

  //! A windowed interpolation kernel
  class Filter {
  public:
    typedef std::shared_ptr<Filter> ptr;

    virtual ~Filter() {}

    //! Half-width of the kernel's support, in input pixels
    virtual double range(void) const = 0;

    //! Kernel weight at distance x from the sampling centre
    virtual SAMPLE eval(double x) const = 0;
  };

  //! Windowed sinc, sinc(x)·sinc(x/radius) for |x| < radius
  class Lanczos : public Filter {
  private:
    double _radius;

  public:
    /*!
      \param radius Number of lobes on each side, 3 for the usual Lanczos-3
    */
    Lanczos(double radius = 3.0);

    inline double range(void) const { return _radius; }

    SAMPLE eval(double x) const;
  };

  //! Weight tables for resampling one dimension of an image
  /*!
    Output sample i is the weighted sum of N(i) input samples starting at Start(i).
  */
  class Resampler {
  private:
    std::vector<unsigned int> _start;
    std::vector<std::vector<SAMPLE>> _weight;

  public:
    /*!
      \param filter Interpolation kernel
      \param from_start,from_size Span of the input that is resampled
      \param from_max Size of the input, no weight falls outside [0, from_max)
      \param to_size Number of output samples
    */
    Resampler(Filter::ptr filter, double from_start, double from_size, unsigned int from_max, unsigned int to_size);

    inline unsigned int size(void) const { return _start.size(); }

    inline unsigned int N(unsigned int i) const { return _weight[i].size(); }

    inline unsigned int Start(unsigned int i) const { return _start[i]; }

    //! These sum to one
    inline const SAMPLE* Weight(unsigned int i) const { return _weight[i].data(); }

  };

}

#endif // __RESAMPLER_HH__
