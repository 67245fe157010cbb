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
#pragma once

#include <ostream>
#include <string>
#include <time.h>

namespace PhotoPostcard {

  //! Set by --benchmark
  extern bool benchmark_mode;

  //! Monotonic wall-clock timer
  class Timer {
  private:
    timespec _start_time, _end_time;
    bool _running, _stopped;

  public:
    Timer();

    void start(void);
    void stop(void);

    //! Seconds between start() and stop(), or -1 if either is missing
    double elapsed(void) const;

  }; // class Timer

  //! Print the elapsed time with an SI prefix, e.g "12.34 ms"
  std::ostream& operator<< (std::ostream& out, const Timer& t);

  //! Print a "Benchmark:" line to stderr in benchmark mode
  /*!
    \param what Description of the timed step
    \param pixels If non-zero, also print the throughput in Mpixels/second
  */
  void benchmark_report(const std::string& what, const Timer& t, long long pixels = 0);

}; // namespace PhotoPostcard;
