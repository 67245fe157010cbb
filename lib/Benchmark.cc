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
#include <iomanip>
#include "Benchmark.hh"

namespace PhotoPostcard {

  bool benchmark_mode = false;

  Timer::Timer() :
    _running(false), _stopped(false)
  {}

  void Timer::start(void) {
    _running = clock_gettime(CLOCK_MONOTONIC, &_start_time) == 0;
    _stopped = false;
  }

  void Timer::stop(void) {
    if (_running)
      _stopped = clock_gettime(CLOCK_MONOTONIC, &_end_time) == 0;
  }

  double Timer::elapsed(void) const {
    if (!_running || !_stopped)
      return -1;

    return (_end_time.tv_sec - _start_time.tv_sec) + (_end_time.tv_nsec - _start_time.tv_nsec) * 1e-9;
  }

  std::ostream& operator<< (std::ostream& out, const Timer& t) {
    double secs = t.elapsed();
    if (secs < 0)
      return out << "[not timed]";

    static const struct { double scale; const char *unit; } units[] = {
      { 1.0, "s" }, { 1e-3, "ms" }, { 1e-6, "μs" }, { 0.0, "ns" },
    };
    int u = 0;
    while ((units[u].scale > 0) && (secs < units[u].scale))
      u++;
    double value = units[u].scale > 0 ? secs / units[u].scale : secs * 1e+9;

    std::ios::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();
    out << std::fixed << std::setprecision(2) << value << " " << units[u].unit;
    out.flags(flags);
    out.precision(precision);
    return out;
  }

  void benchmark_report(const std::string& what, const Timer& t, long long pixels) {
    if (!benchmark_mode)
      return;

    std::cerr << "Benchmark: " << what << " in " << t;
    double secs = t.elapsed();
    if ((pixels > 0) && (secs > 0)) {
      std::ios::fmtflags flags = std::cerr.flags();
      std::cerr << " = " << std::fixed << std::setprecision(2) << (pixels / secs / 1e+6) << " Mpixels/second";
      std::cerr.flags(flags);
    }
    std::cerr << std::endl;
  }

}; // namespace PhotoPostcard
