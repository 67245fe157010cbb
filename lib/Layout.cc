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
#include <algorithm>
#include <math.h>
#include "Layout.hh"
#include "Exception.hh"

namespace PhotoPostcard {

  std::ostream& operator<< (std::ostream& out, const CanvasPlan& plan) {
    out << plan.canvas_width << "×" << plan.canvas_height << " canvas, "
	<< (plan.rotated ? "rotated " : "")
	<< plan.content_width << "×" << plan.content_height << " content at ("
	<< plan.content_x << ", " << plan.content_y << "), "
	<< plan.strip_height << " px strip from " << plan.strip_top;
    return out;
  }

  LayoutPlanner::LayoutPlanner(const PostcardConfig& config) :
    _config(config)
  {}

  double LayoutPlanner::photo_height(void) const {
    return _config.canvas_height() * (1.0 - _config.strip_ratio());
  }

  unsigned int LayoutPlanner::available_height(void) const {
    return floor(photo_height());
  }

  unsigned int LayoutPlanner::strip_height(void) const {
    return floor(_config.canvas_height() * _config.strip_ratio());
  }

  bool LayoutPlanner::plan_rotation(unsigned int width, unsigned int height) const {
    if ((width == 0) || (height == 0))
      throw GeometryError(width, height, "the image has no area");

    if (width <= height)
      return false;

    double W = _config.canvas_width();
    double H = photo_height();
    double unrotated = std::min(W / width, H / height);
    double rotated = std::min(W / height, H / width);

    return rotated > unrotated * _config.rotate_threshold();
  }

  std::pair<unsigned int, unsigned int> LayoutPlanner::plan_content_size(unsigned int width, unsigned int height) const {
    if ((width == 0) || (height == 0))
      throw GeometryError(width, height, "the image has no area");

    unsigned long long W = _config.canvas_width();
    unsigned long long H = available_height();
    unsigned long long new_width, new_height;

    // W / width <= H / height, without rounding
    if (W * height <= H * width) {
      new_width = W;
      new_height = (height * W) / width;
    } else {
      new_height = H;
      new_width = (width * H) / height;
    }

    // Extreme aspect ratios still get a visible sliver
    if (new_width == 0)
      new_width = 1;
    if (new_height == 0)
      new_height = 1;

    return std::make_pair((unsigned int)new_width, (unsigned int)new_height);
  }

  CanvasPlan LayoutPlanner::plan_canvas(unsigned int content_width, unsigned int content_height) const {
    CanvasPlan plan;
    plan.canvas_width = _config.canvas_width();
    plan.canvas_height = _config.canvas_height();
    plan.content_width = content_width;
    plan.content_height = content_height;
    plan.content_x = content_width < plan.canvas_width ? (plan.canvas_width - content_width) / 2 : 0;
    plan.content_y = 0;
    plan.strip_top = content_height;
    plan.strip_height = strip_height();
    return plan;
  }

  CanvasPlan LayoutPlanner::plan(unsigned int width, unsigned int height) const {
    bool rotated = plan_rotation(width, height);
    if (rotated)
      std::swap(width, height);

    auto size = plan_content_size(width, height);
    CanvasPlan plan = plan_canvas(size.first, size.second);
    plan.rotated = rotated;
    return plan;
  }

}
