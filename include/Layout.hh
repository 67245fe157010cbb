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
#ifndef __LAYOUT_HH__
#define __LAYOUT_HH__

#include <ostream>
#include <utility>
#include "Config.hh"

namespace PhotoPostcard {

  //! Where everything goes on the canvas
  struct CanvasPlan {
    unsigned int canvas_width, canvas_height;
    bool rotated;
    unsigned int content_width, content_height;
    unsigned int content_x, content_y;
    unsigned int strip_top, strip_height;

    CanvasPlan() :
      canvas_width(0), canvas_height(0),
      rotated(false),
      content_width(0), content_height(0),
      content_x(0), content_y(0),
      strip_top(0), strip_height(0)
    {}
  };

  std::ostream& operator<< (std::ostream& out, const CanvasPlan& plan);

  //! Decides rotation, scale and placement of a photo on the postcard
  /*!
    All decisions are pure functions of the source dimensions and the
    configuration.
   */
  class LayoutPlanner {
  private:
    const PostcardConfig& _config;

  public:
    //! Constructor
    LayoutPlanner(const PostcardConfig& config);

    //! Height of the canvas left for the photo, as a real number
    double photo_height(void) const;

    //! Height of the canvas left for the photo, in whole pixels
    unsigned int available_height(void) const;

    //! Height of the caption strip in whole pixels
    unsigned int strip_height(void) const;

    //! Should a photo be turned 90° to fill more of the canvas?
    /*!
      Only landscape photos are turned, and only when turning them makes them
      larger by more than the configured threshold.
    */
    bool plan_rotation(unsigned int width, unsigned int height) const;

    //! Largest size that fits the photo area without cropping
    /*!
      \return (width, height), each at least 1 pixel
      Throws GeometryError if either dimension is zero.
    */
    std::pair<unsigned int, unsigned int> plan_content_size(unsigned int width, unsigned int height) const;

    //! Place content of the given size on the canvas
    CanvasPlan plan_canvas(unsigned int content_width, unsigned int content_height) const;

    //! Rotation, size and placement for a photo of the given size
    CanvasPlan plan(unsigned int width, unsigned int height) const;

  }; // class LayoutPlanner

}

#endif // __LAYOUT_HH__
