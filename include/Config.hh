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
#ifndef __CONFIG_HH__
#define __CONFIG_HH__

#include <string>
#include <vector>
#include <utility>
#include <boost/filesystem.hpp>
#include "yaml-cpp/yaml.h"
#include "Image.hh"
#include "Exception.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  //! JPEG parameters for the postcard output
  class JPEGsettings {
  private:
    int _quality;
    std::pair<int, int> _sample;
    bool _progressive;

  public:
    //! Empty constructor
    JPEGsettings();

    //! Constructor
    /*!
      \param q Quality
      \param h,v Chroma sampling
      \param p Progressive
    */
    JPEGsettings(int q, int h, int v, bool p);

    inline int quality(void) const { return _quality; }
    inline std::pair<int, int> sample(void) const { return _sample; }
    inline bool progressive(void) const { return _progressive; }

    //! Read a "jpeg" record from a YAML document
    void read_config(const YAML::Node& node);
  };

  //! The constants that shape every postcard
  /*!
    Built once at start-up and handed to each component by const reference.
   */
  class PostcardConfig {
  private:
    unsigned int _canvas_width, _canvas_height;
    double _dpi;
    Colour _background, _text_colour;
    double _strip_ratio, _rotate_threshold;
    unsigned int _margin, _font_size;
    std::vector<std::string> _font_paths;
    JPEGsettings _jpeg;
    std::string _fallback_date, _fallback_location, _location_placeholder;
    std::string _suffix;
    std::vector<std::string> _extensions;

    //! Throw a ConfigError if any value cannot produce a postcard
    void _validate(void) const;

  public:
    //! Constructor with the built-in defaults (A6 at 300 DPI)
    PostcardConfig();

    //! Named constructor
    /*! Start from the defaults and override them from a YAML file
      \param filepath File path of the YAML document
    */
    static PostcardConfig load(const fs::path& filepath);

    //! Override values present in a YAML document
    void read_config(const YAML::Node& node);

    inline unsigned int canvas_width(void) const { return _canvas_width; }
    inline unsigned int canvas_height(void) const { return _canvas_height; }
    inline double dpi(void) const { return _dpi; }
    inline const Colour& background(void) const { return _background; }
    inline const Colour& text_colour(void) const { return _text_colour; }

    //! Fraction of the canvas height reserved for the caption strip
    inline double strip_ratio(void) const { return _strip_ratio; }

    //! Rotated fit must beat the unrotated fit by this factor
    inline double rotate_threshold(void) const { return _rotate_threshold; }

    inline unsigned int margin(void) const { return _margin; }
    inline unsigned int font_size(void) const { return _font_size; }
    inline const std::vector<std::string>& font_paths(void) const { return _font_paths; }
    inline const JPEGsettings& jpeg(void) const { return _jpeg; }

    inline const std::string& fallback_date(void) const { return _fallback_date; }
    inline const std::string& fallback_location(void) const { return _fallback_location; }
    inline const std::string& location_placeholder(void) const { return _location_placeholder; }

    //! Appended to the input stem to name the output file
    inline const std::string& suffix(void) const { return _suffix; }

    //! Input file extensions, with the leading dot
    inline const std::vector<std::string>& extensions(void) const { return _extensions; }

  };

}

#endif // __CONFIG_HH__
