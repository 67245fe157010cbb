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
#include <memory>
#include <string>
#include <lcms2.h>
#include "Exception.hh"

namespace CMS {

  //! Colour models of the decoded images, values are LCMS2's PT_* constants
  enum class ColourModel {
    Any = 0,
    Greyscale = PT_GRAY,
    RGB = PT_RGB,
    CMYK = PT_CMYK,
  }; // enum class ColourModel

  std::ostream& operator<< (std::ostream& out, ColourModel model);

  //! An ICC profile, owning its LCMS2 handle
  class Profile {
  private:
    cmsHPROFILE _profile;

  public:
    //! Take ownership of an LCMS2 profile handle
    explicit Profile(cmsHPROFILE p);

    //! Parse an embedded profile
    Profile(const void* data, cmsUInt32Number size);

    Profile(const Profile& other) = delete;
    Profile& operator=(const Profile& other) = delete;

    ~Profile();

    inline operator cmsHPROFILE() const { return _profile; }

    //! Did LCMS2 accept the profile data?
    inline bool valid(void) const { return _profile != NULL; }

    typedef std::shared_ptr<Profile> ptr;

    //! The built-in sRGB profile
    static ptr sRGB(void);

    //! Greyscale with the sRGB tone curve and a D65 white point
    static ptr sGrey(void);

    //! Colour model of the profile's device space, Any if unsupported
    ColourModel colour_model(void) const;

    //! Profile description, or an empty string
    std::string description(void) const;

  }; // class Profile

  //! An LCMS2 pixel format
  class Format {
  private:
    cmsUInt32Number _format;

    Format(cmsUInt32Number f);

  public:
    Format();

    inline operator cmsUInt32Number() const { return _format; }

    static Format Grey8(void);
    static Format RGB8(void);

    Format &set_8bit(void);
    Format &set_16bit(void);

    //! Extra channels (alpha, spot colours) after the colour channels
    Format &set_extra_channels(unsigned int e);

    //! 'Vanilla' flavour means the minimum value is white, e.g Adobe CMYK JPEGs
    Format &set_vanilla(bool v = true);

    //! Set the colour model and number of channels
    /*!
      \param channels Only used if the colour model is Any
    */
    Format &set_colour_model(const ColourModel cm, unsigned int channels = 0);

    inline ColourModel colour_model(void) const { return (ColourModel)T_COLORSPACE(_format); }
    inline unsigned int channels(void) const { return T_CHANNELS(_format); }
    inline unsigned int extra_channels(void) const { return T_EXTRA(_format); }
    inline unsigned int bytes_per_channel(void) const { return T_BYTES(_format); }
    inline unsigned int bytes_per_pixel(void) const { return T_BYTES(_format) * (T_CHANNELS(_format) + T_EXTRA(_format)); }
    inline bool is_vanilla(void) const { return T_FLAVOR(_format); }

    inline bool operator ==(const Format& other) const { return _format == other._format; }
    inline bool operator !=(const Format& other) const { return _format != other._format; }

  }; // class Format

  std::ostream& operator<< (std::ostream& out, Format f);

  //! Rendering intents
  enum class Intent {
    Perceptual = INTENT_PERCEPTUAL,
    Relative_colorimetric = INTENT_RELATIVE_COLORIMETRIC,
  };

  //! A colour transform between two profile/format pairs
  class Transform {
  private:
    cmsHTRANSFORM _transform;

  public:
    //! Throws LibraryError if LCMS2 cannot link the profiles
    Transform(Profile::ptr input, const Format &informat,
	      Profile::ptr output, const Format &outformat,
	      Intent intent);

    Transform(const Transform& other) = delete;
    Transform& operator=(const Transform& other) = delete;

    ~Transform();

    typedef std::shared_ptr<Transform> ptr;

    //! Transform 'pixels' pixels from one buffer to another
    void apply(const void* input, void* output, cmsUInt32Number pixels) const;

  }; // class Transform

}; // namespace CMS

//! Set up an error handler with LCMS2 that will throw a LibraryError exception
void lcms2_error_adaptor(void);
