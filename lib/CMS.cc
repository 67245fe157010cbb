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
#include <vector>
#include "CMS.hh"

namespace CMS {

  std::ostream& operator<< (std::ostream& out, ColourModel model) {
    switch (model) {
    case ColourModel::Greyscale:	out << "Greyscale";
      break;
    case ColourModel::RGB:		out << "RGB";
      break;
    case ColourModel::CMYK:		out << "CMYK";
      break;

    default:
      out << "[unknown (" << (int)model << ")]";
    }
    return out;
  }



  /*
    class Profile
  */

  Profile::Profile(cmsHPROFILE p)
    : _profile(p)
  {
  }

  Profile::Profile(const void* data, cmsUInt32Number size)
    : _profile(cmsOpenProfileFromMem(data, size))
  {
  }

  Profile::~Profile() {
    if (_profile)
      cmsCloseProfile(_profile);
  }

  Profile::ptr Profile::sRGB(void) {
    return std::make_shared<Profile>(cmsCreate_sRGBProfile());
  }

  Profile::ptr Profile::sGrey(void) {
    cmsCIExyY D65;
    cmsWhitePointFromTemp(&D65, 6504);
    // y = (x >= d ? (a*x + b)^gamma : c*x)
    double params[5] = { 2.4, 1.0 / 1.055, 0.055 / 1.055, 1.0 / 12.92, 0.04045 };
    cmsToneCurve *curve = cmsBuildParametricToneCurve(NULL, 4, params);
    if (curve == NULL)
      throw PhotoPostcard::LibraryError("LCMS2", "Could not build the sGrey tone curve");
    auto profile = std::make_shared<Profile>(cmsCreateGrayProfile(&D65, curve));
    cmsFreeToneCurve(curve);

    cmsMLU *desc = cmsMLUalloc(NULL, 1);
    if (desc != NULL) {
      if (cmsMLUsetASCII(desc, "en", "AU", "sGrey built-in"))
	cmsWriteTag(*profile, cmsSigProfileDescriptionTag, desc);
      cmsMLUfree(desc);
    }

    return profile;
  }

  ColourModel Profile::colour_model(void) const {
    switch (cmsGetColorSpace(_profile)) {
    case cmsSigGrayData:	return ColourModel::Greyscale;
    case cmsSigRgbData:		return ColourModel::RGB;
    case cmsSigCmykData:	return ColourModel::CMYK;
    default:
      break;
    }
    return ColourModel::Any;
  }

  std::string Profile::description(void) const {
    cmsUInt32Number len = cmsGetProfileInfoASCII(_profile, cmsInfoDescription, "en", cmsNoCountry, NULL, 0);
    if (len == 0)
      return "";

    std::vector<char> text(len);
    cmsGetProfileInfoASCII(_profile, cmsInfoDescription, "en", cmsNoCountry, text.data(), len);
    return std::string(text.data());
  }



  /*
    class Format
  */

// Masks for clearing fields of an LCMS2 format word
#define FLOAT_MASK      (0xffffffff ^ FLOAT_SH(1))
#define COLORSPACE_MASK (0xffffffff ^ COLORSPACE_SH(31))
#define FLAVOR_MASK     (0xffffffff ^ FLAVOR_SH(1))
#define EXTRA_MASK      (0xffffffff ^ EXTRA_SH(7))
#define CHANNELS_MASK   (0xffffffff ^ CHANNELS_SH(15))
#define BYTES_MASK      (0xffffffff ^ BYTES_SH(7))

  Format::Format(cmsUInt32Number f)
    : _format(f)
  {
  }

  Format::Format()
    : _format(0)
  {
  }

  Format Format::Grey8(void) {
    return Format(COLORSPACE_SH(PT_GRAY) | CHANNELS_SH(1) | BYTES_SH(1));
  }

  Format Format::RGB8(void) {
    return Format(COLORSPACE_SH(PT_RGB) | CHANNELS_SH(3) | BYTES_SH(1));
  }

  Format &Format::set_8bit(void) {
    _format = (_format & FLOAT_MASK & BYTES_MASK) | BYTES_SH(1);
    return *this;
  }

  Format &Format::set_16bit(void) {
    _format = (_format & FLOAT_MASK & BYTES_MASK) | BYTES_SH(2);
    return *this;
  }

  Format &Format::set_extra_channels(unsigned int e) {
    _format = (_format & EXTRA_MASK) | EXTRA_SH(e);
    return *this;
  }

  Format &Format::set_vanilla(bool v) {
    _format = (_format & FLAVOR_MASK) | FLAVOR_SH(v);
    return *this;
  }

  Format &Format::set_colour_model(const ColourModel cm, unsigned int channels) {
    _format = (_format & COLORSPACE_MASK) | COLORSPACE_SH((int)cm);

    switch (cm) {
    case ColourModel::Greyscale:	channels = 1;
      break;
    case ColourModel::RGB:		channels = 3;
      break;
    case ColourModel::CMYK:		channels = 4;
      break;
    default:
      break;
    }

    if ((channels > 0) && (channels < cmsMAXCHANNELS))
      _format = (_format & CHANNELS_MASK) | CHANNELS_SH(channels);

    return *this;
  }

  std::ostream& operator<< (std::ostream& out, Format f) {
    out << f.colour_model() << "[";
    if (f.extra_channels() > 0)
      out << "(" << f.channels() << "+" << f.extra_channels() << ")×";
    else
      out << f.channels() << "×";
    out << (f.bytes_per_channel() * 8) << "b";
    if (f.is_vanilla())
      out << ", vanilla";
    out << "]";

    return out;
  }



  /*
    class Transform
  */

  Transform::Transform(Profile::ptr input, const Format &informat,
		       Profile::ptr output, const Format &outformat,
		       Intent intent)
    : _transform(cmsCreateTransform(*input, (cmsUInt32Number)informat,
				    *output, (cmsUInt32Number)outformat,
				    (cmsUInt32Number)intent, cmsFLAGS_NOCACHE))
  {
    if (_transform == NULL)
      throw PhotoPostcard::LibraryError("LCMS2", "Could not create transform");
  }

  Transform::~Transform() {
    if (_transform != NULL)
      cmsDeleteTransform(_transform);
  }

  void Transform::apply(const void* input, void* output, cmsUInt32Number pixels) const {
    cmsDoTransform(_transform, input, output, pixels);
  }

}; // namespace CMS

static void lcms2_errorhandler(cmsContext ContextID, cmsUInt32Number ErrorCode, const char *Text) {
  throw PhotoPostcard::LibraryError("LCMS2", Text);
}

void lcms2_error_adaptor(void) {
  cmsSetLogErrorHandler(lcms2_errorhandler);
}
