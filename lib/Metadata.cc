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
#include <ctype.h>
#include "Metadata.hh"

namespace PhotoPostcard {

  static const char* month_names[12] = { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
					 "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

  //! Strip trailing NULs and whitespace
  static std::string trim_value(const std::string& value) {
    size_t end = value.length();
    while ((end > 0) && ((value[end - 1] == '\0') || isspace((unsigned char)value[end - 1])))
      end--;
    return value.substr(0, end);
  }

  //! Parse a fixed-width run of decimal digits
  static bool read_digits(const std::string& s, size_t start, size_t len, int& value) {
    value = 0;
    for (size_t i = start; i < start + len; i++) {
      if (!isdigit((unsigned char)s[i]))
	return false;
      value = (value * 10) + (s[i] - '0');
    }
    return true;
  }

  static bool is_leap_year(int year) {
    return ((year % 4 == 0) && (year % 100 != 0)) || (year % 400 == 0);
  }

  definable<std::string> format_capture_date(const std::string& raw) {
    std::string text = trim_value(raw);
    // YYYY:MM:DD HH:MM:SS
    if ((text.length() != 19)
	|| (text[4] != ':') || (text[7] != ':') || (text[10] != ' ')
	|| (text[13] != ':') || (text[16] != ':'))
      return definable<std::string>();

    int year, month, day, hour, minute, second;
    if (!read_digits(text, 0, 4, year) || !read_digits(text, 5, 2, month)
	|| !read_digits(text, 8, 2, day) || !read_digits(text, 11, 2, hour)
	|| !read_digits(text, 14, 2, minute) || !read_digits(text, 17, 2, second))
      return definable<std::string>();

    static const int month_days[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if ((year < 1) || (month < 1) || (month > 12) || (day < 1))
      return definable<std::string>();
    int days = month_days[month - 1];
    if ((month == 2) && is_leap_year(year))
      days++;
    if (day > days)
      return definable<std::string>();

    // Leap seconds are allowed
    if ((hour > 23) || (minute > 59) || (second > 61))
      return definable<std::string>();

    std::string formatted = month_names[month - 1];
    formatted += ' ';
    formatted += text.substr(8, 2);
    formatted += ", ";
    formatted += text.substr(0, 4);
    return formatted;
  }

  MetadataExtractor::MetadataExtractor(const PostcardConfig& config) :
    _config(config)
  {}

  definable<std::string> MetadataExtractor::capture_date(const Exiv2::ExifData& tags) const {
    try {
      auto ei = tags.findKey(Exiv2::ExifKey("Exif.Photo.DateTimeOriginal"));
      if (ei == tags.end())
	return definable<std::string>();

      std::string raw = trim_value(ei->toString());
      // Cameras without a clock write blanks or NULs
      if (raw.length() == 0) {
	std::cerr << "** Capture date tag is empty **" << std::endl;
	return definable<std::string>();
      }

      definable<std::string> formatted = format_capture_date(raw);
      if (formatted.defined())
	return formatted;

      std::cerr << "** Capture date \"" << raw << "\" not in EXIF format, using it as is **" << std::endl;
      return raw;
    } catch (Exiv2::Error& e) {
      std::cerr << "** Could not read capture date: " << e.what() << " **" << std::endl;
    }
    return definable<std::string>();
  }

  definable<std::string> MetadataExtractor::location(const Exiv2::ExifData& tags) const {
    try {
      for (auto ei = tags.begin(); ei != tags.end(); ei++)
	if ((ei->key() == "Exif.Image.GPSTag") || (ei->groupName() == "GPSInfo"))
	  return _config.location_placeholder();
    } catch (Exiv2::Error& e) {
      std::cerr << "** Could not read GPS data: " << e.what() << " **" << std::endl;
    }
    return definable<std::string>();
  }

  CaptureMetadata MetadataExtractor::extract(const Exiv2::ExifData& tags) const {
    CaptureMetadata metadata;

    definable<std::string> date = capture_date(tags);
    if (!date.defined())
      std::cerr << "\tNo capture date, using \"" << _config.fallback_date() << "\"." << std::endl;
    metadata.date_text = date.get_or(_config.fallback_date());

    definable<std::string> place = location(tags);
    if (!place.defined())
      std::cerr << "\tNo GPS data, using \"" << _config.fallback_location() << "\"." << std::endl;
    metadata.location_text = place.get_or(_config.fallback_location());

    std::cerr << "\tCaption: \"" << metadata.date_text << "\", \"" << metadata.location_text << "\"." << std::endl;
    return metadata;
  }

}
