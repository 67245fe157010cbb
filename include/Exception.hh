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

#include <string>
#include <exception>

namespace PhotoPostcard {

  //! Base of every exception thrown by Photo Postcard
  /*!
    Subclasses compose the full message in their constructor.
  */
  class ErrorMsg : public std::exception {
  protected:
    const std::string _msg;
    std::string _what;

    ErrorMsg(const std::string& m) :
      _msg(m)
    {}

    //! Append ": <message>." to w, or just "."
    std::string with_msg(std::string w) const {
      if (_msg.length() > 0)
	w += ": " + _msg;
      return w + ".";
    }

  public:
    //! The message passed to the constructor
    inline const std::string& message(void) const { return _msg; }

    const char* what() const noexcept { return _what.c_str(); }
  };

  //! Something read before it was written, e.g an unallocated image row
  class Uninitialised : public ErrorMsg {
  public:
    /*!
      \param c Class name
      \param a Attribute name
    */
    Uninitialised(const std::string& c, const std::string& a = "") :
      ErrorMsg(a)
    {
      _what = c + (a.length() > 0 ? "::" + a : "") + " is uninitialised.";
    }
  };

  //! Memory allocation exception
  class MemAllocError : public ErrorMsg {
  public:
    MemAllocError(const std::string& m) :
      ErrorMsg(m)
    {
      _what = m;
    }
  };

  //! Base of the exceptions about a particular file
  class FileError : public ErrorMsg {
  protected:
    const std::string _filepath;

    FileError(const std::string& fp, const std::string& m) :
      ErrorMsg(m), _filepath(fp)
    {}

  public:
    inline const std::string& filepath(void) const { return _filepath; }
  };

  //! No reader or writer for a file's format
  class UnknownFileType : public FileError {
  public:
    UnknownFileType(const std::string& fp, const std::string& m = "") :
      FileError(fp, m)
    {
      _what = with_msg("Could not determine type for \"" + fp + "\"");
    }
  };

  //! File could not be opened, created or written
  class FileOpenError : public FileError {
  public:
    FileOpenError(const std::string& fp, const std::string& m = "") :
      FileError(fp, m)
    {
      _what = with_msg("Could not open filepath \"" + fp + "\"");
    }
  };

  //! File opened but its contents could not be decoded
  class FileContentError : public FileError {
  public:
    FileContentError(const std::string& fp, const std::string& m = "") :
      FileError(fp, m)
    {
      _what = with_msg("Something is wrong with the contents of filepath \"" + fp + "\"");
    }
  };

  //! Bad value in the configuration
  class ConfigError : public ErrorMsg {
  public:
    /*!
      \param p Configuration field "path", e.g "canvas.width"
      \param v Value that is wrong
    */
    ConfigError(const std::string& p, const std::string& v) :
      ErrorMsg(v)
    {
      _what = "Error with value of configuration field \"" + p + "\" (\"" + v + "\").";
    }
  };

  //! Source or target dimensions that cannot be laid out
  class GeometryError : public ErrorMsg {
  public:
    GeometryError(unsigned int w, unsigned int h, const std::string& m) :
      ErrorMsg(m)
    {
      _what = "Cannot lay out a " + std::to_string(w) + "×" + std::to_string(h) + " image: " + m + ".";
    }
  };

  //! Failure reported by a third-party library
  class LibraryError : public ErrorMsg {
  public:
    /*!
      \param l Library name
      \param m Error message
    */
    LibraryError(const std::string& l, const std::string& m) :
      ErrorMsg(m)
    {
      _what = "Error in " + l + ": " + m + ".";
    }
  };

  //! Pixel format not supported by an operation
  class cmsTypeError : public ErrorMsg {
  public:
    /*!
      \param t LCMS2 format word
    */
    cmsTypeError(const std::string& m, unsigned int t) :
      ErrorMsg(m)
    {
      _what = "Error with value of cmsType 0x" + hex(t) + ": " + m + ".";
    }

  private:
    static std::string hex(unsigned int t) {
      static const char digits[] = "0123456789abcdef";
      std::string s;
      do {
	s.insert(s.begin(), digits[t & 0xf]);
	t >>= 4;
      } while (t > 0);
      return s;
    }
  };

}
