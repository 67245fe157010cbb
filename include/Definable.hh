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
#ifndef __DEFINABLE_HH__
#define __DEFINABLE_HH__

#include <ostream>

namespace PhotoPostcard {

  //! A value that may be absent, e.g a resolution the file did not state
  template <typename T>
  class definable {
  private:
    bool _defined;
    T _item;

  public:
    //! An undefined value
    definable() :
      _defined(false),
      _item()
    {}

    definable(const T &i) :
      _defined(true),
      _item(i)
    {}

    inline bool defined(void) const { return _defined; }

    //! The item, only meaningful if defined()
    inline const T& get(void) const { return _item; }

    inline operator T(void) const { return _item; }

    inline definable<T>& operator =(const T &i) {
      _defined = true;
      _item = i;
      return *this;
    }

    //! Return the item if defined, otherwise the supplied fallback
    inline T get_or(const T& fallback) const { return _defined ? _item : fallback; }

    inline friend std::ostream& operator << (std::ostream& out, const definable<T>& data) {
      if (data._defined)
	return out << data._item;
      return out << "[undefined]";
    }

  };

}

#endif /* __DEFINABLE_HH__ */
