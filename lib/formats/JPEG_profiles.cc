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
#include <map>
#include <vector>
#include <string.h>
#include <jpeglib.h>
#include "CMS.hh"
#include "JPEG.hh"

namespace PhotoPostcard {

  CMS::Profile::ptr jpeg_read_profile(jpeg_decompress_struct* dinfo) {
    unsigned int profile_size = 0;
    unsigned char num_markers = 0;
    std::map<unsigned char, jpeg_marker_struct*> icc_markers;
    for (jpeg_marker_struct *marker = dinfo->marker_list; marker != nullptr; marker = marker->next)
      if ((marker->marker == JPEG_APP0 + 2)
	  && (marker->data_length > 14)
	  && (memcmp(marker->data, "ICC_PROFILE\0", 12) == 0)) {

	profile_size += marker->data_length - 14;
	unsigned char i = *(marker->data + 12) - 1;
	icc_markers[i] = marker;

	unsigned char j = *(marker->data + 13);
	if ((icc_markers.size() > 1) && (j != num_markers))
	  std::cerr << "** Got a different number of markers! (" << (int)j << " != " << (int)num_markers << ") **" << std::endl;
	num_markers = j;
      }

    if (profile_size == 0)	// Probably no APP2 markers
      return nullptr;

    if (num_markers != icc_markers.size()) {
      std::cerr << "** Supposed to have " << (int)num_markers << " APP2 markers, but only have " << icc_markers.size() << " in list **" << std::endl;
      return nullptr;
    }

    std::vector<unsigned char> profile_data(profile_size);
    unsigned char *pos = profile_data.data();
    for (unsigned int i = 0; i < num_markers; i++) {
      if (icc_markers.count(i) == 0) {
	std::cerr << "** APP2 marker " << (i + 1) << " of " << (int)num_markers << " is missing **" << std::endl;
	return nullptr;
      }
      memcpy(pos, icc_markers[i]->data + 14, icc_markers[i]->data_length - 14);
      pos += icc_markers[i]->data_length - 14;
    }

    CMS::Profile::ptr profile;
    try {
      profile = std::make_shared<CMS::Profile>(profile_data.data(), profile_size);
    } catch (LibraryError& ex) {
      std::cerr << "** Ignoring embedded profile: " << ex.what() << " **" << std::endl;
      return nullptr;
    }
    if (!profile->valid())
      return nullptr;

    std::string profile_name = profile->description();
    if (profile_name.length() == 0)
      profile_name = "JPEG APP2";
    std::cerr << "\tRead embedded profile \"" << profile_name << "\" (" << profile_size << " bytes in " << (int)num_markers << " APP2 markers)" << std::endl;

    return profile;
  }

}
