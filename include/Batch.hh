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
#ifndef __BATCH_HH__
#define __BATCH_HH__

#include <boost/filesystem.hpp>
#include "Config.hh"
#include "Composer.hh"

namespace fs = boost::filesystem;

namespace PhotoPostcard {

  //! Counts from one batch run
  struct BatchSummary {
    unsigned int attempted, succeeded;

    BatchSummary() :
      attempted(0), succeeded(0)
    {}

    inline unsigned int failed(void) const { return attempted - succeeded; }
  };

  //! Makes a postcard from every photo in a directory
  class BatchRunner {
  private:
    const PostcardConfig& _config;
    const PostcardComposer& _composer;

  public:
    //! Constructor
    BatchRunner(const PostcardConfig& config, const PostcardComposer& composer);

    //! Does the file have one of the photo extensions? (any case)
    bool is_supported(const fs::path& filepath) const;

    //! Where the postcard for a photo is written
    fs::path output_path(const fs::path& input, const fs::path& output_dir) const;

    //! Process every supported file in input_dir, in name order
    /*!
      Creates output_dir if needed. Throws FileOpenError if input_dir is not a directory.
    */
    BatchSummary run(const fs::path& input_dir, const fs::path& output_dir) const;

  }; // class BatchRunner

}

#endif // __BATCH_HH__
