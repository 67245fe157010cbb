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
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include "Batch.hh"
#include "Exception.hh"

namespace PhotoPostcard {

  BatchRunner::BatchRunner(const PostcardConfig& config, const PostcardComposer& composer) :
    _config(config),
    _composer(composer)
  {}

  bool BatchRunner::is_supported(const fs::path& filepath) const {
    std::string ext = filepath.extension().string();
    if (ext.length() == 0)
      return false;

    for (auto& supported : _config.extensions())
      if (boost::iequals(ext, supported))
	return true;

    return false;
  }

  fs::path BatchRunner::output_path(const fs::path& input, const fs::path& output_dir) const {
    return output_dir / (input.stem().string() + _config.suffix() + ".jpg");
  }

  BatchSummary BatchRunner::run(const fs::path& input_dir, const fs::path& output_dir) const {
    boost::system::error_code ec;
    if (!fs::is_directory(input_dir, ec))
      throw FileOpenError(input_dir.native(), "not a directory");

    if (!fs::exists(output_dir)) {
      std::cerr << "Creating directory " << output_dir << "." << std::endl;
      fs::create_directories(output_dir);
    }

    std::vector<fs::path> inputs;
    for (fs::directory_iterator di(input_dir); di != fs::directory_iterator(); di++)
      if (fs::is_regular_file(di->status()) && is_supported(di->path()))
	inputs.push_back(di->path());
    std::sort(inputs.begin(), inputs.end());

    BatchSummary summary;
    for (auto& input : inputs) {
      std::cerr << "Processing " << input.filename() << std::endl;
      summary.attempted++;
      if (_composer.compose(input, output_path(input, output_dir)))
	summary.succeeded++;
    }

    std::cerr << std::endl << "Processed " << summary.succeeded << " of " << summary.attempted << " photos." << std::endl;
    return summary;
  }

}
