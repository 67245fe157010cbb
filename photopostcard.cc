/*
	Copyright 2012-2024 Ian Tester

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
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <iostream>
#include <string>
#include <boost/filesystem.hpp>
#include "CMS.hh"
#include "Config.hh"
#include "Composer.hh"
#include "Batch.hh"
#include "Exception.hh"
#include "Benchmark.hh"

namespace fs = boost::filesystem;
namespace po = boost::program_options;

using namespace PhotoPostcard;

int main(int argc, char* argv[]) {
  fs::path input_dir, output_dir, config_path;

  po::variables_map opts;
  try {
    po::options_description generic_options("Allowed options");
    generic_options.add_options()
      ("help,h", "produce help message")
      ("config,c", po::value<fs::path>(&config_path), "YAML file overriding the postcard settings")
      ("benchmark,b", po::bool_switch(&benchmark_mode), "Print timings")
      ;

    po::options_description hidden_options;
    hidden_options.add_options()
      ("input-dir", po::value<fs::path>(&input_dir)->default_value("PostcardPhotos"), "Directory of photos")
      ("output-dir", po::value<fs::path>(&output_dir)->default_value("PostcardAfterProcess"), "Directory for postcards")
      ;

    po::options_description cmdline_options;
    cmdline_options.add(generic_options).add(hidden_options);

    po::positional_options_description positional;
    positional.add("input-dir", 1).add("output-dir", 1);

    po::store(po::command_line_parser(argc, argv).options(cmdline_options).positional(positional).run(), opts);
    po::notify(opts);

    // Display descriptions of command-line options if '--help' is given
    if (opts.count("help")) {
      std::cerr << argv[0] << " [options] [<input dir> [<output dir>]]" << std::endl;
      std::cerr << generic_options << std::endl;
      return 1;
    }
  } catch (po::error& ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }

  lcms2_error_adaptor();

  PostcardConfig config;
  try {
    if (opts.count("config"))
      config = PostcardConfig::load(config_path);
  } catch (std::exception& ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }

  try {
    PostcardComposer composer(config);
    BatchRunner runner(config, composer);
    runner.run(input_dir, output_dir);
  } catch (std::exception& ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }

  return 0;
}
