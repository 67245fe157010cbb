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
#include "Composer.hh"
#include "ImageFile.hh"
#include "Frame.hh"
#include "Benchmark.hh"
#include "Exception.hh"

namespace PhotoPostcard {

  PostcardComposer::PostcardComposer(const PostcardConfig& config, Font::ptr font) :
    _config(config),
    _planner(config),
    _extractor(config),
    _font(font)
  {
    if (_font == nullptr)
      _font = load_font(_config.font_paths(), _config.font_size());
  }

  Image::ptr PostcardComposer::render(Image::ptr img, const CaptureMetadata& metadata, bool can_free) const {
    // Everything downstream works in 8-bit sRGB
    if ((img->format() != CMS::Format::RGB8()) || img->has_profile())
      img = img->transform_colour(CMS::Profile::sRGB(), CMS::Format::RGB8(), CMS::Intent::Perceptual, can_free);

    CanvasPlan plan = _planner.plan(img->width(), img->height());
    std::cerr << "\tLayout: " << plan << "." << std::endl;

    if (plan.rotated)
      img = img->rotate_90(can_free);

    if ((img->width() != plan.content_width) || (img->height() != plan.content_height)) {
      Frame frame(plan.content_width, plan.content_height);
      img = frame.resize(img, nullptr, can_free);
    }

    auto canvas = std::make_shared<Image>(plan.canvas_width, plan.canvas_height, CMS::Format::RGB8());
    canvas->set_profile(CMS::Profile::sRGB());
    canvas->set_resolution(_config.dpi());
    // The strip is whatever the content does not cover
    canvas->fill(_config.background());
    canvas->paste(img, plan.content_x, plan.content_y);

    // Both lines are drawn off-canvas so a failure leaves no partial caption
    if (plan.strip_top < plan.canvas_height) {
      try {
	auto strip = std::make_shared<Image>(plan.canvas_width, plan.canvas_height - plan.strip_top, CMS::Format::RGB8());
	strip->fill(_config.background());
	unsigned int spacing = plan.strip_height / 4;
	_font->draw(strip, _config.margin(), spacing, metadata.date_text, _config.text_colour());
	_font->draw(strip, _config.margin(), 2 * spacing, metadata.location_text, _config.text_colour());
	canvas->paste(strip, 0, plan.strip_top);
      } catch (std::exception& ex) {
	std::cerr << "** Could not draw the caption, leaving it out: " << ex.what() << " **" << std::endl;
      }
    }

    return canvas;
  }

  void PostcardComposer::_write(Image::ptr canvas, const fs::path& output_path) const {
    fs::path temp_path = output_path.parent_path() / ("." + output_path.filename().string() + ".tmp");

    try {
      auto writer = ImageWriter::open(ImageFilepath(temp_path, "jpeg"));
      writer->write(canvas, _config, true);
      fs::rename(temp_path, output_path);
    } catch (std::exception& ex) {
      boost::system::error_code ec;
      fs::remove(temp_path, ec);
      if (ec)
	std::cerr << "** Could not remove " << temp_path << ": " << ec.message() << " **" << std::endl;
      throw;
    }
  }

  bool PostcardComposer::compose(const fs::path& source_path, const fs::path& output_path) const {
    Timer timer;
    timer.start();

    try {
      auto reader = ImageReader::open(ImageFilepath(source_path));
      Image::ptr img = reader->read();

      CaptureMetadata metadata = _extractor.extract(img->EXIFtags());
      Image::ptr canvas = render(img, metadata, true);
      img.reset();

      _write(canvas, output_path);
    } catch (std::exception& ex) {
      std::cerr << "** Failed to make a postcard from " << source_path << ": " << ex.what() << " **" << std::endl;
      return false;
    }
    timer.stop();

    std::cerr << "Wrote " << output_path << "." << std::endl;
    benchmark_report("Made postcard from " + source_path.filename().string(), timer);

    return true;
  }

}
