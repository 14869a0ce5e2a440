// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "CertificateGenerator.hpp"
#include "Color.hpp"
#include "Files.hpp"
#include "Font.hpp"
#include "FontManager.hpp"
#include "PngCodec.hpp"
#include "TemplateRasterizer.hpp"
#include "ZipReader.hpp"

#include <cassert>
#include <filesystem>
#include <unistd.h>

namespace {
auto scratch_dir() -> std::filesystem::path {
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
                              ("certgen_generator_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  return dir;
}

auto make_config(std::filesystem::path const& dir) -> cg::GeneratorConfig {
  cg::write_full_file(dir / "template.png", cg::encode_png(cg::Image(160, 80, 0xFFFFFFFF), 72));
  cg::write_full_file(dir / "names.csv", "Alice,alice@x.com\nBob,bob@x.com\nAlice,again@x.com\n");

  cg::GeneratorConfig config;
  config.template_path = dir / "template.png";
  config.names_path = dir / "names.csv";
  config.output_path = dir / "out.zip";
  // Forces the built-in face so the run does not depend on installed fonts
  config.default_font_family = "certgen-no-such-family";
  config.font_size = 16;
  config.color = "purple";
  config.dpi = 300;
  return config;
}

template <class Error> auto throws(cg::GeneratorConfig const& config) -> bool {
  cg::FontManager fonts;
  cg::CertificateGenerator generator(fonts);
  try {
    generator.generate(config);
  } catch (Error const&) {
    return true;
  }
  return false;
}
} // namespace

void test_generates_archive(std::filesystem::path const& dir) {
  cg::GeneratorConfig config = make_config(dir);
  cg::FontManager fonts;
  cg::CertificateGenerator generator(fonts);

  cg::RunSummary summary = generator.generate(config);
  assert(summary.template_width == 160);
  assert(summary.template_height == 80);
  assert((summary.anchor == cg::Point{80, 40}));
  assert(summary.names == 2);
  assert(summary.succeeded == 2);
  assert(summary.failed == 0);
  assert(std::filesystem::file_size(config.output_path) == summary.archive_bytes);

  cg::ZipReader reader = cg::ZipReader::open(config.output_path);
  assert(reader.entries().size() == 2);
  assert(reader.entries()[0].name == "Alice.png");
  assert(reader.entries()[1].name == "Bob.png");

  std::string png = reader.read("Alice.png");
  assert(cg::read_png_dpi(png) == 300u);
  cg::Image image = cg::decode_png(png);
  assert(image.width() == 160);
  assert(image.height() == 80);
  // Text is drawn in purple somewhere around the centre
  bool found_purple = false;
  for (std::uint32_t pixel : image.pixels()) {
    found_purple = found_purple || pixel == 0xFF800080;
  }
  assert(found_purple);

  // Running again yields the same archive
  std::string first = cg::read_full_file(config.output_path);
  generator.generate(config);
  assert(cg::read_full_file(config.output_path) == first);
}

void test_falls_back_to_builtin_font(std::filesystem::path const& dir) {
  cg::GeneratorConfig config = make_config(dir);
  config.font_path = dir / "names.csv";
  cg::FontManager fonts;
  cg::CertificateGenerator generator(fonts);
  cg::Font font = generator.resolve_font(config);
  assert(font.is_valid());
  assert(font.is_builtin());
}

void test_fatal_errors(std::filesystem::path const& dir) {
  cg::GeneratorConfig config = make_config(dir);

  cg::GeneratorConfig missing_template = config;
  missing_template.template_path = dir / "missing.png";
  assert(throws<cg::TemplateNotFound>(missing_template));

  cg::GeneratorConfig missing_names = config;
  missing_names.names_path = dir / "missing.csv";
  assert(throws<cg::InputNotFound>(missing_names));

  cg::GeneratorConfig missing_font = config;
  missing_font.font_path = dir / "missing.ttf";
  assert(throws<cg::InputNotFound>(missing_font));

  cg::GeneratorConfig bad_color = config;
  bad_color.color = "not-a-colour";
  assert(throws<cg::ColorParseError>(bad_color));

  cg::GeneratorConfig zero_size = config;
  zero_size.font_size = 0;
  assert(throws<cg::ConfigError>(zero_size));

  cg::write_full_file(dir / "empty.csv", " \n \n");
  cg::GeneratorConfig no_names = config;
  no_names.names_path = dir / "empty.csv";
  assert(throws<cg::EmptyNameList>(no_names));
}

void test_failed_items_are_reported(std::filesystem::path const& dir) {
  cg::GeneratorConfig config = make_config(dir);
  cg::FontManager fonts;
  int calls = 0;
  cg::CertificateGenerator generator(fonts, [&calls](cg::Image const& image, std::uint32_t dpi) {
    if (calls++ == 0) {
      throw std::runtime_error("disk full");
    }
    return cg::encode_png(image, dpi);
  });

  cg::RunSummary summary = generator.generate(config);
  assert(summary.succeeded == 1);
  assert(summary.failed == 1);
  assert(summary.outcomes[0].error == "disk full");
  cg::ZipReader reader = cg::ZipReader::open(config.output_path);
  assert(reader.entries().size() == 1);
  assert(reader.contains("Bob.png"));
}

int main() {
  std::filesystem::path dir = scratch_dir();
  test_generates_archive(dir);
  test_falls_back_to_builtin_font(dir);
  test_fatal_errors(dir);
  test_failed_items_are_reported(dir);
  std::filesystem::remove_all(dir);
}
