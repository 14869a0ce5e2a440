// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "BatchPackager.hpp"
#include "GeneratorConfig.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace cg {

class Font;
class FontManager;

// The names file holds no usable name
struct EmptyNameList : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RunSummary {
  std::size_t template_width = 0;
  std::size_t template_height = 0;
  Point anchor{};
  std::string font;
  std::size_t names = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::vector<BatchOutcome> outcomes;
  std::filesystem::path archive_path;
  std::uint64_t archive_bytes = 0;
};

// Runs a whole certificate batch from files on disk to the archive file
class CertificateGenerator {
public:
  explicit CertificateGenerator(FontManager& fonts);
  CertificateGenerator(FontManager& fonts, ImageEncoder encoder);

  // Throws on fatal errors: InputNotFound, ConversionUnavailable, ConversionFailed,
  // ImageDecodeError, EmptyNameList, ColorParseError, EmptyBatch, ArchiveError, ConfigError
  auto generate(GeneratorConfig const& config) -> RunSummary;

  // Configured font file, then the default family, then the built-in face
  auto resolve_font(GeneratorConfig const& config) -> Font;

private:
  FontManager* mFonts;
  TextLayoutEngine mLayout;
  ImageEncoder mEncoder;
};

} // namespace cg
