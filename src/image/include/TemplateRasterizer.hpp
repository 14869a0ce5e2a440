// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Files.hpp"
#include "Image.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace cg {

struct TemplateNotFound : public InputNotFound {
  using InputNotFound::InputNotFound;
};

// The build has no vector rasterizer but the template is a vector file
struct ConversionUnavailable : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ConversionFailed : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct TemplateSize {
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
};

auto is_vector_template(std::filesystem::path const& path) -> bool;

// Whether this build can convert vector templates
auto vector_conversion_available() noexcept -> bool;

// Returns PNG bytes for the template.
// Raster files are returned unchanged. Vector files are rendered onto white, at `size` if given.
// When only one dimension is given the other follows the intrinsic aspect ratio.
auto rasterize(std::filesystem::path const& path, TemplateSize size = {}) -> std::string;

// rasterize() followed by decoding. Throws ImageDecodeError for undecodable bytes.
auto load_template(std::filesystem::path const& path, TemplateSize size = {}) -> Image;

} // namespace cg
