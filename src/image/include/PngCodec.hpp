// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Image.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cg {

struct ImageDecodeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct PngEncodeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Decodes any PNG colour type and bit depth into 8-bit ARGB
// Throws ImageDecodeError on malformed input
auto decode_png(std::string_view bytes) -> Image;

// Encodes as 8-bit RGBA with a pHYs chunk for `dpi` and a fixed compression level
auto encode_png(Image const& image, std::uint32_t dpi) -> std::string;

// Resolution stored in the pHYs chunk, nullopt if absent or not in metres
auto read_png_dpi(std::string_view bytes) -> std::optional<std::uint32_t>;

} // namespace cg
