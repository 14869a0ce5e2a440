// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Image.hpp"

namespace cg {

Image::Image(std::size_t width, std::size_t height, std::uint32_t fill_argb)
    : mWidth(width), mHeight(height), mPixels(width * height, fill_argb) {}

auto Image::view() noexcept -> PixelsView { return PixelsView(mPixels, mWidth, mHeight); }

} // namespace cg
