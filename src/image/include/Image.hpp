// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "PixelsView.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace cg {

// Owned ARGB32 bitmap, row-major without padding
class Image {
public:
  Image() = default;
  Image(std::size_t width, std::size_t height, std::uint32_t fill_argb = 0);

  auto width() const -> std::size_t { return mWidth; }
  auto height() const -> std::size_t { return mHeight; }
  auto empty() const -> bool { return mPixels.empty(); }

  auto pixels() -> std::span<std::uint32_t> { return mPixels; }
  auto pixels() const -> std::span<std::uint32_t const> { return mPixels; }

  auto view() noexcept -> PixelsView;

  auto at(std::size_t x, std::size_t y) const -> std::uint32_t { return mPixels[y * mWidth + x]; }

  auto operator==(Image const&) const -> bool = default;

private:
  std::size_t mWidth = 0;
  std::size_t mHeight = 0;
  std::vector<std::uint32_t> mPixels;
};

} // namespace cg
