// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "PixelsView.hpp"

namespace cg {

PixelsView::PixelsView(std::span<std::uint32_t> data, std::size_t width,
                       std::size_t height) noexcept
    : mData(data.data()), mWidth(width), mHeight(height), mRowStride(width) {}

PixelsView::PixelsView(std::uint32_t* data, std::size_t width, std::size_t height,
                       std::size_t row_stride) noexcept
    : mData(data), mWidth(width), mHeight(height), mRowStride(row_stride) {}

auto PixelsView::width() const -> std::size_t { return mWidth; }
auto PixelsView::height() const -> std::size_t { return mHeight; }

auto PixelsView::data() const -> std::uint32_t* { return mData; }

auto PixelsView::row_stride() const -> std::size_t { return mRowStride; }

auto PixelsView::contains(int x, int y) const -> bool {
  return x >= 0 && y >= 0 && static_cast<std::size_t>(x) < mWidth &&
         static_cast<std::size_t>(y) < mHeight;
}

auto PixelsView::operator[](std::size_t x, std::size_t y) const -> std::uint32_t& {
  return mData[y * mRowStride + x];
}

} // namespace cg
