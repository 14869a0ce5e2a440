// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace cg {

struct Point {
  int x;
  int y;

  auto operator==(Point const&) const -> bool = default;
};

// Non-owning 2D view of ARGB32 pixels, row-major with a row stride in pixels
class PixelsView {
public:
  PixelsView() = default;

  explicit PixelsView(std::span<std::uint32_t> data, std::size_t width,
                      std::size_t height) noexcept;

  explicit PixelsView(std::uint32_t* data, std::size_t width, std::size_t height,
                      std::size_t row_stride) noexcept;

  auto width() const -> std::size_t;
  auto height() const -> std::size_t;

  auto data() const -> std::uint32_t*;

  auto row_stride() const -> std::size_t;

  auto contains(int x, int y) const -> bool;

  auto operator[](std::size_t x, std::size_t y) const -> std::uint32_t&;

private:
  std::uint32_t* mData = nullptr;
  std::size_t mWidth = 0;
  std::size_t mHeight = 0;
  std::size_t mRowStride = 0;
};

} // namespace cg
