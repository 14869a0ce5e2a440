// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <span>

namespace cg::builtin_font {

// 8x16 cells, printable ASCII only. Row 12 is the first row below the baseline.
inline constexpr std::uint32_t kCellWidth = 8;
inline constexpr std::uint32_t kCellHeight = 16;
inline constexpr std::uint32_t kBaseline = 12;
inline constexpr char32_t kFirstCodepoint = 0x20;
inline constexpr char32_t kLastCodepoint = 0x7E;

// Tight ink box of a glyph in cell coordinates; empty for blank glyphs
struct InkBox {
  std::uint32_t min_col;
  std::uint32_t max_col;
  std::uint32_t min_row;
  std::uint32_t max_row;
  bool empty;
};

// 1-based glyph index, 0 if the code point is not covered
auto glyph_index(char32_t codepoint) -> std::uint32_t;

// One byte per row, most significant bit is the leftmost column
auto glyph_rows(std::uint32_t glyph_index) -> std::span<std::uint8_t const, kCellHeight>;

auto ink_box(std::uint32_t glyph_index) -> InkBox;

} // namespace cg::builtin_font
