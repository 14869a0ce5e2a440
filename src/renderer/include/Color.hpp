// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace cg {

struct ColorParseError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct Color {
  static auto from_argb(std::uint32_t argb) -> Color {
    return Color{.r = static_cast<std::uint8_t>((argb >> 16) & 0xFF),
                 .g = static_cast<std::uint8_t>((argb >> 8) & 0xFF),
                 .b = static_cast<std::uint8_t>(argb & 0xFF),
                 .a = static_cast<std::uint8_t>((argb >> 24) & 0xFF)};
  }

  // Accepts #rgb, #rrggbb, #rrggbbaa and a small set of common names
  // Throws ColorParseError for anything else
  static auto parse(std::string_view text) -> Color;

  auto to_argb() const -> std::uint32_t {
    return (static_cast<std::uint32_t>(a) << 24) | (static_cast<std::uint32_t>(r) << 16) |
           (static_cast<std::uint32_t>(g) << 8) | static_cast<std::uint32_t>(b);
  }

  auto operator==(Color const&) const -> bool = default;

  std::uint8_t r, g, b, a;
};

namespace colors {
inline constexpr Color kBlack{.r = 0, .g = 0, .b = 0, .a = 255};
inline constexpr Color kWhite{.r = 255, .g = 255, .b = 255, .a = 255};
inline constexpr Color kTransparent{.r = 0, .g = 0, .b = 0, .a = 0};
} // namespace colors

} // namespace cg
