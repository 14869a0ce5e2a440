// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Color.hpp"
#include "Strings.hpp"

#include <array>
#include <string>
#include <utility>

namespace cg {

namespace {
constexpr std::array<std::pair<std::string_view, std::uint32_t>, 12> kNamedColors{{
    {"black", 0xFF000000},
    {"white", 0xFFFFFFFF},
    {"red", 0xFFFF0000},
    {"green", 0xFF008000},
    {"blue", 0xFF0000FF},
    {"yellow", 0xFFFFFF00},
    {"cyan", 0xFF00FFFF},
    {"magenta", 0xFFFF00FF},
    {"gray", 0xFF808080},
    {"grey", 0xFF808080},
    {"orange", 0xFFFFA500},
    {"purple", 0xFF800080},
}};

auto hex_value(char c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}
} // namespace

auto Color::parse(std::string_view text) -> Color {
  std::string_view trimmed = trim(text);
  if (trimmed.starts_with('#')) {
    std::string_view digits = trimmed.substr(1);
    std::array<int, 8> values{};
    for (std::size_t i = 0; i < digits.size() && i < values.size(); ++i) {
      values[i] = hex_value(digits[i]);
      if (values[i] < 0) {
        throw ColorParseError("Invalid hex digit in color: " + std::string(text));
      }
    }
    auto byte = [&](std::size_t hi, std::size_t lo) {
      return static_cast<std::uint8_t>(values[hi] * 16 + values[lo]);
    };
    switch (digits.size()) {
    case 3:
      return Color{.r = byte(0, 0), .g = byte(1, 1), .b = byte(2, 2), .a = 255};
    case 6:
      return Color{.r = byte(0, 1), .g = byte(2, 3), .b = byte(4, 5), .a = 255};
    case 8:
      return Color{.r = byte(0, 1), .g = byte(2, 3), .b = byte(4, 5), .a = byte(6, 7)};
    default:
      throw ColorParseError("Unsupported color format: " + std::string(text));
    }
  }

  const std::string lowered = to_lower(trimmed);
  for (auto const& [name, argb] : kNamedColors) {
    if (lowered == name) {
      return Color::from_argb(argb);
    }
  }
  throw ColorParseError("Unknown color: " + std::string(text));
}

} // namespace cg
