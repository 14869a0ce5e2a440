// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace cg {

struct FontImpl;
struct FontMetrics {
  std::int32_t ascent;      // Distance from baseline to highest point
  std::int32_t descent;     // Distance from baseline to lowest point
  std::int32_t line_height; // Recommended line spacing
  std::uint32_t size_px;    // Font size in pixels
};

struct GlyphMetrics {
  std::uint32_t width;    // Glyph bitmap width
  std::uint32_t height;   // Glyph bitmap height
  std::int32_t bearing_x; // Horizontal bearing (left side)
  std::int32_t bearing_y; // Vertical bearing (top side)
  std::int32_t advance_x; // Horizontal advance to next glyph
};

// Rasterized glyph coverage, 8-bit grayscale. Rows are `pitch` bytes apart.
struct GlyphBitmap {
  std::span<std::uint8_t const> coverage;
  std::uint32_t pitch;
  GlyphMetrics metrics; // width/height/bearings of the bitmap itself
};

// Represents a loaded font at a specific size
// Does not handle rendering - only provides metrics and glyph data
// Either a FreeType face or the built-in bitmap face
class Font {
public:
  // An invalid font; every query returns an empty result
  Font() = default;

  // Get overall font metrics
  auto metrics() const -> FontMetrics;

  // Size the font was requested at, in pixels
  auto nominal_size() const -> std::uint32_t;

  // Human readable origin (file path or "built-in")
  auto description() const -> std::string;

  auto is_builtin() const -> bool;

  // Get glyph index for a character (or 0 for missing glyph)
  auto get_glyph_index(char32_t codepoint) const -> std::uint32_t;

  // Get outline metrics for a specific glyph, nullopt if it cannot be loaded
  auto get_glyph_metrics(std::uint32_t glyph_index) const -> std::optional<GlyphMetrics>;

  // Rasterize a glyph
  // The coverage buffer is owned by the font, valid until next load_glyph_bitmap call
  auto load_glyph_bitmap(std::uint32_t glyph_index) const -> std::optional<GlyphBitmap>;

  // Get kerning adjustment between two glyphs (in pixels)
  auto get_kerning(std::uint32_t left_glyph, std::uint32_t right_glyph) const -> std::int32_t;

  // Identity of the underlying face, shared between copies of this font
  auto id() const -> void const*;

  // Check if font is valid (not moved-from or default constructed)
  auto is_valid() const -> bool;

private:
  explicit Font(std::shared_ptr<FontImpl> impl);
  friend class FontManager;
  std::shared_ptr<FontImpl> mImpl;
};

} // namespace cg
