// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "TextRenderer.hpp"
#include "Font.hpp"
#include "GlyphCache.hpp"
#include "Utf8.hpp"

#include <algorithm>
#include <climits>
#include <vector>

namespace cg {

auto to_string(MeasureStrategy strategy) -> std::string_view {
  switch (strategy) {
  case MeasureStrategy::InkBounds:
    return "ink-bounds";
  case MeasureStrategy::Advance:
    return "advance";
  case MeasureStrategy::Estimate:
    return "estimate";
  }
  return "unknown";
}

auto to_string(DrawStatus status) -> std::string_view {
  switch (status) {
  case DrawStatus::Ok:
    return "ok";
  case DrawStatus::InvalidFont:
    return "invalid font";
  case DrawStatus::UnsupportedCharacter:
    return "unsupported character";
  case DrawStatus::RasterizationFailed:
    return "glyph rasterization failed";
  }
  return "unknown";
}

auto estimate_bounds(std::u32string_view text, std::uint32_t nominal_size) noexcept
    -> TextBounds {
  const int size = static_cast<int>(nominal_size);
  const int width = static_cast<int>(text.size()) * (size / 2);
  return TextBounds{.left = 0, .top = -size, .width = width, .height = size};
}

struct TextRendererImpl {
  GlyphCache* cache;

  explicit TextRendererImpl(GlyphCache& cache) : cache(&cache) {}

  // Blend a single pixel with alpha
  static auto blend_pixel(std::uint8_t src_alpha, Color color, std::uint32_t& dest_pixel) -> void {
    if (src_alpha == 0)
      return;

    // Extract ARGB components from dest (assuming ARGB32 format)
    std::uint8_t dest_a = (dest_pixel >> 24) & 0xFF;
    std::uint8_t dest_r = (dest_pixel >> 16) & 0xFF;
    std::uint8_t dest_g = (dest_pixel >> 8) & 0xFF;
    std::uint8_t dest_b = dest_pixel & 0xFF;

    // Alpha blend: out = src * src_alpha + dest * (1 - src_alpha)
    float alpha = src_alpha / 255.0f * color.a / 255.0f;
    float inv_alpha = 1.0f - alpha;

    std::uint8_t out_r = static_cast<std::uint8_t>(color.r * alpha + dest_r * inv_alpha + 0.5f);
    std::uint8_t out_g = static_cast<std::uint8_t>(color.g * alpha + dest_g * inv_alpha + 0.5f);
    std::uint8_t out_b = static_cast<std::uint8_t>(color.b * alpha + dest_b * inv_alpha + 0.5f);
    std::uint8_t out_a = std::max(dest_a, static_cast<std::uint8_t>(alpha * 255 + 0.5f));

    dest_pixel = (static_cast<std::uint32_t>(out_a) << 24) |
                 (static_cast<std::uint32_t>(out_r) << 16) |
                 (static_cast<std::uint32_t>(out_g) << 8) | static_cast<std::uint32_t>(out_b);
  }

  static auto draw_glyph(PixelsView buffer, CachedGlyph const& glyph, std::int32_t x,
                         std::int32_t y, Color color) -> void {
    std::int32_t glyph_x = x + glyph.metrics.bearing_x;
    std::int32_t glyph_y = y - glyph.metrics.bearing_y;

    for (std::uint32_t row = 0; row < glyph.metrics.height; ++row) {
      std::int32_t target_y = glyph_y + static_cast<std::int32_t>(row);
      for (std::uint32_t col = 0; col < glyph.metrics.width; ++col) {
        std::int32_t target_x = glyph_x + static_cast<std::int32_t>(col);
        if (!buffer.contains(target_x, target_y))
          continue;

        std::uint8_t alpha = glyph.bitmap[row * glyph.metrics.width + col];
        blend_pixel(alpha, color, buffer[target_x, target_y]);
      }
    }
  }
};

TextRenderer::TextRenderer(GlyphCache& cache) : mImpl(std::make_unique<TextRendererImpl>(cache)) {}

TextRenderer::TextRenderer(TextRenderer&&) noexcept = default;
auto TextRenderer::operator=(TextRenderer&&) noexcept -> TextRenderer& = default;
TextRenderer::~TextRenderer() = default;

auto TextRenderer::draw_text(PixelsView buffer, Font const& font, std::string_view text,
                             Point origin, Color color) -> DrawStatus {
  if (!font.is_valid())
    return DrawStatus::InvalidFont;

  struct PlacedGlyph {
    CachedGlyph glyph;
    std::int32_t x;
  };

  // Resolve every glyph first so that a failure leaves the buffer untouched
  std::vector<PlacedGlyph> glyphs;
  std::int32_t cursor_x = origin.x;
  std::uint32_t prev_glyph = 0;
  for (char32_t c : utf8::decode(text)) {
    std::uint32_t glyph_index = font.get_glyph_index(c);
    if (glyph_index == 0)
      return DrawStatus::UnsupportedCharacter;

    // Apply kerning
    if (prev_glyph != 0) {
      cursor_x += font.get_kerning(prev_glyph, glyph_index);
    }

    std::optional<CachedGlyph> glyph = mImpl->cache->get(font, glyph_index);
    if (!glyph)
      return DrawStatus::RasterizationFailed;

    glyphs.push_back(PlacedGlyph{*glyph, cursor_x});

    // Advance cursor
    cursor_x += glyph->metrics.advance_x;
    prev_glyph = glyph_index;
  }

  for (PlacedGlyph const& placed : glyphs) {
    mImpl->draw_glyph(buffer, placed.glyph, placed.x, origin.y, color);
  }
  return DrawStatus::Ok;
}

auto TextRenderer::measure_ink_bounds(Font const& font, std::u32string_view text) const
    -> std::optional<TextBounds> {
  if (!font.is_valid() || text.empty()) {
    return std::nullopt;
  }

  int min_x = INT_MAX;
  int min_y = INT_MAX;
  int max_x = INT_MIN;
  int max_y = INT_MIN;
  std::int32_t cursor_x = 0;
  std::uint32_t prev_glyph = 0;

  for (char32_t c : text) {
    std::uint32_t glyph_index = font.get_glyph_index(c);
    if (glyph_index == 0)
      return std::nullopt;

    if (prev_glyph != 0) {
      cursor_x += font.get_kerning(prev_glyph, glyph_index);
    }

    std::optional<CachedGlyph> glyph = mImpl->cache->get(font, glyph_index);
    if (!glyph)
      return std::nullopt;

    GlyphMetrics const& m = glyph->metrics;
    if (m.width > 0 && m.height > 0) {
      const int x0 = cursor_x + m.bearing_x;
      const int y0 = -m.bearing_y;
      min_x = std::min(min_x, x0);
      min_y = std::min(min_y, y0);
      max_x = std::max(max_x, x0 + static_cast<int>(m.width));
      max_y = std::max(max_y, y0 + static_cast<int>(m.height));
    }

    cursor_x += m.advance_x;
    prev_glyph = glyph_index;
  }

  if (min_x >= max_x || min_y >= max_y) {
    return std::nullopt;
  }
  return TextBounds{.left = min_x, .top = min_y, .width = max_x - min_x, .height = max_y - min_y};
}

auto TextRenderer::measure_advance(Font const& font, std::u32string_view text) const
    -> std::optional<TextBounds> {
  if (!font.is_valid()) {
    return std::nullopt;
  }

  FontMetrics font_metrics = font.metrics();
  const int height = font_metrics.ascent - font_metrics.descent;
  if (height <= 0) {
    return std::nullopt;
  }

  std::int32_t width = 0;
  std::uint32_t prev_glyph = 0;

  for (char32_t c : text) {
    std::uint32_t glyph_index = font.get_glyph_index(c);
    if (glyph_index == 0)
      continue;

    if (prev_glyph != 0) {
      width += font.get_kerning(prev_glyph, glyph_index);
    }

    std::optional<GlyphMetrics> glyph_metrics = font.get_glyph_metrics(glyph_index);
    if (!glyph_metrics)
      continue;
    width += glyph_metrics->advance_x;
    prev_glyph = glyph_index;
  }

  if (width <= 0) {
    return std::nullopt;
  }
  return TextBounds{.left = 0, .top = -font_metrics.ascent, .width = width, .height = height};
}

auto TextRenderer::measure_text(Font const& font, std::string_view text,
                                std::span<MeasureStrategy const> order) const -> MeasuredText {
  const std::u32string codepoints = utf8::decode(text);
  for (MeasureStrategy strategy : order) {
    std::optional<TextBounds> bounds;
    switch (strategy) {
    case MeasureStrategy::InkBounds:
      bounds = measure_ink_bounds(font, codepoints);
      break;
    case MeasureStrategy::Advance:
      bounds = measure_advance(font, codepoints);
      break;
    case MeasureStrategy::Estimate:
      bounds = estimate_bounds(codepoints, font.nominal_size());
      break;
    }
    if (bounds) {
      return MeasuredText{.bounds = *bounds, .strategy = strategy};
    }
  }
  return MeasuredText{.bounds = estimate_bounds(codepoints, font.nominal_size()),
                      .strategy = MeasureStrategy::Estimate};
}

} // namespace cg
