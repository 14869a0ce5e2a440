// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "Color.hpp"
#include "PixelsView.hpp"

namespace cg {

class Font;
class GlyphCache;

// Box of a string relative to the pen origin on the baseline.
// `top` is negative for text above the baseline.
struct TextBounds {
  int left;
  int top;
  int width;
  int height;

  auto operator==(TextBounds const&) const -> bool = default;
};

// Ways of sizing a string, from most to least precise
enum class MeasureStrategy {
  InkBounds, // Union of rasterized glyph boxes. Fails on missing glyphs.
  Advance,   // Advance widths by line height. Includes side bearings.
  Estimate,  // Half the nominal size per code point. Never fails.
};

inline constexpr std::array<MeasureStrategy, 3> kDefaultMeasureOrder{
    MeasureStrategy::InkBounds, MeasureStrategy::Advance, MeasureStrategy::Estimate};

auto to_string(MeasureStrategy strategy) -> std::string_view;

struct MeasuredText {
  TextBounds bounds;
  MeasureStrategy strategy;
};

enum class DrawStatus {
  Ok,
  InvalidFont,
  UnsupportedCharacter, // The font has no glyph for a code point
  RasterizationFailed,  // A glyph exists but could not be rendered
};

auto to_string(DrawStatus status) -> std::string_view;

// Code points × size/2 wide, size tall, sitting on the baseline
auto estimate_bounds(std::u32string_view text, std::uint32_t nominal_size) noexcept
    -> TextBounds;

// Renders text onto a buffer using fonts and glyph cache
// Buffer format: ARGB32
class TextRenderer {
public:
  explicit TextRenderer(GlyphCache& cache);
  TextRenderer(TextRenderer&&) noexcept;
  auto operator=(TextRenderer&&) noexcept -> TextRenderer&;
  ~TextRenderer();

  // Render UTF-8 text with the pen starting at `origin` on the baseline.
  // Nothing is drawn unless every glyph can be rendered.
  auto draw_text(PixelsView buffer, Font const& font, std::string_view text, Point origin,
                 Color color) -> DrawStatus;

  auto measure_ink_bounds(Font const& font, std::u32string_view text) const
      -> std::optional<TextBounds>;

  auto measure_advance(Font const& font, std::u32string_view text) const
      -> std::optional<TextBounds>;

  // Tries each strategy in order and returns the first that succeeds.
  // Falls back to Estimate if none in `order` does.
  auto measure_text(Font const& font, std::string_view text,
                    std::span<MeasureStrategy const> order = kDefaultMeasureOrder) const
      -> MeasuredText;

private:
  std::unique_ptr<struct TextRendererImpl> mImpl;
};

} // namespace cg
