// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Color.hpp"
#include "Image.hpp"
#include "PixelsView.hpp"
#include "TextRenderer.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace cg {

class Font;

enum class Align { Left, Center, Right };

// Accepts "left", "center"/"centre" and "right"
auto parse_align(std::string_view text) -> std::optional<Align>;
auto to_string(Align align) -> std::string_view;

struct OutlineOptions {
  bool enabled = false;
  int width = 2;
};

// Outcome of the best-effort outline pass
struct OutlineResult {
  int strokes = 0;
  int failed = 0;

  auto ok() const -> bool { return failed == 0; }
};

enum class RenderStatus {
  Rendered,
  EmptyName,  // Nothing to draw, image returned unchanged
  DrawFailed, // Text could not be drawn, image returned unchanged
};

auto to_string(RenderStatus status) -> std::string_view;

struct RenderResult {
  Image image;
  RenderStatus status;
  DrawStatus draw_status;
  MeasuredText measured;
  Point position; // Top-left corner of the text box
  OutlineResult outline;
};

// Top-left corner of a `width` x `height` box aligned on `anchor`, vertically
// centred and clamped so the box stays inside the image when it fits.
auto place_text(int width, int height, Point anchor, Align align, std::size_t image_width,
                std::size_t image_height) -> Point;

// Lays out and draws one name per certificate
class TextLayoutEngine {
public:
  TextLayoutEngine();
  explicit TextLayoutEngine(std::span<MeasureStrategy const> measure_order);
  TextLayoutEngine(TextLayoutEngine&&) noexcept;
  auto operator=(TextLayoutEngine&&) noexcept -> TextLayoutEngine&;
  ~TextLayoutEngine();

  auto measure(Font const& font, std::string_view text) const -> MeasuredText;

  // Draws the trimmed name onto `base` and returns it.
  // Failures to draw are reported in the result, never thrown.
  auto render(Image base, std::string_view name, Point anchor, Font const& font, Color color,
              Align align = Align::Left, OutlineOptions outline = {}) -> RenderResult;

  // Black copies of the text at every offset in [-width, width]^2 except the centre.
  // Best-effort: failed strokes are counted and skipped.
  auto draw_outline(PixelsView buffer, Font const& font, std::string_view text, Point pen,
                    int width) noexcept -> OutlineResult;

private:
  std::unique_ptr<struct TextLayoutEngineImpl> mImpl;
};

} // namespace cg
