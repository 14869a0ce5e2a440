// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "TextLayout.hpp"
#include "Font.hpp"
#include "GlyphCache.hpp"
#include "Logging.hpp"
#include "Strings.hpp"

#include <algorithm>
#include <vector>

namespace cg {

auto parse_align(std::string_view text) -> std::optional<Align> {
  const std::string lower = to_lower(trim(text));
  if (lower == "left") {
    return Align::Left;
  }
  if (lower == "center" || lower == "centre") {
    return Align::Center;
  }
  if (lower == "right") {
    return Align::Right;
  }
  return std::nullopt;
}

auto to_string(Align align) -> std::string_view {
  switch (align) {
  case Align::Left:
    return "left";
  case Align::Center:
    return "center";
  case Align::Right:
    return "right";
  }
  return "unknown";
}

auto to_string(RenderStatus status) -> std::string_view {
  switch (status) {
  case RenderStatus::Rendered:
    return "rendered";
  case RenderStatus::EmptyName:
    return "empty name";
  case RenderStatus::DrawFailed:
    return "draw failed";
  }
  return "unknown";
}

auto place_text(int width, int height, Point anchor, Align align, std::size_t image_width,
                std::size_t image_height) -> Point {
  int x = anchor.x;
  switch (align) {
  case Align::Center:
    x = anchor.x - width / 2;
    break;
  case Align::Right:
    x = anchor.x - width;
    break;
  case Align::Left:
    break;
  }
  int y = anchor.y - height / 2;

  // Hard clamp; a box larger than the image sticks to the top-left corner
  x = std::max(0, std::min(x, static_cast<int>(image_width) - width));
  y = std::max(0, std::min(y, static_cast<int>(image_height) - height));
  return Point{x, y};
}

struct TextLayoutEngineImpl {
  GlyphCache cache;
  TextRenderer renderer{cache};
  std::vector<MeasureStrategy> measure_order;

  explicit TextLayoutEngineImpl(std::span<MeasureStrategy const> order)
      : measure_order(order.begin(), order.end()) {}
};

TextLayoutEngine::TextLayoutEngine() : TextLayoutEngine(kDefaultMeasureOrder) {}

TextLayoutEngine::TextLayoutEngine(std::span<MeasureStrategy const> measure_order)
    : mImpl(std::make_unique<TextLayoutEngineImpl>(measure_order)) {}

TextLayoutEngine::TextLayoutEngine(TextLayoutEngine&&) noexcept = default;
auto TextLayoutEngine::operator=(TextLayoutEngine&&) noexcept -> TextLayoutEngine& = default;
TextLayoutEngine::~TextLayoutEngine() = default;

auto TextLayoutEngine::measure(Font const& font, std::string_view text) const -> MeasuredText {
  return mImpl->renderer.measure_text(font, text, mImpl->measure_order);
}

auto TextLayoutEngine::render(Image base, std::string_view name, Point anchor, Font const& font,
                              Color color, Align align, OutlineOptions outline) -> RenderResult {
  std::string_view text = trim(name);
  if (text.empty()) {
    return RenderResult{.image = std::move(base),
                        .status = RenderStatus::EmptyName,
                        .draw_status = DrawStatus::Ok,
                        .measured = {},
                        .position = {},
                        .outline = {}};
  }

  MeasuredText measured = measure(font, text);
  TextBounds const& bounds = measured.bounds;
  Point position =
      place_text(bounds.width, bounds.height, anchor, align, base.width(), base.height());
  Point pen{position.x - bounds.left, position.y - bounds.top};
  Log::d("'{}' measured {}x{} ({}), placed at {},{}", text, bounds.width, bounds.height,
         to_string(measured.strategy), position.x, position.y);

  Image canvas = base;
  OutlineResult outline_result;
  if (outline.enabled && outline.width > 0) {
    outline_result = draw_outline(canvas.view(), font, text, pen, outline.width);
    if (!outline_result.ok()) {
      Log::w("{} of {} outline strokes failed for '{}'", outline_result.failed,
             outline_result.strokes, text);
    }
  }

  DrawStatus status = mImpl->renderer.draw_text(canvas.view(), font, text, pen, color);
  if (status != DrawStatus::Ok) {
    Log::w("Failed to draw '{}': {}", text, to_string(status));
    return RenderResult{.image = std::move(base),
                        .status = RenderStatus::DrawFailed,
                        .draw_status = status,
                        .measured = measured,
                        .position = position,
                        .outline = outline_result};
  }

  return RenderResult{.image = std::move(canvas),
                      .status = RenderStatus::Rendered,
                      .draw_status = status,
                      .measured = measured,
                      .position = position,
                      .outline = outline_result};
}

auto TextLayoutEngine::draw_outline(PixelsView buffer, Font const& font, std::string_view text,
                                    Point pen, int width) noexcept -> OutlineResult {
  OutlineResult result;
  for (int dx = -width; dx <= width; ++dx) {
    for (int dy = -width; dy <= width; ++dy) {
      if (dx == 0 && dy == 0) {
        continue;
      }
      ++result.strokes;
      try {
        DrawStatus status = mImpl->renderer.draw_text(buffer, font, text,
                                                      Point{pen.x + dx, pen.y + dy}, colors::kBlack);
        if (status != DrawStatus::Ok) {
          ++result.failed;
        }
      } catch (std::exception const& ex) {
        ++result.failed;
        Log::d("Outline stroke at {},{} failed: {}", dx, dy, ex.what());
      } catch (...) {
        ++result.failed;
        Log::d("Outline stroke at {},{} failed with an unknown error", dx, dy);
      }
    }
  }
  return result;
}

} // namespace cg
