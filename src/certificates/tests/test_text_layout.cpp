// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Font.hpp"
#include "FontManager.hpp"
#include "TextLayout.hpp"

#include <array>
#include <cassert>

namespace {
constexpr std::uint32_t kRed = 0xFFFF0000;
constexpr std::uint32_t kWhite = 0xFFFFFFFF;
constexpr std::uint32_t kBlack = 0xFF000000;
constexpr cg::Color kRedColor{.r = 255, .g = 0, .b = 0, .a = 255};
} // namespace

void test_parse_align() {
  assert(cg::parse_align("left") == cg::Align::Left);
  assert(cg::parse_align(" Center ") == cg::Align::Center);
  assert(cg::parse_align("centre") == cg::Align::Center);
  assert(cg::parse_align("RIGHT") == cg::Align::Right);
  assert(!cg::parse_align("middle"));
  assert(cg::to_string(cg::Align::Right) == "right");
}

void test_place_text_alignment() {
  assert((cg::place_text(10, 4, {50, 50}, cg::Align::Left, 100, 100) == cg::Point{50, 48}));
  assert((cg::place_text(10, 4, {50, 50}, cg::Align::Center, 100, 100) == cg::Point{45, 48}));
  assert((cg::place_text(10, 4, {50, 50}, cg::Align::Right, 100, 100) == cg::Point{40, 48}));
}

void test_place_text_clamps() {
  assert((cg::place_text(10, 4, {98, 1}, cg::Align::Left, 100, 100) == cg::Point{90, 0}));
  assert((cg::place_text(10, 4, {2, 99}, cg::Align::Right, 100, 100) == cg::Point{0, 96}));
  // A box wider than the image sticks to the left edge
  assert((cg::place_text(200, 4, {50, 50}, cg::Align::Center, 100, 100) == cg::Point{0, 48}));
}

void test_measure_uses_ink_bounds() {
  cg::TextLayoutEngine engine;
  cg::Font font = cg::FontManager::builtin(16);
  cg::MeasuredText measured = engine.measure(font, "HH");
  assert(measured.strategy == cg::MeasureStrategy::InkBounds);
  assert((measured.bounds == cg::TextBounds{.left = 0, .top = -10, .width = 15, .height = 9}));
}

void test_render_places_name() {
  cg::TextLayoutEngine engine;
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(64, 32, kWhite);

  cg::RenderResult result =
      engine.render(base, "  H ", {32, 16}, font, kRedColor, cg::Align::Center);
  assert(result.status == cg::RenderStatus::Rendered);
  assert(result.draw_status == cg::DrawStatus::Ok);
  assert((result.position == cg::Point{29, 12}));

  // Stems of the H in columns 0,1 and 5,6, crossbar on the fifth row
  assert(result.image.at(29, 12) == kRed);
  assert(result.image.at(31, 12) == kWhite);
  assert(result.image.at(34, 12) == kRed);
  assert(result.image.at(31, 16) == kRed);
  assert(result.image.at(36, 12) == kWhite);
  assert(result.image.at(29, 11) == kWhite);

  // The base image is never modified
  assert(base.at(29, 12) == kWhite);
}

void test_render_is_repeatable() {
  cg::TextLayoutEngine engine;
  cg::Font font = cg::FontManager::builtin(32);
  cg::Image base(200, 60, kWhite);
  cg::RenderResult first = engine.render(base, "Grace Hopper", {100, 30}, font, kRedColor);
  cg::RenderResult second = engine.render(base, "Grace Hopper", {100, 30}, font, kRedColor);
  assert(first.image == second.image);
  assert(first.image != base);
}

void test_empty_name_is_a_no_op() {
  cg::TextLayoutEngine engine;
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(16, 16, kWhite);
  cg::RenderResult result = engine.render(base, " \t ", {8, 8}, font, kRedColor);
  assert(result.status == cg::RenderStatus::EmptyName);
  assert(result.image == base);
}

void test_unsupported_character_leaves_image_unchanged() {
  cg::TextLayoutEngine engine;
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(64, 32, kWhite);
  cg::RenderResult result = engine.render(base, "Zo\xC3\xAB", {32, 16}, font, kRedColor);
  assert(result.status == cg::RenderStatus::DrawFailed);
  assert(result.draw_status == cg::DrawStatus::UnsupportedCharacter);
  assert(result.image == base);
  // Measuring fell through to the advance strategy
  assert(result.measured.strategy == cg::MeasureStrategy::Advance);
}

void test_outline() {
  cg::TextLayoutEngine engine;
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(64, 32, kWhite);
  cg::RenderResult result =
      engine.render(base, "H", {32, 16}, font, kRedColor, cg::Align::Center,
                    cg::OutlineOptions{.enabled = true, .width = 1});
  assert(result.status == cg::RenderStatus::Rendered);
  assert(result.outline.strokes == 8);
  assert(result.outline.ok());

  // Fill keeps its colour, the outline surrounds it
  assert(result.image.at(29, 12) == kRed);
  assert(result.image.at(28, 12) == kBlack);
  assert(result.image.at(31, 12) == kBlack);
  assert(result.image.at(29, 11) == kBlack);
  assert(result.image.at(26, 12) == kWhite);
}

void test_outline_of_unsupported_text_counts_failures() {
  cg::TextLayoutEngine engine;
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image canvas(16, 16, kWhite);
  cg::OutlineResult result = engine.draw_outline(canvas.view(), font, "\xC3\xAB", {2, 12}, 2);
  assert(result.strokes == 24);
  assert(result.failed == 24);
  assert(canvas == cg::Image(16, 16, kWhite));
  // Stroke failures of any kind are counted, never propagated
  static_assert(noexcept(engine.draw_outline(canvas.view(), font, "", {0, 0}, 1)));
}

void test_estimate_only_engine() {
  constexpr std::array<cg::MeasureStrategy, 1> kOrder{cg::MeasureStrategy::Estimate};
  cg::TextLayoutEngine engine(kOrder);
  cg::Font font = cg::FontManager::builtin(16);

  cg::MeasuredText measured = engine.measure(font, "HH");
  assert(measured.strategy == cg::MeasureStrategy::Estimate);
  assert((measured.bounds == cg::TextBounds{.left = 0, .top = -16, .width = 16, .height = 16}));

  cg::Image base(64, 32, kWhite);
  cg::RenderResult result = engine.render(base, "HH", {32, 16}, font, kRedColor);
  assert(result.status == cg::RenderStatus::Rendered);
  assert((result.position == cg::Point{24, 8}));
  assert(result.image.at(24, 14) == kRed);
}

int main() {
  test_parse_align();
  test_place_text_alignment();
  test_place_text_clamps();
  test_measure_uses_ink_bounds();
  test_render_places_name();
  test_render_is_repeatable();
  test_empty_name_is_a_no_op();
  test_unsupported_character_leaves_image_unchanged();
  test_outline();
  test_outline_of_unsupported_text_counts_failures();
  test_estimate_only_engine();
}
