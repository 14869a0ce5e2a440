// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Color.hpp"

#include <cassert>

void test_hex_forms() {
  assert(cg::Color::parse("#000000") == cg::colors::kBlack);
  assert(cg::Color::parse("#fff") == cg::colors::kWhite);
  assert((cg::Color::parse("#1a2B3c") == cg::Color{.r = 0x1A, .g = 0x2B, .b = 0x3C, .a = 0xFF}));
  assert((cg::Color::parse("#11223344") == cg::Color{.r = 0x11, .g = 0x22, .b = 0x33, .a = 0x44}));
}

void test_names() {
  assert(cg::Color::parse("white") == cg::colors::kWhite);
  assert(cg::Color::parse(" Red ").to_argb() == 0xFFFF0000);
  assert(cg::Color::parse("grey") == cg::Color::parse("gray"));
}

void test_argb_round_trip() {
  cg::Color color = cg::Color::from_argb(0x80102030);
  assert(color.a == 0x80);
  assert(color.r == 0x10);
  assert(color.to_argb() == 0x80102030);
}

void test_rejects_garbage() {
  for (char const* text : {"", "#12", "#12345", "#ggg", "chartreuse"}) {
    bool thrown = false;
    try {
      cg::Color::parse(text);
    } catch (cg::ColorParseError const&) {
      thrown = true;
    }
    assert(thrown);
  }
}

int main() {
  test_hex_forms();
  test_names();
  test_argb_round_trip();
  test_rejects_garbage();
}
